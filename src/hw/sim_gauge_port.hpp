#pragma once
#include "iserial_port.hpp"
#include "../core/errors.hpp"
#include <cstdint>
#include <cstdio>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Simulated serial port with a scripted gauge behind it
 *
 * Each command written selects the reply returned by the next read_line().
 * Behaviour per command comes from, in order:
 *  1. one-shot steps queued with push_step() (consumed in order)
 *  2. the standing responder set with set_response()/set_responder()
 *  3. silence (read_line() times out and returns "")
 *
 * Opens can be made to fail, and every write is recorded, so tests can check
 * what the controller sent and how often it reopened the port.
 */
class SimGaugePort : public ISerialPort {
public:
  enum class Action {
    REPLY,        ///< Next read_line() returns the reply text
    SILENT,       ///< Next read_line() times out
    WRITE_ERROR,  ///< The write itself fails
    READ_ERROR    ///< The write succeeds, the following read fails
  };

  struct Step {
    Action action{Action::REPLY};
    std::string reply;
  };

  using Responder = std::function<std::string()>;

  explicit SimGaugePort(std::string name = "SIM") : name_(std::move(name)) {}

  /// Standing reply for a command
  void set_response(const std::string& cmd, const std::string& reply) {
    set_responder(cmd, [reply]() { return reply; });
  }

  /// Standing reply generator for a command
  void set_responder(const std::string& cmd, Responder r) {
    std::lock_guard<std::mutex> g(mtx_);
    responders_[cmd] = std::move(r);
  }

  /// Queue a one-shot behaviour for the next write of @p cmd
  void push_step(const std::string& cmd, Step step) {
    std::lock_guard<std::mutex> g(mtx_);
    steps_[cmd].push_back(std::move(step));
  }

  /// Make the next @p n calls to open() throw SerialIOError
  void fail_next_opens(int n) {
    std::lock_guard<std::mutex> g(mtx_);
    failing_opens_ = n;
  }

  /**
   * @brief Behave like a healthy HVG-2020B
   * @param mean_mbar Centre of the simulated pressure
   * @param noise_mbar Standard deviation of the gaussian noise
   * @param seed Random seed (0 = random)
   */
  void simulate_healthy_gauge(double mean_mbar, double noise_mbar, uint64_t seed = 0) {
    set_response("s1\r\n", "HVG-2020B\r>");
    auto rng = std::make_shared<std::mt19937_64>(seed != 0 ? seed : std::random_device{}());
    auto dist = std::make_shared<std::normal_distribution<double>>(mean_mbar, noise_mbar);
    set_responder("p\r\n", [rng, dist]() {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.3E\r>", (*dist)(*rng));
      return std::string(buf);
    });
  }

  void open() override {
    std::lock_guard<std::mutex> g(mtx_);
    if (open_) return;
    if (failing_opens_ > 0) {
      --failing_opens_;
      ++failed_open_count_;
      throw SerialIOError("could not open " + name_ + ": simulated failure");
    }
    open_ = true;
    ++open_count_;
  }

  void close() override {
    std::lock_guard<std::mutex> g(mtx_);
    if (open_) {
      open_ = false;
      ++close_count_;
    }
    pending_.clear();
    pending_read_error_ = false;
  }

  bool is_open() const override {
    std::lock_guard<std::mutex> g(mtx_);
    return open_;
  }

  void write(const std::string& data) override {
    std::lock_guard<std::mutex> g(mtx_);
    if (!open_) throw SerialIOError("write on closed port " + name_);
    written_.push_back(data);
    pending_.clear();
    pending_read_error_ = false;

    Step step = next_step(data);
    switch (step.action) {
      case Action::REPLY:
        pending_ = step.reply;
        break;
      case Action::SILENT:
        break;
      case Action::WRITE_ERROR:
        throw SerialIOError("write failed on " + name_ + ": simulated I/O error");
      case Action::READ_ERROR:
        pending_read_error_ = true;
        break;
    }
  }

  std::string read_line() override {
    std::lock_guard<std::mutex> g(mtx_);
    if (!open_) throw SerialIOError("read on closed port " + name_);
    if (pending_read_error_) {
      pending_read_error_ = false;
      throw SerialIOError("read failed on " + name_ + ": simulated I/O error");
    }
    std::string out;
    out.swap(pending_);
    return out;
  }

  std::string name() const override { return name_; }

  // Inspection helpers
  int open_count() const { std::lock_guard<std::mutex> g(mtx_); return open_count_; }
  int close_count() const { std::lock_guard<std::mutex> g(mtx_); return close_count_; }
  int failed_open_count() const { std::lock_guard<std::mutex> g(mtx_); return failed_open_count_; }

  std::vector<std::string> written() const {
    std::lock_guard<std::mutex> g(mtx_);
    return written_;
  }

  int count_writes(const std::string& cmd) const {
    std::lock_guard<std::mutex> g(mtx_);
    int n = 0;
    for (const auto& w : written_) {
      if (w == cmd) ++n;
    }
    return n;
  }

private:
  Step next_step(const std::string& cmd) {
    auto it = steps_.find(cmd);
    if (it != steps_.end() && !it->second.empty()) {
      Step s = std::move(it->second.front());
      it->second.pop_front();
      return s;
    }
    auto r = responders_.find(cmd);
    if (r != responders_.end()) {
      return Step{Action::REPLY, r->second()};
    }
    return Step{Action::SILENT, ""};
  }

  std::string name_;
  mutable std::mutex mtx_;
  bool open_{false};
  int failing_opens_{0};
  int open_count_{0};
  int close_count_{0};
  int failed_open_count_{0};
  std::map<std::string, std::deque<Step>> steps_;
  std::map<std::string, Responder> responders_;
  std::vector<std::string> written_;
  std::string pending_;
  bool pending_read_error_{false};
};

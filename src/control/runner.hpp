#pragma once
#include "acquisition.hpp"
#include "session.hpp"
#include "../core/log.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Runs the agent's acq process on a worker thread
 *
 * Each start() gets a fresh Session. Only one worker exists at a time; a
 * start while the previous session is unfinished is refused without touching
 * the running one.
 */
class ProcessRunner {
public:
  explicit ProcessRunner(PressureAgent& agent) : agent_(agent), log_("runner") {}

  ~ProcessRunner() { shutdown(); }

  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;

  OpResult start(const AcqParams& params) {
    std::lock_guard<std::mutex> g(mtx_);
    if (session_ && !session_->finished()) {
      return {false, "acq is already running"};
    }
    if (worker_.joinable()) worker_.join();

    auto session = std::make_shared<Session>("acq");
    session_ = session;
    worker_ = std::thread([this, session, params]() {
      OpResult r = agent_.acq(*session, params);
      session->finish(r);
      if (r.ok) {
        log_.info("acq: " + r.message);
      } else {
        log_.warn("acq: " + r.message);
      }
    });
    return {true, "Started acq"};
  }

  OpResult stop() { return agent_.stop_acq(); }

  /// Current (or last) acq session, null before the first start()
  std::shared_ptr<Session> session() const {
    std::lock_guard<std::mutex> g(mtx_);
    return session_;
  }

  /// Wait for the current session to finish; true if there is none
  bool wait(std::chrono::milliseconds timeout) const {
    auto s = session();
    return !s || s->wait_finished(timeout);
  }

  json status() const {
    auto s = session();
    json j = s ? s->to_json() : json{{"op_name", "acq"}, {"status", "idle"}};
    GaugeStatistics st = agent_.gauge().statistics();
    j["gauge"] = {
      {"port", agent_.gauge().port_name()},
      {"open", agent_.gauge().is_open()},
      {"total_reads", st.total_reads},
      {"invalid_reads", st.invalid_reads},
      {"io_errors", st.io_errors},
      {"connection_checks", st.connection_checks},
      {"failed_checks", st.failed_checks},
      {"reopens", st.reopens}
    };
    j["samples_published"] = agent_.samples_published();
    return j;
  }

  /// Stop the agent and join the worker
  void shutdown() {
    agent_.shutdown();
    std::thread w;
    {
      std::lock_guard<std::mutex> g(mtx_);
      w = std::move(worker_);
    }
    if (w.joinable()) w.join();
  }

private:
  PressureAgent& agent_;
  Logger log_;
  mutable std::mutex mtx_;
  std::shared_ptr<Session> session_;
  std::thread worker_;
};

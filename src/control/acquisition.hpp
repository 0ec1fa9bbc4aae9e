#pragma once
#include "session.hpp"
#include "../core/clock.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"
#include "../core/timeout_lock.hpp"
#include "../hw/hvg2020.hpp"
#include "../ipc/feed.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @brief Parameters of one acq run
 */
struct AcqParams {
  std::optional<double> sampling_frequency;  ///< Hz; agent default when unset
  bool test_mode{false};                     ///< Take exactly one sample, then exit
};

/**
 * @brief Agent-wide acquisition settings
 */
struct AgentSettings {
  double f_sample{2.5};                                    ///< Default sampling frequency in Hz
  std::chrono::nanoseconds loop_overhead{std::chrono::milliseconds(10)};  ///< Subtracted from each sample period
  std::string block_name{"pressure"};                      ///< Block name on the feed
};

/**
 * @brief Acquisition supervisor for one HVG-2020 gauge
 *
 * acq() runs the sampling loop:
 *   lock (non-blocking) -> check_connection -> { read -> publish -> wait }*
 *
 * Failures while sampling are classified:
 *  - unparseable reply: published with the sentinel, loop continues
 *  - SerialIOError with a successful re-check: loop continues
 *  - SerialIOError with a failed re-check: session ends, "Connection lost"
 *
 * stop_acq() is cooperative. It clears the running flag and closes the gauge;
 * the loop notices at the next iteration boundary. The inter-sample wait
 * wakes immediately on stop.
 */
class PressureAgent {
public:
  PressureAgent(std::unique_ptr<HVG2020Gauge> gauge, IFeed& feed, AgentSettings settings = AgentSettings{})
      : gauge_(std::move(gauge)), feed_(feed), settings_(std::move(settings)), log_("agent") {
    if (!gauge_) {
      throw std::invalid_argument("PressureAgent requires a gauge");
    }
  }

  PressureAgent(const PressureAgent&) = delete;
  PressureAgent& operator=(const PressureAgent&) = delete;

  /**
   * @brief Run the acquisition loop until stopped or the connection is lost
   * @param session Receives status and the latest fields
   * @param params Sampling frequency and test mode
   * @return ok=false with a reason if rejected, not connected, or disconnected
   */
  OpResult acq(Session& session, const AcqParams& params = AcqParams{}) {
    double f_sample = params.sampling_frequency.value_or(settings_.f_sample);
    if (!(f_sample > 0.0) || !std::isfinite(f_sample)) {
      return {false, "Invalid sampling frequency " + std::to_string(f_sample)};
    }
    auto sleep_time = SampleClock::sleep_time(f_sample, settings_.loop_overhead);

    auto guard = lock_.acquire_timeout(std::chrono::milliseconds(0), "acq");
    if (!guard) {
      std::string holder = lock_.job();
      if (holder.empty()) holder = "another operation";
      log_.warn("Could not start acq because " + holder + " is already running");
      return {false, "Could not acquire lock: " + holder + " is already running"};
    }

    session.set_status("running");
    session.reset_data();

    if (!gauge_->check_connection()) {
      log_.error("Could not connect with pressure gauge on " + gauge_->port_name() +
                 ". Check that the port name is correct.");
      gauge_->close();
      return {false, "Could not connect to pressure gauge"};
    }
    log_.info("Connected to HVG-2020 on " + gauge_->port_name() + ", sampling at " +
              std::to_string(f_sample) + " Hz");

    {
      std::lock_guard<std::mutex> g(wait_mtx_);
      take_data_.store(true);
    }

    OpResult result;
    try {
      result = run_loop(session, sleep_time, params.test_mode);
    } catch (const std::exception& e) {
      log_.error(std::string("acquisition aborted: ") + e.what());
      result = {false, std::string("Acquisition aborted: ") + e.what()};
    }

    take_data_.store(false);
    try {
      feed_.flush();
    } catch (const std::exception& e) {
      log_.error(std::string("feed flush failed: ") + e.what());
    }
    gauge_->close();
    log_.info("acq finished: " + result.message);
    return result;
  }

  /**
   * @brief Ask a running acq to stop
   * @return ok=false if acq is not in its sampling loop
   */
  OpResult stop_acq() {
    {
      std::lock_guard<std::mutex> g(wait_mtx_);
      if (!take_data_.exchange(false)) {
        return {false, "Acq is not currently running."};
      }
    }
    wake_cv_.notify_all();
    gauge_->close();
    log_.info("stop requested, port is now " + std::string(gauge_->is_open() ? "open" : "closed"));
    return {true, "Requested to stop taking data."};
  }

  /**
   * @brief Make any current and future acq exit at the next boundary
   *
   * Unlike stop_acq() this also catches a run still validating the connection.
   */
  void shutdown() {
    {
      std::lock_guard<std::mutex> g(wait_mtx_);
      shutdown_.store(true);
      take_data_.store(false);
    }
    wake_cv_.notify_all();
  }

  bool is_running() const { return take_data_.load(); }
  uint64_t samples_published() const { return samples_published_.load(); }

  HVG2020Gauge& gauge() { return *gauge_; }
  const HVG2020Gauge& gauge() const { return *gauge_; }
  TimeoutLock& lock() { return lock_; }
  const AgentSettings& settings() const { return settings_; }

private:
  OpResult run_loop(Session& session, std::chrono::nanoseconds sleep_time, bool test_mode) {
    while (take_data_.load() && !shutdown_.load()) {
      PressureSample sample;
      try {
        sample = gauge_->read_pressure();
      } catch (const SerialIOError&) {
        if (gauge_->check_connection()) {
          log_.warn("read/write I/O error, trying again");
          continue;
        }
        log_.error("connection to pressure gauge lost");
        return {false, "Connection lost"};
      } catch (const GaugeNotOpenError& e) {
        // stop_acq() closed the port between the loop check and the read
        if (!take_data_.load()) break;
        throw;
      }

      FeedBlock block;
      block.timestamp = sample.timestamp;
      block.block_name = settings_.block_name;
      block.data = {{"pressure", sample.pressure_mbar}};
      feed_.publish(block);
      samples_published_.fetch_add(1);

      session.update_fields({{"pressure", sample.pressure_mbar}, {"timestamp", sample.timestamp}});
      log_.debug(sample.to_string());

      if (test_mode) break;
      wait_next(sleep_time);
    }
    return {true, "Acquisition exited cleanly"};
  }

  void wait_next(std::chrono::nanoseconds sleep_time) {
    std::unique_lock<std::mutex> lk(wait_mtx_);
    wake_cv_.wait_for(lk, sleep_time, [this]() { return !take_data_.load() || shutdown_.load(); });
  }

  std::unique_ptr<HVG2020Gauge> gauge_;
  IFeed& feed_;
  AgentSettings settings_;
  Logger log_;

  TimeoutLock lock_;
  std::atomic<bool> take_data_{false};
  std::atomic<bool> shutdown_{false};
  std::atomic<uint64_t> samples_published_{0};
  std::mutex wait_mtx_;
  std::condition_variable wake_cv_;
};

#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Outcome of an agent operation
 */
struct OpResult {
  bool ok{false};
  std::string message;
};

/**
 * @brief Externally visible state of one operation run
 *
 * The acquisition loop writes the latest values into data["fields"]; other
 * threads read snapshots. This is a view for inspection, not a data record.
 */
class Session {
public:
  explicit Session(std::string op_name = "acq") : op_name_(std::move(op_name)) {}

  void set_status(const std::string& status) {
    std::lock_guard<std::mutex> g(mtx_);
    status_ = status;
  }

  std::string status() const {
    std::lock_guard<std::mutex> g(mtx_);
    return status_;
  }

  /// Replace data with {"fields": {}}
  void reset_data() {
    std::lock_guard<std::mutex> g(mtx_);
    data_ = {{"fields", json::object()}};
  }

  /// Merge @p fields into data["fields"]
  void update_fields(const json& fields) {
    std::lock_guard<std::mutex> g(mtx_);
    data_["fields"].update(fields);
  }

  json data() const {
    std::lock_guard<std::mutex> g(mtx_);
    return data_;
  }

  /// Record the final result and wake waiters
  void finish(const OpResult& result) {
    {
      std::lock_guard<std::mutex> g(mtx_);
      status_ = "done";
      finished_ = true;
      result_ = result;
    }
    done_cv_.notify_all();
  }

  bool finished() const {
    std::lock_guard<std::mutex> g(mtx_);
    return finished_;
  }

  OpResult result() const {
    std::lock_guard<std::mutex> g(mtx_);
    return result_;
  }

  /**
   * @brief Block until finish() or timeout
   * @return true if the session finished
   */
  bool wait_finished(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return done_cv_.wait_for(lk, timeout, [this]() { return finished_; });
  }

  json to_json() const {
    std::lock_guard<std::mutex> g(mtx_);
    json j = {{"op_name", op_name_}, {"status", status_}, {"data", data_}};
    if (finished_) {
      j["success"] = result_.ok;
      j["message"] = result_.message;
    } else {
      j["success"] = nullptr;
    }
    return j;
  }

private:
  std::string op_name_;
  mutable std::mutex mtx_;
  mutable std::condition_variable done_cv_;
  std::string status_{"starting"};
  json data_ = {{"fields", json::object()}};
  bool finished_{false};
  OpResult result_;
};

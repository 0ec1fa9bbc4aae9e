#pragma once
#include "../core/log.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief One timestamped data block on a feed
 *
 * Serialized as {"timestamp": <sec>, "block_name": <name>, "data": {...}}.
 */
struct FeedBlock {
  double timestamp{0.0};   ///< Wall-clock seconds since epoch
  std::string block_name;  ///< Groups blocks with the same fields
  json data;               ///< Field name -> value

  json to_json() const {
    return {{"timestamp", timestamp}, {"block_name", block_name}, {"data", data}};
  }
};

/**
 * @brief Sink for acquired data
 *
 * Injected into the acquisition agent; implementations decide how blocks are
 * buffered and where they go.
 */
class IFeed {
public:
  virtual ~IFeed() = default;

  /// Accept one block; blocks arrive in sampling order
  virtual void publish(const FeedBlock& block) = 0;

  /// Push out anything still buffered
  virtual void flush() = 0;

  virtual std::string name() const = 0;
};

/**
 * @brief Feed that batches blocks into frames
 *
 * Blocks are buffered until the oldest one is frame_length old, then sent as
 * a single frame {"feed": <name>, "blocks": [...]} through the publisher.
 * flush() sends the partial frame immediately. A block stamped earlier than
 * the previous one (wall clock stepped back) is kept and counted in
 * clock_steps().
 *
 * @tparam Pub anything with bool send(const std::string& topic, const std::string& body)
 */
template<class Pub>
class AggregatedFeed : public IFeed {
public:
  static constexpr std::chrono::seconds DEFAULT_FRAME_LENGTH{60};

  AggregatedFeed(std::string feed_name, Pub& pub,
                 std::chrono::milliseconds frame_length = DEFAULT_FRAME_LENGTH)
      : name_(std::move(feed_name)), pub_(pub), frame_length_(frame_length), log_("feed." + name_) {}

  void publish(const FeedBlock& block) override {
    std::lock_guard<std::mutex> g(mtx_);
    if (have_last_ && block.timestamp < last_timestamp_) {
      clock_steps_++;
      log_.warn("wall clock stepped back " + std::to_string(last_timestamp_ - block.timestamp) +
                " s, keeping block at t=" + std::to_string(block.timestamp));
    }
    last_timestamp_ = block.timestamp;
    have_last_ = true;

    if (buffer_.empty()) frame_start_ = std::chrono::steady_clock::now();
    buffer_.push_back(block);

    if (std::chrono::steady_clock::now() - frame_start_ >= frame_length_) {
      emit_locked();
    }
  }

  void flush() override {
    std::lock_guard<std::mutex> g(mtx_);
    emit_locked();
  }

  std::string name() const override { return name_; }

  std::size_t buffered() const {
    std::lock_guard<std::mutex> g(mtx_);
    return buffer_.size();
  }

  uint64_t frames_sent() const {
    std::lock_guard<std::mutex> g(mtx_);
    return frames_sent_;
  }

  /// Blocks that arrived with a timestamp before their predecessor's
  uint64_t clock_steps() const {
    std::lock_guard<std::mutex> g(mtx_);
    return clock_steps_;
  }

private:
  void emit_locked() {
    if (buffer_.empty()) return;

    json blocks = json::array();
    for (const auto& b : buffer_) blocks.push_back(b.to_json());
    json frame = {{"feed", name_}, {"blocks", blocks}};

    if (pub_.send(name_, frame.dump())) {
      frames_sent_++;
      log_.debug("sent frame with " + std::to_string(buffer_.size()) + " blocks");
    } else {
      log_.warn("publisher rejected frame with " + std::to_string(buffer_.size()) + " blocks");
    }
    buffer_.clear();
  }

  std::string name_;
  Pub& pub_;
  std::chrono::milliseconds frame_length_;
  Logger log_;

  mutable std::mutex mtx_;
  std::vector<FeedBlock> buffer_;
  std::chrono::steady_clock::time_point frame_start_;
  double last_timestamp_{0.0};
  bool have_last_{false};
  uint64_t frames_sent_{0};
  uint64_t clock_steps_{0};
};

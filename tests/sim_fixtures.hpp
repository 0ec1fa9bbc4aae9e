#pragma once
#include "../src/hw/hvg2020.hpp"
#include "../src/hw/sim_gauge_port.hpp"
#include "../src/ipc/feed.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Shared helpers for tests that drive a simulated gauge
 */
namespace Fixtures {

/// Device timing with the delays cut down for tests
inline GaugeTiming fast_timing() {
    GaugeTiming t;
    t.settle_delay = std::chrono::milliseconds(0);
    t.cooldown = std::chrono::milliseconds(10);
    return t;
}

/**
 * @brief Simulated gauge wired to a controller
 *
 * The controller owns the port; `port` stays valid for as long as the
 * controller (or whoever it was moved into) is alive.
 */
struct SimGauge {
    SimGaugePort* port{nullptr};
    std::unique_ptr<HVG2020Gauge> gauge;
};

inline SimGauge make_sim_gauge(const std::string& pressure_reply = "980.3\r>",
                               const std::string& identify_reply = "HVG-2020B\r>",
                               GaugeTiming timing = fast_timing()) {
    auto sim = std::make_unique<SimGaugePort>("SIM0");
    sim->set_response("p\r\n", pressure_reply);
    sim->set_response("s1\r\n", identify_reply);
    SimGauge out;
    out.port = sim.get();
    out.gauge = std::make_unique<HVG2020Gauge>(std::move(sim), timing);
    return out;
}

/**
 * @brief In-memory feed recording every block and flush
 */
class MockFeed : public IFeed {
public:
    void publish(const FeedBlock& block) override {
        {
            std::lock_guard<std::mutex> g(mtx_);
            blocks_.push_back(block);
        }
        cv_.notify_all();
    }

    void flush() override {
        std::lock_guard<std::mutex> g(mtx_);
        flushes_++;
    }

    std::string name() const override { return "pressure"; }

    std::vector<FeedBlock> blocks() const {
        std::lock_guard<std::mutex> g(mtx_);
        return blocks_;
    }

    std::size_t count() const {
        std::lock_guard<std::mutex> g(mtx_);
        return blocks_.size();
    }

    int flushes() const {
        std::lock_guard<std::mutex> g(mtx_);
        return flushes_;
    }

    /// Wait until at least @p n blocks arrived
    bool wait_for(std::size_t n, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [&]() { return blocks_.size() >= n; });
    }

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::vector<FeedBlock> blocks_;
    int flushes_{0};
};

/**
 * @brief Poll @p pred every millisecond until true or timeout
 */
template<typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}

}  // namespace Fixtures

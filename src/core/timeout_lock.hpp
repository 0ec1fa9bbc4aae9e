#pragma once
#include <chrono>
#include <mutex>
#include <string>

/**
 * @brief Named exclusivity lock with timed acquisition
 *
 * Guards operations that must not overlap (one acquisition loop per gauge).
 * The name of the current holder is kept so a rejected caller can report who
 * is in the way. A zero timeout makes acquisition a single non-blocking try.
 */
class TimeoutLock {
public:
    /**
     * @brief RAII holder returned by acquire_timeout()
     *
     * Converts to true if the lock was obtained; releases it on destruction.
     */
    class Guard {
    public:
        Guard(Guard&& other) noexcept : lock_(other.lock_), acquired_(other.acquired_) {
            other.acquired_ = false;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        ~Guard() { release(); }

        explicit operator bool() const { return acquired_; }
        bool acquired() const { return acquired_; }

        /// Release early; later calls and the destructor do nothing
        void release() {
            if (acquired_) {
                lock_.release();
                acquired_ = false;
            }
        }

    private:
        friend class TimeoutLock;
        Guard(TimeoutLock& lock, bool acquired) : lock_(lock), acquired_(acquired) {}

        TimeoutLock& lock_;
        bool acquired_;
    };

    TimeoutLock() = default;
    TimeoutLock(const TimeoutLock&) = delete;
    TimeoutLock& operator=(const TimeoutLock&) = delete;

    /**
     * @brief Try to take the lock, waiting at most @p timeout
     * @param timeout Zero for a single non-blocking attempt
     * @param job Name recorded as the holder on success
     */
    Guard acquire_timeout(std::chrono::milliseconds timeout, const std::string& job) {
        bool ok = timeout.count() <= 0 ? mtx_.try_lock() : mtx_.try_lock_for(timeout);
        if (ok) {
            std::lock_guard<std::mutex> g(job_mtx_);
            job_ = job;
        }
        return Guard(*this, ok);
    }

    /**
     * @brief Name of the current holder, empty if free
     */
    std::string job() const {
        std::lock_guard<std::mutex> g(job_mtx_);
        return job_;
    }

private:
    void release() {
        {
            std::lock_guard<std::mutex> g(job_mtx_);
            job_.clear();
        }
        mtx_.unlock();
    }

    std::timed_mutex mtx_;
    mutable std::mutex job_mtx_;
    std::string job_;
};

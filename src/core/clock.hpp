#pragma once
#include <chrono>

/**
 * @brief Timing helpers for the sampling loop
 *
 * Samples carry wall-clock timestamps (seconds since the Unix epoch) so they
 * line up with the rest of the data pipeline, while intervals are measured on
 * the steady clock.
 */
struct SampleClock {
    using clock = std::chrono::steady_clock;

    /**
     * @brief Current wall-clock time in seconds since the epoch
     */
    static double wall_time() {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    }

    /// Longest wait sleep_time() returns
    static constexpr std::chrono::hours MAX_SLEEP{24};

    /**
     * @brief Wait between two samples
     * @param f_sample Sampling frequency in Hz (must be > 0)
     * @param overhead Time already spent per iteration outside the wait
     * @return max(0, 1/f_sample - overhead), capped at MAX_SLEEP
     */
    static std::chrono::nanoseconds sleep_time(double f_sample, std::chrono::nanoseconds overhead) {
        // In floating point: 1/f for a tiny f does not fit in integer nanoseconds
        std::chrono::duration<double> wait =
            std::chrono::duration<double>(1.0 / f_sample) - std::chrono::duration<double>(overhead);
        if (!(wait > std::chrono::duration<double>::zero())) return std::chrono::nanoseconds::zero();
        if (wait >= std::chrono::duration<double>(MAX_SLEEP)) return MAX_SLEEP;
        return std::chrono::duration_cast<std::chrono::nanoseconds>(wait);
    }
};

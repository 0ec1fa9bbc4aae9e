#pragma once
#include <cstdio>
#include <string>

/**
 * @brief One pressure reading from the gauge
 *
 * A reading whose line could not be parsed carries INVALID_PRESSURE instead of
 * a value. It is still a reading: it gets published, and consumers filter on
 * the sentinel.
 */
struct PressureSample {
    static constexpr double INVALID_PRESSURE = -99.0;  ///< Sentinel for unparseable lines

    double pressure_mbar{INVALID_PRESSURE};  ///< Pressure in mbar, or the sentinel
    double timestamp{0.0};                   ///< Wall-clock capture time, seconds since epoch
    std::string raw;                         ///< Response text after framing was stripped

    PressureSample() = default;
    PressureSample(double p, double t, std::string r)
        : pressure_mbar(p), timestamp(t), raw(std::move(r)) {}

    bool is_valid() const { return pressure_mbar != INVALID_PRESSURE; }

    std::string to_string() const {
        char buffer[160];
        std::snprintf(buffer, sizeof(buffer),
            "PressureSample{t=%.3f, p=%gmbar, %s}",
            timestamp, pressure_mbar, is_valid() ? "OK" : "INVALID");
        return std::string(buffer);
    }
};

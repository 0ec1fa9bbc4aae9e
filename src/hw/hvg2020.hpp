#pragma once
#include "iserial_port.hpp"
#include "../core/clock.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"
#include "../core/sample.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * @brief Protocol timing and recovery policy for the HVG-2020
 *
 * Defaults match the device. Tests shorten the delays.
 */
struct GaugeTiming {
    std::chrono::milliseconds settle_delay{100};   ///< Wait between "p" and reading the reply
    std::chrono::milliseconds cooldown{5000};      ///< Port closed this long before a recovery reopen
    int identify_attempts{3};                      ///< Signature probes per connection check
    bool verify_after_reopen{false};               ///< Re-probe the signature after a recovery reopen
};

/**
 * @brief Counters kept by the gauge controller
 */
struct GaugeStatistics {
    uint64_t total_reads{0};        ///< read_pressure() calls that reached the device
    uint64_t invalid_reads{0};      ///< Replies that did not parse as a number
    uint64_t io_errors{0};          ///< SerialIOError seen during reads or probes
    uint64_t connection_checks{0};  ///< check_connection() calls
    uint64_t failed_checks{0};      ///< check_connection() calls that reported not connected
    uint64_t reopens{0};            ///< Successful reopens of a closed port
};

/**
 * @brief Controller for a Teledyne HVG-2020 pressure gauge
 *
 * Owns the serial port and speaks the gauge's line protocol:
 *  - "p\r\n"  -> one pressure line in mbar
 *  - "s1\r\n" -> identification line starting with "HVG-2020"
 * Replies end in "\r>", which is removed before interpretation.
 *
 * Two failure classes are kept apart:
 *  - a reply that is not a number is a data anomaly; the sample carries
 *    PressureSample::INVALID_PRESSURE and nothing is thrown
 *  - a port that cannot be written or read raises SerialIOError, which
 *    check_connection() handles by probing and reopening
 *
 * All port access is serialized, so close() from another thread waits for an
 * exchange in progress.
 */
class HVG2020Gauge {
public:
    static constexpr const char* READ_PRESSURE_CMD = "p\r\n";
    static constexpr const char* IDENTIFY_CMD = "s1\r\n";
    static constexpr const char* DEVICE_SIGNATURE = "HVG-2020";
    static constexpr const char* RESPONSE_TERMINATOR = "\r>";

    /**
     * @brief Take ownership of @p port and open it
     * @throws GaugeConnectionError if the port cannot be opened
     */
    explicit HVG2020Gauge(std::unique_ptr<ISerialPort> port, GaugeTiming timing = GaugeTiming{})
        : port_(std::move(port)), timing_(timing), log_("hvg2020") {
        if (!port_) {
            throw std::invalid_argument("HVG2020Gauge requires a serial port");
        }
        try {
            open_port_locked();
        } catch (const SerialIOError& e) {
            throw GaugeConnectionError(std::string("could not open pressure gauge: ") + e.what());
        }
    }

    ~HVG2020Gauge() { close(); }

    HVG2020Gauge(const HVG2020Gauge&) = delete;
    HVG2020Gauge& operator=(const HVG2020Gauge&) = delete;

    /**
     * @brief Ask the gauge for one pressure reading
     * @return Sample stamped when the command was sent; the sentinel value if
     *         the reply did not parse
     * @throws SerialIOError if the port cannot be written or read
     * @throws GaugeNotOpenError if the port is closed
     */
    PressureSample read_pressure() {
        std::lock_guard<std::mutex> g(io_mtx_);
        if (!port_->is_open()) {
            throw GaugeNotOpenError("read_pressure on closed port " + port_->name());
        }

        double t = SampleClock::wall_time();
        std::string body;
        try {
            port_->write(READ_PRESSURE_CMD);
            std::this_thread::sleep_for(timing_.settle_delay);
            body = strip_response(port_->read_line());
        } catch (const SerialIOError& e) {
            bump(&GaugeStatistics::io_errors);
            log_.warn(std::string("pressure read failed: ") + e.what());
            throw;
        }
        bump(&GaugeStatistics::total_reads);

        bool ok = false;
        double p = parse_pressure(body, ok);
        if (!ok) {
            bump(&GaugeStatistics::invalid_reads);
            log_.warn("unparseable pressure reply \"" + printable(body) + "\"");
        }
        return PressureSample(p, t, body);
    }

    /**
     * @brief Verify the link is up and talking to an HVG-2020
     *
     * Reopens a closed port once, then probes the identification signature.
     * An I/O error during the probe switches to the cool-down reopen.
     */
    bool check_connection() {
        std::lock_guard<std::mutex> g(io_mtx_);
        bump(&GaugeStatistics::connection_checks);
        bool ok = check_connection_locked();
        if (!ok) bump(&GaugeStatistics::failed_checks);
        return ok;
    }

    /// Close the port; safe to call repeatedly
    void close() {
        std::lock_guard<std::mutex> g(io_mtx_);
        close_port_locked();
    }

    /// Does not wait for an exchange or recovery in progress
    bool is_open() const { return open_.load(); }

    std::string port_name() const { return port_->name(); }

    const GaugeTiming& timing() const { return timing_; }

    /// Snapshot of the counters; does not wait for an exchange or recovery in progress
    GaugeStatistics statistics() const {
        std::lock_guard<std::mutex> g(stats_mtx_);
        return stats_;
    }

    /**
     * @brief Remove every "\r>" framing artifact from a reply
     */
    static std::string strip_response(std::string line) {
        const std::string term(RESPONSE_TERMINATOR);
        std::string::size_type pos = 0;
        while ((pos = line.find(term, pos)) != std::string::npos) {
            line.erase(pos, term.size());
        }
        return line;
    }

    /**
     * @brief Parse a stripped reply as a pressure in mbar
     * @param body Reply text; surrounding whitespace is ignored
     * @param ok Set to whether the whole body was a number
     * @return The value, or PressureSample::INVALID_PRESSURE
     */
    static double parse_pressure(const std::string& body, bool& ok) {
        ok = false;
        auto first = body.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return PressureSample::INVALID_PRESSURE;
        auto last = body.find_last_not_of(" \t\r\n");
        std::string s = body.substr(first, last - first + 1);

        // strtod accepts hex floats, the gauge never sends them
        if (s.find_first_of("xX") != std::string::npos) return PressureSample::INVALID_PRESSURE;

        errno = 0;
        char* end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size() || errno == ERANGE) {
            return PressureSample::INVALID_PRESSURE;
        }
        ok = true;
        return v;
    }

    static double parse_pressure(const std::string& body) {
        bool ok;
        return parse_pressure(body, ok);
    }

private:
    bool check_connection_locked() {
        if (!port_->is_open()) {
            try {
                open_port_locked();
                bump(&GaugeStatistics::reopens);
            } catch (const SerialIOError& e) {
                log_.error(e.what());
                return false;
            }
        }

        try {
            return probe_signature();
        } catch (const SerialIOError& e) {
            bump(&GaugeStatistics::io_errors);
            log_.warn(e.what());
            return cooldown_reopen();
        }
    }

    // Bounded probing: success needs a signature match within identify_attempts
    bool probe_signature() {
        const std::string signature(DEVICE_SIGNATURE);
        for (int i = 0; i < timing_.identify_attempts; ++i) {
            log_.debug("connection check " + std::to_string(i));
            port_->write(IDENTIFY_CMD);
            std::string reply = strip_response(port_->read_line());
            log_.debug("received \"" + printable(reply) + "\"");
            if (reply.size() >= signature.size() && reply.compare(0, signature.size(), signature) == 0) {
                if (i > 0) log_.info("connection check passed on attempt " + std::to_string(i + 1));
                return true;
            }
        }
        log_.warn("no " + signature + " signature after " +
                  std::to_string(timing_.identify_attempts) + " attempts");
        return false;
    }

    // Single-shot recovery: success needs only the reopen, unless verify_after_reopen is set
    bool cooldown_reopen() {
        log_.warn("closing port for " + std::to_string(timing_.cooldown.count()) + " ms to reset");
        close_port_locked();
        std::this_thread::sleep_for(timing_.cooldown);
        log_.info("reopening port");
        try {
            open_port_locked();
            bump(&GaugeStatistics::reopens);
        } catch (const SerialIOError& e) {
            log_.error(e.what());
            return false;
        }
        if (!timing_.verify_after_reopen) return true;

        try {
            return probe_signature();
        } catch (const SerialIOError& e) {
            bump(&GaugeStatistics::io_errors);
            log_.error(std::string("probe after reopen failed: ") + e.what());
            return false;
        }
    }

    // The open flag and counters are readable while io_mtx_ is held through a cool-down
    void open_port_locked() {
        port_->open();
        open_.store(true);
    }

    void close_port_locked() {
        port_->close();
        open_.store(false);
    }

    void bump(uint64_t GaugeStatistics::*counter) {
        std::lock_guard<std::mutex> g(stats_mtx_);
        ++(stats_.*counter);
    }

    static std::string printable(const std::string& s) {
        std::string out;
        for (char c : s) {
            if (c == '\r') out += "\\r";
            else if (c == '\n') out += "\\n";
            else if (std::isprint(static_cast<unsigned char>(c))) out.push_back(c);
            else out += "?";
        }
        return out;
    }

    std::unique_ptr<ISerialPort> port_;
    GaugeTiming timing_;
    Logger log_;
    mutable std::mutex io_mtx_;
    std::atomic<bool> open_{false};
    mutable std::mutex stats_mtx_;
    GaugeStatistics stats_;
};

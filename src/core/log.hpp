#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Minimal leveled logger
 *
 * Each component holds a Logger tagged with its name. Lines go to std::cout
 * (warn and error to std::cerr) unless a sink is installed, in which case the
 * sink receives the formatted line instead.
 */
class Logger {
public:
    enum class Level { DEBUG = 0, INFO, WARN, ERROR };

    using Sink = std::function<void(Level, const std::string&)>;

    explicit Logger(std::string name) : name_(std::move(name)) {}

    void debug(const std::string& msg) const { write(Level::DEBUG, msg); }
    void info(const std::string& msg) const { write(Level::INFO, msg); }
    void warn(const std::string& msg) const { write(Level::WARN, msg); }
    void error(const std::string& msg) const { write(Level::ERROR, msg); }

    const std::string& name() const { return name_; }

    /**
     * @brief Set the process-wide minimum level
     */
    static void set_level(Level level) {
        std::lock_guard<std::mutex> g(state().mtx);
        state().min_level = level;
    }

    /**
     * @brief Install (or clear, with nullptr) a process-wide sink
     */
    static void set_sink(Sink sink) {
        std::lock_guard<std::mutex> g(state().mtx);
        state().sink = std::move(sink);
    }

    /**
     * @brief Parse "debug", "info", "warn" or "error"
     * @return false if the name is not recognised
     */
    static bool parse_level(const std::string& s, Level& out) {
        if (s == "debug") { out = Level::DEBUG; return true; }
        if (s == "info")  { out = Level::INFO;  return true; }
        if (s == "warn")  { out = Level::WARN;  return true; }
        if (s == "error") { out = Level::ERROR; return true; }
        return false;
    }

    static const char* level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO";
            case Level::WARN:  return "WARN";
            case Level::ERROR: return "ERROR";
            default: return "?";
        }
    }

private:
    struct State {
        std::mutex mtx;
        Level min_level{Level::INFO};
        Sink sink;
    };

    static State& state() {
        static State s;
        return s;
    }

    void write(Level level, const std::string& msg) const {
        State& s = state();
        std::lock_guard<std::mutex> g(s.mtx);
        if (level < s.min_level) return;

        std::string line = timestamp() + " [" + name_ + "] " + level_to_string(level) + ": " + msg;
        if (s.sink) {
            s.sink(level, line);
        } else if (level >= Level::WARN) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d",
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms));
        return std::string(buf);
    }

    std::string name_;
};

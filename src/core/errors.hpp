#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Exception types for the gauge agent
 *
 * Runtime faults derive from std::runtime_error, misuse from std::logic_error.
 * Unparseable readings are not errors and never appear here.
 */

/// Serial transport could not be opened, written or read
struct SerialIOError : std::runtime_error {
  explicit SerialIOError(const std::string& what) : std::runtime_error(what) {}
};

/// The gauge could not be opened when the controller was constructed
struct GaugeConnectionError : std::runtime_error {
  explicit GaugeConnectionError(const std::string& what) : std::runtime_error(what) {}
};

/// A reading was requested on a closed connection
struct GaugeNotOpenError : std::logic_error {
  explicit GaugeNotOpenError(const std::string& what) : std::logic_error(what) {}
};

/// Invalid configuration value or command line
struct ConfigError : std::runtime_error {
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

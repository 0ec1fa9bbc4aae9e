#pragma once
#include "errors.hpp"
#include "log.hpp"
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Agent configuration
 *
 * Built from an optional JSON file (--config) and then command-line flags,
 * which take precedence. JSON keys use the flag names without dashes, with
 * '-' replaced by '_' (e.g. "sampling_frequency", "verify_after_reopen").
 */
struct AgentConfig {
  std::string port;                                  ///< Serial device path (required unless simulate)
  int baud{19200};                                   ///< Serial baud rate
  double sampling_frequency{2.5};                    ///< Hz
  bool test_mode{false};                             ///< --mode test: one sample, then exit
  bool simulate{false};                              ///< Use the simulated gauge
  bool verify_after_reopen{false};                   ///< Re-probe identity after a recovery reopen
  std::string telemetry_address{"tcp://127.0.0.1:5556"};
  std::string control_address{"tcp://127.0.0.1:5555"};
  Logger::Level log_level{Logger::Level::INFO};
  bool show_help{false};

  /**
   * @brief Parse the command line
   * @throws ConfigError on unknown flags, missing values or bad numbers
   */
  static AgentConfig from_args(int argc, const char* const argv[]) {
    AgentConfig cfg;

    // --config is applied first so the remaining flags override it
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--config") {
        if (i + 1 >= argc) throw ConfigError("--config requires a value");
        cfg.apply_json(load_json_file(argv[i + 1]));
      } else if (a.rfind("--config=", 0) == 0) {
        cfg.apply_json(load_json_file(a.substr(9)));
      }
    }

    for (int i = 1; i < argc; ++i) {
      std::string key = argv[i];
      std::string value;
      bool has_inline = false;

      if (key == "-h") {
        cfg.show_help = true;
        continue;
      }
      if (key.rfind("--", 0) != 0) throw ConfigError("unexpected argument '" + key + "'");
      auto eq = key.find('=');
      if (eq != std::string::npos) {
        value = key.substr(eq + 1);
        key = key.substr(0, eq);
        has_inline = true;
      }

      auto next_value = [&]() -> std::string {
        if (has_inline) return value;
        if (i + 1 >= argc) throw ConfigError(key + " requires a value");
        return argv[++i];
      };

      if (key == "--help") {
        cfg.show_help = true;
      } else if (key == "--config") {
        next_value();
      } else if (key == "--port") {
        cfg.port = next_value();
      } else if (key == "--baud") {
        cfg.baud = parse_int(key, next_value());
      } else if (key == "--sampling_frequency" || key == "--sampling-frequency") {
        cfg.sampling_frequency = parse_double(key, next_value());
      } else if (key == "--mode") {
        cfg.set_mode(next_value());
      } else if (key == "--simulate") {
        cfg.simulate = true;
      } else if (key == "--verify-after-reopen") {
        cfg.verify_after_reopen = true;
      } else if (key == "--telemetry") {
        cfg.telemetry_address = next_value();
      } else if (key == "--control") {
        cfg.control_address = next_value();
      } else if (key == "--log-level") {
        cfg.set_log_level(next_value());
      } else {
        throw ConfigError("unknown option '" + key + "'");
      }
    }
    return cfg;
  }

  /**
   * @brief Overlay values from a JSON object
   * @throws ConfigError if a value has the wrong type
   */
  void apply_json(const json& j) {
    if (!j.is_object()) throw ConfigError("configuration must be a JSON object");
    try {
      if (j.contains("port")) port = j.at("port").get<std::string>();
      if (j.contains("baud")) baud = json_int("baud", j.at("baud"));
      if (j.contains("sampling_frequency")) sampling_frequency = j.at("sampling_frequency").get<double>();
      if (j.contains("mode")) set_mode(j.at("mode").get<std::string>());
      if (j.contains("simulate")) simulate = j.at("simulate").get<bool>();
      if (j.contains("verify_after_reopen")) verify_after_reopen = j.at("verify_after_reopen").get<bool>();
      if (j.contains("telemetry")) telemetry_address = j.at("telemetry").get<std::string>();
      if (j.contains("control")) control_address = j.at("control").get<std::string>();
      if (j.contains("log_level")) set_log_level(j.at("log_level").get<std::string>());
    } catch (const json::exception& e) {
      throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
  }

  /**
   * @brief Reject configurations the agent cannot run with
   * @throws ConfigError
   */
  void validate() const {
    if (port.empty() && !simulate) throw ConfigError("--port is required");
    if (baud <= 0) throw ConfigError("baud rate must be positive");
    if (!(sampling_frequency > 0.0) || !std::isfinite(sampling_frequency)) {
      throw ConfigError("sampling frequency must be a positive number of Hz");
    }
  }

  static std::string usage() {
    return
      "Usage: hvg_gauge_agent --port <device> [options]\n"
      "  --port <device>              serial device of the HVG-2020 gauge\n"
      "  --baud <rate>                baud rate (default 19200)\n"
      "  --sampling_frequency <hz>    samples per second (default 2.5)\n"
      "  --mode acq|test              test takes a single sample and exits (default acq)\n"
      "  --config <file.json>         load options from a JSON file\n"
      "  --simulate                   use a simulated gauge instead of a serial port\n"
      "  --verify-after-reopen        re-check gauge identity after a recovery reopen\n"
      "  --telemetry <endpoint>       ZeroMQ PUB endpoint (default tcp://127.0.0.1:5556)\n"
      "  --control <endpoint>         ZeroMQ REP endpoint (default tcp://127.0.0.1:5555)\n"
      "  --log-level debug|info|warn|error\n";
  }

private:
  void set_mode(const std::string& mode) {
    if (mode == "acq") test_mode = false;
    else if (mode == "test") test_mode = true;
    else throw ConfigError("mode must be 'acq' or 'test', got '" + mode + "'");
  }

  void set_log_level(const std::string& name) {
    if (!Logger::parse_level(name, log_level)) throw ConfigError("unknown log level '" + name + "'");
  }

  static json load_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("could not read configuration file " + path);
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw ConfigError("configuration file " + path + " is not valid JSON");
    return j;
  }

  static int parse_int(const std::string& key, const std::string& v) {
    char* end = nullptr;
    errno = 0;
    long n = std::strtol(v.c_str(), &end, 10);
    if (v.empty() || *end != '\0') throw ConfigError(key + " expects an integer, got '" + v + "'");
    if (errno == ERANGE || n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
      throw ConfigError(key + " is out of range: '" + v + "'");
    }
    return static_cast<int>(n);
  }

  // get<int>() would truncate 9600.5 and wrap values past INT_MAX
  static int json_int(const std::string& key, const json& v) {
    if (!v.is_number_integer()) throw ConfigError(key + " expects an integer, got " + v.dump());
    if (v.is_number_unsigned()) {
      auto u = v.get<uint64_t>();
      if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw ConfigError(key + " is out of range: " + v.dump());
      }
      return static_cast<int>(u);
    }
    auto n = v.get<int64_t>();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
      throw ConfigError(key + " is out of range: " + v.dump());
    }
    return static_cast<int>(n);
  }

  static double parse_double(const std::string& key, const std::string& v) {
    char* end = nullptr;
    double d = std::strtod(v.c_str(), &end);
    if (v.empty() || *end != '\0') throw ConfigError(key + " expects a number, got '" + v + "'");
    return d;
  }
};

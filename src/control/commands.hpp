#pragma once
#include "runner.hpp"
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace detail {
inline std::string op_reply(const OpResult& r) {
  return json{{"ok", r.ok}, {"message", r.message}}.dump();
}
}  // namespace detail

/**
 * @brief Handle one JSON command for the agent
 *
 * Supported commands:
 * - {"cmd":"acq","sampling_frequency":2.5,"test_mode":false}  start acquisition
 * - {"cmd":"stop_acq"} / {"cmd":"close"}                       stop acquisition
 * - {"cmd":"status"}                                           session and gauge state
 * - {"cmd":"test","text":"hello"}                              echo check
 *
 * @return JSON reply; {"ok":false} for malformed or unknown commands
 */
inline std::string handle_command(ProcessRunner& runner, const std::string& s) {
  auto j = json::parse(s, nullptr, false);
  if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string()) return "{\"ok\":false}";

  const std::string cmd = j["cmd"].get<std::string>();

  if (cmd == "acq") {
    AcqParams params;
    if (j.contains("sampling_frequency") && !j["sampling_frequency"].is_null()) {
      if (!j["sampling_frequency"].is_number()) return "{\"ok\":false}";
      params.sampling_frequency = j["sampling_frequency"].get<double>();
    }
    if (j.contains("test_mode")) {
      if (!j["test_mode"].is_boolean()) return "{\"ok\":false}";
      params.test_mode = j["test_mode"].get<bool>();
    }
    return detail::op_reply(runner.start(params));
  } else if (cmd == "stop_acq" || cmd == "close") {
    return detail::op_reply(runner.stop());
  } else if (cmd == "status") {
    json status = {{"ok", true}, {"acq", runner.status()}};
    return status.dump();
  } else if (cmd == "test") {
    std::string text = "hello";
    if (j.contains("text") && j["text"].is_string()) text = j["text"].get<std::string>();
    return json{{"ok", true}, {"message", "good"}, {"text", text}}.dump();
  }
  return "{\"ok\":false}";
}

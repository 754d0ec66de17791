// -----------------------------------------------------------------------------
// config.cpp - JSON config file (XDG location, atomic save)
//
// {
//   "client": "cec-client",
//   "client_args": ["-d", "8"],
//   "device_name": "cecbridge",
//   "device_address": "RECORDINGDEVICE1",
//   "monitor_mode": false,
//   "log_level": "warn",
//   "ready_timeout_ms": 10000
// }
// -----------------------------------------------------------------------------
#include "cecbridge/config.hpp"
#include "cecbridge/event_json.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace cecbridge {

using json = nlohmann::json;
namespace fs = std::filesystem;

fs::path default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return base / "cecbridge" / "config.json";
}

static bool bad(std::string& err, const char* key) {
  err = std::string("bad_config:") + key;
  return false;
}

bool config_from_json(const json& j, BridgeConfig& cfg, std::string& err) {
  if (!j.is_object()) return bad(err, "root");

  BridgeConfig out = cfg;   // commit only if every key is valid

  if (j.contains("client")) {
    const auto& v = j["client"];
    if (!v.is_string() || v.get<std::string>().empty()) return bad(err, "client");
    out.client = v.get<std::string>();
  }

  if (j.contains("client_args")) {
    const auto& v = j["client_args"];
    if (!v.is_array()) return bad(err, "client_args");
    out.client_args.clear();
    for (const auto& a : v) {
      if (!a.is_string()) return bad(err, "client_args");
      out.client_args.push_back(a.get<std::string>());
    }
  }

  if (j.contains("device_name")) {
    const auto& v = j["device_name"];
    if (!v.is_string()) return bad(err, "device_name");
    out.device_name = v.get<std::string>();
  }

  if (j.contains("device_address")) {
    const auto& v = j["device_address"];
    if (v.is_string()) {
      if (!parse_logical_address(v.get<std::string>(), out.device_address)) return bad(err, "device_address");
    } else if (v.is_number_integer()) {
      const auto n = v.get<int64_t>();
      if (n < 0 || n > 15) return bad(err, "device_address");
      out.device_address = logical_address_from_int(static_cast<int>(n));
    } else {
      return bad(err, "device_address");
    }
  }

  if (j.contains("monitor_mode")) {
    const auto& v = j["monitor_mode"];
    if (!v.is_boolean()) return bad(err, "monitor_mode");
    out.monitor_mode = v.get<bool>();
  }

  if (j.contains("log_level")) {
    const auto& v = j["log_level"];
    if (!v.is_string() || !log::parse_level(v.get<std::string>(), out.log_level)) {
      return bad(err, "log_level");
    }
  }

  if (j.contains("ready_timeout_ms")) {
    const auto& v = j["ready_timeout_ms"];
    if (!v.is_number_integer()) return bad(err, "ready_timeout_ms");
    const auto n = v.get<int64_t>();
    if (n < 0 || n > static_cast<int64_t>(UINT32_MAX)) return bad(err, "ready_timeout_ms");
    out.ready_timeout_ms = static_cast<uint32_t>(n);
  }

  cfg = out;
  return true;
}

json config_to_json(const BridgeConfig& cfg) {
  json j;
  j["client"]           = cfg.client;
  j["client_args"]      = cfg.client_args;
  j["device_name"]      = cfg.device_name;
  j["device_address"]   = logical_address_name(cfg.device_address);
  j["monitor_mode"]     = cfg.monitor_mode;
  j["log_level"]        = log::level_name(cfg.log_level);
  j["ready_timeout_ms"] = cfg.ready_timeout_ms;
  return j;
}

std::optional<BridgeConfig> parse_config(const std::string& text, std::string& err) {
  const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    err = "bad_config:syntax";
    return std::nullopt;
  }
  BridgeConfig cfg;
  if (!config_from_json(j, cfg, err)) return std::nullopt;
  return cfg;
}

std::optional<BridgeConfig> load_config(const fs::path& p, std::string& err) {
  std::error_code ec;
  if (!fs::exists(p, ec)) return BridgeConfig{};   // first run

  std::ifstream in;
  if (fs::is_regular_file(p, ec)) in.open(p);
  if (!in.is_open()) {
    err = "config_unreadable:" + p.string();
    return std::nullopt;
  }
  std::ostringstream text;
  text << in.rdbuf();
  return parse_config(text.str(), err);
}

bool save_config(const fs::path& p, const BridgeConfig& cfg, std::string& err) {
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      err = "config_mkdir:" + ec.message();
      return false;
    }
  }

  auto tmp = p; tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      err = "config_write:" + tmp.string();
      return false;
    }
    out << to_json_text(config_to_json(cfg), 2) << "\n";
    out.flush();
    if (!out) {
      err = "config_write:" + tmp.string();
      return false;
    }
  }

  fs::rename(tmp, p, ec);
  if (ec) {
    err = "config_rename:" + ec.message();
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

} // namespace cecbridge

/**
 * @file config.hpp
 * @brief On-disk bridge configuration (JSON).
 *
 * Location: `$XDG_CONFIG_HOME/cecbridge/config.json`, falling back to
 * `~/.config/cecbridge/config.json`. A missing file means defaults.
 *
 * @code
 * {
 *   "client": "cec-client",
 *   "client_args": ["-d", "8"],
 *   "device_name": "livingroom-pi",
 *   "device_address": "PLAYBACKDEVICE1",
 *   "monitor_mode": false,
 *   "log_level": "info",
 *   "ready_timeout_ms": 10000
 * }
 * @endcode
 *
 * Errors come back as reason strings, never as exceptions:
 * - `bad_config:syntax` for text that is not JSON, `bad_config:root` when it
 *   is not an object, `bad_config:<key>` for a wrongly typed or invalid value;
 * - `config_unreadable:<path>` when the file exists but cannot be read;
 * - `config_mkdir:<why>`, `config_write:<tmp path>`, `config_rename:<why>`
 *   from save_config().
 */
#ifndef CECBRIDGE_CONFIG_HPP
#define CECBRIDGE_CONFIG_HPP

#include <stdint.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "cecbridge/log.hpp"
#include "cecbridge/logical_address.hpp"

namespace cecbridge {

struct BridgeConfig {
  std::string              client{"cec-client"};
  std::vector<std::string> client_args;
  std::string              device_name{"cecbridge"};
  LogicalAddress           device_address{LogicalAddress::RECORDINGDEVICE1};
  bool                     monitor_mode{false};
  log::Level               log_level{log::Level::Warn};
  uint32_t                 ready_timeout_ms{10000};
};

/// `$XDG_CONFIG_HOME/cecbridge/config.json` or `~/.config/cecbridge/config.json`.
std::filesystem::path default_config_path();

/**
 * @brief Fill a config from JSON; absent keys keep their defaults.
 * @return false with @p err = "bad_config:<key>" on a wrongly typed or invalid value.
 */
bool config_from_json(const nlohmann::json& j, BridgeConfig& cfg, std::string& err);

nlohmann::json config_to_json(const BridgeConfig& cfg);

/// Parse config text. std::nullopt + @p err on failure.
std::optional<BridgeConfig> parse_config(const std::string& text, std::string& err);

/// Load from disk. A missing file yields defaults; a path that exists but is
/// not a readable regular file gives "config_unreadable:<path>".
std::optional<BridgeConfig> load_config(const std::filesystem::path& p, std::string& err);

/// Atomic write (temp file + rename). false + @p err on failure.
bool save_config(const std::filesystem::path& p, const BridgeConfig& cfg, std::string& err);

} // namespace cecbridge

#endif // CECBRIDGE_CONFIG_HPP

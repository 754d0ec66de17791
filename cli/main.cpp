/**
 * @file main.cpp
 * @brief cecbridge CLI - run one CEC operation through cec-client, or watch the bus.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); load the JSON config (XDG) and apply overrides.
 *  - Spawn the adapter through ProcessTransport and Monitor::start().
 *  - Pump adapter output into the Monitor, tick the Commander with a steady clock.
 *  - Wait for the adapter to report ready, then run exactly one command,
 *    or print every bus event until the adapter exits or SIGINT (--watch).
 *
 * Output:
 *  - pretty: one `key=value` line per result/event.
 *  - json:   one JSON object per line.
 *  - errors: `status=error reason=<reason>` on stderr, non-zero exit.
 *
 * Exit codes: 0 ok, 1 command failed (send/timeout), 2 usage/config, 3 adapter.
 */

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "cecbridge/commander.hpp"
#include "cecbridge/config.hpp"
#include "cecbridge/event_json.hpp"
#include "cecbridge/log.hpp"
#include "cecbridge/monitor.hpp"
#include "cecbridge/remote.hpp"
#include "cecbridge/transport/transport_process.hpp"

using json = nlohmann::json;
using namespace cecbridge;

// ---------- small utilities ----------

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_signal(int) { g_interrupted = 1; }

static uint32_t now_ms_steady32() {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
  return static_cast<uint32_t>(ms);
}

static int fail(const std::string& reason, int code) {
  std::cerr << "status=error reason=" << reason << "\n";
  return code;
}

// Time for the adapter to put a fire-and-forget frame on the bus before we stop it.
static constexpr uint32_t DRAIN_MS = 250;

struct Printer {
  bool as_json{false};

  void event(const Event& ev) const {
    if (as_json) std::cout << to_json_text(event_to_json(ev)) << "\n";
    else         std::cout << event_to_text(ev) << "\n";
    std::cout.flush();
  }

  void result(const std::string& key, const json& value) const {
    if (as_json) {
      json j;
      j["status"] = "ok";
      if (!key.empty()) j[key] = value;
      std::cout << to_json_text(j) << "\n";
    } else {
      std::cout << "status=ok";
      if (!key.empty()) std::cout << " " << key << "=" << (value.is_string() ? value.get<std::string>() : to_json_text(value));
      std::cout << "\n";
    }
  }
};

// Pump until the reply settles; the Commander's tick() enforces the deadline.
template <typename T>
static bool await_reply(const ReplyPtr<T>& reply, const std::function<bool()>& pump) {
  while (reply->pending()) {
    if (g_interrupted || !pump()) return false;
  }
  return reply->resolved();
}

static std::string hex_physical_address(uint16_t pa) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%x.%x.%x.%x", (pa >> 12) & 0xF, (pa >> 8) & 0xF, (pa >> 4) & 0xF, pa & 0xF);
  return buf;
}

// ---------- main ----------

int main(int argc, char** argv) {
  // CLI-centered options
  std::string opt_config;
  std::string opt_client;
  std::string opt_name;
  std::string opt_address;
  bool        opt_monitor = false;
  std::string opt_log_level;
  std::string opt_format = "pretty";   // pretty|json
  std::string opt_target = "TV";
  bool        opt_save_config = false;

  // Commands (exactly one)
  bool        cmd_standby = false;
  bool        cmd_power_on = false;
  bool        cmd_power_status = false;
  bool        cmd_osd_name = false;
  bool        cmd_physical_address = false;
  bool        cmd_cec_version = false;
  std::string cmd_press;
  std::string cmd_raw;
  bool        cmd_watch = false;

  CLI::App app{"cecbridge - CEC bus bridge over cec-client"};

  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/cecbridge/config.json)");
  app.add_option("--client", opt_client, "Adapter executable");
  app.add_option("--name", opt_name, "OSD name to announce");
  app.add_option("--address", opt_address, "Logical address to claim (name or number)");
  app.add_flag("--monitor", opt_monitor, "Surface packets addressed to other devices");
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|off");
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));
  app.add_option("--target", opt_target, "Target device for commands and queries")->capture_default_str();
  app.add_flag("--save-config", opt_save_config, "Write the effective config back to the config file");

  app.add_flag("--standby", cmd_standby, "Broadcast STANDBY");
  app.add_flag("--power-on", cmd_power_on, "Send IMAGE_VIEW_ON to the target");
  app.add_flag("--power-status", cmd_power_status, "Query the target's power status");
  app.add_flag("--osd-name", cmd_osd_name, "Query the target's OSD name");
  app.add_flag("--physical-address", cmd_physical_address, "Query the target's physical address");
  app.add_flag("--cec-version", cmd_cec_version, "Query the target's CEC version");
  app.add_option("--press", cmd_press, "Press and release a remote button (e.g. UP, SELECT, VOLUME_UP)");
  app.add_option("--raw", cmd_raw, "Send one raw adapter line (e.g. \"tx 10:04\")");
  app.add_flag("--watch", cmd_watch, "Print bus events until the adapter exits or Ctrl-C");

  CLI11_PARSE(app, argc, argv);

  const int n_commands = int(cmd_standby) + int(cmd_power_on) + int(cmd_power_status) +
                         int(cmd_osd_name) + int(cmd_physical_address) + int(cmd_cec_version) +
                         int(!cmd_press.empty()) + int(!cmd_raw.empty()) + int(cmd_watch);
  if (n_commands != 1) return fail(n_commands ? "too_many_commands" : "no_command", 2);

  // Config: file → env → flags
  std::string err;
  const auto config_path = opt_config.empty() ? default_config_path() : std::filesystem::path(opt_config);
  auto loaded = load_config(config_path, err);
  if (!loaded) return fail(err, 2);
  BridgeConfig cfg = *loaded;

  if (!opt_client.empty()) cfg.client = opt_client;
  if (!opt_name.empty())   cfg.device_name = opt_name;
  if (!opt_address.empty() && !parse_logical_address(opt_address, cfg.device_address)) {
    return fail("bad_address:" + opt_address, 2);
  }
  if (opt_monitor) cfg.monitor_mode = true;

  log::set_level(cfg.log_level);
  log::apply_env();
  if (!opt_log_level.empty()) {
    log::Level lvl;
    if (!log::parse_level(opt_log_level, lvl)) return fail("bad_log_level:" + opt_log_level, 2);
    log::set_level(lvl);
    cfg.log_level = lvl;
  }

  LogicalAddress target;
  if (!parse_logical_address(opt_target, target)) return fail("bad_target:" + opt_target, 2);

  UserControlButton button = UserControlButton::SELECT;
  if (!cmd_press.empty() && !parse_user_control(cmd_press, button)) {
    return fail("bad_button:" + cmd_press, 2);
  }

  if (opt_save_config && !save_config(config_path, cfg, err)) return fail(err, 2);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  // Wire up: transport ← monitor ← remote, commander
  transport::ProcessTransport link;
  Monitor   monitor(link, cfg.device_name, cfg.device_address, cfg.monitor_mode);
  Remote    remote(monitor);
  Commander commander(monitor);
  Printer   out{opt_format == "json"};

  transport::Config tcfg;
  tcfg.program = cfg.client;
  tcfg.args    = cfg.client_args;
  if (!monitor.start(tcfg)) return fail("adapter_start_failed:" + cfg.client, 3);

  bool adapter_gone = false;
  std::function<bool()> pump = [&]() {
    uint8_t buf[512];
    std::size_t n = 0;
    switch (link.recv(buf, sizeof(buf), n)) {
      case transport::RxResult::Ok:
        monitor.feed(reinterpret_cast<const char*>(buf), n);
        break;
      case transport::RxResult::None:
        break;
      case transport::RxResult::Closed:
      case transport::RxResult::Error:
        if (!adapter_gone) monitor.end_of_stream();
        adapter_gone = true;
        return false;
    }
    commander.tick(now_ms_steady32());
    return true;
  };

  // Wait for "waiting for input"
  const uint32_t t0 = now_ms_steady32();
  while (!monitor.ready()) {
    if (g_interrupted) { monitor.stop(); return fail("interrupted", 1); }
    if (!pump()) return fail("adapter_closed", 3);
    if (now_ms_steady32() - t0 > cfg.ready_timeout_ms) {
      monitor.stop();
      return fail("adapter_not_ready", 3);
    }
  }
  CECBRIDGE_INFO("cli", "ready after " << (now_ms_steady32() - t0) << " ms");

  auto drain = [&]() {
    const uint32_t d0 = now_ms_steady32();
    while (!adapter_gone && now_ms_steady32() - d0 < DRAIN_MS && pump()) {}
  };

  auto finish = [&](bool ok, const std::string& key, const json& value,
                    const std::string& reason) -> int {
    drain();
    if (!adapter_gone) monitor.stop();
    if (!ok) return fail(reason, 1);
    out.result(key, value);
    return 0;
  };

  // ---------- watch ----------
  if (cmd_watch) {
    auto print = [&out](const Event& ev) { out.event(ev); };
    EventBus& bus = monitor.events();
    for (const char* name : { event::STOP, event::POLLING, event::PACKET, event::SET_OSD_NAME,
                              event::ROUTING_CHANGE, event::ACTIVE_SOURCE,
                              event::REPORT_PHYSICAL_ADDRESS }) {
      bus.on(name, print);
    }
    for (int code = 0; code <= 0xFF; ++code) {
      if (is_known_opcode(code)) bus.on(opcode_event_name(static_cast<OperationCode>(code)), print);
    }
    for (const char* name : { event::KEYDOWN, event::KEYUP, event::KEYPRESS }) {
      remote.events().on(name, print);
    }

    while (!g_interrupted && pump()) {}
    if (!adapter_gone) monitor.stop();
    return 0;
  }

  // ---------- fire-and-forget ----------
  if (cmd_standby)       return finish(commander.broadcast_standby(), "", nullptr, "send_failed");
  if (cmd_power_on)      return finish(commander.set_power_state(PowerStatus::ON, target), "", nullptr, "send_failed");
  if (!cmd_press.empty()) return finish(commander.press_button(button, target), "button", cmd_press, "send_failed");
  if (!cmd_raw.empty())  return finish(monitor.send(cmd_raw), "", nullptr, "send_failed");

  // ---------- queries ----------
  auto why = [&](const std::string& settled) -> std::string {
    if (!settled.empty()) return settled;
    return g_interrupted ? "interrupted" : "adapter_closed";
  };

  if (cmd_power_status) {
    auto reply = commander.get_power_state(now_ms_steady32(), target);
    const bool ok = await_reply(reply, pump);
    return finish(ok, "power", ok ? power_status_name(reply->value()) : "", why(reply->error()));
  }
  if (cmd_osd_name) {
    auto reply = commander.get_osd_name(now_ms_steady32(), target);
    const bool ok = await_reply(reply, pump);
    return finish(ok, "osd_name", ok ? std::string(reply->value().c_str()) : "", why(reply->error()));
  }
  if (cmd_physical_address) {
    auto reply = commander.get_physical_address(now_ms_steady32(), target);
    const bool ok = await_reply(reply, pump);
    return finish(ok, "physical_address", ok ? hex_physical_address(reply->value()) : "", why(reply->error()));
  }
  if (cmd_cec_version) {
    auto reply = commander.get_cec_version(now_ms_steady32(), target);
    const bool ok = await_reply(reply, pump);
    return finish(ok, "cec_version", ok ? int(reply->value()) : 0, why(reply->error()));
  }

  return fail("no_command", 2);
}

// -----------------------------------------------------------------------------
// log.cpp - levelled key=value diagnostics on stderr
//
// Line shape: level=<lvl> chan=<chan> msg=<text>
// -----------------------------------------------------------------------------
#include "cecbridge/log.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>

namespace cecbridge {
namespace log {

static Level         g_level = Level::Warn;
static std::ostream* g_sink  = nullptr;    // nullptr → std::cerr

static const char* const LEVEL_NAMES[] = { "trace", "debug", "info", "warn", "error", "off" };

void set_level(Level lvl) { g_level = lvl; }

Level level() { return g_level; }

bool enabled(Level lvl) {
  return lvl != Level::Off && static_cast<uint8_t>(lvl) >= static_cast<uint8_t>(g_level);
}

void set_sink(std::ostream* out) { g_sink = out; }

const char* level_name(Level lvl) {
  const auto i = static_cast<size_t>(lvl);
  return i < sizeof(LEVEL_NAMES) / sizeof(LEVEL_NAMES[0]) ? LEVEL_NAMES[i] : "?";
}

bool parse_level(const std::string& text, Level& out) {
  std::string t;
  for (char c : text) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (t == "warning") t = "warn";

  for (size_t i = 0; i < sizeof(LEVEL_NAMES) / sizeof(LEVEL_NAMES[0]); ++i) {
    if (t == LEVEL_NAMES[i]) {
      out = static_cast<Level>(i);
      return true;
    }
  }
  return false;
}

bool apply_env() {
  const char* env = std::getenv("CECBRIDGE_LOG");
  if (!env || !*env) return false;

  Level lvl;
  if (!parse_level(env, lvl)) {
    write(Level::Warn, "log", std::string("ignoring CECBRIDGE_LOG=") + env);
    return false;
  }
  set_level(lvl);
  return true;
}

void write(Level lvl, const char* channel, const std::string& msg) {
  if (!enabled(lvl)) return;
  std::ostream& os = g_sink ? *g_sink : std::cerr;
  os << "level=" << level_name(lvl)
     << " chan=" << (channel ? channel : "-")
     << " msg=" << msg << "\n";
}

} // namespace log
} // namespace cecbridge

// -----------------------------------------------------------------------------
// remote.cpp - key pressed/released lines → keydown / keyup / keypress
//
//   "DEBUG:   [  1234]\tkey pressed: up (1)"
//   "DEBUG:   [  1390]\tkey released: up (1)"
//
// Slots: current = key held right now, previous = what the held slot had
// before the last keydown or keyup (-1 when it was empty).
// -----------------------------------------------------------------------------
#include "cecbridge/remote.hpp"

#include <algorithm>
#include <cstdlib>

#include <boost/regex.hpp>

#include "cecbridge/log.hpp"

namespace cecbridge {

static const boost::regex& key_pattern(bool pressed) {
  static const boost::regex down(R"(^DEBUG:[ \[\d\]\t]+key pressed: (.+?) \(([0-9a-fA-F]+)\))");
  static const boost::regex up(R"(^DEBUG:[ \[\d\]\t]+key released: (.+?) \(([0-9a-fA-F]+)\))");
  return pressed ? down : up;
}

Remote::Remote(Monitor& monitor) : monitor_(monitor) {
  monitor_.handlers().add_pattern(key_pattern(true),  [this](const std::string& l) { key_down(l); });
  monitor_.handlers().add_pattern(key_pattern(false), [this](const std::string& l) { key_up(l); });
}

bool Remote::parse_key_line(const std::string& line, bool pressed, KeyNameStr& name, int& code) {
  boost::smatch m;
  if (!boost::regex_search(line, m, key_pattern(pressed))) return false;

  const std::string key = m.str(1);
  const std::string hex = m.str(2);
  if (hex.size() > 4) return false;                  // not a key code

  name.assign(key.c_str(), std::min(key.size(), name.max_size()));
  code = static_cast<int>(std::strtol(hex.c_str(), nullptr, 16));
  return true;
}

void Remote::key_down(const std::string& line) {
  KeyEvent ev;
  if (!parse_key_line(line, true, ev.key, ev.key_code)) return;

  ev.repeat = (state_.current_code != -1 && state_.current_key == ev.key);
  CECBRIDGE_DEBUG("remote", "keydown \"" << ev.key.c_str() << "\" (" << ev.key_code << ")"
                  << (ev.repeat ? " repeat" : ""));

  events_.emit(event::KEYDOWN, ev);

  state_.previous_key  = state_.current_key;
  state_.previous_code = state_.current_code;
  state_.current_key  = ev.key;
  state_.current_code = ev.key_code;
}

void Remote::key_up(const std::string& line) {
  KeyEvent up;
  if (!parse_key_line(line, false, up.key, up.key_code)) return;

  CECBRIDGE_DEBUG("remote", "keyup \"" << up.key.c_str() << "\" (" << up.key_code << ")");
  events_.emit(event::KEYUP, up);

  if (up.key_code != state_.current_code) return;   // out of order or never pressed

  KeyEvent press = up;
  press.repeat = (state_.previous_code == state_.current_code);

  events_.emit(event::KEYPRESS, press);
  events_.emit(std::string(event::KEYPRESS_PREFIX) + press.key.c_str(), press);

  state_.previous_key  = state_.current_key;
  state_.previous_code = state_.current_code;
  state_.current_key.clear();
  state_.current_code = -1;
}

} // namespace cecbridge

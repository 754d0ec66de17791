/**
 * @file remote.hpp
 * @brief Remote-control key events from the adapter's key log lines.
 *
 * @details
 * The adapter does not put remote keys on the TRAFFIC channel in a usable
 * form; it logs them as separate debug lines:
 * ```
 *   DEBUG:   [           12034]\tkey pressed: up (1)
 *   DEBUG:   [           12210]\tkey released: up (1)
 * ```
 * Remote installs one pattern for each family into the Monitor's registry
 * and turns the pair into events on its own bus:
 *
 * - `keydown`  on every pressed line (`repeat`: the same key is still held),
 * - `keyup`    on every released line,
 * - `keypress` and `keypress.<name>` when a release matches the held key
 *   (`repeat`: the key was already held when its last keydown arrived,
 *   i.e. it auto-repeated before release).
 *
 * A release for a key that is not held produces `keyup` only.
 */
#ifndef CECBRIDGE_REMOTE_HPP
#define CECBRIDGE_REMOTE_HPP

#include <string>
#include "cecbridge/event_bus.hpp"
#include "cecbridge/events.hpp"
#include "cecbridge/monitor.hpp"

namespace cecbridge {

class Remote {
public:
  /// Held/previous key slots. key_code -1 means empty.
  struct KeyState {
    KeyNameStr previous_key;
    int        previous_code{-1};
    KeyNameStr current_key;
    int        current_code{-1};
  };

  /// Installs the two key patterns into @p monitor's registry. The registry
  /// keeps calling back into this object: no lines may reach @p monitor after
  /// the Remote is destroyed.
  explicit Remote(Monitor& monitor);

  Remote(const Remote&) = delete;
  Remote& operator=(const Remote&) = delete;

  EventBus& events() { return events_; }
  const KeyState& state() const { return state_; }

  /// Parse "key pressed|released: <name> (<hex>)". false if @p line is not one.
  static bool parse_key_line(const std::string& line, bool pressed,
                             KeyNameStr& name, int& code);

private:
  void key_down(const std::string& line);
  void key_up(const std::string& line);

  Monitor& monitor_;
  EventBus events_;
  KeyState state_;
};

} // namespace cecbridge

#endif // CECBRIDGE_REMOTE_HPP

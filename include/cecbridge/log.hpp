/**
 * @file log.hpp
 * @brief Levelled, channel-tagged diagnostics on stderr.
 *
 * @details
 * Output is one `key=value` line per record, the same shape the CLI uses for
 * status lines, so a log can be grepped with the same habits:
 * ```
 *   level=debug chan=monitor msg=device address set to 4
 * ```
 * Channels name the component: `monitor`, `monitor:raw`, `commander`,
 * `remote`, `transport`, `cli`.
 *
 * The level is global to the process. Default is `warn`. The CLI applies the
 * config file value, then `CECBRIDGE_LOG`, then `--log-level`.
 */
#ifndef CECBRIDGE_LOG_HPP
#define CECBRIDGE_LOG_HPP

#include <stdint.h>
#include <ostream>
#include <sstream>
#include <string>

namespace cecbridge {
namespace log {

enum class Level : uint8_t { Trace=0, Debug=1, Info=2, Warn=3, Error=4, Off=5 };

void  set_level(Level lvl);
Level level();
bool  enabled(Level lvl);

/// Redirect output (tests). nullptr restores std::cerr.
void set_sink(std::ostream* out);

/// "trace".."off", case-insensitive.
bool        parse_level(const std::string& text, Level& out);
const char* level_name(Level lvl);

/// Apply CECBRIDGE_LOG if set and valid. Returns true if it changed the level.
bool apply_env();

void write(Level lvl, const char* channel, const std::string& msg);

} // namespace log
} // namespace cecbridge

// Stream-style helpers; the message is only built when the level is on.
#define CECBRIDGE_LOG(lvl, chan, expr)                                   \
  do {                                                                   \
    if (::cecbridge::log::enabled(lvl)) {                                \
      std::ostringstream cecbridge_log_os_;                              \
      cecbridge_log_os_ << expr;                                         \
      ::cecbridge::log::write(lvl, chan, cecbridge_log_os_.str());       \
    }                                                                    \
  } while (0)

#define CECBRIDGE_TRACE(chan, expr) CECBRIDGE_LOG(::cecbridge::log::Level::Trace, chan, expr)
#define CECBRIDGE_DEBUG(chan, expr) CECBRIDGE_LOG(::cecbridge::log::Level::Debug, chan, expr)
#define CECBRIDGE_INFO(chan, expr)  CECBRIDGE_LOG(::cecbridge::log::Level::Info,  chan, expr)
#define CECBRIDGE_WARN(chan, expr)  CECBRIDGE_LOG(::cecbridge::log::Level::Warn,  chan, expr)
#define CECBRIDGE_ERROR(chan, expr) CECBRIDGE_LOG(::cecbridge::log::Level::Error, chan, expr)

#endif // CECBRIDGE_LOG_HPP

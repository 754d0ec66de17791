/**
 * @file logical_address.hpp
 * @brief CEC logical addresses - who is talking to whom on the bus.
 *
 * @details
 * Every participant on a CEC bus claims one 4-bit logical address. The value
 * says what kind of device it is (TV, recorder, tuner, player, audio system).
 * Address 15 is overloaded: as a **target** it means "everyone" (broadcast),
 * as a **source** it means "I have no address yet" (unregistered).
 *
 * The adapter process is told which *category* of address to claim through
 * its `-t` flag; it then reports the address it was actually granted, which
 * may differ from the one requested (slot already taken by another device).
 *
 * @note `UNKNOWN` is not a bus value. It marks "not resolved" in host code.
 */
#ifndef CECBRIDGE_LOGICAL_ADDRESS_HPP
#define CECBRIDGE_LOGICAL_ADDRESS_HPP

#include <stdint.h>
#include <string>

namespace cecbridge {

enum class LogicalAddress : int8_t {
  UNKNOWN          = -1,
  TV               = 0,
  RECORDINGDEVICE1 = 1,
  RECORDINGDEVICE2 = 2,
  TUNER1           = 3,
  PLAYBACKDEVICE1  = 4,
  AUDIOSYSTEM      = 5,
  TUNER2           = 6,
  TUNER3           = 7,
  PLAYBACKDEVICE2  = 8,
  RECORDINGDEVICE3 = 9,
  TUNER4           = 10,
  PLAYBACKDEVICE3  = 11,
  RESERVED1        = 12,
  RESERVED2        = 13,
  FREEUSE          = 14,
  UNREGISTERED     = 15,   ///< as source
  BROADCAST        = 15    ///< as target
};

/// Numeric value of an address (UNKNOWN yields -1).
inline int to_int(LogicalAddress a) { return static_cast<int>(a); }

/**
 * @brief Build an address from a raw nibble.
 * @return The matching address, or UNKNOWN when @p v is outside 0..15.
 */
LogicalAddress logical_address_from_int(int v);

/**
 * @brief Symbolic name of an address ("TV", "PLAYBACKDEVICE1", ...).
 *
 * Value 15 always renders as "BROADCAST"; the caller knows whether it sits
 * in a source or target position.
 */
const char* logical_address_name(LogicalAddress a);

/**
 * @brief Parse an address from a symbolic name (case-insensitive) or a
 *        number ("4", "0x4").
 * @retval true  @p out holds the parsed address.
 * @retval false unknown name or out-of-range number; @p out untouched.
 */
bool parse_logical_address(const std::string& text, LogicalAddress& out);

/**
 * @brief Device type flag the adapter expects for `-t`.
 *
 * audio system → 'a', playback devices → 'p', tuners → 't',
 * everything else → 'r' (recording device).
 */
char client_type_for(LogicalAddress a);

} // namespace cecbridge

#endif // CECBRIDGE_LOGICAL_ADDRESS_HPP

#ifndef CECBRIDGE_POWER_STATUS_HPP
#define CECBRIDGE_POWER_STATUS_HPP

#include <stdint.h>

namespace cecbridge {

/// Power state operand of REPORT_POWER_STATUS.
enum class PowerStatus : uint8_t {
  ON                          = 0x00,
  STANDBY                     = 0x01,
  IN_TRANSITION_STANDBY_TO_ON = 0x02,
  IN_TRANSITION_ON_TO_STANDBY = 0x03,
  UNKNOWN                     = 0x99
};

/// Map a raw operand to a PowerStatus; out-of-range values become UNKNOWN.
inline PowerStatus power_status_from_int(int v) {
  switch (v) {
    case 0x00: return PowerStatus::ON;
    case 0x01: return PowerStatus::STANDBY;
    case 0x02: return PowerStatus::IN_TRANSITION_STANDBY_TO_ON;
    case 0x03: return PowerStatus::IN_TRANSITION_ON_TO_STANDBY;
    default:   return PowerStatus::UNKNOWN;
  }
}

inline const char* power_status_name(PowerStatus s) {
  switch (s) {
    case PowerStatus::ON:                          return "on";
    case PowerStatus::STANDBY:                     return "standby";
    case PowerStatus::IN_TRANSITION_STANDBY_TO_ON: return "standby_to_on";
    case PowerStatus::IN_TRANSITION_ON_TO_STANDBY: return "on_to_standby";
    default:                                       return "unknown";
  }
}

} // namespace cecbridge

#endif // CECBRIDGE_POWER_STATUS_HPP

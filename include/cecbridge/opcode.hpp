/**
 * @file opcode.hpp
 * @brief CEC operation codes and their symbolic names.
 *
 * @details
 * The symbolic name of an opcode doubles as an event-channel key: the Monitor
 * republishes any recognized opcode without a dedicated decoder as
 * `op.<NAME>` (e.g. `op.REPORT_POWER_STATUS`). Name lookup goes through a
 * 256-slot table built once on first use; no scanning of the enumeration at
 * dispatch time.
 *
 * Codes follow HDMI-CEC 1.4 (plus the CDC tunnel and ABORT).
 */
#ifndef CECBRIDGE_OPCODE_HPP
#define CECBRIDGE_OPCODE_HPP

#include <stdint.h>
#include <string>

namespace cecbridge {

enum class OperationCode : uint8_t {
  FEATURE_ABORT                  = 0x00,
  IMAGE_VIEW_ON                  = 0x04,
  TUNER_STEP_INCREMENT           = 0x05,
  TUNER_STEP_DECREMENT           = 0x06,
  TUNER_DEVICE_STATUS            = 0x07,
  GIVE_TUNER_DEVICE_STATUS       = 0x08,
  RECORD_ON                      = 0x09,
  RECORD_STATUS                  = 0x0A,
  RECORD_OFF                     = 0x0B,
  TEXT_VIEW_ON                   = 0x0D,
  RECORD_TV_SCREEN               = 0x0F,
  GIVE_DECK_STATUS               = 0x1A,
  DECK_STATUS                    = 0x1B,
  SET_MENU_LANGUAGE              = 0x32,
  CLEAR_ANALOGUE_TIMER           = 0x33,
  SET_ANALOGUE_TIMER             = 0x34,
  TIMER_STATUS                   = 0x35,
  STANDBY                        = 0x36,
  PLAY                           = 0x41,
  DECK_CONTROL                   = 0x42,
  TIMER_CLEARED_STATUS           = 0x43,
  USER_CONTROL_PRESSED           = 0x44,
  USER_CONTROL_RELEASE           = 0x45,
  GIVE_OSD_NAME                  = 0x46,
  SET_OSD_NAME                   = 0x47,
  SET_OSD_STRING                 = 0x64,
  SET_TIMER_PROGRAM_TITLE        = 0x67,
  SYSTEM_AUDIO_MODE_REQUEST      = 0x70,
  GIVE_AUDIO_STATUS              = 0x71,
  SET_SYSTEM_AUDIO_MODE          = 0x72,
  REPORT_AUDIO_STATUS            = 0x7A,
  GIVE_SYSTEM_AUDIO_MODE_STATUS  = 0x7D,
  SYSTEM_AUDIO_MODE_STATUS       = 0x7E,
  ROUTING_CHANGE                 = 0x80,
  ROUTING_INFORMATION            = 0x81,
  ACTIVE_SOURCE                  = 0x82,
  GIVE_PHYSICAL_ADDRESS          = 0x83,
  REPORT_PHYSICAL_ADDRESS        = 0x84,
  REQUEST_ACTIVE_SOURCE          = 0x85,
  SET_STREAM_PATH                = 0x86,
  DEVICE_VENDOR_ID               = 0x87,
  VENDOR_COMMAND                 = 0x89,
  VENDOR_REMOTE_BUTTON_DOWN      = 0x8A,
  VENDOR_REMOTE_BUTTON_UP        = 0x8B,
  GIVE_DEVICE_VENDOR_ID          = 0x8C,
  MENU_REQUEST                   = 0x8D,
  MENU_STATUS                    = 0x8E,
  GIVE_DEVICE_POWER_STATUS       = 0x8F,
  REPORT_POWER_STATUS            = 0x90,
  GET_MENU_LANGUAGE              = 0x91,
  SELECT_ANALOGUE_SERVICE        = 0x92,
  SELECT_DIGITAL_SERVICE         = 0x93,
  SET_DIGITAL_TIMER              = 0x97,
  CLEAR_DIGITAL_TIMER            = 0x99,
  SET_AUDIO_RATE                 = 0x9A,
  INACTIVE_SOURCE                = 0x9D,
  CEC_VERSION                    = 0x9E,
  GET_CEC_VERSION                = 0x9F,
  VENDOR_COMMAND_WITH_ID         = 0xA0,
  CLEAR_EXTERNAL_TIMER           = 0xA1,
  SET_EXTERNAL_TIMER             = 0xA2,
  REPORT_SHORT_AUDIO_DESCRIPTORS = 0xA3,
  REQUEST_SHORT_AUDIO_DESCRIPTORS= 0xA4,
  INITIATE_ARC                   = 0xC0,
  REPORT_ARC_INITIATED           = 0xC1,
  REPORT_ARC_TERMINATED          = 0xC2,
  REQUEST_ARC_INITIATION         = 0xC3,
  REQUEST_ARC_TERMINATION        = 0xC4,
  TERMINATE_ARC                  = 0xC5,
  CDC_MESSAGE                    = 0xF8,
  ABORT                          = 0xFF
};

inline uint8_t to_byte(OperationCode op) { return static_cast<uint8_t>(op); }

/**
 * @brief Symbolic name for a raw opcode value.
 * @return Static string such as "STANDBY", or nullptr if @p code is not a
 *         recognized opcode (negative values included).
 */
const char* opcode_name(int code);

/// Convenience overload for typed opcodes; never returns nullptr.
const char* opcode_name(OperationCode op);

/// True if @p code maps to a recognized opcode.
bool is_known_opcode(int code);

/**
 * @brief Parse an opcode from its symbolic name (exact, upper-case) or a
 *        number ("0x36", "54").
 */
bool parse_opcode(const std::string& text, OperationCode& out);

/// Event channel key for the generic per-opcode event: "op." + name.
std::string opcode_event_name(OperationCode op);

} // namespace cecbridge

#endif // CECBRIDGE_OPCODE_HPP

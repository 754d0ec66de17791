/**
 * @file user_control.hpp
 * @brief CEC "UI command" codes carried by USER_CONTROL_PRESSED.
 *
 * Used by Commander::press_button() and by the CLI `--press` option.
 * Names are upper-case with underscores; parsing is case-insensitive.
 */
#ifndef CECBRIDGE_USER_CONTROL_HPP
#define CECBRIDGE_USER_CONTROL_HPP

#include <stdint.h>
#include <string>

namespace cecbridge {

enum class UserControlButton : uint8_t {
  SELECT                      = 0x00,
  UP                          = 0x01,
  DOWN                        = 0x02,
  LEFT                        = 0x03,
  RIGHT                       = 0x04,
  RIGHT_UP                    = 0x05,
  RIGHT_DOWN                  = 0x06,
  LEFT_UP                     = 0x07,
  LEFT_DOWN                   = 0x08,
  ROOT_MENU                   = 0x09,
  SETUP_MENU                  = 0x0A,
  CONTENTS_MENU               = 0x0B,
  FAVORITE_MENU               = 0x0C,
  EXIT                        = 0x0D,
  NUMBER0                     = 0x20,
  NUMBER1                     = 0x21,
  NUMBER2                     = 0x22,
  NUMBER3                     = 0x23,
  NUMBER4                     = 0x24,
  NUMBER5                     = 0x25,
  NUMBER6                     = 0x26,
  NUMBER7                     = 0x27,
  NUMBER8                     = 0x28,
  NUMBER9                     = 0x29,
  DOT                         = 0x2A,
  ENTER                       = 0x2B,
  CLEAR                       = 0x2C,
  NEXT_FAVORITE               = 0x2F,
  CHANNEL_UP                  = 0x30,
  CHANNEL_DOWN                = 0x31,
  PREVIOUS_CHANNEL            = 0x32,
  SOUND_SELECT                = 0x33,
  INPUT_SELECT                = 0x34,
  DISPLAY_INFORMATION         = 0x35,
  HELP                        = 0x36,
  PAGE_UP                     = 0x37,
  PAGE_DOWN                   = 0x38,
  POWER                       = 0x40,
  VOLUME_UP                   = 0x41,
  VOLUME_DOWN                 = 0x42,
  MUTE                        = 0x43,
  PLAY                        = 0x44,
  STOP                        = 0x45,
  PAUSE                       = 0x46,
  RECORD                      = 0x47,
  REWIND                      = 0x48,
  FAST_FORWARD                = 0x49,
  EJECT                       = 0x4A,
  FORWARD                     = 0x4B,
  BACKWARD                    = 0x4C,
  STOP_RECORD                 = 0x4D,
  PAUSE_RECORD                = 0x4E,
  ANGLE                       = 0x50,
  SUB_PICTURE                 = 0x51,
  VIDEO_ON_DEMAND             = 0x52,
  ELECTRONIC_PROGRAM_GUIDE    = 0x53,
  TIMER_PROGRAMMING           = 0x54,
  INITIAL_CONFIGURATION       = 0x55,
  PLAY_FUNCTION               = 0x60,
  PAUSE_PLAY_FUNCTION         = 0x61,
  RECORD_FUNCTION             = 0x62,
  PAUSE_RECORD_FUNCTION       = 0x63,
  STOP_FUNCTION               = 0x64,
  MUTE_FUNCTION               = 0x65,
  RESTORE_VOLUME_FUNCTION     = 0x66,
  TUNE_FUNCTION               = 0x67,
  SELECT_MEDIA_FUNCTION       = 0x68,
  SELECT_AV_INPUT_FUNCTION    = 0x69,
  SELECT_AUDIO_INPUT_FUNCTION = 0x6A,
  POWER_TOGGLE_FUNCTION       = 0x6B,
  POWER_OFF_FUNCTION          = 0x6C,
  POWER_ON_FUNCTION           = 0x6D,
  F1_BLUE                     = 0x71,
  F2_RED                      = 0x72,
  F3_GREEN                    = 0x73,
  F4_YELLOW                   = 0x74,
  F5                          = 0x75,
  DATA                        = 0x76
};

/// Symbolic name, or nullptr for codes outside the table.
const char* user_control_name(int code);

/// Parse a button by name ("volume_up", "VOLUME_UP") or number ("0x41").
bool parse_user_control(const std::string& text, UserControlButton& out);

} // namespace cecbridge

#endif // CECBRIDGE_USER_CONTROL_HPP

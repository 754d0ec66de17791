// -----------------------------------------------------------------------------
// user_control.cpp - UI command code ⇄ name
// -----------------------------------------------------------------------------
#include "cecbridge/user_control.hpp"
#include "cecbridge/parse_number.hpp"

#include <cctype>

namespace cecbridge {

namespace {

struct ButtonEntry {
  UserControlButton code;
  const char*       name;
};

#define CECBRIDGE_BTN(x) { UserControlButton::x, #x }
const ButtonEntry BUTTONS[] = {
  CECBRIDGE_BTN(SELECT), CECBRIDGE_BTN(UP), CECBRIDGE_BTN(DOWN), CECBRIDGE_BTN(LEFT),
  CECBRIDGE_BTN(RIGHT), CECBRIDGE_BTN(RIGHT_UP), CECBRIDGE_BTN(RIGHT_DOWN),
  CECBRIDGE_BTN(LEFT_UP), CECBRIDGE_BTN(LEFT_DOWN), CECBRIDGE_BTN(ROOT_MENU),
  CECBRIDGE_BTN(SETUP_MENU), CECBRIDGE_BTN(CONTENTS_MENU), CECBRIDGE_BTN(FAVORITE_MENU),
  CECBRIDGE_BTN(EXIT),
  CECBRIDGE_BTN(NUMBER0), CECBRIDGE_BTN(NUMBER1), CECBRIDGE_BTN(NUMBER2),
  CECBRIDGE_BTN(NUMBER3), CECBRIDGE_BTN(NUMBER4), CECBRIDGE_BTN(NUMBER5),
  CECBRIDGE_BTN(NUMBER6), CECBRIDGE_BTN(NUMBER7), CECBRIDGE_BTN(NUMBER8),
  CECBRIDGE_BTN(NUMBER9),
  CECBRIDGE_BTN(DOT), CECBRIDGE_BTN(ENTER), CECBRIDGE_BTN(CLEAR),
  CECBRIDGE_BTN(NEXT_FAVORITE), CECBRIDGE_BTN(CHANNEL_UP), CECBRIDGE_BTN(CHANNEL_DOWN),
  CECBRIDGE_BTN(PREVIOUS_CHANNEL), CECBRIDGE_BTN(SOUND_SELECT), CECBRIDGE_BTN(INPUT_SELECT),
  CECBRIDGE_BTN(DISPLAY_INFORMATION), CECBRIDGE_BTN(HELP), CECBRIDGE_BTN(PAGE_UP),
  CECBRIDGE_BTN(PAGE_DOWN),
  CECBRIDGE_BTN(POWER), CECBRIDGE_BTN(VOLUME_UP), CECBRIDGE_BTN(VOLUME_DOWN),
  CECBRIDGE_BTN(MUTE), CECBRIDGE_BTN(PLAY), CECBRIDGE_BTN(STOP), CECBRIDGE_BTN(PAUSE),
  CECBRIDGE_BTN(RECORD), CECBRIDGE_BTN(REWIND), CECBRIDGE_BTN(FAST_FORWARD),
  CECBRIDGE_BTN(EJECT), CECBRIDGE_BTN(FORWARD), CECBRIDGE_BTN(BACKWARD),
  CECBRIDGE_BTN(STOP_RECORD), CECBRIDGE_BTN(PAUSE_RECORD),
  CECBRIDGE_BTN(ANGLE), CECBRIDGE_BTN(SUB_PICTURE), CECBRIDGE_BTN(VIDEO_ON_DEMAND),
  CECBRIDGE_BTN(ELECTRONIC_PROGRAM_GUIDE), CECBRIDGE_BTN(TIMER_PROGRAMMING),
  CECBRIDGE_BTN(INITIAL_CONFIGURATION),
  CECBRIDGE_BTN(PLAY_FUNCTION), CECBRIDGE_BTN(PAUSE_PLAY_FUNCTION),
  CECBRIDGE_BTN(RECORD_FUNCTION), CECBRIDGE_BTN(PAUSE_RECORD_FUNCTION),
  CECBRIDGE_BTN(STOP_FUNCTION), CECBRIDGE_BTN(MUTE_FUNCTION),
  CECBRIDGE_BTN(RESTORE_VOLUME_FUNCTION), CECBRIDGE_BTN(TUNE_FUNCTION),
  CECBRIDGE_BTN(SELECT_MEDIA_FUNCTION), CECBRIDGE_BTN(SELECT_AV_INPUT_FUNCTION),
  CECBRIDGE_BTN(SELECT_AUDIO_INPUT_FUNCTION), CECBRIDGE_BTN(POWER_TOGGLE_FUNCTION),
  CECBRIDGE_BTN(POWER_OFF_FUNCTION), CECBRIDGE_BTN(POWER_ON_FUNCTION),
  CECBRIDGE_BTN(F1_BLUE), CECBRIDGE_BTN(F2_RED), CECBRIDGE_BTN(F3_GREEN),
  CECBRIDGE_BTN(F4_YELLOW), CECBRIDGE_BTN(F5), CECBRIDGE_BTN(DATA),
};
#undef CECBRIDGE_BTN

std::string upper(std::string s) {
  for (auto& c : s)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

const char* user_control_name(int code) {
  for (const auto& b : BUTTONS) {
    if (static_cast<int>(b.code) == code) return b.name;
  }
  return nullptr;
}

bool parse_user_control(const std::string& text, UserControlButton& out) {
  if (text.empty()) return false;

  long v = 0;
  if (parse_number(text, v)) {
    if (!user_control_name(static_cast<int>(v))) return false;
    out = static_cast<UserControlButton>(v);
    return true;
  }

  const std::string name = upper(text);
  for (const auto& b : BUTTONS) {
    if (name == b.name) { out = b.code; return true; }
  }
  return false;
}

} // namespace cecbridge

// -----------------------------------------------------------------------------
// opcode.cpp - opcode ⇄ symbolic name
//
// The name table is filled once from OPCODES[] into a 256-slot array so that
// dispatch-time lookup is a single index, not a scan.
// -----------------------------------------------------------------------------
#include "cecbridge/opcode.hpp"
#include "cecbridge/parse_number.hpp"

#include <array>

namespace cecbridge {

namespace {

struct OpcodeEntry {
  OperationCode code;
  const char*   name;
};

#define CECBRIDGE_OP(x) { OperationCode::x, #x }
const OpcodeEntry OPCODES[] = {
  CECBRIDGE_OP(FEATURE_ABORT),
  CECBRIDGE_OP(IMAGE_VIEW_ON),
  CECBRIDGE_OP(TUNER_STEP_INCREMENT),
  CECBRIDGE_OP(TUNER_STEP_DECREMENT),
  CECBRIDGE_OP(TUNER_DEVICE_STATUS),
  CECBRIDGE_OP(GIVE_TUNER_DEVICE_STATUS),
  CECBRIDGE_OP(RECORD_ON),
  CECBRIDGE_OP(RECORD_STATUS),
  CECBRIDGE_OP(RECORD_OFF),
  CECBRIDGE_OP(TEXT_VIEW_ON),
  CECBRIDGE_OP(RECORD_TV_SCREEN),
  CECBRIDGE_OP(GIVE_DECK_STATUS),
  CECBRIDGE_OP(DECK_STATUS),
  CECBRIDGE_OP(SET_MENU_LANGUAGE),
  CECBRIDGE_OP(CLEAR_ANALOGUE_TIMER),
  CECBRIDGE_OP(SET_ANALOGUE_TIMER),
  CECBRIDGE_OP(TIMER_STATUS),
  CECBRIDGE_OP(STANDBY),
  CECBRIDGE_OP(PLAY),
  CECBRIDGE_OP(DECK_CONTROL),
  CECBRIDGE_OP(TIMER_CLEARED_STATUS),
  CECBRIDGE_OP(USER_CONTROL_PRESSED),
  CECBRIDGE_OP(USER_CONTROL_RELEASE),
  CECBRIDGE_OP(GIVE_OSD_NAME),
  CECBRIDGE_OP(SET_OSD_NAME),
  CECBRIDGE_OP(SET_OSD_STRING),
  CECBRIDGE_OP(SET_TIMER_PROGRAM_TITLE),
  CECBRIDGE_OP(SYSTEM_AUDIO_MODE_REQUEST),
  CECBRIDGE_OP(GIVE_AUDIO_STATUS),
  CECBRIDGE_OP(SET_SYSTEM_AUDIO_MODE),
  CECBRIDGE_OP(REPORT_AUDIO_STATUS),
  CECBRIDGE_OP(GIVE_SYSTEM_AUDIO_MODE_STATUS),
  CECBRIDGE_OP(SYSTEM_AUDIO_MODE_STATUS),
  CECBRIDGE_OP(ROUTING_CHANGE),
  CECBRIDGE_OP(ROUTING_INFORMATION),
  CECBRIDGE_OP(ACTIVE_SOURCE),
  CECBRIDGE_OP(GIVE_PHYSICAL_ADDRESS),
  CECBRIDGE_OP(REPORT_PHYSICAL_ADDRESS),
  CECBRIDGE_OP(REQUEST_ACTIVE_SOURCE),
  CECBRIDGE_OP(SET_STREAM_PATH),
  CECBRIDGE_OP(DEVICE_VENDOR_ID),
  CECBRIDGE_OP(VENDOR_COMMAND),
  CECBRIDGE_OP(VENDOR_REMOTE_BUTTON_DOWN),
  CECBRIDGE_OP(VENDOR_REMOTE_BUTTON_UP),
  CECBRIDGE_OP(GIVE_DEVICE_VENDOR_ID),
  CECBRIDGE_OP(MENU_REQUEST),
  CECBRIDGE_OP(MENU_STATUS),
  CECBRIDGE_OP(GIVE_DEVICE_POWER_STATUS),
  CECBRIDGE_OP(REPORT_POWER_STATUS),
  CECBRIDGE_OP(GET_MENU_LANGUAGE),
  CECBRIDGE_OP(SELECT_ANALOGUE_SERVICE),
  CECBRIDGE_OP(SELECT_DIGITAL_SERVICE),
  CECBRIDGE_OP(SET_DIGITAL_TIMER),
  CECBRIDGE_OP(CLEAR_DIGITAL_TIMER),
  CECBRIDGE_OP(SET_AUDIO_RATE),
  CECBRIDGE_OP(INACTIVE_SOURCE),
  CECBRIDGE_OP(CEC_VERSION),
  CECBRIDGE_OP(GET_CEC_VERSION),
  CECBRIDGE_OP(VENDOR_COMMAND_WITH_ID),
  CECBRIDGE_OP(CLEAR_EXTERNAL_TIMER),
  CECBRIDGE_OP(SET_EXTERNAL_TIMER),
  CECBRIDGE_OP(REPORT_SHORT_AUDIO_DESCRIPTORS),
  CECBRIDGE_OP(REQUEST_SHORT_AUDIO_DESCRIPTORS),
  CECBRIDGE_OP(INITIATE_ARC),
  CECBRIDGE_OP(REPORT_ARC_INITIATED),
  CECBRIDGE_OP(REPORT_ARC_TERMINATED),
  CECBRIDGE_OP(REQUEST_ARC_INITIATION),
  CECBRIDGE_OP(REQUEST_ARC_TERMINATION),
  CECBRIDGE_OP(TERMINATE_ARC),
  CECBRIDGE_OP(CDC_MESSAGE),
  CECBRIDGE_OP(ABORT),
};
#undef CECBRIDGE_OP

using NameTable = std::array<const char*, 256>;

const NameTable& name_table() {
  static const NameTable table = [] {
    NameTable t{};                     // all nullptr
    for (const auto& e : OPCODES)
      t[to_byte(e.code)] = e.name;
    return t;
  }();
  return table;
}

} // namespace

const char* opcode_name(int code) {
  if (code < 0 || code > 0xFF) return nullptr;
  return name_table()[static_cast<size_t>(code)];
}

const char* opcode_name(OperationCode op) {
  return name_table()[to_byte(op)];
}

bool is_known_opcode(int code) {
  return opcode_name(code) != nullptr;
}

bool parse_opcode(const std::string& text, OperationCode& out) {
  if (text.empty()) return false;

  long v = 0;
  if (parse_number(text, v)) {
    if (!is_known_opcode(static_cast<int>(v))) return false;
    out = static_cast<OperationCode>(v);
    return true;
  }

  for (const auto& entry : OPCODES) {
    if (text == entry.name) { out = entry.code; return true; }
  }
  return false;
}

std::string opcode_event_name(OperationCode op) {
  return std::string("op.") + opcode_name(op);
}

} // namespace cecbridge

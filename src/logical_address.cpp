// -----------------------------------------------------------------------------
// logical_address.cpp - name/number conversions for CEC logical addresses
//
// API: see include/cecbridge/logical_address.hpp
// -----------------------------------------------------------------------------
#include "cecbridge/logical_address.hpp"
#include "cecbridge/parse_number.hpp"

#include <cctype>

namespace cecbridge {

// Index = address value. 15 is listed once, as BROADCAST.
static const char* const ADDRESS_NAMES[16] = {
  "TV", "RECORDINGDEVICE1", "RECORDINGDEVICE2", "TUNER1",
  "PLAYBACKDEVICE1", "AUDIOSYSTEM", "TUNER2", "TUNER3",
  "PLAYBACKDEVICE2", "RECORDINGDEVICE3", "TUNER4", "PLAYBACKDEVICE3",
  "RESERVED1", "RESERVED2", "FREEUSE", "BROADCAST"
};

static std::string upper(std::string s) {
  for (auto& c : s)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

LogicalAddress logical_address_from_int(int v) {
  if (v < 0 || v > 15) return LogicalAddress::UNKNOWN;
  return static_cast<LogicalAddress>(v);
}

const char* logical_address_name(LogicalAddress a) {
  const int v = to_int(a);
  if (v < 0 || v > 15) return "UNKNOWN";
  return ADDRESS_NAMES[v];
}

bool parse_logical_address(const std::string& text, LogicalAddress& out) {
  if (text.empty()) return false;

  // numeric first: "4", "0x4", "0xf"
  long v = 0;
  if (parse_number(text, v)) {
    if (v < 0 || v > 15) return false;
    out = static_cast<LogicalAddress>(v);
    return true;
  }

  const std::string name = upper(text);
  if (name == "UNREGISTERED") { out = LogicalAddress::UNREGISTERED; return true; }
  for (int i = 0; i < 16; ++i) {
    if (name == ADDRESS_NAMES[i]) { out = static_cast<LogicalAddress>(i); return true; }
  }
  return false;
}

char client_type_for(LogicalAddress a) {
  switch (a) {
    case LogicalAddress::AUDIOSYSTEM:
      return 'a';
    case LogicalAddress::PLAYBACKDEVICE1:
    case LogicalAddress::PLAYBACKDEVICE2:
    case LogicalAddress::PLAYBACKDEVICE3:
      return 'p';
    case LogicalAddress::TUNER1:
    case LogicalAddress::TUNER2:
    case LogicalAddress::TUNER3:
    case LogicalAddress::TUNER4:
      return 't';
    default:
      return 'r';
  }
}

} // namespace cecbridge

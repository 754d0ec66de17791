// -----------------------------------------------------------------------------
// packet.cpp - CEC packet codec (traffic text → ParsedPacket, operation → tx text)
//
// API & format notes: see include/cecbridge/packet.hpp
// Usage: see tests/test_packet.cpp
//
// Decoding never fails outright. Whatever cannot be read as hex turns into
// INVALID_BYTE and the rest of the line is still decoded; the Monitor decides
// whether a gap matters for the opcode at hand.
// -----------------------------------------------------------------------------
#include "cecbridge/packet.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace cecbridge {

// ---------- local helpers ----------

static bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// hex digit → 0..15, or -1
static int nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// lower-case hex, no padding
static std::string hex(unsigned v) {
  std::ostringstream os;
  os << std::hex << v;
  return os.str();
}

// Everything after the timestamp bracket and the direction arrow.
// "TRAFFIC: [  22588]\t<< 0f:36" → "0f:36"
static std::string traffic_tail(const std::string& line) {
  size_t start = line.find("]\t");
  if (start == std::string::npos) start = line.find(']');   // space-separated variant
  start = (start == std::string::npos) ? 0 : start + 1;

  while (start < line.size() && is_blank(line[start])) ++start;

  std::string command = line.substr(start);                   // "<< 0f:36"
  const size_t sp = command.find(' ');
  if (sp != std::string::npos) command = command.substr(sp + 1);

  while (!command.empty() && is_blank(command.back())) command.pop_back();
  return command;
}

// ---------- decode ----------

int16_t parse_hex_byte(const char* s, size_t n) {
  if (!s) return INVALID_BYTE;

  size_t b = 0, e = n;
  while (b < e && is_blank(s[b])) ++b;
  while (e > b && is_blank(s[e - 1])) --e;
  if (b == e) return INVALID_BYTE;                 // empty token

  unsigned v = 0;
  for (size_t i = b; i < e; ++i) {
    const int d = nibble(s[i]);
    if (d < 0) return INVALID_BYTE;                // not hex
    v = (v << 4) | static_cast<unsigned>(d);
    if (v > 0xFF) return INVALID_BYTE;             // not a byte
  }
  return static_cast<int16_t>(v);
}

bool ParsedPacket::has_invalid_args(size_t count) const {
  if (args.size() < count) return true;
  for (size_t i = 0; i < count; ++i) {
    if (args[i] == INVALID_BYTE) return true;
  }
  return false;
}

ParsedPacket decode_traffic(const std::string& line) {
  ParsedPacket p;
  const std::string command = traffic_tail(line);      // "0f:..:.."

  // split on ':' - always at least one (possibly empty) token
  std::vector<std::string> raw;
  size_t pos = 0;
  while (true) {
    const size_t c = command.find(':', pos);
    raw.push_back(command.substr(pos, c == std::string::npos ? std::string::npos : c - pos));
    if (c == std::string::npos) break;
    pos = c + 1;
  }
  if (raw.size() > MAX_FRAME_BLOCKS) raw.resize(MAX_FRAME_BLOCKS);  // not a CEC frame; keep the head

  for (const auto& t : raw) {
    p.tokens.push_back(TokenStr(t.c_str(), std::min(t.size(), TokenStr::MAX_SIZE)));
  }

  // header block: source nibble, target nibble
  const std::string& header = raw[0];
  if (header.size() >= 2) {
    const int s = nibble(header[0]);
    const int d = nibble(header[1]);
    p.source = static_cast<int16_t>(s < 0 ? INVALID_BYTE : s);
    p.target = static_cast<int16_t>(d < 0 ? INVALID_BYTE : d);
  }

  if (raw.size() > 1) {
    p.opcode = parse_hex_byte(raw[1].data(), raw[1].size());
    for (size_t i = 2; i < raw.size() && !p.args.full(); ++i) {
      p.args.push_back(parse_hex_byte(raw[i].data(), raw[i].size()));
    }
  }
  return p;
}

uint16_t decode_be16(const ArgBytes& args, size_t at) {
  return static_cast<uint16_t>(((args[at] & 0xFF) << 8) | (args[at + 1] & 0xFF));
}

OsdNameStr decode_osd_name(const ArgBytes& args) {
  OsdNameStr name;
  for (auto b : args) {
    if (b == INVALID_BYTE || name.full()) continue;
    name.push_back(static_cast<char>(b));
  }
  return name;
}

std::string describe_packet(const ParsedPacket& p) {
  auto addr = [](int16_t v) { return v < 0 ? std::string("?") : hex(static_cast<unsigned>(v)); };
  std::ostringstream os;
  os << "src=" << addr(p.source) << " dst=" << addr(p.target) << std::hex;
  if (p.is_polling()) {
    os << " polling";
    return os.str();
  }
  const char* name = opcode_name(p.opcode);
  if (p.opcode == INVALID_BYTE) {
    os << " op=??";
    return os.str();
  }
  os << " op=0x" << std::setw(2) << std::setfill('0') << p.opcode
     << "(" << (name ? name : "?") << ") args=[";
  for (size_t i = 0; i < p.args.size(); ++i) {
    if (i) os << ' ';
    if (p.args[i] == INVALID_BYTE) os << "??";
    else os << std::setw(2) << std::setfill('0') << p.args[i];
  }
  os << "]";
  return os.str();
}

// ---------- encode ----------

std::string encode_operation(LogicalAddress source, LogicalAddress target,
                             OperationCode opcode, const ParamBytes& params) {
  std::string out = "tx ";
  out += hex(static_cast<unsigned>(to_int(source)) & 0xF);
  out += hex(static_cast<unsigned>(to_int(target)) & 0xF);
  out += ':';
  out += hex(to_byte(opcode));
  for (auto b : params) {
    out += ':';
    out += hex(b);
  }
  return out;
}

std::string encode_broadcast(LogicalAddress source, OperationCode opcode,
                             const ParamBytes& params) {
  return encode_operation(source, LogicalAddress::BROADCAST, opcode, params);
}

std::string encode_command(const uint8_t* blocks, size_t n) {
  std::ostringstream os;
  os << "tx";
  for (size_t i = 0; i < n; ++i) {
    os << (i ? ':' : ' ') << std::hex;
    if (i == 0) os << std::setw(2) << std::setfill('0');   // header is always an address pair
    os << static_cast<unsigned>(blocks[i]);
  }
  return os.str();
}

ParamBytes encode_boolean_param(bool value) {
  ParamBytes out;
  out.push_back(value ? 0x01 : 0x00);
  return out;
}

ParamBytes encode_integer_param(uint32_t value) {
  ParamBytes out;
  out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
  return out;
}

ParamBytes encode_string_param(const std::string& value) {
  ParamBytes out;
  for (char c : value) {
    if (out.full()) break;
    out.push_back(static_cast<uint8_t>(c));
  }
  return out;
}

} // namespace cecbridge

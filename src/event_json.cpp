// -----------------------------------------------------------------------------
// event_json.cpp - bus events → JSON objects / one-line text (CLI output)
// -----------------------------------------------------------------------------
#include "cecbridge/event_json.hpp"

#include <iomanip>
#include <sstream>

#include "cecbridge/opcode.hpp"

namespace cecbridge {

using json = nlohmann::json;

static json args_to_json(const ArgBytes& args) {
  json a = json::array();
  for (auto b : args) {
    if (b == INVALID_BYTE) a.push_back(nullptr);
    else a.push_back(b);
  }
  return a;
}

// 0x1000 → "1.0.0.0"
static std::string physical_address_text(uint16_t pa) {
  std::ostringstream os;
  os << std::hex << ((pa >> 12) & 0xF) << '.' << ((pa >> 8) & 0xF) << '.'
     << ((pa >> 4) & 0xF) << '.' << (pa & 0xF);
  return os.str();
}

json packet_to_json(const ParsedPacket& p) {
  json j;
  json tokens = json::array();
  for (const auto& t : p.tokens) tokens.push_back(std::string(t.c_str()));
  j["tokens"] = tokens;
  j["source"] = p.source;
  j["target"] = p.target;
  if (!p.is_polling()) {
    j["opcode"] = p.opcode;
    const char* name = opcode_name(p.opcode);
    j["opcode_name"] = name ? json(name) : json(nullptr);
    j["args"] = args_to_json(p.args);
  }
  return j;
}

json event_to_json(const Event& ev) {
  json j;
  j["event"] = ev.name;

  if (const auto* e = ev.get<LineEvent>()) {
    j["line"] = e->line;
  } else if (const auto* e = ev.get<PacketEvent>()) {
    j["packet"] = packet_to_json(e->packet);
  } else if (const auto* e = ev.get<OsdNameEvent>()) {
    j["packet"] = packet_to_json(e->packet);
    j["name"] = std::string(e->name.c_str());
  } else if (const auto* e = ev.get<RoutingChangeEvent>()) {
    j["packet"] = packet_to_json(e->packet);
    j["from"] = physical_address_text(e->from);
    j["to"] = physical_address_text(e->to);
  } else if (const auto* e = ev.get<ActiveSourceEvent>()) {
    j["packet"] = packet_to_json(e->packet);
    j["physical_address"] = physical_address_text(e->physical_address);
  } else if (const auto* e = ev.get<PhysicalAddressEvent>()) {
    j["packet"] = packet_to_json(e->packet);
    j["physical_address"] = physical_address_text(e->physical_address);
    j["device_type"] = e->device_type == INVALID_BYTE ? json(nullptr) : json(e->device_type);
  } else if (const auto* e = ev.get<OperationEvent>()) {
    j["opcode_name"] = e->opcode_name;
    j["packet"] = packet_to_json(e->packet);
    j["args"] = args_to_json(e->args);
  } else if (const auto* e = ev.get<KeyEvent>()) {
    j["key"] = std::string(e->key.c_str());
    j["key_code"] = e->key_code;
    j["repeat"] = e->repeat;
  }
  return j;
}

std::string to_json_text(const json& j, int indent) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string event_to_text(const Event& ev) {
  std::ostringstream os;
  os << "event=" << ev.name;

  if (const auto* e = ev.get<LineEvent>()) {
    os << " line=\"" << e->line << "\"";
  } else if (const auto* e = ev.get<PacketEvent>()) {
    os << " " << describe_packet(e->packet);
  } else if (const auto* e = ev.get<OsdNameEvent>()) {
    os << " name=\"" << e->name.c_str() << "\"";
  } else if (const auto* e = ev.get<RoutingChangeEvent>()) {
    os << " from=" << physical_address_text(e->from) << " to=" << physical_address_text(e->to);
  } else if (const auto* e = ev.get<ActiveSourceEvent>()) {
    os << " physical_address=" << physical_address_text(e->physical_address);
  } else if (const auto* e = ev.get<PhysicalAddressEvent>()) {
    os << " physical_address=" << physical_address_text(e->physical_address)
       << " device_type=" << e->device_type;
  } else if (const auto* e = ev.get<OperationEvent>()) {
    os << " " << describe_packet(e->packet);
  } else if (const auto* e = ev.get<KeyEvent>()) {
    os << " key=" << e->key.c_str() << " code=" << e->key_code
       << " repeat=" << (e->repeat ? "true" : "false");
  }
  return os.str();
}

} // namespace cecbridge

#ifndef CECBRIDGE_EVENT_JSON_HPP
#define CECBRIDGE_EVENT_JSON_HPP

#include <string>
#include "nlohmann/json.hpp"
#include "cecbridge/events.hpp"

namespace cecbridge {

/// Packet as JSON: {"tokens":[...],"source":..,"target":..,"opcode":..,"opcode_name":..,"args":[...]}.
nlohmann::json packet_to_json(const ParsedPacket& p);

/// Event as JSON object with "event" plus payload fields.
nlohmann::json event_to_json(const Event& ev);

/// json::dump() that never throws. Bytes that are not valid UTF-8 (Latin-1
/// OSD names, stray bytes in traffic tokens) come out as U+FFFD.
std::string to_json_text(const nlohmann::json& j, int indent = -1);

/// Single-line key=value rendering for the CLI's pretty output.
std::string event_to_text(const Event& ev);

} // namespace cecbridge

#endif // CECBRIDGE_EVENT_JSON_HPP

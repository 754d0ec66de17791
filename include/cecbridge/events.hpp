/**
 * @file events.hpp
 * @brief Event names and payloads published by Monitor and Remote.
 *
 * @details
 * Names are the contract with subscribers:
 *
 * | name                      | payload              | emitted by |
 * |---------------------------|----------------------|------------|
 * | `ready`, `stop`           | (none)               | Monitor    |
 * | `data`, `line`            | LineEvent            | Monitor    |
 * | `polling`, `packet`       | PacketEvent          | Monitor    |
 * | `SET_OSD_NAME`            | OsdNameEvent         | Monitor    |
 * | `ROUTING_CHANGE`          | RoutingChangeEvent   | Monitor    |
 * | `ACTIVE_SOURCE`           | ActiveSourceEvent    | Monitor    |
 * | `REPORT_PHYSICAL_ADDRESS` | PhysicalAddressEvent | Monitor    |
 * | `op.<OPCODE_NAME>`        | OperationEvent       | Monitor    |
 * | `keydown`, `keyup`        | KeyEvent             | Remote     |
 * | `keypress`, `keypress.<KEY>` | KeyEvent          | Remote     |
 */
#ifndef CECBRIDGE_EVENTS_HPP
#define CECBRIDGE_EVENTS_HPP

#include <stdint.h>
#include <string>
#include <variant>
#include "etl/string.h"
#include "cecbridge/packet.hpp"

namespace cecbridge {

namespace event {
static constexpr const char* READY                   = "ready";
static constexpr const char* STOP                    = "stop";
static constexpr const char* DATA                    = "data";
static constexpr const char* LINE                    = "line";
static constexpr const char* POLLING                 = "polling";
static constexpr const char* PACKET                  = "packet";
static constexpr const char* SET_OSD_NAME            = "SET_OSD_NAME";
static constexpr const char* ROUTING_CHANGE          = "ROUTING_CHANGE";
static constexpr const char* ACTIVE_SOURCE           = "ACTIVE_SOURCE";
static constexpr const char* REPORT_PHYSICAL_ADDRESS = "REPORT_PHYSICAL_ADDRESS";
static constexpr const char* KEYDOWN                 = "keydown";
static constexpr const char* KEYUP                   = "keyup";
static constexpr const char* KEYPRESS                = "keypress";
static constexpr const char* OP_PREFIX               = "op.";
static constexpr const char* KEYPRESS_PREFIX         = "keypress.";
} // namespace event

using KeyNameStr = etl::string<32>;

struct LineEvent {
  std::string line;
};

struct PacketEvent {
  ParsedPacket packet;
};

struct OsdNameEvent {
  ParsedPacket packet;
  OsdNameStr   name;
};

struct RoutingChangeEvent {
  ParsedPacket packet;
  uint16_t     from{0};
  uint16_t     to{0};
};

struct ActiveSourceEvent {
  ParsedPacket packet;
  uint16_t     physical_address{0};
};

struct PhysicalAddressEvent {
  ParsedPacket packet;
  uint16_t     physical_address{0};
  int16_t      device_type{INVALID_BYTE};  ///< operand 2, INVALID_BYTE when absent
};

/// Generic `op.<NAME>` payload; args are the packet operands as decoded.
struct OperationEvent {
  std::string  opcode_name;
  ParsedPacket packet;
  ArgBytes     args;
};

/**
 * @brief Key state change from the adapter's remote-control log lines.
 *
 * On keydown, `repeat` means the same key is still held. On keypress, it
 * means the previous completed key was this one.
 */
struct KeyEvent {
  KeyNameStr key;
  int        key_code{-1};
  bool       repeat{false};
};

using EventPayload = std::variant<std::monostate,
                                  LineEvent,
                                  PacketEvent,
                                  OsdNameEvent,
                                  RoutingChangeEvent,
                                  ActiveSourceEvent,
                                  PhysicalAddressEvent,
                                  OperationEvent,
                                  KeyEvent>;

struct Event {
  std::string  name;
  EventPayload payload;

  /// Typed payload access; nullptr if the event carries another type.
  template <typename T>
  const T* get() const { return std::get_if<T>(&payload); }
};

} // namespace cecbridge

#endif // CECBRIDGE_EVENTS_HPP

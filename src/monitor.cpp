// -----------------------------------------------------------------------------
// monitor.cpp - adapter line classification, traffic publish, tx output
//
// Model & event flow: see include/cecbridge/monitor.hpp
// Usage: see tests/test_monitor.cpp
// -----------------------------------------------------------------------------
#include "cecbridge/monitor.hpp"

#include <utility>

#include <boost/regex.hpp>

#include "cecbridge/log.hpp"

namespace cecbridge {

// "DEBUG:   [  95]\tAllocateLogicalAddresses - device '0', type 'recording device', LA '1'"
static const boost::regex& allocation_pattern() {
  static const boost::regex re(
      R"(^DEBUG:[ \[\d\]\t]+AllocateLogicalAddresses - device '\d', type '[\w ]+', LA '([0-9a-fA-F])')");
  return re;
}

static const boost::regex& traffic_pattern() {
  static const boost::regex re("^TRAFFIC:");
  return re;
}

Monitor::Monitor(transport::ITransport& transport, std::string device_name,
                 LogicalAddress device_address, bool monitor_mode)
  : transport_(transport),
    device_name_(std::move(device_name)),
    requested_address_(device_address),
    device_address_(device_address),
    monitor_mode_(monitor_mode),
    splitter_([this](const std::string& line) { process_line(line); }) {
  handlers_.add_contains(READY_MARKER, [this](const std::string& l) { on_ready(l); });
  handlers_.add_pattern(traffic_pattern(), [this](const std::string& l) { process_traffic(l); });
  handlers_.add_pattern(allocation_pattern(), [this](const std::string& l) { set_device_address(l); });
}

// ---------- lifecycle ----------

std::vector<std::string> Monitor::client_arguments() const {
  std::vector<std::string> args;
  if (!device_name_.empty()) {
    args.push_back("-o");
    args.push_back(device_name_);
    args.push_back("-t");
    args.push_back(std::string(1, client_type_for(requested_address_)));
  }
  return args;
}

bool Monitor::start(transport::Config cfg) {
  for (auto& a : client_arguments()) cfg.args.push_back(std::move(a));
  CECBRIDGE_INFO("monitor", "start program=" << cfg.program << " args=" << cfg.args.size()
                 << " name=" << device_name_
                 << " address=" << logical_address_name(requested_address_));
  if (!transport_.begin(cfg)) {
    CECBRIDGE_ERROR("monitor", "transport " << transport_.name() << " failed to start");
    return false;
  }
  return true;
}

void Monitor::stop() {
  CECBRIDGE_DEBUG("monitor", "stop (by host)");
  ready_ = false;
  events_.emit(event::STOP);
  transport_.end();
}

void Monitor::end_of_stream() {
  CECBRIDGE_DEBUG("monitor", "stop (by adapter)");
  splitter_.finish();
  ready_ = false;
  events_.emit(event::STOP);
}

void Monitor::on_ready(const std::string& /*line*/) {
  ready_ = true;
  CECBRIDGE_INFO("monitor", "adapter ready, address=" << logical_address_name(device_address_));
  events_.emit(event::READY);
}

// ---------- inbound ----------

size_t Monitor::feed(const char* data, size_t len) {
  return splitter_.feed(data, len);
}

size_t Monitor::process_line(const std::string& line) {
  CECBRIDGE_TRACE("monitor:raw", "rx \"" << line << "\"");
  events_.emit(event::DATA, LineEvent{line});
  events_.emit(event::LINE, LineEvent{line});
  return handlers_.dispatch(line);
}

bool Monitor::set_device_address(const std::string& line) {
  boost::smatch m;
  if (!boost::regex_search(line, m, allocation_pattern())) return false;

  LogicalAddress granted;
  if (!parse_logical_address("0x" + m.str(1), granted)) return false;

  if (granted != device_address_) {
    CECBRIDGE_INFO("monitor", "address granted " << logical_address_name(granted)
                   << " (requested " << logical_address_name(requested_address_) << ")");
  }
  device_address_ = granted;
  return true;
}

bool Monitor::process_traffic(const std::string& line) {
  return process_packet(decode_traffic(line));
}

bool Monitor::addressed_to_us(const ParsedPacket& packet) const {
  return packet.target == to_int(device_address_) ||
         packet.target == to_int(LogicalAddress::BROADCAST);
}

bool Monitor::process_packet(const ParsedPacket& packet) {
  if (packet.is_polling()) {
    events_.emit(event::POLLING, PacketEvent{packet});
    return false;
  }

  if (!monitor_mode_ && !addressed_to_us(packet)) return false;   // someone else's conversation

  CECBRIDGE_DEBUG("monitor", describe_packet(packet));
  events_.emit(event::PACKET, PacketEvent{packet});

  if (!is_known_opcode(packet.opcode)) return false;
  const auto op = static_cast<OperationCode>(packet.opcode);
  const ArgBytes& a = packet.args;

  switch (op) {
    case OperationCode::SET_OSD_NAME: {
      if (a.empty()) return false;
      events_.emit(event::SET_OSD_NAME, OsdNameEvent{packet, decode_osd_name(a)});
      return true;
    }
    case OperationCode::ROUTING_CHANGE: {
      if (packet.has_invalid_args(4)) return false;
      events_.emit(event::ROUTING_CHANGE,
                   RoutingChangeEvent{packet, decode_be16(a, 0), decode_be16(a, 2)});
      return true;
    }
    case OperationCode::ACTIVE_SOURCE: {
      if (packet.has_invalid_args(2)) return false;
      events_.emit(event::ACTIVE_SOURCE, ActiveSourceEvent{packet, decode_be16(a, 0)});
      return true;
    }
    case OperationCode::REPORT_PHYSICAL_ADDRESS: {
      if (packet.has_invalid_args(2)) return false;
      const int16_t device_type = a.size() > 2 ? a[2] : INVALID_BYTE;
      events_.emit(event::REPORT_PHYSICAL_ADDRESS,
                   PhysicalAddressEvent{packet, decode_be16(a, 0), device_type});
      return true;
    }
    default: {
      const char* name = opcode_name(op);
      events_.emit(opcode_event_name(op), OperationEvent{name, packet, a});
      return true;
    }
  }
}

// ---------- outbound ----------

bool Monitor::send(const std::string& message) {
  CECBRIDGE_DEBUG("monitor:raw", "tx \"" << message << "\"");
  const std::string wire = message + "\n";
  const auto r = transport_.send(reinterpret_cast<const uint8_t*>(wire.data()), wire.size());
  if (r != transport::TxResult::Ok) {
    CECBRIDGE_WARN("monitor", "send failed: " << message);
    return false;
  }
  return true;
}

bool Monitor::send_command(const uint8_t* blocks, size_t n) {
  if (!blocks || n == 0) return false;
  return send(encode_command(blocks, n));
}

bool Monitor::execute_operation(LogicalAddress target, OperationCode opcode,
                                const ParamBytes& params) {
  return send(encode_operation(device_address_, target, opcode, params));
}

bool Monitor::execute_operation_with_boolean(LogicalAddress target, OperationCode opcode, bool param) {
  return execute_operation(target, opcode, encode_boolean_param(param));
}

bool Monitor::execute_operation_with_integer(LogicalAddress target, OperationCode opcode, uint32_t param) {
  return execute_operation(target, opcode, encode_integer_param(param));
}

bool Monitor::execute_operation_with_string(LogicalAddress target, OperationCode opcode,
                                            const std::string& param) {
  return execute_operation(target, opcode, encode_string_param(param));
}

bool Monitor::execute_broadcast_operation(OperationCode opcode, const ParamBytes& params) {
  return send(encode_broadcast(device_address_, opcode, params));
}

} // namespace cecbridge

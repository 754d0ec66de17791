/**
 * @file monitor.hpp
 * @brief cecbridge Monitor - adapter lines in, typed bus events out, `tx` lines back.
 *
 * @details
 * ## Field Brief
 * The adapter (libcec's `cec-client`) is chatty and unstructured: timestamps,
 * debug noise, traffic dumps, key logs, all on one text stream. The Monitor
 * is the only place that reads that stream. It owns:
 *
 * - a **HandlerRegistry** that classifies each line,
 * - the **packet decode** path for `TRAFFIC:` lines,
 * - an **EventBus** where decoded traffic is republished by name,
 * - the local device identity (name, requested and granted logical address).
 *
 * It never spawns anything. The host hands it a transport for writes and
 * feeds it bytes (feed()) or whole lines (process_line()).
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  adapter stdout ── feed() ──► LineSplitter ──► process_line()
 *                                                   │  emit data, line
 *                                                   ▼
 *                                           HandlerRegistry::dispatch()
 *                      ┌───────────────────┬────────┴──────────┬──────────────────┐
 *               "waiting for input"    ^TRAFFIC:        LA allocation       Remote key lines
 *                 ready=true          decode_traffic()   device address      (installed later)
 *                 emit ready          process_packet()
 *                                      │ polling? ─► emit polling, stop
 *                                      │ not for us & !monitor_mode ─► drop
 *                                      │ emit packet
 *                                      └─► SET_OSD_NAME / ROUTING_CHANGE /
 *                                          ACTIVE_SOURCE / REPORT_PHYSICAL_ADDRESS /
 *                                          op.<NAME>
 * ```
 *
 * ---
 *
 * @par States
 * - **not ready** (initial): sends go out but the adapter is not listening yet.
 * - **ready**: entered on "waiting for input"; left only by stop(). Every
 *   such line emits `ready` again, so a restarted adapter is announced too.
 *
 * ---
 *
 * @par Failure Model
 * - Transport write failure: send-family calls return `false`.
 * - Unmatched line: nothing beyond `data`/`line`.
 * - Packet not addressed to us (monitor mode off): dropped silently.
 * - Unknown opcode or too few operands: only `packet` fires.
 * - Stream end: end_of_stream() emits `stop`. Nothing here throws.
 */
#ifndef CECBRIDGE_MONITOR_HPP
#define CECBRIDGE_MONITOR_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "cecbridge/event_bus.hpp"
#include "cecbridge/handler_registry.hpp"
#include "cecbridge/line_splitter.hpp"
#include "cecbridge/logical_address.hpp"
#include "cecbridge/opcode.hpp"
#include "cecbridge/packet.hpp"
#include "cecbridge/transport/transport_base.hpp"

namespace cecbridge {

class Monitor {
public:
  static constexpr const char* DEFAULT_DEVICE_NAME = "cecbridge";
  static constexpr const char* READY_MARKER        = "waiting for input";

  /**
   * @param transport      Where outbound lines go. Not owned; must outlive the Monitor.
   * @param device_name    OSD name announced to the bus (`-o`).
   * @param device_address Address category to claim (`-t`); the adapter may grant another.
   * @param monitor_mode   Surface packets addressed to other devices too.
   */
  explicit Monitor(transport::ITransport& transport,
                   std::string device_name = DEFAULT_DEVICE_NAME,
                   LogicalAddress device_address = LogicalAddress::RECORDINGDEVICE1,
                   bool monitor_mode = false);

  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  /// @name Lifecycle
  ///@{

  /**
   * @brief Build the adapter command line and begin the transport.
   *
   * `-o <device_name>` and `-t <type>` are appended after @p cfg.args.
   * @return transport begin() result.
   */
  bool start(transport::Config cfg);

  /// Emit `stop`, leave the ready state and end the transport.
  void stop();

  /// Adapter stream closed: flush the last partial line, then emit `stop`.
  void end_of_stream();

  /// Arguments start() passes to the adapter after any extras.
  std::vector<std::string> client_arguments() const;

  bool ready() const { return ready_; }
  ///@}

  /// @name Inbound
  ///@{

  /// Raw adapter output, any chunking.
  size_t feed(const char* data, size_t len);

  /**
   * @brief Classify one complete line.
   *
   * Emits `data` and `line`, then runs the handler registry.
   * @return Number of handlers that fired.
   */
  size_t process_line(const std::string& line);

  /// Decode a TRAFFIC line and publish it. Returns process_packet()'s result.
  bool process_traffic(const std::string& line);

  /**
   * @brief Publish one decoded packet.
   * @return true if a semantic (non-generic) event was emitted.
   */
  bool process_packet(const ParsedPacket& packet);

  /**
   * @brief Take the granted logical address from an allocation line.
   * @return false if @p line is not an allocation line.
   */
  bool set_device_address(const std::string& line);
  ///@}

  /// @name Outbound (transport-level success only, never bus acknowledgement)
  ///@{
  bool send(const std::string& message);
  bool send_command(const uint8_t* blocks, size_t n);
  bool execute_operation(LogicalAddress target, OperationCode opcode,
                         const ParamBytes& params = ParamBytes());
  bool execute_operation_with_boolean(LogicalAddress target, OperationCode opcode, bool param);
  bool execute_operation_with_integer(LogicalAddress target, OperationCode opcode, uint32_t param);
  bool execute_operation_with_string(LogicalAddress target, OperationCode opcode,
                                     const std::string& param);
  bool execute_broadcast_operation(OperationCode opcode,
                                   const ParamBytes& params = ParamBytes());
  ///@}

  /// @name Identity & policy
  ///@{
  const std::string& device_name() const { return device_name_; }
  LogicalAddress device_address() const { return device_address_; }
  LogicalAddress requested_address() const { return requested_address_; }
  bool monitor_mode() const { return monitor_mode_; }
  void set_monitor_mode(bool on) { monitor_mode_ = on; }
  ///@}

  /// Shared with the Remote, which installs its key patterns here.
  HandlerRegistry& handlers() { return handlers_; }
  EventBus& events() { return events_; }

private:
  void on_ready(const std::string& line);
  bool addressed_to_us(const ParsedPacket& packet) const;

  transport::ITransport& transport_;
  std::string            device_name_;
  LogicalAddress         requested_address_;
  LogicalAddress         device_address_;
  bool                   monitor_mode_;
  bool                   ready_{false};

  HandlerRegistry handlers_;
  EventBus        events_;
  LineSplitter    splitter_;
};

} // namespace cecbridge

#endif // CECBRIDGE_MONITOR_HPP

/**
 * @file commander.hpp
 * @brief High-level CEC intents on top of the Monitor, with request/response correlation.
 *
 * @details
 * Two kinds of operation:
 *
 * - **Fire-and-forget** (broadcast_standby, set_power_state, press_button,
 *   set_active_source, set_osd_name): encode, write, return the transport
 *   result. The bus never acknowledges at this layer.
 *
 * - **Queries** (get_power_state, get_osd_name, get_physical_address,
 *   get_cec_version): write the request, then arm two things at once, a
 *   one-shot subscription on the reply event and a deadline. The first to
 *   happen settles the Reply; it also disarms the other:
 *   ```
 *     reply event ─► resolve ─► drop deadline entry
 *     tick() past deadline ─► bus.off(subscription) ─► reject
 *   ```
 *   A late event after a timeout therefore finds no listener.
 *
 * Time is driven by the host: pass `now_ms` to each query and call tick()
 * regularly with the same clock (the loop that feeds the Monitor is the
 * natural place). Nothing here blocks.
 *
 * @par Concurrency of queries
 * Each query has its own subscription. Two identical queries in flight are
 * satisfied by the next two matching events, in event order.
 */
#ifndef CECBRIDGE_COMMANDER_HPP
#define CECBRIDGE_COMMANDER_HPP

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <string>
#include "etl/vector.h"
#include "cecbridge/event_bus.hpp"
#include "cecbridge/logical_address.hpp"
#include "cecbridge/monitor.hpp"
#include "cecbridge/packet.hpp"
#include "cecbridge/power_status.hpp"
#include "cecbridge/reply.hpp"
#include "cecbridge/user_control.hpp"

namespace cecbridge {

class Commander {
public:
  static constexpr uint32_t RESPONSE_TIMEOUT_MS = 5000;  ///< fixed per query
  static constexpr size_t   PENDING_CAP         = 8;     ///< outstanding queries

  static constexpr const char* TIMEOUT_REASON   = "Target cec-device took too long to respond to the request.";
  static constexpr const char* PENDING_FULL     = "Too many outstanding requests.";
  static constexpr const char* CANCELLED_REASON = "Request cancelled.";

  /// @param monitor Not owned; must outlive the Commander.
  explicit Commander(Monitor& monitor);

  /// Cancels outstanding queries (rejects them, removes their subscriptions).
  ~Commander();

  Commander(const Commander&) = delete;
  Commander& operator=(const Commander&) = delete;

  /// @name Fire-and-forget
  ///@{

  /// STANDBY to every device.
  bool broadcast_standby();

  /// STANDBY → STANDBY opcode, ON → IMAGE_VIEW_ON, anything else → false.
  bool set_power_state(PowerStatus state, LogicalAddress target = LogicalAddress::TV);

  /// USER_CONTROL_PRESSED then USER_CONTROL_RELEASE; true only if both were written.
  bool press_button(UserControlButton button, LogicalAddress target = LogicalAddress::TV);

  /// Broadcast ACTIVE_SOURCE with our physical address (e.g. 0x1000 for 1.0.0.0).
  bool set_active_source(uint16_t physical_address);

  /// SET_OSD_NAME to @p target (name cut to 14 bytes).
  bool set_osd_name(const std::string& name, LogicalAddress target = LogicalAddress::TV);
  ///@}

  /// @name Queries
  ///@{
  ReplyPtr<PowerStatus> get_power_state(uint32_t now_ms, LogicalAddress target = LogicalAddress::TV);
  ReplyPtr<OsdNameStr>  get_osd_name(uint32_t now_ms, LogicalAddress target = LogicalAddress::TV);
  ReplyPtr<uint16_t>    get_physical_address(uint32_t now_ms, LogicalAddress target = LogicalAddress::TV);
  ReplyPtr<uint8_t>     get_cec_version(uint32_t now_ms, LogicalAddress target = LogicalAddress::TV);
  ///@}

  /**
   * @brief Expire queries whose deadline has passed.
   * @return Number of queries rejected by this call.
   */
  size_t tick(uint32_t now_ms);

  size_t pending_count() const { return pending_.size(); }

  Monitor& monitor() { return monitor_; }

private:
  struct PendingQuery {
    uint32_t                          id;
    EventBus::SubscriptionId          subscription;
    uint32_t                          deadline_ms;
    std::function<void(const std::string&)> fail;
  };

  /**
   * @brief Send a request and correlate the reply.
   *
   * @param what    Human label for the send-failure message ("the power status").
   * @param event   Reply event name to wait on.
   * @param extract Maps the reply event to the result value.
   */
  template <typename T>
  ReplyPtr<T> query(uint32_t now_ms, LogicalAddress target, OperationCode request,
                    const char* what, const std::string& event,
                    std::function<T(const Event&)> extract);

  bool remove_pending(uint32_t id);

  Monitor&                                   monitor_;
  etl::vector<PendingQuery, PENDING_CAP>     pending_;
  uint32_t                                   next_query_id_{1};
};

} // namespace cecbridge

#endif // CECBRIDGE_COMMANDER_HPP

// -----------------------------------------------------------------------------
// commander.cpp - fire-and-forget operations and request/response queries
//
// Every query is a (one-shot subscription, deadline) pair. Whichever side
// fires first settles the Reply and disarms the other:
//   reply event → remove_pending(id) drops the deadline
//   tick() past deadline → off(subscription) drops the listener
// Reply::resolve/reject ignore a second settle anyway.
// -----------------------------------------------------------------------------
#include "cecbridge/commander.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "cecbridge/log.hpp"

namespace cecbridge {

Commander::Commander(Monitor& monitor) : monitor_(monitor) {}

Commander::~Commander() {
  std::vector<PendingQuery> left(pending_.begin(), pending_.end());
  pending_.clear();
  for (auto& q : left) {
    monitor_.events().off(q.subscription);
    if (q.fail) q.fail(CANCELLED_REASON);
  }
}

// ---------- fire-and-forget ----------

bool Commander::broadcast_standby() {
  return monitor_.execute_broadcast_operation(OperationCode::STANDBY);
}

bool Commander::set_power_state(PowerStatus state, LogicalAddress target) {
  switch (state) {
    case PowerStatus::STANDBY: return monitor_.execute_operation(target, OperationCode::STANDBY);
    case PowerStatus::ON:      return monitor_.execute_operation(target, OperationCode::IMAGE_VIEW_ON);
    default:
      CECBRIDGE_WARN("commander", "cannot request power state " << power_status_name(state));
      return false;
  }
}

bool Commander::press_button(UserControlButton button, LogicalAddress target) {
  ParamBytes key;
  key.push_back(static_cast<uint8_t>(button));
  if (!monitor_.execute_operation(target, OperationCode::USER_CONTROL_PRESSED, key)) return false;
  return monitor_.execute_operation(target, OperationCode::USER_CONTROL_RELEASE);
}

bool Commander::set_active_source(uint16_t physical_address) {
  ParamBytes pa;
  pa.push_back(static_cast<uint8_t>(physical_address >> 8));
  pa.push_back(static_cast<uint8_t>(physical_address & 0xFF));
  return monitor_.execute_broadcast_operation(OperationCode::ACTIVE_SOURCE, pa);
}

bool Commander::set_osd_name(const std::string& name, LogicalAddress target) {
  return monitor_.execute_operation_with_string(target, OperationCode::SET_OSD_NAME, name);
}

// ---------- queries ----------

template <typename T>
ReplyPtr<T> Commander::query(uint32_t now_ms, LogicalAddress target, OperationCode request,
                             const char* what, const std::string& event,
                             std::function<T(const Event&)> extract) {
  if (pending_.full()) {
    CECBRIDGE_WARN("commander", "refusing " << opcode_name(request) << ": "
                   << pending_.size() << " queries outstanding");
    return rejected_reply<T>(PENDING_FULL);
  }

  if (!monitor_.execute_operation(target, request)) {
    return rejected_reply<T>(std::string("Unable to request ") + what + ".");
  }

  auto reply = std::make_shared<Reply<T>>();
  const uint32_t id = next_query_id_++;

  const auto sub = monitor_.events().once(event,
      [this, id, reply, extract](const Event& ev) {
        remove_pending(id);
        reply->resolve(extract(ev));
      });

  pending_.push_back(PendingQuery{id, sub, now_ms + RESPONSE_TIMEOUT_MS,
                                  [reply](const std::string& reason) { reply->reject(reason); }});

  CECBRIDGE_DEBUG("commander", "query #" << id << " " << opcode_name(request)
                  << " → " << logical_address_name(target) << ", awaiting " << event);
  return reply;
}

ReplyPtr<PowerStatus> Commander::get_power_state(uint32_t now_ms, LogicalAddress target) {
  return query<PowerStatus>(now_ms, target, OperationCode::GIVE_DEVICE_POWER_STATUS,
      "the power status", opcode_event_name(OperationCode::REPORT_POWER_STATUS),
      [](const Event& ev) {
        const auto* op = ev.get<OperationEvent>();
        if (!op || op->args.empty()) return PowerStatus::UNKNOWN;
        return power_status_from_int(op->args[0]);
      });
}

ReplyPtr<OsdNameStr> Commander::get_osd_name(uint32_t now_ms, LogicalAddress target) {
  return query<OsdNameStr>(now_ms, target, OperationCode::GIVE_OSD_NAME,
      "the OSD name", event::SET_OSD_NAME,
      [](const Event& ev) {
        const auto* osd = ev.get<OsdNameEvent>();
        return osd ? osd->name : OsdNameStr();
      });
}

ReplyPtr<uint16_t> Commander::get_physical_address(uint32_t now_ms, LogicalAddress target) {
  return query<uint16_t>(now_ms, target, OperationCode::GIVE_PHYSICAL_ADDRESS,
      "the physical address", event::REPORT_PHYSICAL_ADDRESS,
      [](const Event& ev) -> uint16_t {
        const auto* pa = ev.get<PhysicalAddressEvent>();
        return pa ? pa->physical_address : 0;
      });
}

ReplyPtr<uint8_t> Commander::get_cec_version(uint32_t now_ms, LogicalAddress target) {
  return query<uint8_t>(now_ms, target, OperationCode::GET_CEC_VERSION,
      "the CEC version", opcode_event_name(OperationCode::CEC_VERSION),
      [](const Event& ev) -> uint8_t {
        const auto* op = ev.get<OperationEvent>();
        if (!op || op->args.empty() || op->args[0] == INVALID_BYTE) return 0;
        return static_cast<uint8_t>(op->args[0]);
      });
}

// ---------- deadlines ----------

bool Commander::remove_pending(uint32_t id) {
  auto it = std::find_if(pending_.begin(), pending_.end(),
                         [id](const PendingQuery& q) { return q.id == id; });
  if (it == pending_.end()) return false;
  pending_.erase(it);
  return true;
}

size_t Commander::tick(uint32_t now_ms) {
  // Unlink every expired entry before running any continuation; a
  // continuation may settle or add queries and so reshape pending_.
  std::vector<PendingQuery> expired;
  for (size_t i = 0; i < pending_.size();) {
    if (static_cast<int32_t>(now_ms - pending_[i].deadline_ms) < 0) { ++i; continue; }  // wrap-safe

    expired.push_back(pending_[i]);
    pending_.erase(pending_.begin() + i);
    monitor_.events().off(expired.back().subscription);
  }

  for (auto& q : expired) {
    CECBRIDGE_INFO("commander", "query #" << q.id << " timed out");
    if (q.fail) q.fail(TIMEOUT_REASON);
  }
  return expired.size();
}

} // namespace cecbridge

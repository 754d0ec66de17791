// -----------------------------------------------------------------------------
// event_bus.cpp - name-keyed listeners, once/off, re-entrant emit
// -----------------------------------------------------------------------------
#include "cecbridge/event_bus.hpp"

#include <algorithm>
#include <utility>

namespace cecbridge {

EventBus::SubscriptionId EventBus::subscribe(const std::string& name, Listener fn, bool once) {
  const SubscriptionId id = next_id_++;
  if (next_id_ == NO_SUBSCRIPTION) next_id_ = 1;   // wrap, never hand out 0
  subs_.push_back(Subscription{id, name, std::move(fn), once});
  return id;
}

EventBus::SubscriptionId EventBus::on(const std::string& name, Listener fn) {
  return subscribe(name, std::move(fn), false);
}

EventBus::SubscriptionId EventBus::once(const std::string& name, Listener fn) {
  return subscribe(name, std::move(fn), true);
}

std::vector<EventBus::Subscription>::iterator EventBus::find(SubscriptionId id) {
  return std::find_if(subs_.begin(), subs_.end(),
                      [id](const Subscription& s) { return s.id == id; });
}

bool EventBus::off(SubscriptionId id) {
  auto it = find(id);
  if (it == subs_.end()) return false;
  subs_.erase(it);
  return true;
}

size_t EventBus::emit(const Event& ev) {
  // Snapshot who is subscribed right now; later additions wait for the next emit.
  std::vector<SubscriptionId> targets;
  for (const auto& s : subs_) {
    if (s.name == ev.name) targets.push_back(s.id);
  }

  size_t invoked = 0;
  for (SubscriptionId id : targets) {
    auto it = find(id);
    if (it == subs_.end()) continue;            // removed by an earlier listener
    Listener fn = it->fn;
    if (it->once) subs_.erase(it);              // gone before it runs
    if (fn) {
      fn(ev);
      ++invoked;
    }
  }
  return invoked;
}

size_t EventBus::emit(const std::string& name, EventPayload payload) {
  return emit(Event{name, std::move(payload)});
}

size_t EventBus::listener_count(const std::string& name) const {
  return static_cast<size_t>(std::count_if(subs_.begin(), subs_.end(),
                             [&name](const Subscription& s) { return s.name == name; }));
}

} // namespace cecbridge

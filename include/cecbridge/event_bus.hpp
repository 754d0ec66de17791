/**
 * @file event_bus.hpp
 * @brief Name-keyed publish/subscribe registry with one-shot subscriptions.
 *
 * @details
 * One bus per Monitor (bus traffic) and one per Remote (key events). No
 * globals.
 *
 * Rules:
 * - Any number of listeners per name; they run in subscription order.
 * - A one-shot listener is removed *before* it runs, so it fires at most
 *   once even if the listener itself emits the same event again.
 * - Listeners may subscribe or unsubscribe during emit(). A listener removed
 *   by an earlier listener of the same emit does not run; a listener added
 *   during emit() waits for the next one.
 * - off() on an id that already fired or was removed returns false. That is
 *   what lets a timer and an event race without double resolution.
 */
#ifndef CECBRIDGE_EVENT_BUS_HPP
#define CECBRIDGE_EVENT_BUS_HPP

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <string>
#include <vector>
#include "cecbridge/events.hpp"

namespace cecbridge {

class EventBus {
public:
  using Listener       = std::function<void(const Event&)>;
  using SubscriptionId = uint32_t;

  static constexpr SubscriptionId NO_SUBSCRIPTION = 0;

  /// Subscribe until off().
  SubscriptionId on(const std::string& name, Listener fn);

  /// Subscribe for the next matching event only.
  SubscriptionId once(const std::string& name, Listener fn);

  /// Remove a subscription. false if it is already gone.
  bool off(SubscriptionId id);

  /// Deliver @p ev to every listener of ev.name. Returns listeners invoked.
  size_t emit(const Event& ev);

  /// Shorthand for emit(Event{name, payload}).
  size_t emit(const std::string& name, EventPayload payload = std::monostate{});

  size_t listener_count(const std::string& name) const;
  size_t listener_count() const { return subs_.size(); }

private:
  struct Subscription {
    SubscriptionId id;
    std::string    name;
    Listener       fn;
    bool           once;
  };

  SubscriptionId subscribe(const std::string& name, Listener fn, bool once);
  std::vector<Subscription>::iterator find(SubscriptionId id);

  std::vector<Subscription> subs_;
  SubscriptionId            next_id_{1};
};

} // namespace cecbridge

#endif // CECBRIDGE_EVENT_BUS_HPP

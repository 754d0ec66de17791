/**
 * @file reply.hpp
 * @brief Deferred result of a bus query: pending, then resolved or rejected exactly once.
 *
 * The host keeps pumping adapter lines while a Reply is pending; whoever
 * settles it first wins and later attempts are ignored (resolve()/reject()
 * return false). Continuations registered with then() run on settlement, or
 * immediately if the Reply is already settled.
 */
#ifndef CECBRIDGE_REPLY_HPP
#define CECBRIDGE_REPLY_HPP

#include <stdint.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cecbridge {

template <typename T>
class Reply {
public:
  enum class State : uint8_t { Pending, Resolved, Rejected };

  using ResolveFn = std::function<void(const T&)>;
  using RejectFn  = std::function<void(const std::string&)>;

  State state() const { return state_; }
  bool  pending() const { return state_ == State::Pending; }
  bool  resolved() const { return state_ == State::Resolved; }
  bool  rejected() const { return state_ == State::Rejected; }

  /// Valid once resolved().
  const T& value() const { return value_; }

  /// Valid once rejected().
  const std::string& error() const { return error_; }

  bool resolve(const T& v) {
    if (state_ != State::Pending) return false;
    value_ = v;
    state_ = State::Resolved;
    settle();
    return true;
  }

  bool reject(const std::string& reason) {
    if (state_ != State::Pending) return false;
    error_ = reason;
    state_ = State::Rejected;
    settle();
    return true;
  }

  void then(ResolveFn on_value, RejectFn on_error = RejectFn()) {
    waiters_.push_back({std::move(on_value), std::move(on_error)});
    if (state_ != State::Pending) settle();
  }

private:
  struct Waiter {
    ResolveFn on_value;
    RejectFn  on_error;
  };

  void settle() {
    std::vector<Waiter> ready;
    ready.swap(waiters_);
    for (auto& w : ready) {
      if (state_ == State::Resolved && w.on_value) w.on_value(value_);
      if (state_ == State::Rejected && w.on_error) w.on_error(error_);
    }
  }

  State               state_{State::Pending};
  T                   value_{};
  std::string         error_;
  std::vector<Waiter> waiters_;
};

template <typename T>
using ReplyPtr = std::shared_ptr<Reply<T>>;

/// Already-rejected reply (request never left the host).
template <typename T>
ReplyPtr<T> rejected_reply(const std::string& reason) {
  auto r = std::make_shared<Reply<T>>();
  r->reject(reason);
  return r;
}

} // namespace cecbridge

#endif // CECBRIDGE_REPLY_HPP

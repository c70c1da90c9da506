// lww_signal.hpp
#ifndef LWW_SIGNAL_HPP
#define LWW_SIGNAL_HPP

#include "lww_types.hpp"

#include <functional>
#include <memory>
#include <utility>

/// Move-only disposer returned by every subscribe call.
///
/// Disconnects on unsubscribe() or destruction. Holding a subscription past
/// the lifetime of the signal it came from is fine; it becomes a no-op.
class Subscription {
public:
  Subscription() = default;
  explicit Subscription(std::function<void()> disposer) : disposer_(std::move(disposer)) {}

  ~Subscription() { unsubscribe(); }

  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  Subscription(Subscription &&other) noexcept : disposer_(std::move(other.disposer_)) { other.disposer_ = nullptr; }
  Subscription &operator=(Subscription &&other) noexcept {
    if (this != &other) {
      unsubscribe();
      disposer_ = std::move(other.disposer_);
      other.disposer_ = nullptr;
    }
    return *this;
  }

  void unsubscribe() {
    if (disposer_) {
      auto disposer = std::move(disposer_);
      disposer_ = nullptr;
      disposer();
    }
  }

  bool connected() const { return static_cast<bool>(disposer_); }

private:
  std::function<void()> disposer_;
};

/// Synchronous multicast callback list.
template <typename... Args> class Signal {
public:
  using Handler = std::function<void(Args...)>;

  Signal() : slots_(std::make_shared<Slots>()) {}

  Signal(const Signal &) = delete;
  Signal &operator=(const Signal &) = delete;

  Subscription connect(Handler handler) {
    uint64_t id = ++slots_->next_id;
    slots_->handlers.emplace(id, std::move(handler));
    std::weak_ptr<Slots> weak = slots_;
    return Subscription([weak, id]() {
      if (auto slots = weak.lock()) {
        slots->handlers.erase(id);
      }
    });
  }

  /// Invokes every handler connected at the time of the call. A handler
  /// disconnected by an earlier handler in the same emission is skipped.
  void emit(Args... args) const {
    if (slots_->handlers.empty())
      return;
    LwwVector<uint64_t> ids;
    ids.reserve(slots_->handlers.size());
    for (const auto &[id, _] : slots_->handlers) {
      ids.push_back(id);
    }
    auto keep_alive = slots_;
    for (uint64_t id : ids) {
      auto it = keep_alive->handlers.find(id);
      if (it == keep_alive->handlers.end())
        continue;
      Handler handler = it->second;
      handler(args...);
    }
  }

  size_t size() const { return slots_->handlers.size(); }
  bool empty() const { return slots_->handlers.empty(); }

private:
  struct Slots {
    uint64_t next_id = 0;
    LwwSortedMap<uint64_t, Handler> handlers;
  };

  std::shared_ptr<Slots> slots_;
};

#endif // LWW_SIGNAL_HPP

#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "identity.h"

namespace multisplit {

// Owning handle for a signal subscription. Dropping it unregisters the handler.
template <typename... Args>
class SignalListener {
public:
  explicit SignalListener(std::function<void(Args...)> handler) : handler_(std::move(handler)) {
  }

  SignalListener(const SignalListener&) = delete;
  SignalListener& operator=(const SignalListener&) = delete;

  void emit(Args... args) {
    if (handler_) {
      handler_(args...);
    }
  }

private:
  std::function<void(Args...)> handler_;
};

// Synchronous typed signal. Handlers run in registration order on the emitting thread.
template <typename... Args>
class Signal {
public:
  using Listener = std::shared_ptr<SignalListener<Args...>>;

  Signal() = default;
  Signal(const Signal&) = delete;
  Signal& operator=(const Signal&) = delete;

  [[nodiscard("Listener is unregistered when the handle is lost")]] Listener
  register_listener(std::function<void(Args...)> handler) {
    auto listener = std::make_shared<SignalListener<Args...>>(std::move(handler));
    listeners_.emplace_back(listener);
    return listener;
  }

  void emit(Args... args) {
    bool dirty = false;

    // Snapshot first so handlers may drop their own handle while we iterate
    std::vector<Listener> alive;
    alive.reserve(listeners_.size());
    for (auto& weak : listeners_) {
      if (auto listener = weak.lock()) {
        alive.push_back(std::move(listener));
      } else {
        dirty = true;
      }
    }

    for (auto& listener : alive) {
      // Only our snapshot holds it: the handle was dropped during this emission
      if (listener.use_count() == 1) {
        dirty = true;
        continue;
      }
      listener->emit(args...);
    }

    alive.clear();

    if (dirty) {
      std::erase_if(listeners_, [](const auto& weak) { return weak.expired(); });
    }
  }

  [[nodiscard]] size_t listener_count() const {
    return static_cast<size_t>(std::count_if(listeners_.begin(), listeners_.end(),
                                             [](const auto& weak) { return !weak.expired(); }));
  }

private:
  std::vector<std::weak_ptr<SignalListener<Args...>>> listeners_;
};

// Change notifications published by the pane model.
// Order per mutation: about_to_change, (mutation), changed, layout_changed,
// then node_changed / maximize_changed when focus or maximize moved.
struct LayoutSignals {
  Signal<> about_to_change;
  Signal<> changed;
  Signal<> layout_changed;
  Signal<const PaneId&> node_changed;
  Signal<const std::optional<PaneId>&> maximize_changed;
};

} // namespace multisplit

#pragma once

#include <pulse/errors.h>
#include <pulse/insertion_order.h>
#include <pulse/tracker.h>
#include <pulse/utility.h>

#include <concepts>
#include <functional>
#include <memory>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace pulse {

using unsubscribe_t = std::function<void()>;

template <typename T> class signal_state : public source_t {
public:
  using callback_t = std::function<void(const T &)>;
  using callback_ptr = std::shared_ptr<const callback_t>;

  T value;
  insertion_order_set<callback_ptr> callbacks;
  tracker_t *tracker;

  signal_state(tracker_t &tracker, auto &&...args)
      : value(FWD(args)...), tracker{&tracker} {}

  ~signal_state() { tracker->clear_dependencies(*this); }

  std::string_view kind() const override { return "Signal"; }

  const T &get() const {
    tracker->track(*this, "value");
    return value;
  }

  void set(auto &&new_value) {
    auto candidate = T(FWD(new_value));
    if constexpr (std::equality_comparable<T>) {
      if (value == candidate)
        return;
    }

    value = std::move(candidate);
    event("Signal.value changed ({} direct subscribers)", callbacks.size());

    notify_callbacks();
    tracker->trigger(*this, "value");
  }

  void notify_callbacks() {
    // copy, because a callback may unsubscribe itself
    const auto snapshot =
        std::vector<callback_ptr>(callbacks.begin(), callbacks.end());
    for (auto &callback : snapshot) {
      if (not callbacks.contains(callback))
        continue;

      tracker->invoke_isolated("signal subscriber",
                               [&] { (*callback)(value); });
    }
  }

  void dispose() {
    callbacks.clear();
    tracker->clear_dependencies(*this);
  }
};

/// A reactive cell. Copies of a signal share the same cell.
template <typename T> class signal {
  using state_t = signal_state<T>;

  std::shared_ptr<state_t> state;

public:
  using value_type = T;
  using callback_t = typename state_t::callback_t;
  using callback_ptr = typename state_t::callback_ptr;

  signal() : state{std::make_shared<state_t>(global_tracker())} {}

  signal(const signal &) = default;
  signal(signal &&) = default;

  explicit(false) signal(std::convertible_to<T> auto value,
                         tracker_t &tracker = global_tracker())
    requires(not std::same_as<decltype(value), signal>)
      : state{std::make_shared<state_t>(tracker, std::move(value))} {}

  signal(std::in_place_t, tracker_t &tracker, auto &&...args)
      : state{std::make_shared<state_t>(tracker, FWD(args)...)} {}

  // Disallow assignment from signals, which would silently rewire every
  // node that captured this handle.
  signal &operator=(const signal &) = delete;
  signal &operator=(signal &&) = delete;

  auto &operator=(auto &&value)
    requires(not std::same_as<std::remove_cvref_t<decltype(value)>, signal>)
  {
    set(FWD(value));
    return *this;
  }

  /// False for a moved-from handle.
  auto valid() const { return bool{state}; }

  /// Returns the value, registering a dependency of the current context.
  const T &value() const { return state->get(); }
  const T &operator()() const { return value(); }
  operator const T &() const { return value(); }

  /// Returns the value without registering a dependency.
  const T &peek() const { return state->value; }

  void set(auto &&value) {
    // keep the cell alive even if a subscriber drops the last handle
    auto keep_alive = state;
    keep_alive->set(FWD(value));
  }

  /// Registers a callback invoked with every new value. Each call creates
  /// a distinct registration.
  unsubscribe_t subscribe(std::invocable<const T &> auto callback) {
    return subscribe(std::make_shared<const callback_t>(std::move(callback)));
  }

  /// Registers a shared callback. Registering the same callback twice
  /// keeps a single registration.
  unsubscribe_t subscribe(callback_ptr callback) {
    if (not callback)
      throw usage_error{"subscribe requires a callback"};

    state->callbacks.insert(callback);
    return [weak = std::weak_ptr{state}, callback] {
      if (auto p = weak.lock())
        p->callbacks.erase(callback);
    };
  }

  bool unsubscribe(const callback_ptr &callback) {
    return state->callbacks.erase(callback);
  }

  void clear_subscribers() { state->callbacks.clear(); }
  auto subscriber_count() const { return state->callbacks.size(); }
  auto has_subscribers() const { return not state->callbacks.empty(); }

  /// Drops direct subscribers and every graph edge sourced at this signal.
  void dispose() { state->dispose(); }

  auto &tracker() const { return *state->tracker; }
  auto source() const -> const source_t & { return *state; }

  /// A non-owning reference to the cell.
  auto weak() const { return std::weak_ptr<state_t>{state}; }
};

template <typename T> signal(T) -> signal<T>;
template <typename T> signal(T, tracker_t &) -> signal<T>;

namespace detail {
template <typename T> void require_live(const signal<T> &s) {
  if (not s.valid())
    throw usage_error{"All dependencies must be Signal instances"};
}

inline auto join(std::vector<unsubscribe_t> unsubscribes) -> unsubscribe_t {
  return [unsubscribes = std::move(unsubscribes)] {
    for (auto &unsubscribe : unsubscribes)
      unsubscribe();
  };
}

// Subscriptions that end when their owner goes away.
class links_t {
  std::vector<unsubscribe_t> unsubscribes;

public:
  explicit links_t(std::vector<unsubscribe_t> unsubscribes)
      : unsubscribes{std::move(unsubscribes)} {}

  links_t(const links_t &) = delete;
  links_t &operator=(const links_t &) = delete;

  ~links_t() { release(); }

  void release() {
    for (auto &unsubscribe : std::exchange(unsubscribes, {}))
      unsubscribe();
  }
};
} // namespace detail

/// A signal driven by other signals. Its value can only change through
/// those signals. The last copy to go away detaches from them.
template <typename T> class readonly_signal {
  signal<T> cell;
  std::shared_ptr<detail::links_t> links;

public:
  using value_type = T;
  using callback_t = typename signal<T>::callback_t;
  using callback_ptr = typename signal<T>::callback_ptr;

  readonly_signal(signal<T> cell, std::vector<unsubscribe_t> links)
      : cell{std::move(cell)},
        links{std::make_shared<detail::links_t>(std::move(links))} {}

  const T &value() const { return cell.value(); }
  const T &operator()() const { return value(); }
  operator const T &() const { return value(); }
  const T &peek() const { return cell.peek(); }

  unsubscribe_t subscribe(std::invocable<const T &> auto callback) {
    return cell.subscribe(std::move(callback));
  }
  unsubscribe_t subscribe(callback_ptr callback) {
    return cell.subscribe(std::move(callback));
  }
  bool unsubscribe(const callback_ptr &callback) {
    return cell.unsubscribe(callback);
  }
  auto subscriber_count() const { return cell.subscriber_count(); }
  auto has_subscribers() const { return cell.has_subscribers(); }

  /// Detaches from the driving signals, then disposes the cell.
  void dispose() {
    links->release();
    cell.dispose();
  }

  auto source() const -> const source_t & { return cell.source(); }
};

/// Calls callback with the new value whenever any of the signals changes.
template <typename F, typename... Ts>
  requires(std::invocable<F &, const Ts &> and ...)
auto subscribe_to_multiple(F callback, signal<Ts>... signals)
    -> unsubscribe_t {
  (detail::require_live(signals), ...);

  auto shared = std::make_shared<F>(std::move(callback));
  auto unsubscribes = std::vector<unsubscribe_t>{};
  (unsubscribes.push_back(
       signals.subscribe([shared](const Ts &value) { (*shared)(value); })),
   ...);

  return detail::join(std::move(unsubscribes));
}

template <typename T>
auto subscribe_to_multiple(std::vector<signal<T>> signals,
                           std::invocable<const T &> auto callback)
    -> unsubscribe_t {
  for (auto &s : signals)
    detail::require_live(s);

  const auto shared = std::make_shared<const typename signal<T>::callback_t>(
      std::move(callback));
  auto unsubscribes = std::vector<unsubscribe_t>{};
  for (auto &s : signals)
    unsubscribes.push_back(s.subscribe(shared));

  return detail::join(std::move(unsubscribes));
}

/// Builds a read-only signal holding fn(values of signals...), recomputed
/// whenever one of the signals changes.
template <typename F, typename... Ts>
  requires(sizeof...(Ts) > 0) and std::invocable<F &, const Ts &...>
auto derived(F fn, signal<Ts>... signals) {
  using R = std::remove_cvref_t<std::invoke_result_t<F &, const Ts &...>>;

  (detail::require_live(signals), ...);

  auto compute = std::make_shared<F>(std::move(fn));
  auto &tracker = std::get<0>(std::tie(signals...)).tracker();
  auto cell =
      signal<R>{std::in_place, tracker, std::invoke(*compute, signals.peek()...)};

  // Only weak references, so that the driving signals do not keep the
  // derived cell (or each other) alive.
  auto recompute = [compute, target = cell.weak(),
                    sources = std::tuple{signals.weak()...}](const auto &) {
    auto cell = target.lock();
    if (not cell)
      return;

    std::apply(
        [&](const auto &...weak) {
          auto locked = std::tuple{weak.lock()...};
          std::apply(
              [&](const auto &...p) {
                if ((p and ...))
                  cell->set(std::invoke(*compute, std::as_const(p->value)...));
              },
              locked);
        },
        sources);
  };

  auto unsubscribes = std::vector<unsubscribe_t>{};
  (unsubscribes.push_back(signals.subscribe(recompute)), ...);

  return readonly_signal<R>{std::move(cell), std::move(unsubscribes)};
}

template <typename T, typename F>
  requires std::invocable<F &, const std::vector<T> &>
auto derived(std::vector<signal<T>> signals, F fn) {
  using R = std::remove_cvref_t<std::invoke_result_t<F &, const std::vector<T> &>>;

  for (auto &s : signals)
    detail::require_live(s);

  auto compute = std::make_shared<F>(std::move(fn));
  auto &tracker = signals.empty() ? global_tracker() : signals.front().tracker();

  auto values = std::vector<T>{};
  for (auto &s : signals)
    values.push_back(s.peek());
  auto cell = signal<R>{std::in_place, tracker, std::invoke(*compute, values)};

  auto sources = std::vector<std::weak_ptr<signal_state<T>>>{};
  for (auto &s : signals)
    sources.push_back(s.weak());

  auto recompute = [compute, target = cell.weak(), sources](const T &) {
    auto cell = target.lock();
    if (not cell)
      return;

    auto values = std::vector<T>{};
    for (auto &weak : sources) {
      auto p = weak.lock();
      if (not p)
        return;
      values.push_back(p->value);
    }
    cell->set(std::invoke(*compute, std::as_const(values)));
  };

  auto unsubscribes = std::vector<unsubscribe_t>{};
  for (auto &s : signals)
    unsubscribes.push_back(s.subscribe(recompute));

  return readonly_signal<R>{std::move(cell), std::move(unsubscribes)};
}

} // namespace pulse

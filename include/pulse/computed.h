#pragma once

#include <pulse/tracker.h>
#include <pulse/utility.h>

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>

namespace pulse {

template <typename F>
class computed_state : public source_t,
                       public subscriber_t,
                       public std::enable_shared_from_this<computed_state<F>> {
public:
  using T = std::remove_cvref_t<std::invoke_result_t<F &>>;

  F f;
  std::optional<T> cache;
  bool dirty = true;
  tracker_t *tracker;

  computed_state(F f, tracker_t &tracker)
      : f{std::move(f)}, tracker{&tracker} {}

  ~computed_state() {
    event("~computed_state()");
    tracker->release(*this);
    tracker->clear_dependencies(*this);
  }

  std::string_view kind() const override { return "Computed"; }

  const T &get() {
    // Track first, so that a reader stays subscribed even when the
    // computation below fails.
    tracker->track(*this, "value");
    if (dirty)
      recalculate();

    return *cache;
  }

  void recalculate() {
    auto keep_alive = this->shared_from_this();

    // Dependencies are data dependent, so the previous run's edges are
    // dropped and rebuilt from whatever this run reads.
    tracker->cleanup_context(*this);
    auto value = tracker->with_tracking([this] { return std::invoke(f); }, *this);

    cache.emplace(std::move(value));
    dirty = false;
  }

  // Marks the cached value as stale and lets readers of this computed know.
  // Recalculation is deferred until the next read.
  void update() override {
    dirty = true;
    tracker->trigger(*this, "value");
  }
};

/// A lazily evaluated, cached derivation of other reactive values.
template <typename F> class computed {
  using state_t = computed_state<F>;

  std::shared_ptr<state_t> state;

public:
  using T = typename state_t::T;
  using value_type = T;

  computed(const computed &) = default;
  computed &operator=(const computed &) = default;

  computed(computed &&) = default;
  computed &operator=(computed &&) = default;

  template <typename U>
    requires(not std::same_as<std::remove_cvref_t<U>, computed>) and
            std::convertible_to<U, F>
  computed(U f, tracker_t &tracker = global_tracker())
      : state{std::make_shared<state_t>(std::move(f), tracker)} {}

  const T &value() const { return state->get(); }
  const T &operator()() const { return value(); }
  operator const T &() const { return value(); }

  auto is_dirty() const { return state->dirty; }

  auto &tracker() const { return *state->tracker; }
  auto source() const -> const source_t & { return *state; }
  auto context() const -> const subscriber_t & { return *state; }
};

template <typename F> computed(F) -> computed<F>;
template <typename F> computed(F, tracker_t &) -> computed<F>;

} // namespace pulse

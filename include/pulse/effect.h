#pragma once

#include <pulse/tracker.h>
#include <pulse/utility.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace pulse {

class effect_base : public subscriber_t,
                    public std::enable_shared_from_this<effect_base> {
protected:
  std::function<void()> cleanup;
  bool active = true;
  bool running = false;
  tracker_t *tracker;

  explicit effect_base(tracker_t &tracker) : tracker{&tracker} {}

  virtual void run() = 0;

  // Drops the effect function and everything it captured.
  virtual void release_body() = 0;

  void run_cleanup() {
    if (auto f = std::exchange(cleanup, nullptr))
      tracker->invoke_isolated("effect cleanup", f);
  }

public:
  ~effect_base() override {
    // The owner is gone; whatever the effect acquired is torn down too.
    if (active) {
      active = false;
      try {
        run_cleanup();
      } catch (const std::exception &e) {
        tracker->report_error("effect cleanup", e);
      }
    }
    tracker->release(*this);
  }

  std::string_view kind() const override { return "Effect"; }

  auto is_active() const { return active; }

  void start() { tracker->invoke_isolated("effect", [this] { run(); }); }

  void update() override {
    if (not active)
      return;

    auto keep_alive = shared_from_this();
    event("effect update");

    // Tear down what the previous run acquired before running again.
    run_cleanup();
    run();
  }

  void dispose() {
    if (not active)
      return;

    event("effect dispose");
    active = false;
    run_cleanup();
    tracker->cleanup_context(*this);

    // A body that disposes its own effect is released once it returns.
    if (not running)
      release_body();
  }
};

template <typename F> class effect_state final : public effect_base {
  std::optional<F> f;

  using result_t = std::invoke_result_t<F &>;
  static_assert(std::is_void_v<result_t> or
                    std::is_constructible_v<std::function<void()>, result_t>,
                "an effect returns nothing or a cleanup callable");

protected:
  void run() override {
    tracker->cleanup_context(*this);

    running = true;
    {
      auto _ = scope_guard{[this] { running = false; }};

      if constexpr (std::is_void_v<result_t>) {
        tracker->with_tracking(*f, *this);
      } else {
        cleanup = std::function<void()>(tracker->with_tracking(*f, *this));
      }
    }

    if (not active) {
      run_cleanup();
      release_body();
    }
  }

  void release_body() override { f.reset(); }

public:
  effect_state(F f, tracker_t &tracker)
      : effect_base{tracker}, f{std::move(f)} {}
};

using scope_manager_t = std::vector<std::shared_ptr<effect_base>>;

inline auto &global_scope_manager() {
  static auto instance = scope_manager_t{};
  return instance;
}

/// Disposes every effect owned by the scope and releases them.
/// Disposing a single effect releases its function right away; the scope
/// drops the emptied entry the next time an effect is registered with it.
inline void dispose(scope_manager_t &scope) {
  for (auto &e : std::exchange(scope, {}))
    e->dispose();
}

/// A side-effecting subscriber. Runs immediately and again whenever
/// something it read changes.
///
/// The effect is kept alive by the scope manager it is registered with
/// (the global one by default). With a nullptr scope the handle is the
/// only owner and destroying it stops the effect.
class effect {
  std::shared_ptr<effect_base> state;

public:
  template <std::invocable F>
    requires(not std::same_as<std::remove_cvref_t<F>, effect>)
  explicit effect(F f, scope_manager_t *scope_manager = &global_scope_manager(),
                  tracker_t &tracker = global_tracker())
      : state{std::make_shared<effect_state<F>>(std::move(f), tracker)} {
    if (scope_manager) {
      std::erase_if(*scope_manager,
                    [](const auto &e) { return not e->is_active(); });
      scope_manager->push_back(state);
    }

    state->start();
  }

  template <std::invocable F>
  effect(F f, std::nullptr_t, tracker_t &tracker = global_tracker())
      : effect{std::move(f), static_cast<scope_manager_t *>(nullptr),
               tracker} {}

  void dispose() { state->dispose(); }
  auto is_active() const { return state->is_active(); }

  auto context() const -> const subscriber_t & { return *state; }
};

} // namespace pulse

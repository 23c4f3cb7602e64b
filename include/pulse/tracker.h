#pragma once

#include <pulse/errors.h>
#include <pulse/insertion_order.h>
#include <pulse/log.h>
#include <pulse/utility.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pulse {

using property_key_t = std::string;

/// Something whose reads can be tracked (Signal, Computed).
struct source_t {
  virtual ~source_t() = default;
  virtual std::string_view kind() const { return "source"; }
};

/// Something that can be invalidated by a source (Computed, Effect).
struct subscriber_t {
  virtual ~subscriber_t() = default;
  virtual void update() = 0;
  virtual std::string_view kind() const { return "subscriber"; }
};

/// A queued update. Identity is the identity of the shared callable, so
/// queueing the same update_fn twice within a batch runs it once.
using update_fn = std::shared_ptr<const std::function<void()>>;

inline auto make_update(std::function<void()> f) -> update_fn {
  return std::make_shared<const std::function<void()>>(std::move(f));
}

using error_handler_t =
    std::function<void(std::string_view where, const std::exception &)>;

inline void log_error(std::string_view where, const std::exception &e) {
  logger().error("Error in {}: {}", where, e.what());
}

class tracker_t {
  using subscribers_t = insertion_order_set<subscriber_t *>;
  using keys_t = insertion_order_set<property_key_t>;

  // source -> key -> subscribers
  std::unordered_map<const source_t *,
                     insertion_order_map<property_key_t, subscribers_t>>
      dependencies;

  // subscriber -> source -> keys
  std::unordered_map<const subscriber_t *,
                     insertion_order_map<const source_t *, keys_t>>
      subscriptions;

  struct update_frame_t {
    const subscriber_t *subscriber;
    const source_t *source;
    property_key_t key;
  };

  std::vector<subscriber_t *> execution_stack;
  std::vector<update_frame_t> update_stack;

  using update_queue_t =
      insertion_order_map<const void *, std::function<void()>>;

  int batch_depth_ = 0;
  update_queue_t pending_updates;
  std::vector<update_queue_t *> draining;

  error_handler_t error_handler = log_error;

public:
  tracker_t() = default;
  tracker_t(const tracker_t &) = delete;
  tracker_t &operator=(const tracker_t &) = delete;

  void set_error_handler(error_handler_t handler) {
    error_handler = handler ? std::move(handler) : log_error;
  }

  /// Runs fn with context as the current execution context.
  decltype(auto) with_tracking(std::invocable auto &&fn,
                               subscriber_t &context) {
    execution_stack.push_back(&context);
    auto _ = scope_guard{[this] { execution_stack.pop_back(); }};
    return std::invoke(FWD(fn));
  }

  auto current_context() const -> subscriber_t * {
    return execution_stack.empty() ? nullptr : execution_stack.back();
  }

  auto is_tracking() const { return not execution_stack.empty(); }
  auto is_batching() const { return batch_depth_ > 0; }
  auto stack_depth() const { return execution_stack.size(); }
  auto batch_depth() const { return batch_depth_; }
  auto pending_updates_count() const { return pending_updates.size(); }

  void track(const source_t &source, std::string_view key) {
    auto *context = current_context();
    if (not context)
      return;

    dependencies[&source][key].insert(context);
    subscriptions[context][&source].insert(property_key_t{key});
  }

  void trigger(const source_t &source, std::string_view key) {
    const auto it = dependencies.find(&source);
    if (it == dependencies.end())
      return;

    const auto *subscribers = it->second.find(key);
    if (not subscribers or subscribers->empty())
      return;

    if (is_mid_update(source, key))
      throw circular_dependency_error{source.kind(), key};

    // Outside a batch the update would run inside a body that is still
    // executing.
    if (not is_batching() and
        std::ranges::any_of(*subscribers, [this](const auto *subscriber) {
          return std::ranges::find(execution_stack, subscriber) !=
                 execution_stack.end();
        }))
      throw circular_dependency_error{source.kind(), key};

    event("trigger {}.{} ({} subscribers)", source.kind(), key,
          subscribers->size());

    // copy, because updates may modify the index
    const auto snapshot =
        std::vector<subscriber_t *>(subscribers->begin(), subscribers->end());
    for (auto *subscriber : snapshot) {
      // A previous update may have disposed or destroyed this subscriber.
      if (not has_subscriber(source, key, *subscriber))
        continue;

      enqueue(subscriber, [this, subscriber, source = &source,
                           key = property_key_t{key}] {
        run_update(*subscriber, source, key);
      });
    }
  }

  void queue_update(const update_fn &fn) {
    if (not fn)
      throw usage_error{"queue_update requires a callable"};

    enqueue(fn.get(), [fn] { (*fn)(); });
  }

  decltype(auto) batch_updates(std::invocable auto &&fn) {
    using result_t = std::invoke_result_t<decltype(fn)>;

    ++batch_depth_;
    auto guard = batch_guard{this};

    if constexpr (std::is_void_v<result_t>) {
      std::invoke(FWD(fn));
      guard.self = nullptr;
      end_batch();
    } else {
      result_t result = std::invoke(FWD(fn));
      guard.self = nullptr;
      end_batch();
      return result;
    }
  }

  void cleanup_context(const subscriber_t &context) {
    auto node = subscriptions.extract(&context);
    if (node.empty())
      return;

    for (auto &[source, keys] : node.mapped()) {
      const auto it = dependencies.find(source);
      if (it == dependencies.end())
        continue;

      auto &keyed = it->second;
      for (auto &key : keys) {
        if (auto *subscribers = keyed.find(key)) {
          subscribers->erase(&context);
          if (subscribers->empty())
            keyed.erase(key);
        }
      }

      if (keyed.empty())
        dependencies.erase(it);
    }
  }

  void clear_dependencies(const source_t &source) {
    auto node = dependencies.extract(&source);
    if (node.empty())
      return;

    for (auto &[key, subscribers] : node.mapped()) {
      for (auto *subscriber : subscribers) {
        const auto it = subscriptions.find(subscriber);
        if (it == subscriptions.end())
          continue;

        it->second.erase(&source);
        if (it->second.empty())
          subscriptions.erase(it);
      }
    }
  }

  /// Forgets everything about a subscriber that is going away, including
  /// an update it may still have pending in the current batch.
  void release(const subscriber_t &context) {
    const auto identity = static_cast<const void *>(&context);
    cleanup_context(context);
    pending_updates.erase(identity);
    for (auto *queue : draining) {
      if (auto *pending = queue->find(identity))
        *pending = nullptr;
    }
  }

  auto has_subscribers(const source_t &source, std::string_view key) const {
    const auto it = dependencies.find(&source);
    if (it == dependencies.end())
      return false;

    const auto *subscribers = it->second.find(key);
    return subscribers and not subscribers->empty();
  }

  /// Number of (source, key) edges held by a subscriber.
  auto dependency_count(const subscriber_t &context) const {
    auto count = std::size_t{0};
    if (const auto it = subscriptions.find(&context);
        it != subscriptions.end()) {
      for (auto &[source, keys] : it->second)
        count += keys.size();
    }
    return count;
  }

  /// Checks that the forward and reverse indices describe the same edges.
  auto is_consistent() const {
    auto forward_edges = std::size_t{0};
    for (auto &[source, keyed] : dependencies) {
      for (auto &[key, subscribers] : keyed) {
        if (subscribers.empty())
          return false;

        for (auto *subscriber : subscribers) {
          ++forward_edges;
          const auto it = subscriptions.find(subscriber);
          if (it == subscriptions.end())
            return false;

          const auto *keys = it->second.find(source);
          if (not keys or not keys->contains(key))
            return false;
        }
      }
    }

    auto reverse_edges = std::size_t{0};
    for (auto &[subscriber, sources] : subscriptions)
      for (auto &[source, keys] : sources)
        reverse_edges += keys.size();

    return forward_edges == reverse_edges;
  }

  /// Runs fn, reporting any failure other than a circular dependency
  /// through the error handler instead of propagating it.
  void invoke_isolated(std::string_view where, std::invocable auto &&fn) {
    try {
      std::invoke(FWD(fn));
    } catch (const circular_dependency_error &) {
      throw;
    } catch (const std::exception &e) {
      report_error(where, e);
    }
  }

  void report_error(std::string_view where, const std::exception &e) const {
    error_handler(where, e);
  }

private:
  struct batch_guard {
    tracker_t *self;

    // Only reached when the batch body throws. The original exception is
    // already propagating, so flush failures can only be reported.
    ~batch_guard() {
      if (not self)
        return;

      if (--self->batch_depth_ != 0)
        return;

      try {
        self->flush_updates();
      } catch (const std::exception &e) {
        self->report_error("batch flush", e);
      }
    }
  };

  void end_batch() {
    if (--batch_depth_ == 0)
      flush_updates();
  }

  void enqueue(const void *identity, std::function<void()> run) {
    if (is_batching()) {
      auto &pending = pending_updates[identity];
      if (not pending)
        pending = std::move(run);
      return;
    }

    invoke_isolated("reactive update", run);
  }

  void flush_updates() {
    if (pending_updates.empty())
      return;

    event("flush {} pending updates", pending_updates.size());

    // Taken as a whole; a subscriber destroyed by an earlier update is
    // cleared from the queue by release() before it would run.
    auto queue = std::exchange(pending_updates, {});
    draining.push_back(&queue);
    auto _ = scope_guard{[this] { draining.pop_back(); }};

    auto circular = std::exception_ptr{};
    for (auto &entry : queue) {
      auto update = std::exchange(entry.second, nullptr);
      if (not update)
        continue;

      try {
        invoke_isolated("reactive update", update);
      } catch (const circular_dependency_error &) {
        if (not circular)
          circular = std::current_exception();
      }
    }

    if (circular)
      std::rethrow_exception(circular);
  }

  void run_update(subscriber_t &subscriber, const source_t *source,
                  const property_key_t &key) {
    update_stack.push_back({&subscriber, source, key});
    auto _ = scope_guard{[this] { update_stack.pop_back(); }};
    subscriber.update();
  }

  bool has_subscriber(const source_t &source, std::string_view key,
                      subscriber_t &subscriber) const {
    const auto it = dependencies.find(&source);
    if (it == dependencies.end())
      return false;

    const auto *subscribers = it->second.find(key);
    return subscribers and subscribers->contains(&subscriber);
  }

  // A context on the live execution stack that is itself being updated
  // because of (source, key) would be re-notified by this trigger.
  bool is_mid_update(const source_t &source, std::string_view key) const {
    return std::ranges::any_of(execution_stack, [&](const auto *context) {
      return std::ranges::any_of(update_stack, [&](const auto &frame) {
        return frame.subscriber == context and frame.source == &source and
               frame.key == key;
      });
    });
  }
};

inline auto &global_tracker() {
  static auto instance = tracker_t{};
  return instance;
}

/// Runs fn as one batch on the global tracker.
decltype(auto) batch(std::invocable auto &&fn) {
  return global_tracker().batch_updates(FWD(fn));
}

} // namespace pulse

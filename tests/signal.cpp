#include "common.h"

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace pulse_test {

using pulse::derived;
using pulse::subscribe_to_multiple;

static suite<"signal"> _ = [] {
  "signal"_test = [] {
    auto t = tracker_t{};
    auto a = signal{42, t};

    expect(that % a() == 42) << "state should be accessible directly";
    expect(that % a.peek() == 42);

    a.set(1729);
    expect(that % a.value() == 1729) << "mutations should be observable";

    a = 7;
    expect(that % int{a} == 7) << "direct assignment should set the value";
  };

  "syntaxes"_test = [] {
    signal a = 42;
    auto b = signal{"text"s};
    auto c = signal<std::string>{"text"};
    auto d = signal<std::vector<int>>{std::in_place, pulse::global_tracker(),
                                      3, 1};

    static_assert(std::same_as<decltype(a), signal<int>>);
    static_assert(std::same_as<decltype(b), signal<std::string>>);
    static_assert(std::is_assignable_v<signal<int> &, int>);
    static_assert(not std::is_assignable_v<signal<int> &, signal<int> &>,
                  "assigning a signal to a signal should not compile");
    static_assert(
        not std::is_assignable_v<signal<int> &, const signal<int> &>);

    expect(b.peek() == c.peek());
    expect(d.peek() == std::vector{1, 1, 1});
  };

  "copies_share_the_cell"_test = [] {
    auto t = tracker_t{};
    auto a = signal{1, t};
    auto b = a;

    b = 2;
    expect(that % a.peek() == 2);
  };

  "equal_writes_are_ignored"_test = [] {
    auto t = tracker_t{};
    auto a = signal{1, t};
    auto notifications = 0;
    a.subscribe([&](int) { ++notifications; });

    auto runs = 0;
    auto e = effect{[&, a] {
                      a();
                      ++runs;
                    },
                    nullptr, t};

    a = 2;
    a = 2;
    expect(that % notifications == 1)
        << "writing the same value twice should notify once";
    expect(that % runs == 2) << "initial run plus one propagation";
  };

  "types_without_equality_always_propagate"_test = [] {
    struct opaque {
      int x = 0;
    };

    auto t = tracker_t{};
    auto a = signal{opaque{}, t};
    auto notifications = 0;
    a.subscribe([&](const opaque &) { ++notifications; });

    a = opaque{};
    a = opaque{};
    expect(that % notifications == 2);
  };

  "subscribe"_test = [] {
    auto t = tracker_t{};
    auto a = signal{0, t};
    auto values = std::vector<int>{};

    auto unsubscribe = a.subscribe([&](int v) { values.push_back(v); });
    expect(that % a.subscriber_count() == 1u);
    expect(a.has_subscribers());

    a = 1;
    a = 2;
    unsubscribe();
    a = 3;

    expect(values == std::vector{1, 2}) << fmt::format("{}", values);
    expect(not a.has_subscribers());

    unsubscribe();
    expect(that % a.subscriber_count() == 0u)
        << "unsubscribing twice should be harmless";
  };

  "shared_callbacks_have_set_semantics"_test = [] {
    auto t = tracker_t{};
    auto a = signal{0, t};
    auto count = 0;
    auto callback = std::make_shared<const signal<int>::callback_t>(
        [&](int) { ++count; });

    a.subscribe(callback);
    a.subscribe(callback);
    a.subscribe([&](int) { ++count; });
    a.subscribe([&](int) { ++count; });
    expect(that % a.subscriber_count() == 3u)
        << "the same callback should only be registered once, distinct "
           "callbacks each once";

    a = 1;
    expect(that % count == 3);

    expect(a.unsubscribe(callback));
    expect(not a.unsubscribe(callback));

    a.clear_subscribers();
    expect(that % a.subscriber_count() == 0u);
  };

  "subscriber_errors_are_isolated"_test = [] {
    auto t = tracker_t{};
    auto errors = capture_errors(t);
    auto a = signal{0, t};
    auto called = false;

    a.subscribe([](int) { throw std::runtime_error{"broken"}; });
    a.subscribe([&](int) { called = true; });

    expect(nothrow([&] { a = 1; }));
    expect(called) << "a failing subscriber should not block its siblings";
    expect(that % errors->size() == 1u);
    expect(errors->front() == "signal subscriber: broken"s);
    expect(that % a.peek() == 1);
  };

  "unsubscribe_during_notification"_test = [] {
    auto t = tracker_t{};
    auto a = signal{0, t};
    auto count = 0;

    auto second = pulse::unsubscribe_t{};
    a.subscribe([&](int) {
      ++count;
      second();
    });
    second = a.subscribe([&](int) { ++count; });

    a = 1;
    expect(that % count == 1)
        << "a callback removed by a sibling should not be called";
  };

  "peek"_test = [] {
    auto t = tracker_t{};
    auto a = signal{1, t};
    auto runs = 0;

    auto e = effect{[&, a] {
                      a.peek();
                      ++runs;
                    },
                    nullptr, t};

    expect(not t.has_subscribers(a.source(), "value"));
    a = 2;
    expect(that % runs == 1) << "peek should not create a dependency";
  };

  "dispose"_test = [] {
    auto t = tracker_t{};
    auto a = signal{0, t};
    auto notifications = 0;
    auto runs = 0;

    a.subscribe([&](int) { ++notifications; });
    auto e = effect{[&, a] {
                      a();
                      ++runs;
                    },
                    nullptr, t};

    a.dispose();
    expect(not a.has_subscribers());
    expect(not t.has_subscribers(a.source(), "value"));
    expect(t.is_consistent());

    expect(nothrow([&] { a = 1; }));
    expect(that % notifications == 0);
    expect(that % runs == 1);
    expect(that % a.peek() == 1) << "the cell itself still holds values";
  };

  "subscribe_to_multiple"_test = [] {
    auto t = tracker_t{};
    auto a = signal{0, t};
    auto b = signal{"x"s, t};
    auto seen = std::vector<std::string>{};

    auto unsubscribe = subscribe_to_multiple(
        [&](const auto &v) { seen.push_back(fmt::format("{}", v)); }, a, b);

    a = 1;
    b = "y";
    unsubscribe();
    a = 2;

    expect(seen == std::vector<std::string>{"1", "y"})
        << fmt::format("{}", seen);
  };

  "subscribe_to_multiple_vector"_test = [] {
    auto t = tracker_t{};
    auto a = signal{0, t};
    auto b = signal{0, t};
    auto sum = 0;

    auto unsubscribe =
        subscribe_to_multiple(std::vector{a, b}, [&](int v) { sum += v; });
    a = 1;
    b = 2;
    expect(that % sum == 3);

    unsubscribe();
    expect(not a.has_subscribers());
    expect(not b.has_subscribers());
  };

  "derived"_test = [] {
    auto t = tracker_t{};
    auto first = signal{"John"s, t};
    auto last = signal{"Doe"s, t};

    auto full = derived(
        [](const std::string &f, const std::string &l) { return f + " " + l; },
        first, last);
    expect(full.peek() == "John Doe"s);

    auto seen = std::vector<std::string>{};
    auto e = effect{[&, full] { seen.push_back(full()); }, nullptr, t};

    first = "Jane";
    expect(full.peek() == "Jane Doe"s);
    expect(seen == std::vector<std::string>{"John Doe", "Jane Doe"})
        << fmt::format("{}", seen);

    full.dispose();
    last = "Roe";
    expect(full.peek() == "Jane Doe"s)
        << "a disposed derived signal should stop following its inputs";
    expect(not first.has_subscribers());
  };

  "derived_vector"_test = [] {
    auto t = tracker_t{};
    auto inputs = std::vector{signal{1, t}, signal{2, t}, signal{3, t}};

    auto total = derived(inputs, [](const std::vector<int> &values) {
      auto sum = 0;
      for (auto v : values)
        sum += v;
      return sum;
    });
    expect(that % total.peek() == 6);

    inputs[1] = 20;
    expect(that % total.peek() == 24);
  };

  "derived_misuse"_test = [] {
    auto t = tracker_t{};
    auto a = signal{1, t};
    auto moved = std::move(a);

    expect(throws<pulse::usage_error>(
        [&] { derived([](int v) { return v; }, a); }))
        << "an empty handle is not a signal";
    expect(throws<pulse::usage_error>(
        [&] { subscribe_to_multiple(std::vector{a, moved}, [](int) {}); }));
    expect(that % moved.peek() == 1);
  };

  "derived_detaches_when_dropped"_test = [] {
    auto t = tracker_t{};
    auto a = signal{1, t};

    {
      auto doubled = derived([](int v) { return v * 2; }, a);
      auto copy = doubled;
      expect(that % copy.peek() == 2);
      expect(that % a.subscriber_count() == 1u);
    }

    expect(that % a.subscriber_count() == 0u)
        << "the last copy of a derived signal should unsubscribe";
    expect(nothrow([&] { a = 2; }));
  };
};

} // namespace pulse_test

#include "common.h"

#include <spdlog/sinks/ostream_sink.h>

#include <sstream>
#include <stdexcept>

namespace pulse_test {

static suite<"properties"> _ = [] {
  "index_invariant"_test = [] {
    auto t = tracker_t{};
    auto a = signal{0, t};
    auto b = signal{0, t};
    auto c = computed{[=] { return a() + b(); }, t};
    auto scope = scope_manager_t{};

    for (auto i = 0; i < 3; ++i)
      effect{[=] {
               if (c() % 2 == 0)
                 a();
               else
                 b();
             },
             &scope, t};

    for (auto i = 1; i < 10; ++i) {
      a = i;
      expect(t.is_consistent()) << fmt::format("after writing a = {}", i);
      b = i * 3;
      expect(t.is_consistent()) << fmt::format("after writing b = {}", i * 3);
    }

    pulse::dispose(scope);
    expect(t.is_consistent());
    expect(that % t.dependency_count(c.context()) == 2u);
  };

  "stack_is_empty_after_propagation"_test = [] {
    auto t = tracker_t{};
    auto a = signal{0, t};
    auto b = computed{[=] { return a() + 1; }, t};
    auto e = effect{[=] { b(); }, nullptr, t};

    t.batch_updates([&] { a = 1; });
    a = 2;

    expect(that % t.stack_depth() == 0u);
    expect(that % t.batch_depth() == 0);
    expect(that % t.pending_updates_count() == 0u);
  };

  "isolated_errors_are_logged"_test = [] {
    auto out = std::make_shared<std::ostringstream>();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_st>(*out);
    sink->set_pattern("%l %v");
    pulse::set_logger(std::make_shared<spdlog::logger>("pulse-test", sink));
    pulse::set_log_level(spdlog::level::trace);

    auto t = tracker_t{};
    auto a = signal{0, t};
    a.subscribe([](int) { throw std::runtime_error{"broken"}; });
    a = 1;

    const auto text = out->str();
    expect(text.find("error Error in signal subscriber: broken") !=
           std::string::npos)
        << text;

    pulse::set_logger(nullptr);
  };
};

} // namespace pulse_test

int main() {}

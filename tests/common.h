#pragma once

#include <pulse/pulse.h>

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace boost::ut;
using namespace std::string_literals;

namespace pulse_test {

using pulse::computed;
using pulse::effect;
using pulse::scope_manager_t;
using pulse::signal;
using pulse::tracker_t;

// Collects the failures a tracker isolated instead of propagating.
inline auto capture_errors(tracker_t &tracker) {
  auto errors = std::make_shared<std::vector<std::string>>();
  tracker.set_error_handler(
      [errors](std::string_view where, const std::exception &e) {
        errors->push_back(fmt::format("{}: {}", where, e.what()));
      });
  return errors;
}

// A plain source for exercising the tracker directly.
struct target_t : pulse::source_t {
  std::string_view kind() const override { return "Target"; }
};

// A plain subscriber for exercising the tracker directly.
struct context_t : pulse::subscriber_t {
  int updates = 0;
  std::function<void()> on_update = [] {};

  void update() override {
    ++updates;
    on_update();
  }
};

} // namespace pulse_test

#define CONCAT2(a, b) a##b
#define CONCAT(a, b) CONCAT2(a, b)
#define _ CONCAT(placeholder_, __LINE__)

#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace pulse {

/// Thrown from a write when a subscriber that is currently updating
/// because of (source, key) would be notified for (source, key) again.
class circular_dependency_error : public std::logic_error {
  std::string source_kind_;
  std::string key_;

public:
  circular_dependency_error(std::string_view source_kind, std::string_view key)
      : std::logic_error{fmt::format("Circular dependency detected for {}.{}",
                                     source_kind, key)},
        source_kind_{source_kind}, key_{key} {}

  auto &source_kind() const { return source_kind_; }
  auto &key() const { return key_; }
};

/// Precondition violation by the caller, e.g. an empty handle passed to a
/// helper that combines several signals.
class usage_error : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace pulse

#pragma once

#include <utility>

#define FWD(x) std::forward<decltype(x)>(x)

namespace pulse {

template <typename F> struct scope_guard {
  F f;
  ~scope_guard() { f(); };
};

} // namespace pulse

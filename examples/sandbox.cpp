#include <pulse/pulse.h>

#include <fmt/core.h>

#include <string>

using namespace std::string_literals;

int main() {
  pulse::load_log_levels_from_env();

  auto first_name = pulse::signal{"Anita"s};
  auto last_name = pulse::signal{"Laera"s};
  auto nick_name = pulse::signal{""s};

  auto full_name = pulse::computed{[=] {
    fmt::print("calc full_name\n");
    if (nick_name() != "")
      return nick_name();
    else
      return first_name() + " " + last_name();
  }};

  auto display_full = pulse::signal{true};
  pulse::effect{[=] {
    fmt::print("run effect\n");
    if (display_full()) {
      const auto n = full_name();
      fmt::print(">> {}\n", n);
    } else
      fmt::print("disable effect\n");
  }};

  // Anita Laera
  first_name = "Missi";
  // full_name >> effect >> Missi Laera
  last_name = "Valkering";
  // full_name >> effect >> Missi Valkering
  pulse::batch([&] {
    first_name = "Erik";
    last_name = "Engelbertus";
  });
  // full_name >> effect >> Erik Engelbertus (once)
  nick_name = "Erik Valkering";
  // full_name >> effect >> Erik Valkering
  display_full = false;
  // effect >> disable
  nick_name = "Ciri";
  // nothing, the effect no longer reads full_name

  pulse::dispose(pulse::global_scope_manager());
}

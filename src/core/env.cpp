#include "hkr/core/env.hpp"

#include <cstdlib>
#include <optional>
#include <string>

#include <unistd.h>

extern "C" {
  extern char** environ; // NOLINT
}

namespace hkr::core::env {

auto get(std::string const& name) -> std::optional<std::string> {
  if (char const* value = std::getenv(name.c_str())) {
    return std::string{value};
  }
  return std::nullopt;
}

void set(std::string const& name, std::string const& value) {
  setenv(name.c_str(), value.c_str(), 1);
}

void unset(std::string const& name) {
  unsetenv(name.c_str());
}

auto enabled(std::string const& name) -> bool {
  auto value = get(name);
  if (!value) {
    return false;
  }
  return !value->empty() && *value != "0" && *value != "false" && *value != "no";
}

auto environ() -> char** {
  return ::environ;
}

} // namespace hkr::core::env

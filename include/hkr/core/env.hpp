#pragma once

#include <optional>
#include <string>

namespace hkr::core::env {

auto get(std::string const& name) -> std::optional<std::string>;
void set(std::string const& name, std::string const& value);
void unset(std::string const& name);

// Set to anything other than "", "0", "false" or "no".
auto enabled(std::string const& name) -> bool;

auto environ() -> char**;

} // namespace hkr::core::env

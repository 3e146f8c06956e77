#pragma once

#include <optional>
#include <string>

#include "hkr/config/configuration.hpp"
#include "hkr/core/log.hpp"

namespace hkr::cli {

struct AppOptions {
  std::optional<std::string> config_path_;
  bool                       verbose_ = false;
  bool                       quiet_   = false;
};

// Entry point behind main(); returns a core::ExitCode value.
auto run_app(int argc, char** argv) -> int;

auto run_hooks(config::Configuration const& config, std::string const& hook_type, AppOptions const& options,
               core::Logger& log, core::Logger& err) -> int;

// Prints each configured hook of `hook_type` with its effective state.
auto list_hooks(config::Configuration const& config, std::string const& hook_type, core::Logger& log,
                core::Logger& err) -> int;

void print_version();

} // namespace hkr::cli

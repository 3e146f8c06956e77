#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "hkr/config/configuration.hpp"
#include "hkr/context/context.hpp"
#include "hkr/core/error.hpp"
#include "hkr/core/log.hpp"
#include "hkr/hook/hook.hpp"
#include "hkr/hook/registry.hpp"

namespace hkr::hook {

class Loader {
public:
  virtual ~Loader() = default;

  // Hooks in run order. A failure carries a message meant for the user.
  virtual auto load_hooks() -> core::Result<HookList> = 0;
};

// Lowercased names from a SKIP value; names are separated by commas or
// whitespace.
auto parse_skip_list(std::string_view value) -> std::vector<std::string>;
auto skip_list_matches(std::vector<std::string> const& skip, std::string_view name) -> bool;

class ConfigLoader final : public Loader {
  config::Configuration const& config_;
  context::Context&            context_;
  HookRegistry                 registry_;
  core::Logger&                logger_;
  std::vector<std::string>     skip_;

public:
  ConfigLoader(
      config::Configuration const& config,
      context::Context&            context,
      HookRegistry                 registry,
      core::Logger&                logger,
      std::string_view             skip_env
  );

  auto load_hooks() -> core::Result<HookList> override;
};

} // namespace hkr::hook

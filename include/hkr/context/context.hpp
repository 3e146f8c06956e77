#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hkr/config/configuration.hpp"
#include "hkr/core/error.hpp"
#include "hkr/core/log.hpp"

namespace hkr::context {

using core::Result;
using Files = std::shared_ptr<std::vector<std::string> const>;

// The repository state a hook type runs against.
class Context {
public:
  virtual ~Context() = default;

  [[nodiscard]] virtual auto hook_type() const -> std::string const& = 0;

  virtual auto setup_environment() -> Result<void>   = 0;
  virtual auto cleanup_environment() -> Result<void> = 0;

  // Files the hooks should look at.
  virtual auto modified_files() -> Result<Files> = 0;
};

// Runs the configured setup, cleanup and files commands.
class CommandContext final : public Context {
  std::string                 hook_type_;
  config::EnvironmentSettings settings_;
  core::Logger&               logger_;
  std::optional<Files>        files_cache_;

  auto run_step(std::vector<std::string> const& argv, std::string_view step) -> Result<std::string>;

public:
  CommandContext(std::string hook_type, config::EnvironmentSettings settings, core::Logger& logger);

  [[nodiscard]] auto hook_type() const -> std::string const& override;

  auto setup_environment() -> Result<void> override;
  auto cleanup_environment() -> Result<void> override;
  auto modified_files() -> Result<Files> override;
};

} // namespace hkr::context

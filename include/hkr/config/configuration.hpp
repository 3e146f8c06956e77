#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "hkr/core/error.hpp"
#include "hkr/hook/settings.hpp"

namespace hkr::config {

using core::Result;
// Keys keep file order, which is the order hooks run in.
using Json = nlohmann::ordered_json;

// Commands that prepare and restore the repository around one hook type.
struct EnvironmentSettings {
  std::vector<std::string> setup_;
  std::vector<std::string> cleanup_;
  // Prints the applicable files, one per line.
  std::vector<std::string> files_;
};

class Configuration {
  Json        data_;
  std::string source_;

public:
  Configuration();
  Configuration(Json data, std::string source);

  static auto parse(std::string_view text, std::string source) -> Result<Configuration>;
  static auto load_file(std::string const& path) -> Result<Configuration>;
  // An explicit path must exist; a missing default file means no hooks.
  static auto load(std::optional<std::string> const& explicit_path) -> Result<Configuration>;

  [[nodiscard]] auto source() const noexcept -> std::string const&;

  // Hook names configured for `hook_type` in file order, without ALL.
  [[nodiscard]] auto hook_names(std::string const& hook_type) const -> Result<std::vector<std::string>>;
  [[nodiscard]] auto defines_command(std::string const& hook_type, std::string const& name) const -> bool;

  // Applies the hook type's ALL entry, then the hook's own entry.
  auto apply_hook_settings(std::string const& hook_type, std::string const& name, hook::HookSettings& settings) const
      -> Result<void>;

  [[nodiscard]] auto environment(std::string const& hook_type) const -> Result<EnvironmentSettings>;
};

// HKR_CONFIG when set, the config file in the working directory otherwise.
auto default_config_path() -> std::string;

} // namespace hkr::config

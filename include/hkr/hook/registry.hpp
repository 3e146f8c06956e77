#pragma once

#include <functional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "hkr/core/error.hpp"
#include "hkr/hook/hook.hpp"
#include "hkr/hook/settings.hpp"

namespace hkr::hook {

// The check behind a hook: runs against the applicable files and returns the
// untransformed outcome.
using Check        = std::function<core::Result<HookOutcome>(std::span<std::string const> files)>;
using CheckFactory = std::function<core::Result<Check>(HookSettings const& settings)>;

struct Registration {
  CheckFactory factory_;
  // Settings a hook has before any configuration is applied.
  std::function<void(HookSettings&)> defaults_;
};

class HookRegistry {
  std::unordered_map<std::string, Registration> hooks_;
  std::vector<std::string>                      order_;

public:
  // Registering a name again replaces the earlier registration.
  void add(std::string name, Registration registration);

  [[nodiscard]] auto find(std::string const& name) const -> Registration const*;
  [[nodiscard]] auto contains(std::string const& name) const -> bool;
  // Names in first-registration order.
  [[nodiscard]] auto names() const -> std::vector<std::string> const&;
};

// Builds the check for a hook that names its own command.
auto make_command_check(HookSettings const& settings) -> core::Result<Check>;

void register_builtin_hooks(HookRegistry& registry);

} // namespace hkr::hook

#include "hkr/hook/registry.hpp"

#include <utility>

namespace hkr::hook {

void HookRegistry::add(std::string name, Registration registration) {
  if (!hooks_.contains(name)) {
    order_.push_back(name);
  }
  hooks_[std::move(name)] = std::move(registration);
}

auto HookRegistry::find(std::string const& name) const -> Registration const* {
  auto it = hooks_.find(name);
  if (it == hooks_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto HookRegistry::contains(std::string const& name) const -> bool {
  return hooks_.contains(name);
}

auto HookRegistry::names() const -> std::vector<std::string> const& {
  return order_;
}

} // namespace hkr::hook

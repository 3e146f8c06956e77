#include "hkr/hook/status.hpp"

namespace hkr::hook {

auto to_string(HookStatus status) noexcept -> std::string_view {
  switch (status) {
    case HookStatus::Pass:
      return "pass";
    case HookStatus::Warn:
      return "warn";
    case HookStatus::Fail:
      return "fail";
    case HookStatus::Interrupt:
      return "interrupt";
  }
  return "unknown";
}

auto parse_status(std::string_view name) noexcept -> std::optional<HookStatus> {
  if (name == "pass") {
    return HookStatus::Pass;
  }
  if (name == "warn") {
    return HookStatus::Warn;
  }
  if (name == "fail") {
    return HookStatus::Fail;
  }
  return std::nullopt;
}

} // namespace hkr::hook

#pragma once

#include <optional>
#include <string_view>

namespace hkr::hook {

enum struct HookStatus {
  Pass,
  Warn,
  Fail,
  Interrupt
};

[[nodiscard]] auto to_string(HookStatus status) noexcept -> std::string_view;

// Accepts the names a configuration may use: pass, warn and fail.
[[nodiscard]] auto parse_status(std::string_view name) noexcept -> std::optional<HookStatus>;

} // namespace hkr::hook

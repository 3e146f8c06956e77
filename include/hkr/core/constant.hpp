#pragma once

#include <string_view>

namespace hkr::core::constant {

inline constexpr std::string_view EXE_NAME = "hkr";
inline constexpr std::string_view EXE_DESC = "Runs the checks configured for a repository hook";
inline constexpr std::string_view VERSION  = "v0.1.0-dev";

inline constexpr std::string_view CONFIG_FILE  = ".hkr.json";
inline constexpr std::string_view CONFIG_VAR   = "HKR_CONFIG";
inline constexpr std::string_view DEBUG_VAR    = "HKR_DEBUG";
inline constexpr std::string_view SKIP_VAR     = "SKIP";
inline constexpr std::string_view NO_COLOR_VAR = "NO_COLOR";
inline constexpr std::string_view PATH_VAR     = "PATH";
inline constexpr std::string_view TMPDIR_VAR   = "TMPDIR";

inline constexpr std::string_view ALL_HOOKS = "ALL";

inline constexpr int SIGNAL_EXIT_CODE_OFFSET = 128;

} // namespace hkr::core::constant

namespace hkr::core {

// sysexits(3) values, so wrappers can tell failures apart without parsing output.
enum struct ExitCode : int {
  Success    = 0,
  Usage      = 64,
  HookFailed = 65,
  Internal   = 70,
  IoError    = 74,
  Config     = 78
};

constexpr auto to_int(ExitCode code) noexcept -> int {
  return static_cast<int>(code);
}

} // namespace hkr::core

#pragma once

#include <optional>
#include <string_view>

#include "hkr/context/context.hpp"
#include "hkr/core/error.hpp"
#include "hkr/core/log.hpp"
#include "hkr/hook/hook.hpp"
#include "hkr/hook/loader.hpp"
#include "hkr/runner/sink.hpp"

namespace hkr::runner {

enum struct RunErrorKind {
  Load,
  Setup,
  Cleanup,
  Isolation
};

[[nodiscard]] auto to_string(RunErrorKind kind) noexcept -> std::string_view;

// A fault that ended the run outside of any single hook.
struct RunError {
  RunErrorKind kind_;
  core::Error  error_;
};

inline constexpr std::string_view HOOK_FAULT_HEADER = "Hook raised unexpected error";
inline constexpr std::string_view HOOK_INTERRUPTED  = "Hook was interrupted by Ctrl-C; restoring repo state...";

class HookRunner {
  hook::Loader&     loader_;
  context::Context& context_;
  ResultSink&       sink_;
  core::Logger&     logger_;
  hook::HookList    hooks_;

  auto run_hooks() -> bool;
  auto should_skip(hook::Hook const& hook) -> bool;
  // std::nullopt when the hook was skipped.
  auto run_hook(hook::Hook& hook) -> std::optional<hook::HookStatus>;

public:
  HookRunner(hook::Loader& loader, context::Context& context, ResultSink& sink, core::Logger& logger);

  // Loads and runs the hooks with SIGINT held off, except while a hook itself
  // runs. true when no hook failed and the run was not interrupted.
  auto run() -> core::Result<bool, RunError>;
};

} // namespace hkr::runner

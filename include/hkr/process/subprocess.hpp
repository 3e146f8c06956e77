#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <sys/types.h>

#include "hkr/core/error.hpp"
#include "hkr/core/file_descriptor.hpp"

namespace hkr::process {

using core::Result;

// Exit status and raw output of a finished child. A child killed by signal N
// reports 128 + N.
class SubprocessResult {
  int         exit_code_;
  std::string stdout_;
  std::string stderr_;

public:
  SubprocessResult(int exit_code, std::string standard_output, std::string standard_error);

  [[nodiscard]] auto exit_code() const noexcept -> int {
    return exit_code_;
  }
  [[nodiscard]] auto success() const noexcept -> bool {
    return exit_code_ == 0;
  }
  [[nodiscard]] auto standard_output() const noexcept -> std::string const& {
    return stdout_;
  }
  [[nodiscard]] auto standard_error() const noexcept -> std::string const& {
    return stderr_;
  }
};

// A child started by spawn_detached. The handle keeps the capture files alive;
// dropping it does not stop the child.
class DetachedProcess {
  pid_t                pid_;
  core::FileDescriptor stdout_;
  core::FileDescriptor stderr_;

public:
  DetachedProcess(pid_t pid, core::FileDescriptor standard_output, core::FileDescriptor standard_error);

  DetachedProcess(DetachedProcess const&)            = delete;
  DetachedProcess& operator=(DetachedProcess const&) = delete;
  DetachedProcess(DetachedProcess&&) noexcept        = default;
  DetachedProcess& operator=(DetachedProcess&&)      = delete;

  [[nodiscard]] auto pid() const noexcept -> pid_t {
    return pid_;
  }

  // Exit code once the child has finished, std::nullopt while it runs.
  [[nodiscard]] auto try_wait() const -> Result<std::optional<int>>;
};

// Runs argv[0] (looked up on PATH) with the remaining elements as literal
// arguments and blocks until it exits. stdin is /dev/null; stdout and stderr
// are captured separately. The child gets its own process group, which is
// where a SIGINT caught under DeferredIsolation is forwarded.
auto spawn(std::span<std::string const> argv) -> Result<SubprocessResult>;

// Starts argv like spawn but returns at once. Nothing waits for the child
// unless the caller polls try_wait, so once the handle is dropped a finished
// child stays a zombie until hkr itself exits and init reaps it.
auto spawn_detached(std::span<std::string const> argv) -> Result<DetachedProcess>;

// Full path of `name` as posix_spawnp would resolve it.
auto find_executable(std::string const& name) -> std::optional<std::string>;

// Renders argv the way a POSIX shell would need it typed.
auto shell_join(std::span<std::string const> argv) -> std::string;

auto exit_code_from_status(int wait_status) noexcept -> int;

} // namespace hkr::process

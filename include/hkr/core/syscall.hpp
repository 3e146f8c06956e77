#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <spawn.h>
#include <sys/types.h>

namespace hkr::core::syscall {

template<typename T>
using Result = std::expected<T, int>;

struct ProcessInfo {
  pid_t pid_;
  int   status_;
};

auto kill_process_group(pid_t group, int signal) -> Result<void>;

// Blocks until the child changes state as selected by `options` (exit by
// default, WUNTRACED adds stops), retrying when a signal interrupts the wait.
auto wait_for_process(pid_t pid, int options = 0) -> Result<ProcessInfo>;
auto try_wait_for_process(pid_t pid) -> Result<std::optional<ProcessInfo>>;

auto spawn_process(
    std::span<std::string const>      argv,
    char* const*                      env,
    posix_spawn_file_actions_t const* file_actions = nullptr,
    posix_spawnattr_t const*          attr         = nullptr
) -> Result<pid_t>;

auto close_fd(int fd) -> Result<void>;
auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t>;
auto rewind_fd(int fd) -> Result<void>;

// Creates a close-on-exec file in `directory` and unlinks it right away, so it
// disappears with the last descriptor referring to it.
auto create_unlinked_temp_file(std::string const& directory, std::string_view prefix) -> Result<int>;

auto is_executable_file(std::string const& path) noexcept -> bool;

} // namespace hkr::core::syscall

#include "hkr/core/syscall.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <expected>
#include <string>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hkr::core::syscall {

auto kill_process_group(pid_t group, int signal) -> Result<void> {
  if (killpg(group, signal) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto wait_for_process(pid_t pid, int options) -> Result<ProcessInfo> {
  int   status     = 0;
  pid_t result_pid = -1;
  do {
    result_pid = waitpid(pid, &status, options);
  } while (result_pid == -1 && errno == EINTR);

  if (result_pid == -1) {
    return std::unexpected(errno);
  }
  return ProcessInfo{result_pid, status};
}

auto try_wait_for_process(pid_t pid) -> Result<std::optional<ProcessInfo>> {
  int   status     = 0;
  pid_t result_pid = waitpid(pid, &status, WNOHANG);
  if (result_pid == -1) {
    return std::unexpected(errno);
  }
  if (result_pid == 0) {
    return std::nullopt;
  }
  return ProcessInfo{result_pid, status};
}

auto spawn_process(
    std::span<std::string const>      argv,
    char* const*                      env,
    posix_spawn_file_actions_t const* file_actions,
    posix_spawnattr_t const*          attr
) -> Result<pid_t> {
  if (argv.empty()) {
    return std::unexpected(EINVAL);
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (auto const& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  pid_t pid = 0;
  if (int result = posix_spawnp(&pid, args[0], file_actions, attr, args.data(), env)) {
    return std::unexpected(result);
  }
  return pid;
}

auto close_fd(int fd) -> Result<void> {
  if (close(fd) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t> {
  ssize_t result = -1;
  do {
    result = read(fd, buffer, size);
  } while (result == -1 && errno == EINTR);

  if (result == -1) {
    return std::unexpected(errno);
  }
  return static_cast<size_t>(result);
}

auto rewind_fd(int fd) -> Result<void> {
  if (lseek(fd, 0, SEEK_SET) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto create_unlinked_temp_file(std::string const& directory, std::string_view prefix) -> Result<int> {
  std::string path = directory;
  if (path.empty() || path.back() != '/') {
    path += '/';
  }
  path += prefix;
  path += "XXXXXX";

  int fd = mkostemp(path.data(), O_CLOEXEC);
  if (fd == -1) {
    return std::unexpected(errno);
  }

  if (unlink(path.c_str()) == -1) {
    int error = errno;
    close(fd);
    return std::unexpected(error);
  }
  return fd;
}

auto is_executable_file(std::string const& path) noexcept -> bool {
  struct stat info{};
  if (stat(path.c_str(), &info) == -1) {
    return false;
  }
  return S_ISREG(info.st_mode) && access(path.c_str(), X_OK) == 0;
}

} // namespace hkr::core::syscall

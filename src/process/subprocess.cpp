#include "hkr/process/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <expected>
#include <string>
#include <utility>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "hkr/core/constant.hpp"
#include "hkr/core/env.hpp"
#include "hkr/core/interrupt.hpp"
#include "hkr/core/syscall.hpp"

namespace hkr::process {

using core::Error;
using core::FileDescriptor;

namespace {

constexpr char const* DEFAULT_PATH = "/bin:/usr/bin";

class SpawnFileActions {
  posix_spawn_file_actions_t actions_{};
  bool                       initialized_ = false;

public:
  SpawnFileActions() = default;

  ~SpawnFileActions() {
    if (initialized_) {
      posix_spawn_file_actions_destroy(&actions_);
    }
  }

  SpawnFileActions(SpawnFileActions const&)            = delete;
  SpawnFileActions& operator=(SpawnFileActions const&) = delete;

  // stdin from /dev/null, stdout and stderr into the capture files.
  auto init(int stdout_fd, int stderr_fd) -> int {
    if (int err = posix_spawn_file_actions_init(&actions_)) {
      return err;
    }
    initialized_ = true;

    if (int err = posix_spawn_file_actions_addopen(&actions_, STDIN_FILENO, "/dev/null", O_RDONLY, 0)) {
      return err;
    }
    if (int err = posix_spawn_file_actions_adddup2(&actions_, stdout_fd, STDOUT_FILENO)) {
      return err;
    }
    return posix_spawn_file_actions_adddup2(&actions_, stderr_fd, STDERR_FILENO);
  }

  [[nodiscard]] auto get() const noexcept -> posix_spawn_file_actions_t const* {
    return &actions_;
  }
};

class SpawnAttributes {
  posix_spawnattr_t attrs_{};
  bool              initialized_ = false;

public:
  SpawnAttributes() = default;

  ~SpawnAttributes() {
    if (initialized_) {
      posix_spawnattr_destroy(&attrs_);
    }
  }

  SpawnAttributes(SpawnAttributes const&)            = delete;
  SpawnAttributes& operator=(SpawnAttributes const&) = delete;

  // The child leads a new process group, starts with SIGINT at its default
  // action even when we ignore it, and with nothing blocked.
  auto init() -> int {
    if (int err = posix_spawnattr_init(&attrs_)) {
      return err;
    }
    initialized_ = true;

    short flags = POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK;
    if (int err = posix_spawnattr_setflags(&attrs_, flags)) {
      return err;
    }
    if (int err = posix_spawnattr_setpgroup(&attrs_, 0)) {
      return err;
    }

    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGINT);
    if (int err = posix_spawnattr_setsigdefault(&attrs_, &defaults)) {
      return err;
    }

    sigset_t mask;
    sigemptyset(&mask);
    return posix_spawnattr_setsigmask(&attrs_, &mask);
  }

  [[nodiscard]] auto get() const noexcept -> posix_spawnattr_t const* {
    return &attrs_;
  }
};

struct Started {
  pid_t          pid_;
  FileDescriptor stdout_;
  FileDescriptor stderr_;
};

auto start(std::span<std::string const> argv) -> Result<Started> {
  if (argv.empty() || argv.front().empty()) {
    return std::unexpected(Error{"cannot run an empty command"});
  }

  auto const& program = argv.front();
  if (!find_executable(program)) {
    return std::unexpected(Error{fmt::format("{}: command not found", program)});
  }

  if (core::interrupt::InterruptHandler::instance().requested()) {
    return std::unexpected(Error{fmt::format("{}: not started, interrupt pending", program)});
  }

  auto out = FileDescriptor::temporary("hkr-stdout-");
  if (!out) {
    return std::unexpected(std::move(out.error()));
  }
  auto err = FileDescriptor::temporary("hkr-stderr-");
  if (!err) {
    return std::unexpected(std::move(err.error()));
  }

  SpawnFileActions actions;
  if (int rc = actions.init(out->get(), err->get())) {
    return std::unexpected(Error::from_errno("posix_spawn_file_actions", rc));
  }

  SpawnAttributes attrs;
  if (int rc = attrs.init()) {
    return std::unexpected(Error::from_errno("posix_spawnattr", rc));
  }

  auto pid = core::syscall::spawn_process(argv, core::env::environ(), actions.get(), attrs.get());
  if (!pid) {
    return std::unexpected(Error::from_errno(fmt::format("cannot run {}", program), pid.error()));
  }

  return Started{*pid, std::move(*out), std::move(*err)};
}

auto read_capture(FileDescriptor const& fd, std::string_view stream) -> Result<std::string> {
  auto text = fd.read_from_start();
  if (!text) {
    return std::unexpected(std::move(text.error()).context(fmt::format("reading captured {}", stream)));
  }
  return std::move(*text);
}

auto is_safe_shell_char(char c) -> bool {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
    case '_':
    case '-':
    case '.':
    case '/':
    case ',':
    case ':':
    case '=':
    case '+':
    case '@':
    case '%':
      return true;
    default:
      return false;
  }
}

} // namespace

SubprocessResult::SubprocessResult(int exit_code, std::string standard_output, std::string standard_error)
    : exit_code_(exit_code), stdout_(std::move(standard_output)), stderr_(std::move(standard_error)) {}

DetachedProcess::DetachedProcess(pid_t pid, FileDescriptor standard_output, FileDescriptor standard_error)
    : pid_(pid), stdout_(std::move(standard_output)), stderr_(std::move(standard_error)) {}

auto DetachedProcess::try_wait() const -> Result<std::optional<int>> {
  auto info = core::syscall::try_wait_for_process(pid_);
  if (!info) {
    return std::unexpected(Error::from_errno(fmt::format("waitpid {}", pid_), info.error()));
  }
  if (!*info) {
    return std::optional<int>{};
  }
  return std::optional<int>{exit_code_from_status((*info)->status_)};
}

auto spawn(std::span<std::string const> argv) -> Result<SubprocessResult> {
  auto started = start(argv);
  if (!started) {
    return std::unexpected(std::move(started.error()));
  }

  auto& handler = core::interrupt::InterruptHandler::instance();
  handler.set_foreground_group(started->pid_);
  // A SIGINT that landed between the pending check and the line above was not
  // forwarded by the handler.
  if (handler.requested()) {
    [[maybe_unused]] auto _ = core::syscall::kill_process_group(started->pid_, SIGINT);
  }

  auto info = core::syscall::wait_for_process(started->pid_, WUNTRACED);
  handler.clear_foreground_group();
  if (!info) {
    return std::unexpected(Error::from_errno(fmt::format("waitpid {}", started->pid_), info.error()));
  }

  // The child never owns the terminal, so a stop means it wanted terminal
  // input (SIGTTIN) or output, or stopped itself. Nothing would resume it.
  if (WIFSTOPPED(info->status_)) {
    [[maybe_unused]] auto killed  = core::syscall::kill_process_group(started->pid_, SIGKILL);
    [[maybe_unused]] auto resumed = core::syscall::kill_process_group(started->pid_, SIGCONT);
    if (auto reaped = core::syscall::wait_for_process(started->pid_); !reaped) {
      return std::unexpected(Error::from_errno(fmt::format("waitpid {}", started->pid_), reaped.error()));
    }
    return std::unexpected(Error{fmt::format("`{}` stopped waiting for terminal input", shell_join(argv))});
  }

  auto out = read_capture(started->stdout_, "stdout");
  if (!out) {
    return std::unexpected(std::move(out.error()));
  }
  auto err = read_capture(started->stderr_, "stderr");
  if (!err) {
    return std::unexpected(std::move(err.error()));
  }

  return SubprocessResult{exit_code_from_status(info->status_), std::move(*out), std::move(*err)};
}

auto spawn_detached(std::span<std::string const> argv) -> Result<DetachedProcess> {
  auto started = start(argv);
  if (!started) {
    return std::unexpected(std::move(started.error()));
  }
  return DetachedProcess{started->pid_, std::move(started->stdout_), std::move(started->stderr_)};
}

auto find_executable(std::string const& name) -> std::optional<std::string> {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (core::syscall::is_executable_file(name)) {
      return name;
    }
    return std::nullopt;
  }

  std::string path = core::env::get(std::string{core::constant::PATH_VAR}).value_or(DEFAULT_PATH);

  size_t begin = 0;
  while (begin <= path.size()) {
    size_t end = path.find(':', begin);
    if (end == std::string::npos) {
      end = path.size();
    }

    std::string dir = path.substr(begin, end - begin);
    if (dir.empty()) {
      dir = ".";
    }
    std::string candidate = dir + "/" + name;
    if (core::syscall::is_executable_file(candidate)) {
      return candidate;
    }

    begin = end + 1;
  }
  return std::nullopt;
}

auto shell_join(std::span<std::string const> argv) -> std::string {
  std::string joined;
  for (auto const& arg : argv) {
    if (!joined.empty()) {
      joined += ' ';
    }

    bool safe = !arg.empty();
    for (char c : arg) {
      if (!is_safe_shell_char(c)) {
        safe = false;
        break;
      }
    }
    if (safe) {
      joined += arg;
      continue;
    }

    joined += '\'';
    for (char c : arg) {
      if (c == '\'') {
        joined += "'\\''";
      } else {
        joined += c;
      }
    }
    joined += '\'';
  }
  return joined;
}

auto exit_code_from_status(int wait_status) noexcept -> int {
  if (WIFEXITED(wait_status)) {
    return WEXITSTATUS(wait_status);
  }
  if (WIFSIGNALED(wait_status)) {
    return core::constant::SIGNAL_EXIT_CODE_OFFSET + WTERMSIG(wait_status);
  }
  return wait_status;
}

} // namespace hkr::process

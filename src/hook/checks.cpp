#include <algorithm>
#include <expected>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "hkr/hook/registry.hpp"
#include "hkr/process/subprocess.hpp"

namespace hkr::hook {

namespace {

auto combined_output(process::SubprocessResult const& result) -> std::string {
  return result.standard_output() + result.standard_error();
}

// grep exits 0 when a line matched and 1 when none did. Anything else is an
// error, which may still come with matches from the readable files.
auto make_grep_check(std::string pattern, std::string message) -> Check {
  return [pattern = std::move(pattern),
          message = std::move(message)](std::span<std::string const> files) -> core::Result<HookOutcome> {
    std::vector<std::string> argv{"grep", "-IHn", "-e", pattern, "--"};
    argv.insert(argv.end(), files.begin(), files.end());

    auto result = process::spawn(argv);
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }

    switch (result->exit_code()) {
      case 0:
        return HookOutcome{HookStatus::Fail, fmt::format("{}\n{}", message, result->standard_output())};
      case 1:
        return HookOutcome{HookStatus::Pass, ""};
      default:
        return HookOutcome{HookStatus::Fail, combined_output(*result)};
    }
  };
}

auto grep_defaults(std::string description) -> std::function<void(HookSettings&)> {
  return [description = std::move(description)](HookSettings& settings) {
    settings.description_         = description;
    settings.requires_files_      = true;
    settings.required_executable_ = "grep";
  };
}

} // namespace

auto make_command_check(HookSettings const& settings) -> core::Result<Check> {
  if (settings.command_.empty() || settings.command_.front().empty()) {
    return std::unexpected(core::Error{"no command configured"});
  }

  return [command         = settings.command_,
          pass_files      = settings.pass_files_,
          detach          = settings.detach_,
          warn_exit_codes = settings.warn_exit_codes_](std::span<std::string const> files) -> core::Result<HookOutcome> {
    std::vector<std::string> argv = command;
    if (pass_files) {
      argv.insert(argv.end(), files.begin(), files.end());
    }

    // The handle is dropped right away; the child is left running unwatched.
    if (detach) {
      auto child = process::spawn_detached(argv);
      if (!child) {
        return std::unexpected(std::move(child.error()));
      }
      return HookOutcome{HookStatus::Pass, ""};
    }

    auto result = process::spawn(argv);
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }

    if (result->success()) {
      return HookOutcome{HookStatus::Pass, combined_output(*result)};
    }
    if (std::ranges::find(warn_exit_codes, result->exit_code()) != warn_exit_codes.end()) {
      return HookOutcome{HookStatus::Warn, combined_output(*result)};
    }
    return HookOutcome{HookStatus::Fail, combined_output(*result)};
  };
}

void register_builtin_hooks(HookRegistry& registry) {
  registry.add(
      "TrailingWhitespace",
      Registration{
          [](HookSettings const&) -> core::Result<Check> {
            return make_grep_check("[[:blank:]]$", "Trailing whitespace detected:");
          },
          grep_defaults("Check for trailing whitespace")
      }
  );
  registry.add(
      "MergeConflicts",
      Registration{
          [](HookSettings const&) -> core::Result<Check> {
            return make_grep_check("^<<<<<<<[ \t]", "Merge conflict markers detected:");
          },
          grep_defaults("Check for merge conflicts")
      }
  );
}

} // namespace hkr::hook

#include <expected>
#include <sstream>
#include <utility>

#include <fmt/core.h>

#include "hkr/context/context.hpp"
#include "hkr/process/subprocess.hpp"

namespace hkr::context {

using core::Error;

CommandContext::CommandContext(std::string hook_type, config::EnvironmentSettings settings, core::Logger& logger)
    : hook_type_(std::move(hook_type)), settings_(std::move(settings)), logger_(logger) {}

auto CommandContext::hook_type() const -> std::string const& {
  return hook_type_;
}

auto CommandContext::run_step(std::vector<std::string> const& argv, std::string_view step) -> Result<std::string> {
  logger_.debug(fmt::format("{} {}: {}", hook_type_, step, process::shell_join(argv)));

  auto result = process::spawn(argv);
  if (!result) {
    return std::unexpected(std::move(result.error()).context(fmt::format("{} {}", hook_type_, step)));
  }
  if (!result->success()) {
    return std::unexpected(Error{fmt::format(
        "{} {} `{}` exited with {}\n{}{}",
        hook_type_,
        step,
        process::shell_join(argv),
        result->exit_code(),
        result->standard_output(),
        result->standard_error()
    )});
  }
  return result->standard_output();
}

auto CommandContext::setup_environment() -> Result<void> {
  if (settings_.setup_.empty()) {
    return {};
  }
  auto output = run_step(settings_.setup_, "setup");
  if (!output) {
    return std::unexpected(std::move(output.error()));
  }
  return {};
}

auto CommandContext::cleanup_environment() -> Result<void> {
  if (settings_.cleanup_.empty()) {
    return {};
  }
  auto output = run_step(settings_.cleanup_, "cleanup");
  if (!output) {
    return std::unexpected(std::move(output.error()));
  }
  return {};
}

auto CommandContext::modified_files() -> Result<Files> {
  if (files_cache_) {
    return *files_cache_;
  }

  std::vector<std::string> files;
  if (!settings_.files_.empty()) {
    auto output = run_step(settings_.files_, "files");
    if (!output) {
      return std::unexpected(std::move(output.error()));
    }

    std::istringstream lines(*output);
    std::string        line;
    while (std::getline(lines, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (!line.empty()) {
        files.push_back(std::move(line));
      }
    }
  }

  files_cache_ = std::make_shared<std::vector<std::string> const>(std::move(files));
  return *files_cache_;
}

} // namespace hkr::context

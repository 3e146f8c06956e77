#include "hkr/hook/configured_hook.hpp"

#include <expected>
#include <span>
#include <utility>

#include <fmt/core.h>

#include "hkr/process/subprocess.hpp"

namespace hkr::hook {

ConfiguredHook::ConfiguredHook(std::string name, HookSettings settings, Check check, FileList files)
    : name_(std::move(name))
    , description_(settings.description_.value_or(fmt::format("Run {}", name_)))
    , settings_(std::move(settings))
    , check_(std::move(check))
    , files_(std::move(files)) {}

auto ConfiguredHook::name() const -> std::string const& {
  return name_;
}

auto ConfiguredHook::description() const -> std::string const& {
  return description_;
}

auto ConfiguredHook::enabled() const -> bool {
  return settings_.enabled_;
}

auto ConfiguredHook::skip_requested() const -> bool {
  return settings_.skip_;
}

auto ConfiguredHook::required() const -> bool {
  return settings_.required_;
}

auto ConfiguredHook::would_run() const -> bool {
  if (!settings_.enabled_) {
    return false;
  }
  if (settings_.requires_files_) {
    return files_ && !files_->empty();
  }
  return true;
}

auto ConfiguredHook::quiet() const -> bool {
  return settings_.quiet_;
}

auto ConfiguredHook::missing_requirement() const -> std::optional<std::string> {
  std::optional<std::string> executable = settings_.required_executable_;
  if (!executable && !settings_.command_.empty()) {
    executable = settings_.command_.front();
  }
  if (!executable || process::find_executable(*executable)) {
    return std::nullopt;
  }

  auto message = fmt::format("'{}' is not installed or not executable from PATH", *executable);
  if (settings_.install_command_) {
    message += fmt::format("\nInstall it by running: {}", *settings_.install_command_);
  }
  return message;
}

auto ConfiguredHook::run_and_transform() -> core::Result<HookOutcome> {
  if (auto missing = missing_requirement()) {
    return HookOutcome{HookStatus::Fail, std::move(*missing)};
  }

  std::span<std::string const> files;
  if (files_) {
    files = *files_;
  }

  auto outcome = check_(files);
  if (!outcome) {
    return std::unexpected(std::move(outcome.error()));
  }

  switch (outcome->status_) {
    case HookStatus::Fail:
      outcome->status_ = settings_.on_fail_;
      break;
    case HookStatus::Warn:
      outcome->status_ = settings_.on_warn_;
      break;
    case HookStatus::Pass:
    case HookStatus::Interrupt:
      break;
  }
  return outcome;
}

} // namespace hkr::hook

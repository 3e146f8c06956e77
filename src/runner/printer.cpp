#include "hkr/runner/printer.hpp"

#include <utility>

#include <fmt/core.h>

namespace hkr::runner {

namespace {

constexpr size_t HEADER_WIDTH = 70;

} // namespace

Printer::Printer(core::Logger& log, std::string hook_type, bool quiet)
    : log_(log), hook_type_(std::move(hook_type)), quiet_(quiet) {}

void Printer::start_run() {
  if (!quiet_) {
    log_.bold(fmt::format("Running {} hooks", hook_type_));
  }
}

void Printer::nothing_to_run() {
  log_.debug(fmt::format("✓ No applicable {} hooks to run", hook_type_));
}

void Printer::start_hook(hook::Hook const& hook) {
  log_.debug(fmt::format("starting {}", hook.name()));
}

void Printer::print_header(hook::Hook const& hook) {
  auto name = fmt::format("[{}] ", hook.name());
  auto used = hook.description().size() + name.size();

  log_.partial(hook.description());
  log_.partial(std::string(used < HEADER_WIDTH ? HEADER_WIDTH - used : 0, '.'));
  log_.partial(name);
}

void Printer::end_hook(hook::Hook const& hook, hook::HookStatus status, std::string const& output) {
  bool silent = quiet_ || hook.quiet();
  // Quiet hooks only show up when something went wrong.
  if (!silent || status != hook::HookStatus::Pass) {
    print_header(hook);
  }

  switch (status) {
    case hook::HookStatus::Pass:
      if (!silent) {
        log_.success("OK");
      }
      return;
    case hook::HookStatus::Warn:
      log_.warning("WARNING");
      if (!output.empty()) {
        log_.bold_warning(output);
      }
      return;
    case hook::HookStatus::Fail:
      log_.error("FAILED");
      break;
    case hook::HookStatus::Interrupt:
      log_.error("INTERRUPTED");
      break;
  }
  if (!output.empty()) {
    log_.bold_error(output);
  }
}

void Printer::hook_skipped(hook::Hook const& hook) {
  log_.warning(fmt::format("Skipping {}", hook.name()));
}

void Printer::required_hook_not_skipped(hook::Hook const& hook) {
  log_.warning(fmt::format("Cannot skip {} since it is required", hook.name()));
}

void Printer::run_succeeded() {
  if (!quiet_) {
    log_.success(fmt::format("✓ All {} hooks passed", hook_type_));
    log_.newline();
  }
}

void Printer::run_warned() {
  log_.warning(fmt::format("⚠ All {} hooks passed, but with warnings", hook_type_));
  log_.newline();
}

void Printer::run_failed() {
  log_.error(fmt::format("✗ One or more {} hooks failed", hook_type_));
  log_.newline();
}

void Printer::run_interrupted() {
  log_.newline();
  log_.warning("⚠  Hook run interrupted by user");
  log_.newline();
}

} // namespace hkr::runner

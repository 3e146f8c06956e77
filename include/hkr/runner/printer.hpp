#pragma once

#include <string>

#include "hkr/core/log.hpp"
#include "hkr/runner/sink.hpp"

namespace hkr::runner {

// Terminal rendering of a run: one line per hook, with the hook's output under
// anything that did not pass.
class Printer final : public ResultSink {
  core::Logger& log_;
  std::string   hook_type_;
  bool          quiet_;

  void print_header(hook::Hook const& hook);

public:
  Printer(core::Logger& log, std::string hook_type, bool quiet = false);

  void start_run() override;
  void nothing_to_run() override;

  void start_hook(hook::Hook const& hook) override;
  void end_hook(hook::Hook const& hook, hook::HookStatus status, std::string const& output) override;
  void hook_skipped(hook::Hook const& hook) override;
  void required_hook_not_skipped(hook::Hook const& hook) override;

  void run_succeeded() override;
  void run_warned() override;
  void run_failed() override;
  void run_interrupted() override;
};

} // namespace hkr::runner

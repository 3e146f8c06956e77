#pragma once

#include <string>

#include "hkr/hook/hook.hpp"
#include "hkr/hook/status.hpp"

namespace hkr::runner {

// Observes a run. Each run ends with exactly one of the run_* events, except a
// run that had nothing to run.
class ResultSink {
public:
  virtual ~ResultSink() = default;

  virtual void start_run()      = 0;
  virtual void nothing_to_run() = 0;

  virtual void start_hook(hook::Hook const& hook)                                                   = 0;
  virtual void end_hook(hook::Hook const& hook, hook::HookStatus status, std::string const& output) = 0;
  virtual void hook_skipped(hook::Hook const& hook)                                                 = 0;
  virtual void required_hook_not_skipped(hook::Hook const& hook)                                    = 0;

  virtual void run_succeeded()   = 0;
  virtual void run_warned()      = 0;
  virtual void run_failed()      = 0;
  virtual void run_interrupted() = 0;
};

} // namespace hkr::runner

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "hkr/hook/status.hpp"

namespace hkr::hook {

// Per-hook configuration after the hook type's ALL entry has been merged in.
struct HookSettings {
  bool                       enabled_        = true;
  bool                       required_       = false;
  bool                       skip_           = false;
  bool                       quiet_          = false;
  bool                       pass_files_     = false;
  bool                       requires_files_ = false;
  bool                       detach_         = false;
  std::optional<std::string> description_;
  std::vector<std::string>   command_;
  std::vector<int>           warn_exit_codes_;
  HookStatus                 on_fail_ = HookStatus::Fail;
  HookStatus                 on_warn_ = HookStatus::Warn;
  std::optional<std::string> required_executable_;
  std::optional<std::string> install_command_;
};

} // namespace hkr::hook

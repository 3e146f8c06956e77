#pragma once

#include <memory>
#include <string>
#include <vector>

#include "hkr/core/error.hpp"
#include "hkr/hook/status.hpp"

namespace hkr::hook {

struct HookOutcome {
  HookStatus  status_;
  std::string output_;
};

// One check bound to a hook type. The runner only reads these; a unit is
// built by a Loader and lives for a single run.
class Hook {
public:
  virtual ~Hook() = default;

  [[nodiscard]] virtual auto name() const -> std::string const&        = 0;
  [[nodiscard]] virtual auto description() const -> std::string const& = 0;

  [[nodiscard]] virtual auto enabled() const -> bool        = 0;
  [[nodiscard]] virtual auto skip_requested() const -> bool = 0;
  [[nodiscard]] virtual auto required() const -> bool       = 0;
  // Whether the hook applies to the current repository state.
  [[nodiscard]] virtual auto would_run() const -> bool = 0;
  [[nodiscard]] virtual auto quiet() const -> bool     = 0;

  // Runs the check and maps its raw result to the configured status.
  virtual auto run_and_transform() -> core::Result<HookOutcome> = 0;
};

using HookList = std::vector<std::unique_ptr<Hook>>;

} // namespace hkr::hook

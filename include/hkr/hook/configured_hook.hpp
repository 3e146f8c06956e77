#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hkr/hook/hook.hpp"
#include "hkr/hook/registry.hpp"
#include "hkr/hook/settings.hpp"

namespace hkr::hook {

using FileList = std::shared_ptr<std::vector<std::string> const>;

// A Hook assembled from merged settings and the check its registration built.
class ConfiguredHook final : public Hook {
  std::string  name_;
  std::string  description_;
  HookSettings settings_;
  Check        check_;
  FileList     files_;

  // Message explaining why the hook cannot run here, if it cannot.
  [[nodiscard]] auto missing_requirement() const -> std::optional<std::string>;

public:
  ConfiguredHook(std::string name, HookSettings settings, Check check, FileList files);

  [[nodiscard]] auto name() const -> std::string const& override;
  [[nodiscard]] auto description() const -> std::string const& override;
  [[nodiscard]] auto enabled() const -> bool override;
  [[nodiscard]] auto skip_requested() const -> bool override;
  [[nodiscard]] auto required() const -> bool override;
  [[nodiscard]] auto would_run() const -> bool override;
  [[nodiscard]] auto quiet() const -> bool override;

  auto run_and_transform() -> core::Result<HookOutcome> override;
};

} // namespace hkr::hook

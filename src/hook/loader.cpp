#include "hkr/hook/loader.hpp"

#include <algorithm>
#include <cctype>
#include <expected>
#include <memory>
#include <utility>

#include <fmt/core.h>

#include "hkr/hook/configured_hook.hpp"

namespace hkr::hook {

using core::Error;

namespace {

auto to_lower(std::string_view text) -> std::string {
  std::string lowered;
  lowered.reserve(text.size());
  for (char c : text) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lowered;
}

auto is_separator(char c) -> bool {
  return c == ',' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

struct Pending {
  std::string         name_;
  HookSettings        settings_;
  Registration const* registration_;
};

} // namespace

auto parse_skip_list(std::string_view value) -> std::vector<std::string> {
  std::vector<std::string> names;
  size_t                   i = 0;
  while (i < value.size()) {
    while (i < value.size() && is_separator(value[i])) {
      ++i;
    }
    size_t start = i;
    while (i < value.size() && !is_separator(value[i])) {
      ++i;
    }
    if (i > start) {
      names.push_back(to_lower(value.substr(start, i - start)));
    }
  }
  return names;
}

auto skip_list_matches(std::vector<std::string> const& skip, std::string_view name) -> bool {
  auto lowered = to_lower(name);
  return std::ranges::any_of(skip, [&](std::string const& entry) { return entry == "all" || entry == lowered; });
}

ConfigLoader::ConfigLoader(
    config::Configuration const& config,
    context::Context&            context,
    HookRegistry                 registry,
    core::Logger&                logger,
    std::string_view             skip_env
)
    : config_(config)
    , context_(context)
    , registry_(std::move(registry))
    , logger_(logger)
    , skip_(parse_skip_list(skip_env)) {}

auto ConfigLoader::load_hooks() -> core::Result<HookList> {
  auto const& hook_type = context_.hook_type();

  auto names = config_.hook_names(hook_type);
  if (!names) {
    return std::unexpected(std::move(names.error()));
  }

  // A hook that names a command replaces any registration with that name.
  for (auto const& name : *names) {
    if (config_.defines_command(hook_type, name)) {
      registry_.add(name, Registration{make_command_check, {}});
    }
  }

  std::vector<Pending> pending;
  bool                 needs_files = false;
  for (auto const& name : *names) {
    auto const* registration = registry_.find(name);
    if (registration == nullptr) {
      return std::unexpected(Error{fmt::format(
          "A load error occurred. Did you forget to give `{}` a `command` in {}?", name, config_.source()
      )});
    }

    HookSettings settings;
    if (registration->defaults_) {
      registration->defaults_(settings);
    }
    if (auto applied = config_.apply_hook_settings(hook_type, name, settings); !applied) {
      return std::unexpected(std::move(applied.error()));
    }
    if (skip_list_matches(skip_, name)) {
      settings.skip_ = true;
    }

    needs_files = needs_files || (settings.enabled_ && (settings.requires_files_ || settings.pass_files_));
    pending.push_back(Pending{name, std::move(settings), registration});
  }

  context::Files files;
  if (needs_files) {
    auto listed = context_.modified_files();
    if (!listed) {
      return std::unexpected(std::move(listed.error()).context("listing files for hooks"));
    }
    files = std::move(*listed);
    logger_.debug(fmt::format("{} applicable file(s)", files->size()));
  }

  HookList hooks;
  hooks.reserve(pending.size());
  for (auto& entry : pending) {
    auto check = entry.registration_->factory_(entry.settings_);
    if (!check) {
      return std::unexpected(std::move(check.error()).context(fmt::format("loading hook {}", entry.name_)));
    }
    logger_.debug(fmt::format("loaded {} hook {}", hook_type, entry.name_));
    hooks.push_back(std::make_unique<ConfiguredHook>(entry.name_, std::move(entry.settings_), std::move(*check), files));
  }
  return hooks;
}

} // namespace hkr::hook

#include "hkr/cli/app.hpp"

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "hkr/cli/argument_parser.hpp"
#include "hkr/context/context.hpp"
#include "hkr/core/constant.hpp"
#include "hkr/core/env.hpp"
#include "hkr/hook/loader.hpp"
#include "hkr/hook/registry.hpp"
#include "hkr/runner/printer.hpp"
#include "hkr/runner/runner.hpp"

namespace hkr::cli {

using core::ExitCode;
using core::to_int;

namespace {

auto skip_env() -> std::string {
  return core::env::get(std::string{core::constant::SKIP_VAR}).value_or("");
}

auto exit_code_for(runner::RunErrorKind kind) -> ExitCode {
  switch (kind) {
    case runner::RunErrorKind::Load:
      return ExitCode::Config;
    case runner::RunErrorKind::Setup:
    case runner::RunErrorKind::Cleanup:
      return ExitCode::IoError;
    case runner::RunErrorKind::Isolation:
      return ExitCode::Internal;
  }
  return ExitCode::Internal;
}

auto usage_error(ArgumentParser const& parser, std::string_view message) -> int {
  fmt::print(stderr, "Error: {}\n\n{}", message, parser.generate_help());
  return to_int(ExitCode::Usage);
}

} // namespace

auto run_hooks(config::Configuration const& config, std::string const& hook_type, AppOptions const& options,
               core::Logger& log, core::Logger& err) -> int {
  auto environment = config.environment(hook_type);
  if (!environment) {
    err.error(environment.error().describe());
    return to_int(ExitCode::Config);
  }

  context::CommandContext repo_context(hook_type, std::move(*environment), log);

  hook::HookRegistry registry;
  hook::register_builtin_hooks(registry);

  hook::ConfigLoader loader(config, repo_context, std::move(registry), log, skip_env());
  runner::Printer    printer(log, hook_type, options.quiet_);
  runner::HookRunner hook_runner(loader, repo_context, printer, log);

  auto passed = hook_runner.run();
  if (!passed) {
    auto const& failure = passed.error();
    err.error(fmt::format("{} error: {}", runner::to_string(failure.kind_), failure.error_.describe()));
    return to_int(exit_code_for(failure.kind_));
  }
  return to_int(*passed ? ExitCode::Success : ExitCode::HookFailed);
}

auto list_hooks(config::Configuration const& config, std::string const& hook_type, core::Logger& log,
                core::Logger& err) -> int {
  auto names = config.hook_names(hook_type);
  if (!names) {
    err.error(names.error().describe());
    return to_int(ExitCode::Config);
  }

  hook::HookRegistry registry;
  hook::register_builtin_hooks(registry);
  auto skip = hook::parse_skip_list(skip_env());

  for (auto const& name : *names) {
    hook::HookSettings settings;
    auto const*        registration = registry.find(name);
    if (registration != nullptr && registration->defaults_ && !config.defines_command(hook_type, name)) {
      registration->defaults_(settings);
    }
    if (auto applied = config.apply_hook_settings(hook_type, name, settings); !applied) {
      err.error(applied.error().describe());
      return to_int(ExitCode::Config);
    }

    std::vector<std::string> state;
    state.emplace_back(settings.enabled_ ? "enabled" : "disabled");
    if (settings.required_) {
      state.emplace_back("required");
    }
    if (settings.skip_ || hook::skip_list_matches(skip, name)) {
      state.emplace_back("skipped");
    }
    if (registration == nullptr && !config.defines_command(hook_type, name)) {
      state.emplace_back("no command");
    }

    log.log(fmt::format(
        "{}: {} ({})",
        name,
        settings.description_.value_or(fmt::format("Run {}", name)),
        fmt::join(state, ", ")
    ));
  }
  return to_int(ExitCode::Success);
}

void print_version() {
  fmt::print("{} version {}\n", core::constant::EXE_NAME, core::constant::VERSION);
}

auto run_app(int argc, char** argv) -> int {
  auto parser = patterns::create_hkr_parser(std::string{core::constant::EXE_NAME});
  auto args   = parser.parse(argc, argv);

  if (args.has_error()) {
    return usage_error(parser, args.error_message());
  }
  if (args.has("help")) {
    fmt::print("{}", parser.generate_help());
    return to_int(ExitCode::Success);
  }
  if (args.has("version")) {
    print_version();
    return to_int(ExitCode::Success);
  }

  auto const& positional = args.positional_args();
  if (positional.size() != 2) {
    return usage_error(parser, "expected a command and a hook type");
  }
  auto const& command   = positional[0];
  auto const& hook_type = positional[1];
  if (command != "run" && command != "list") {
    return usage_error(parser, fmt::format("unknown command `{}`", command));
  }
  if (hook_type.empty()) {
    return usage_error(parser, "hook type must not be empty");
  }

  AppOptions options;
  options.config_path_ = args.get("config");
  options.verbose_     = args.has("verbose") || core::env::enabled(std::string{core::constant::DEBUG_VAR});
  options.quiet_       = args.has("quiet");

  core::Logger log(stdout, options.verbose_);
  core::Logger err(stderr, options.verbose_);

  try {
    auto config = config::Configuration::load(options.config_path_);
    if (!config) {
      err.error(config.error().describe());
      return to_int(ExitCode::Config);
    }
    log.debug(fmt::format("configuration: {}", config->source()));

    if (command == "list") {
      return list_hooks(*config, hook_type, log, err);
    }
    return run_hooks(*config, hook_type, options, log, err);
  } catch (std::exception const& e) {
    err.error(fmt::format("{}: internal error: {}", core::constant::EXE_NAME, e.what()));
    return to_int(ExitCode::Internal);
  }
}

} // namespace hkr::cli

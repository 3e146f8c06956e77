#include "hkr/config/configuration.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <fmt/core.h>

#include "hkr/core/constant.hpp"
#include "hkr/core/env.hpp"

namespace hkr::config {

using core::Error;

namespace {

auto type_error(std::string const& path, std::string_view expected) -> Error {
  return Error{fmt::format("{} must be {}", path, expected)};
}

auto read_bool(Json const& value, std::string const& path) -> Result<bool> {
  if (!value.is_boolean()) {
    return std::unexpected(type_error(path, "a boolean"));
  }
  return value.get<bool>();
}

auto read_string(Json const& value, std::string const& path) -> Result<std::string> {
  if (!value.is_string()) {
    return std::unexpected(type_error(path, "a string"));
  }
  return value.get<std::string>();
}

auto read_string_array(Json const& value, std::string const& path) -> Result<std::vector<std::string>> {
  if (!value.is_array()) {
    return std::unexpected(type_error(path, "an array of strings"));
  }
  std::vector<std::string> items;
  for (auto const& item : value) {
    if (!item.is_string()) {
      return std::unexpected(type_error(path, "an array of strings"));
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

// Exit codes are 0..255; anything wider would be narrowed into that range.
auto read_exit_codes(Json const& value, std::string const& path) -> Result<std::vector<int>> {
  if (!value.is_array()) {
    return std::unexpected(type_error(path, "an array of exit codes"));
  }
  std::vector<int> items;
  for (auto const& item : value) {
    if (!item.is_number_integer()) {
      return std::unexpected(type_error(path, "an array of exit codes"));
    }
    auto code = item.get<std::int64_t>();
    if (code < 0 || code > 255) {
      return std::unexpected(type_error(path, "an array of exit codes"));
    }
    items.push_back(static_cast<int>(code));
  }
  return items;
}

auto read_status(Json const& value, std::string const& path) -> Result<hook::HookStatus> {
  auto name = read_string(value, path);
  if (!name) {
    return std::unexpected(std::move(name.error()));
  }
  auto status = hook::parse_status(*name);
  if (!status) {
    return std::unexpected(type_error(path, "one of pass, warn or fail"));
  }
  return *status;
}

// Assigns the result to `target` or hands back the error.
template<typename T, typename U>
auto assign(Result<T> value, U& target) -> Result<void> {
  if (!value) {
    return std::unexpected(std::move(value.error()));
  }
  target = std::move(*value);
  return {};
}

auto apply_entry(Json const& entry, std::string const& path, hook::HookSettings& settings) -> Result<void> {
  if (!entry.is_object()) {
    return std::unexpected(type_error(path, "an object"));
  }

  for (auto const& [key, value] : entry.items()) {
    auto key_path = fmt::format("{}.{}", path, key);

    Result<void> applied;
    if (key == "enabled") {
      applied = assign(read_bool(value, key_path), settings.enabled_);
    } else if (key == "required") {
      applied = assign(read_bool(value, key_path), settings.required_);
    } else if (key == "skip") {
      applied = assign(read_bool(value, key_path), settings.skip_);
    } else if (key == "quiet") {
      applied = assign(read_bool(value, key_path), settings.quiet_);
    } else if (key == "pass_files") {
      applied = assign(read_bool(value, key_path), settings.pass_files_);
    } else if (key == "requires_files") {
      applied = assign(read_bool(value, key_path), settings.requires_files_);
    } else if (key == "detach") {
      applied = assign(read_bool(value, key_path), settings.detach_);
    } else if (key == "description") {
      applied = assign(read_string(value, key_path), settings.description_);
    } else if (key == "command") {
      applied = assign(read_string_array(value, key_path), settings.command_);
    } else if (key == "warn_exit_codes") {
      applied = assign(read_exit_codes(value, key_path), settings.warn_exit_codes_);
    } else if (key == "on_fail") {
      applied = assign(read_status(value, key_path), settings.on_fail_);
    } else if (key == "on_warn") {
      applied = assign(read_status(value, key_path), settings.on_warn_);
    } else if (key == "required_executable") {
      applied = assign(read_string(value, key_path), settings.required_executable_);
    } else if (key == "install_command") {
      applied = assign(read_string(value, key_path), settings.install_command_);
    } else {
      applied = std::unexpected(Error{fmt::format("{}: unknown setting", key_path)});
    }

    if (!applied) {
      return applied;
    }
  }
  return {};
}

} // namespace

Configuration::Configuration()
    : data_(Json::object()) {}

Configuration::Configuration(Json data, std::string source)
    : data_(std::move(data)), source_(std::move(source)) {}

auto Configuration::parse(std::string_view text, std::string source) -> Result<Configuration> {
  Json data;
  try {
    data = Json::parse(text);
  } catch (Json::parse_error const& e) {
    return std::unexpected(Error{fmt::format("{}: {}", source, e.what())});
  }

  if (!data.is_object()) {
    return std::unexpected(Error{fmt::format("{}: top level must be an object", source)});
  }
  for (auto const* section : {"environment", "hooks"}) {
    if (data.contains(section) && !data[section].is_object()) {
      return std::unexpected(Error{fmt::format("{}: {} must be an object", source, section)});
    }
  }
  return Configuration{std::move(data), std::move(source)};
}

auto Configuration::load_file(std::string const& path) -> Result<Configuration> {
  std::ifstream input(path);
  if (!input) {
    return std::unexpected(Error{fmt::format("{}: cannot open configuration", path)});
  }
  std::stringstream buffer;
  buffer << input.rdbuf();
  return parse(buffer.str(), path);
}

auto Configuration::load(std::optional<std::string> const& explicit_path) -> Result<Configuration> {
  if (explicit_path) {
    return load_file(*explicit_path);
  }
  if (auto from_env = core::env::get(std::string{core::constant::CONFIG_VAR}); from_env && !from_env->empty()) {
    return load_file(*from_env);
  }

  auto path = default_config_path();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Configuration{Json::object(), path};
  }
  return load_file(path);
}

auto Configuration::source() const noexcept -> std::string const& {
  return source_;
}

auto Configuration::hook_names(std::string const& hook_type) const -> Result<std::vector<std::string>> {
  std::vector<std::string> names;
  if (!data_.contains("hooks") || !data_["hooks"].contains(hook_type)) {
    return names;
  }

  auto const& hooks = data_["hooks"][hook_type];
  if (!hooks.is_object()) {
    return std::unexpected(type_error(fmt::format("{}: hooks.{}", source_, hook_type), "an object"));
  }
  for (auto const& [name, _] : hooks.items()) {
    if (name != core::constant::ALL_HOOKS) {
      names.push_back(name);
    }
  }
  return names;
}

auto Configuration::defines_command(std::string const& hook_type, std::string const& name) const -> bool {
  if (!data_.contains("hooks") || !data_["hooks"].contains(hook_type)) {
    return false;
  }
  auto const& hooks = data_["hooks"][hook_type];
  if (!hooks.is_object() || !hooks.contains(name)) {
    return false;
  }
  auto const& entry = hooks[name];
  return entry.is_object() && entry.contains("command");
}

auto Configuration::apply_hook_settings(
    std::string const& hook_type, std::string const& name, hook::HookSettings& settings
) const -> Result<void> {
  if (!data_.contains("hooks") || !data_["hooks"].contains(hook_type)) {
    return {};
  }
  auto const& hooks = data_["hooks"][hook_type];
  if (!hooks.is_object()) {
    return std::unexpected(type_error(fmt::format("{}: hooks.{}", source_, hook_type), "an object"));
  }

  for (std::string const& entry_name : {std::string{core::constant::ALL_HOOKS}, name}) {
    if (!hooks.contains(entry_name)) {
      continue;
    }
    auto path = fmt::format("{}: hooks.{}.{}", source_, hook_type, entry_name);
    if (auto applied = apply_entry(hooks[entry_name], path, settings); !applied) {
      return applied;
    }
  }
  return {};
}

auto Configuration::environment(std::string const& hook_type) const -> Result<EnvironmentSettings> {
  EnvironmentSettings settings;
  if (!data_.contains("environment") || !data_["environment"].contains(hook_type)) {
    return settings;
  }

  auto const& entry = data_["environment"][hook_type];
  auto        path  = fmt::format("{}: environment.{}", source_, hook_type);
  if (!entry.is_object()) {
    return std::unexpected(type_error(path, "an object"));
  }

  for (auto const& [key, value] : entry.items()) {
    auto         key_path = fmt::format("{}.{}", path, key);
    Result<void> applied;
    if (key == "setup") {
      applied = assign(read_string_array(value, key_path), settings.setup_);
    } else if (key == "cleanup") {
      applied = assign(read_string_array(value, key_path), settings.cleanup_);
    } else if (key == "files") {
      applied = assign(read_string_array(value, key_path), settings.files_);
    } else {
      applied = std::unexpected(Error{fmt::format("{}: unknown setting", key_path)});
    }
    if (!applied) {
      return std::unexpected(std::move(applied.error()));
    }
  }
  return settings;
}

auto default_config_path() -> std::string {
  if (auto from_env = core::env::get(std::string{core::constant::CONFIG_VAR}); from_env && !from_env->empty()) {
    return *from_env;
  }
  return std::string{core::constant::CONFIG_FILE};
}

} // namespace hkr::config

#include "hkr/cli/argument_parser.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

#include <fmt/core.h>

#include "hkr/core/constant.hpp"

namespace hkr::cli {

namespace {

auto is_alpha(char c) noexcept -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // namespace

Option::Option(std::string short_name, std::string long_name, std::string description, Type type)
    : short_name_(std::move(short_name))
    , long_name_(std::move(long_name))
    , description_(std::move(description))
    , type_(type) {}

Option& Option::default_value(std::string value) {
  default_value_ = std::move(value);
  return *this;
}

ParseResult::ParseResult(bool success, std::string error_message)
    : success_(success), error_message_(std::move(error_message)) {}

bool ParseResult::has(std::string const& option_name) const {
  auto it = option_values_.find(option_name);
  return it != option_values_.end() && !it->second.empty();
}

std::optional<std::string> ParseResult::get(std::string const& option_name) const {
  if (auto it = option_values_.find(option_name); it != option_values_.end() && !it->second.empty()) {
    return it->second.back();
  }
  return std::nullopt;
}

ArgumentParser::ArgumentParser(std::string program_name, std::string description)
    : program_name_(std::move(program_name)), description_(std::move(description)) {}

Option&
ArgumentParser::add_option(std::string short_name, std::string long_name, std::string description, Option::Type type) {
  if (!short_name.empty()) {
    option_map_[short_name] = options_.size();
  }
  if (!long_name.empty()) {
    option_map_[long_name] = options_.size();
  }

  return options_.emplace_back(std::move(short_name), std::move(long_name), std::move(description), type);
}

Option& ArgumentParser::add_option(std::string long_name, std::string description, Option::Type type) {
  return add_option("", std::move(long_name), std::move(description), type);
}

ArgumentParser& ArgumentParser::positional_usage(std::string usage) {
  positional_usage_ = std::move(usage);
  return *this;
}

ParseResult ArgumentParser::parse(int argc, char** argv) const {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse(std::span<std::string const>(args));
}

ParseResult ArgumentParser::parse(std::span<std::string const> args) const {
  ParseResult result(true);

  std::vector<bool> option_seen(options_.size(), false);
  bool              options_ended = false;

  for (size_t i = 0; i < args.size(); ++i) {
    std::string const& arg = args[i];

    if (options_ended || (!is_short_option(arg) && !is_long_option(arg))) {
      if (arg == "--" && !options_ended) {
        options_ended = true;
        continue;
      }
      result.positional_args_.push_back(arg);
      continue;
    }

    auto option_name  = extract_option_name(arg);
    auto option_index = find_option(option_name);
    if (!option_index) {
      return create_error(fmt::format("Unknown option: {}", arg));
    }

    Option const& option       = options_[*option_index];
    option_seen[*option_index] = true;

    if (option.type() == Option::Type::Flag) {
      result.option_values_[option.long_name()].emplace_back("true");
      continue;
    }

    if (i + 1 >= args.size()) {
      return create_error(fmt::format("Option {} requires a value", arg));
    }
    ++i;
    result.option_values_[option.long_name()].push_back(args[i]);
  }

  for (size_t i = 0; i < options_.size(); ++i) {
    Option const& option = options_[i];
    if (!option_seen[i] && option.default_value_) {
      result.option_values_[option.long_name()].push_back(*option.default_value_);
    }
  }

  return result;
}

std::string ArgumentParser::generate_help() const {
  std::ostringstream oss;

  if (!description_.empty()) {
    oss << description_ << "\n\n";
  }

  oss << generate_usage() << "\n";

  if (!options_.empty()) {
    oss << "\nOptions:\n";

    size_t max_width = 0;
    for (Option const& option : options_) {
      size_t width = 0;
      if (!option.short_name().empty()) {
        width += 2 + option.short_name().length(); // "-x"
      }
      if (!option.long_name().empty()) {
        if (width > 0) {
          width += 2; // ", "
        }
        width += 2 + option.long_name().length(); // "--long"
      }
      if (option.type() == Option::Type::Value) {
        width += 6; // " <val>"
      }
      max_width = std::max(max_width, width);
    }

    for (Option const& option : options_) {
      std::ostringstream option_str;
      if (!option.short_name().empty()) {
        option_str << "-" << option.short_name();
      }
      if (!option.long_name().empty()) {
        if (!option.short_name().empty()) {
          option_str << ", ";
        }
        option_str << "--" << option.long_name();
      }
      if (option.type() == Option::Type::Value) {
        option_str << " <val>";
      }

      oss << "  " << std::left << std::setw(static_cast<int>(max_width) + 2) << option_str.str();
      oss << option.description();
      if (option.default_value_) {
        oss << " (default: " << *option.default_value_ << ")";
      }
      oss << "\n";
    }
  }

  return oss.str();
}

std::string ArgumentParser::generate_usage() const {
  std::ostringstream oss;
  oss << "Usage: " << program_name_;

  if (!options_.empty()) {
    oss << " [options]";
  }
  if (!positional_usage_.empty()) {
    oss << " " << positional_usage_;
  }

  return oss.str();
}

std::optional<size_t> ArgumentParser::find_option(std::string const& name) const {
  auto it = option_map_.find(name);
  return it != option_map_.end() ? std::optional{it->second} : std::nullopt;
}

bool ArgumentParser::is_short_option(std::string const& arg) noexcept {
  return arg.length() >= 2 && arg[0] == '-' && arg[1] != '-' && is_alpha(arg[1]);
}

bool ArgumentParser::is_long_option(std::string const& arg) noexcept {
  return arg.length() >= 3 && arg[0] == '-' && arg[1] == '-' && is_alpha(arg[2]);
}

std::string ArgumentParser::extract_option_name(std::string const& arg) {
  if (is_long_option(arg)) {
    return arg.substr(2);
  }
  if (is_short_option(arg)) {
    return arg.substr(1);
  }
  return arg;
}

ParseResult ArgumentParser::create_error(std::string message) {
  return ParseResult{false, std::move(message)};
}

namespace patterns {

ArgumentParser create_hkr_parser(std::string program_name) {
  ArgumentParser parser(std::move(program_name), std::string{core::constant::EXE_DESC});
  parser.positional_usage("<run|list> <hook-type>");

  parser.add_option("c", "config", "Read hook configuration from this file", Option::Type::Value);
  add_standard_options(parser);

  return parser;
}

void add_standard_options(ArgumentParser& parser) {
  parser.add_option("h", "help", "Show this help message and exit");
  parser.add_option("version", "Show version information and exit");
  parser.add_option("v", "verbose", "Enable debug output");
  parser.add_option("q", "quiet", "Only report hooks that did not pass");
}

} // namespace patterns

} // namespace hkr::cli

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hkr::cli {

struct Option {
  enum class Type {
    Flag, // --verbose, -v
    Value // --config file, -c file
  };

  std::string                short_name_;
  std::string                long_name_;
  std::string                description_;
  Type                       type_;
  std::optional<std::string> default_value_;

  Option(std::string short_name, std::string long_name, std::string description, Type type = Type::Flag);

  Option& default_value(std::string value);

  [[nodiscard]] std::string const& short_name() const noexcept {
    return short_name_;
  }
  [[nodiscard]] std::string const& long_name() const noexcept {
    return long_name_;
  }
  [[nodiscard]] std::string const& description() const noexcept {
    return description_;
  }
  [[nodiscard]] Type type() const noexcept {
    return type_;
  }
};

struct ParseResult {
  bool                                                      success_;
  std::string                                               error_message_;
  std::unordered_map<std::string, std::vector<std::string>> option_values_;
  std::vector<std::string>                                  positional_args_;

  explicit ParseResult(bool success, std::string error_message = "");

  bool has_error() const noexcept {
    return !success_;
  }
  std::string_view error_message() const noexcept {
    return error_message_;
  }

  bool                       has(std::string const& option_name) const;
  std::optional<std::string> get(std::string const& option_name) const;

  std::vector<std::string> const& positional_args() const noexcept {
    return positional_args_;
  }
};

class ArgumentParser {
  std::string                             program_name_;
  std::string                             description_;
  std::string                             positional_usage_;
  std::vector<Option>                     options_;
  std::unordered_map<std::string, size_t> option_map_; // option names to indices

public:
  explicit ArgumentParser(std::string program_name, std::string description = "");

  Option& add_option(
      std::string  short_name,
      std::string  long_name,
      std::string  description,
      Option::Type type = Option::Type::Flag
  );
  Option& add_option(std::string long_name, std::string description, Option::Type type = Option::Type::Flag);

  // Shown after the options in the usage line, e.g. "<command> <hook-type>".
  ArgumentParser& positional_usage(std::string usage);

  ParseResult parse(int argc, char** argv) const;
  ParseResult parse(std::span<std::string const> args) const;

  std::string generate_help() const;
  std::string generate_usage() const;

private:
  std::optional<size_t> find_option(std::string const& name) const;
  static bool           is_short_option(std::string const& arg) noexcept;
  static bool           is_long_option(std::string const& arg) noexcept;
  static std::string    extract_option_name(std::string const& arg);
  static ParseResult    create_error(std::string message);
};

namespace patterns {

ArgumentParser create_hkr_parser(std::string program_name);

// --help, --version, --verbose and --quiet
void add_standard_options(ArgumentParser& parser);

} // namespace patterns

} // namespace hkr::cli

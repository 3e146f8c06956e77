#pragma once

#include <cstdio>
#include <string_view>

#include <fmt/color.h>

namespace hkr::core {

// Colors are used when writing to a terminal and NO_COLOR is unset.
auto color_supported(std::FILE* stream) -> bool;

class Logger {
  std::FILE* out_;
  bool       color_;
  bool       debug_;

  void write(std::string_view text, fmt::text_style style, bool newline);

public:
  explicit Logger(std::FILE* out, bool debug = false);
  Logger(std::FILE* out, bool debug, bool color);

  void set_debug(bool enabled) noexcept;

  // Writes without a trailing newline.
  void partial(std::string_view text);
  void newline();
  void log(std::string_view text);

  void debug(std::string_view text);
  void success(std::string_view text);
  void warning(std::string_view text);
  void error(std::string_view text);
  void bold(std::string_view text);
  void bold_warning(std::string_view text);
  void bold_error(std::string_view text);
};

} // namespace hkr::core

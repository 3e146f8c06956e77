#include "hkr/core/log.hpp"

#include <cstdio>
#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>
#include <unistd.h>

#include "hkr/core/constant.hpp"
#include "hkr/core/env.hpp"

namespace hkr::core {

auto color_supported(std::FILE* stream) -> bool {
  if (stream == nullptr || env::get(std::string{constant::NO_COLOR_VAR})) {
    return false;
  }
  if (auto term = env::get("TERM"); term && *term == "dumb") {
    return false;
  }
  return isatty(fileno(stream)) == 1;
}

Logger::Logger(std::FILE* out, bool debug)
    : Logger(out, debug, color_supported(out)) {}

Logger::Logger(std::FILE* out, bool debug, bool color)
    : out_(out), color_(color), debug_(debug) {}

void Logger::set_debug(bool enabled) noexcept {
  debug_ = enabled;
}

void Logger::write(std::string_view text, fmt::text_style style, bool newline) {
  if (color_ && (style.has_foreground() || style.has_emphasis())) {
    fmt::print(out_, style, "{}", text);
  } else {
    fmt::print(out_, "{}", text);
  }
  if (newline) {
    fmt::print(out_, "\n");
  }
  std::fflush(out_);
}

void Logger::partial(std::string_view text) {
  write(text, {}, false);
}

void Logger::newline() {
  write("", {}, true);
}

void Logger::log(std::string_view text) {
  write(text, {}, true);
}

void Logger::debug(std::string_view text) {
  if (debug_) {
    write(fmt::format("[{}] {}", constant::EXE_NAME, text), fmt::fg(fmt::terminal_color::magenta), true);
  }
}

void Logger::success(std::string_view text) {
  write(text, fmt::fg(fmt::terminal_color::green), true);
}

void Logger::warning(std::string_view text) {
  write(text, fmt::fg(fmt::terminal_color::yellow), true);
}

void Logger::error(std::string_view text) {
  write(text, fmt::fg(fmt::terminal_color::red), true);
}

void Logger::bold(std::string_view text) {
  write(text, fmt::emphasis::bold, true);
}

void Logger::bold_warning(std::string_view text) {
  write(text, fmt::emphasis::bold | fmt::fg(fmt::terminal_color::yellow), true);
}

void Logger::bold_error(std::string_view text) {
  write(text, fmt::emphasis::bold | fmt::fg(fmt::terminal_color::red), true);
}

} // namespace hkr::core

#include "hkr/core/error.hpp"

#include <cstring>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace hkr::core {

Error::Error(std::string message)
    : message_(std::move(message)) {}

auto Error::from_errno(std::string_view what, int error_number) -> Error {
  return Error{fmt::format("{}: {}", what, std::strerror(error_number))};
}

auto Error::context(std::string frame) const& -> Error {
  Error copy{*this};
  copy.trace_.push_back(std::move(frame));
  return copy;
}

auto Error::context(std::string frame) && -> Error {
  trace_.push_back(std::move(frame));
  return std::move(*this);
}

auto Error::message() const noexcept -> std::string const& {
  return message_;
}

auto Error::trace() const noexcept -> std::vector<std::string> const& {
  return trace_;
}

auto Error::describe() const -> std::string {
  std::string out = message_;
  for (auto const& frame : trace_) {
    out += fmt::format("\n  from {}", frame);
  }
  return out;
}

} // namespace hkr::core

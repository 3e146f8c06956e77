#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace hkr::core {

// An error value travelling outwards through Result returns. Each layer it
// passes may append a frame, which together form the trace shown to the user.
class Error {
  std::string              message_;
  std::vector<std::string> trace_;

public:
  explicit Error(std::string message);

  static auto from_errno(std::string_view what, int error_number) -> Error;

  [[nodiscard]] auto context(std::string frame) const& -> Error;
  [[nodiscard]] auto context(std::string frame) && -> Error;

  [[nodiscard]] auto message() const noexcept -> std::string const&;
  [[nodiscard]] auto trace() const noexcept -> std::vector<std::string> const&;

  // Message followed by one "  from <frame>" line per frame.
  [[nodiscard]] auto describe() const -> std::string;
};

template<typename T, typename E = Error>
using Result = std::expected<T, E>;

} // namespace hkr::core

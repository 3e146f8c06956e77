#pragma once

#include <string>
#include <string_view>

#include "hkr/core/error.hpp"

namespace hkr::core {

class FileDescriptor {
  int  fd_;
  bool owning_;

public:
  explicit FileDescriptor(int fd = -1, bool owning = true) noexcept;
  ~FileDescriptor() noexcept;

  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;

  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  // An anonymous file in TMPDIR (or /tmp) that only this descriptor, and any
  // process it is handed to, can reach.
  static auto temporary(std::string_view prefix) -> Result<FileDescriptor>;

  [[nodiscard]] auto get() const noexcept -> int;
  auto               release() noexcept -> int;
  [[nodiscard]] auto valid() const noexcept -> bool;

  // Reads everything from the start of the file, leaving the offset at the end.
  [[nodiscard]] auto read_from_start() const -> Result<std::string>;
};

} // namespace hkr::core

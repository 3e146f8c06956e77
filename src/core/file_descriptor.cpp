#include "hkr/core/file_descriptor.hpp"

#include <array>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "hkr/core/constant.hpp"
#include "hkr/core/env.hpp"
#include "hkr/core/syscall.hpp"

namespace hkr::core {

namespace {

constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

auto temp_directory() -> std::string {
  if (auto dir = env::get(std::string{constant::TMPDIR_VAR}); dir && !dir->empty()) {
    return *dir;
  }
  return "/tmp";
}

} // namespace

FileDescriptor::FileDescriptor(int fd, bool owning) noexcept
    : fd_(fd), owning_(owning) {}

FileDescriptor::~FileDescriptor() noexcept {
  if (owning_ && fd_ >= 0) {
    [[maybe_unused]] auto _ = syscall::close_fd(fd_);
  }
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_), owning_(other.owning_) {
  other.fd_     = -1;
  other.owning_ = false;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    if (owning_ && fd_ >= 0) {
      [[maybe_unused]] auto _ = syscall::close_fd(fd_);
    }
    fd_           = other.fd_;
    owning_       = other.owning_;
    other.fd_     = -1;
    other.owning_ = false;
  }
  return *this;
}

auto FileDescriptor::temporary(std::string_view prefix) -> Result<FileDescriptor> {
  auto dir = temp_directory();
  auto fd  = syscall::create_unlinked_temp_file(dir, prefix);
  if (!fd) {
    return std::unexpected(Error::from_errno(fmt::format("cannot create a temporary file in {}", dir), fd.error()));
  }
  return FileDescriptor{*fd};
}

auto FileDescriptor::get() const noexcept -> int {
  return fd_;
}

auto FileDescriptor::release() noexcept -> int {
  int fd  = fd_;
  fd_     = -1;
  owning_ = false;
  return fd;
}

auto FileDescriptor::valid() const noexcept -> bool {
  return fd_ >= 0;
}

auto FileDescriptor::read_from_start() const -> Result<std::string> {
  if (auto rewound = syscall::rewind_fd(fd_); !rewound) {
    return std::unexpected(Error::from_errno("lseek", rewound.error()));
  }

  std::string                       contents;
  std::array<char, READ_CHUNK_SIZE> buffer{};
  while (true) {
    auto count = syscall::read_fd(fd_, buffer.data(), buffer.size());
    if (!count) {
      return std::unexpected(Error::from_errno("read", count.error()));
    }
    if (*count == 0) {
      break;
    }
    contents.append(buffer.data(), *count);
  }
  return contents;
}

} // namespace hkr::core

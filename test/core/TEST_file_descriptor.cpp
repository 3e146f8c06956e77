#include <gtest/gtest.h>

#include <string>
#include <utility>

#include <unistd.h>

#include "hkr/core/env.hpp"
#include "hkr/core/file_descriptor.hpp"

namespace hkr::core::test {

TEST(FileDescriptorTest, TemporaryFileRoundTrip) {
  auto fd = FileDescriptor::temporary("hkr-test-");
  ASSERT_TRUE(fd.has_value()) << fd.error().describe();
  ASSERT_TRUE(fd->valid());

  std::string text = "line one\nline two\n";
  ASSERT_EQ(write(fd->get(), text.data(), text.size()), static_cast<ssize_t>(text.size()));

  auto contents = fd->read_from_start();
  ASSERT_TRUE(contents.has_value());
  EXPECT_EQ(*contents, text);
}

TEST(FileDescriptorTest, MoveTransfersOwnership) {
  auto fd = FileDescriptor::temporary("hkr-test-");
  ASSERT_TRUE(fd.has_value());
  int raw = fd->get();

  FileDescriptor moved = std::move(*fd);
  EXPECT_EQ(moved.get(), raw);
  EXPECT_FALSE(fd->valid());
}

TEST(FileDescriptorTest, ReleaseStopsClosing) {
  auto fd = FileDescriptor::temporary("hkr-test-");
  ASSERT_TRUE(fd.has_value());

  int raw = fd->release();
  EXPECT_FALSE(fd->valid());
  EXPECT_EQ(close(raw), 0);
}

TEST(FileDescriptorTest, TemporaryFailsInMissingDirectory) {
  auto saved = env::get("TMPDIR");
  env::set("TMPDIR", "/nonexistent/hkr-test-dir");

  auto fd = FileDescriptor::temporary("hkr-test-");

  if (saved) {
    env::set("TMPDIR", *saved);
  } else {
    env::unset("TMPDIR");
  }

  ASSERT_FALSE(fd.has_value());
  EXPECT_NE(fd.error().message().find("/nonexistent/hkr-test-dir"), std::string::npos);
}

} // namespace hkr::core::test

/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of filerewrite.
 *
 * filerewrite is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * filerewrite is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with filerewrite.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <cerrno>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>

#include <fcntl.h>
#include <sys/stat.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filerewrite/error.h>
#include <filerewrite/file_rewriter.h>
#include <filerewrite/file_util.h>

#include <filerewrite/internal/file_io_ops.h>

#include "file_io_ops_mock.h"
#include "test_helpers.h"
#include "test_logger.h"

using namespace filerewrite;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace fs = std::filesystem;

namespace {

struct ::timespec get_mtime(fs::path const& path) {
  struct ::stat st{};
  if (::lstat(path.c_str(), &st) != 0) {
    throw std::system_error(errno, std::generic_category(), "lstat");
  }
  return st.st_mtim;
}

void set_times(fs::path const& path, struct ::timespec atime,
               struct ::timespec mtime) {
  struct ::timespec const ts[2] = {atime, mtime};
  if (::utimensat(AT_FDCWD, path.c_str(), ts, AT_SYMLINK_NOFOLLOW) != 0) {
    throw std::system_error(errno, std::generic_category(), "utimensat");
  }
}

constexpr struct ::timespec kAtime{.tv_sec = 1'111'111'111,
                                   .tv_nsec = 222'333'444};
constexpr struct ::timespec kMtime{.tv_sec = 1'222'222'222,
                                   .tv_nsec = 555'666'777};

} // namespace

class file_rewriter_test : public ::testing::Test {
 protected:
  void SetUp() override { td.emplace("filerewrite_rewriter"); }

  void TearDown() override { td.reset(); }

  fs::path path(std::string_view name) const { return td->path() / name; }

  std::optional<temporary_directory> td;
  test::test_logger lgr{logger::VERBOSE};
};

class file_rewriter_native_test : public file_rewriter_test {
 protected:
  file_rewriter rw{lgr, internal::create_native_file_io_ops()};
};

class file_rewriter_mock_test : public file_rewriter_test {
 protected:
  std::shared_ptr<test::file_io_ops_mock> ops{
      std::make_shared<test::file_io_ops_mock>()};
  file_rewriter rw{lgr, ops};
};

TEST_F(file_rewriter_native_test, preserves_content_and_times) {
  auto const p = path("file");
  auto const content = test::make_random_file(p, 100'000, 42);
  set_times(p, kAtime, kMtime);

  EXPECT_TRUE(rw.rewrite(p, {.buffer_size = 4096}));

  EXPECT_EQ(read_file(p), content);

  struct ::stat st{};
  ASSERT_EQ(0, ::stat(p.c_str(), &st));
  EXPECT_EQ(st.st_atim.tv_sec, kAtime.tv_sec);
  EXPECT_EQ(st.st_atim.tv_nsec, kAtime.tv_nsec);
  EXPECT_EQ(st.st_mtim.tv_sec, kMtime.tv_sec);
  EXPECT_EQ(st.st_mtim.tv_nsec, kMtime.tv_nsec);

  EXPECT_THAT(lgr.messages(logger::ERROR), IsEmpty());
  EXPECT_THAT(lgr.messages(logger::WARN), IsEmpty());
}

class file_rewriter_sizes_test
    : public file_rewriter_native_test,
      public ::testing::WithParamInterface<std::tuple<size_t, size_t>> {};

TEST_P(file_rewriter_sizes_test, content_and_times_are_unchanged) {
  auto const [file_size, buffer_size] = GetParam();
  auto const p = path("data");
  auto const content = test::make_random_file(p, file_size, file_size);
  set_times(p, kAtime, kMtime);

  EXPECT_TRUE(rw.rewrite(p, {.buffer_size = buffer_size})) << lgr;
  EXPECT_EQ(read_file(p), content);

  struct ::stat st{};
  ASSERT_EQ(0, ::stat(p.c_str(), &st));
  EXPECT_EQ(st.st_atim.tv_sec, kAtime.tv_sec);
  EXPECT_EQ(st.st_atim.tv_nsec, kAtime.tv_nsec);
  EXPECT_EQ(st.st_mtim.tv_sec, kMtime.tv_sec);
  EXPECT_EQ(st.st_mtim.tv_nsec, kMtime.tv_nsec);
}

INSTANTIATE_TEST_SUITE_P(
    filerewrite, file_rewriter_sizes_test,
    ::testing::Values(std::make_tuple(0, 4096), std::make_tuple(1, 1),
                      std::make_tuple(1000, 1), std::make_tuple(4096, 4096),
                      std::make_tuple(4097, 4096),
                      std::make_tuple(12'345, 1 << 20),
                      std::make_tuple(3 << 20, 1 << 20)));

TEST_F(file_rewriter_native_test, logs_each_chunk_when_verbose) {
  auto const p = path("chunks");
  test::make_random_file(p, 10);

  EXPECT_TRUE(rw.rewrite(p, {.buffer_size = 4}));

  auto const name = p.string();

  EXPECT_THAT(lgr.messages(logger::VERBOSE),
              ElementsAre("Read 4 from " + name + " at offset 0",
                          "Wrote 4 to " + name + " at offset 0",
                          "Read 4 from " + name + " at offset 4",
                          "Wrote 4 to " + name + " at offset 4",
                          "Read 2 from " + name + " at offset 8",
                          "Wrote 2 to " + name + " at offset 8",
                          "Restored access and modification times on " + name,
                          HasSubstr("rewrote 10 B of " + name + " [")));
}

TEST_F(file_rewriter_native_test, missing_file) {
  auto const p = path("missing");

  EXPECT_FALSE(rw.rewrite(p, {}));

  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre(HasSubstr("Unable to open " + p.string() + ": ")));
}

TEST_F(file_rewriter_native_test, directory) {
  auto const p = path("dir");
  fs::create_directory(p);

  EXPECT_FALSE(rw.rewrite(p, {}));

  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre(HasSubstr("Unable to open " + p.string())));
}

TEST_F(file_rewriter_native_test, symlink_and_target_untouched) {
  auto const target = path("target");
  auto const link = path("link");
  auto const content = test::make_random_file(target, 5000);
  set_times(target, kAtime, kMtime);
  fs::create_symlink(target, link);

  EXPECT_FALSE(rw.rewrite(link, {}));

  EXPECT_EQ(read_file(target), content);
  auto const mtime = get_mtime(target);
  EXPECT_EQ(mtime.tv_sec, kMtime.tv_sec);
  EXPECT_EQ(mtime.tv_nsec, kMtime.tv_nsec);
  EXPECT_TRUE(fs::is_symlink(link));

  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre(HasSubstr("Unable to open " + link.string())));
}

TEST_F(file_rewriter_native_test, fifo_is_skipped) {
  auto const p = path("fifo");
  ASSERT_EQ(0, ::mkfifo(p.c_str(), 0600));

  EXPECT_FALSE(rw.rewrite(p, {}));

  EXPECT_THAT(lgr.messages(logger::INFO),
              ElementsAre(p.string() + " is not a regular file, skipping"));
  EXPECT_THAT(lgr.messages(logger::ERROR), IsEmpty());
}

TEST_F(file_rewriter_native_test, zero_buffer_size_throws) {
  auto const p = path("file");
  test::make_random_file(p, 10);

  EXPECT_THROW(rw.rewrite(p, {.buffer_size = 0}), runtime_error);
}

TEST_F(file_rewriter_mock_test, short_write_is_tolerated) {
  auto const p = path("short");
  auto const content = test::make_random_file(p, 1000, 7);

  ops->set_write_limit(0, 300);
  ops->set_write_limit(2, 1);

  EXPECT_TRUE(rw.rewrite(p, {.buffer_size = 512}));
  EXPECT_EQ(read_file(p), content);

  auto const name = p.string();

  EXPECT_THAT(
      lgr.messages(logger::WARN),
      ElementsAre("Short write to " + name +
                      " at offset 0 (wrote 300 instead of 512)",
                  "Short write to " + name +
                      " at offset 812 (wrote 1 instead of 188)"));
  EXPECT_EQ(ops->open_calls(), 1);
  EXPECT_EQ(ops->close_calls(), 1);
}

TEST_F(file_rewriter_mock_test, zero_write_fails) {
  auto const p = path("zero");
  test::make_random_file(p, 1000);

  ops->set_write_limit(1, 0);

  EXPECT_FALSE(rw.rewrite(p, {.buffer_size = 256}));

  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre("Wrote nothing to " + p.string() + " at offset 256"));
  EXPECT_EQ(ops->write_calls(), 2);
  EXPECT_EQ(ops->close_calls(), 1);
}

TEST_F(file_rewriter_mock_test, read_error_fails) {
  auto const p = path("rderr");
  test::make_random_file(p, 1000);

  ops->set_read_error(2, std::make_error_code(std::errc::io_error));

  EXPECT_FALSE(rw.rewrite(p, {.buffer_size = 100}));

  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre(HasSubstr("Read from " + p.string() +
                                    " at offset 200 failed: ")));
  EXPECT_EQ(ops->write_calls(), 2);
  EXPECT_EQ(ops->close_calls(), 1);
}

TEST_F(file_rewriter_mock_test, write_error_fails) {
  auto const p = path("wrerr");
  test::make_random_file(p, 1000);

  ops->set_write_error(0, std::make_error_code(std::errc::no_space_on_device));

  EXPECT_FALSE(rw.rewrite(p, {.buffer_size = 100}));

  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre(HasSubstr("Write " + p.string() +
                                    " at offset 0 failed: ")));
  EXPECT_EQ(ops->read_calls(), 1);
  EXPECT_EQ(ops->close_calls(), 1);
}

TEST_F(file_rewriter_mock_test, stat_error_fails) {
  auto const p = path("staterr");
  test::make_random_file(p, 10);

  ops->set_stat_error(std::make_error_code(std::errc::io_error));

  EXPECT_FALSE(rw.rewrite(p, {}));

  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre(HasSubstr("Unable to stat " + p.string() + ": ")));
  EXPECT_EQ(ops->read_calls(), 0);
  EXPECT_EQ(ops->close_calls(), 1);
}

TEST_F(file_rewriter_mock_test, non_regular_type_is_skipped) {
  auto const p = path("device");
  test::make_random_file(p, 10);

  ops->set_file_type(internal::file_type::character_device);

  EXPECT_FALSE(rw.rewrite(p, {}));

  EXPECT_THAT(lgr.messages(logger::INFO),
              ElementsAre(p.string() + " is not a regular file, skipping"));
  EXPECT_EQ(ops->read_calls(), 0);
  EXPECT_EQ(ops->close_calls(), 1);
}

TEST_F(file_rewriter_mock_test, set_times_error_fails) {
  auto const p = path("timeserr");
  auto const content = test::make_random_file(p, 100);

  ops->set_times_error(std::make_error_code(std::errc::operation_not_permitted));

  EXPECT_FALSE(rw.rewrite(p, {}));

  EXPECT_EQ(read_file(p), content);
  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre(HasSubstr(
                  "Unable to restore access and modification times on " +
                  p.string() + ": ")));
  EXPECT_EQ(ops->close_calls(), 1);
}

TEST_F(file_rewriter_mock_test, unsupported_times_fail_after_data_pass) {
  auto const p = path("notimes");
  auto const content = test::make_random_file(p, 100);

  ops->set_times_unsupported(true);

  EXPECT_FALSE(rw.rewrite(p, {.buffer_size = 64}));

  EXPECT_EQ(read_file(p), content);
  EXPECT_EQ(ops->write_calls(), 2);
  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre("Unable to restore access and modification times on " +
                          p.string() +
                          ": unsupported stat timestamp fields"));
  EXPECT_EQ(ops->close_calls(), 1);
}

TEST_F(file_rewriter_mock_test, close_error_fails) {
  auto const p = path("closeerr");
  test::make_random_file(p, 100);

  ops->set_close_error(std::make_error_code(std::errc::io_error));

  EXPECT_FALSE(rw.rewrite(p, {}));

  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre(HasSubstr("Unable to close " + p.string() + ": ")));
  EXPECT_EQ(ops->close_calls(), 1);
}

TEST_F(file_rewriter_mock_test, open_error_does_not_close) {
  auto const p = path("openerr");
  test::make_random_file(p, 100);

  ops->set_open_error(p, std::make_error_code(std::errc::permission_denied));

  EXPECT_FALSE(rw.rewrite(p, {}));

  EXPECT_THAT(lgr.messages(logger::ERROR),
              ElementsAre(HasSubstr("Unable to open " + p.string() + ": ")));
  EXPECT_EQ(ops->open_calls(), 0);
  EXPECT_EQ(ops->close_calls(), 0);
}

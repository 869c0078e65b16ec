/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of filerewrite.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#include <cerrno>

#include <fcntl.h>

#include <folly/FileUtil.h>
#include <folly/portability/Fcntl.h>
#include <folly/portability/SysStat.h>
#include <folly/portability/Unistd.h>

#include <filerewrite/error.h>

#include <filerewrite/internal/file_io_ops.h>

namespace filerewrite::internal {

namespace {

std::error_code last_error() { return {errno, std::generic_category()}; }

file_type posix_file_type(mode_t mode) {
  switch (mode & S_IFMT) {
  case S_IFREG:
    return file_type::regular;
  case S_IFDIR:
    return file_type::directory;
  case S_IFLNK:
    return file_type::symlink;
  case S_IFIFO:
    return file_type::fifo;
  case S_IFSOCK:
    return file_type::socket;
  case S_IFCHR:
    return file_type::character_device;
  case S_IFBLK:
    return file_type::block_device;
  default:
    break;
  }

  return file_type::unknown;
}

class file_io_ops_posix : public file_io_ops {
 public:
  struct posix_handle {
    int fd;
  };

  std::any open_nofollow_rw(std::filesystem::path const& path,
                            std::error_code& ec) const override {
    ec.clear();

    int fd = folly::openNoInt(path.c_str(), O_RDWR | O_NOFOLLOW | O_CLOEXEC);

    if (fd == -1) {
      ec = last_error();
      return {};
    }

    return posix_handle{fd};
  }

  void close(std::any const& handle, std::error_code& ec) const override {
    if (auto const* h = get_handle(handle, ec)) {
      if (folly::closeNoInt(h->fd) != 0) {
        ec = last_error();
      }
    }
  }

  file_metadata
  stat(std::any const& handle, std::error_code& ec) const override {
    file_metadata md;

    if (auto const* h = get_handle(handle, ec)) {
      if (::fstat(h->fd, &md.native) != 0) {
        ec = last_error();
        return {};
      }

      md.type = posix_file_type(md.native.st_mode);
      md.size = static_cast<uint64_t>(md.native.st_size);
    }

    return md;
  }

  size_t pread(std::any const& handle, void* buf, size_t size, uint64_t offset,
               std::error_code& ec) const override {
    if (auto const* h = get_handle(handle, ec)) {
      auto const rv =
          folly::preadNoInt(h->fd, buf, size, static_cast<off_t>(offset));

      if (rv == -1) {
        ec = last_error();
        return 0;
      }

      return static_cast<size_t>(rv);
    }

    return 0;
  }

  size_t pwrite(std::any const& handle, void const* buf, size_t size,
                uint64_t offset, std::error_code& ec) const override {
    if (auto const* h = get_handle(handle, ec)) {
      auto const rv =
          folly::pwriteNoInt(h->fd, buf, size, static_cast<off_t>(offset));

      if (rv == -1) {
        ec = last_error();
        return 0;
      }

      return static_cast<size_t>(rv);
    }

    return 0;
  }

  void set_times(std::any const& handle, file_times const& times,
                 std::error_code& ec) const override {
    if (auto const* h = get_handle(handle, ec)) {
      struct ::timespec const ts[2] = {times.atime, times.mtime};

      if (::futimens(h->fd, ts) != 0) {
        ec = last_error();
      }
    }
  }

  std::optional<file_times> times(file_metadata const& md) const override {
    return get_file_times(md);
  }

 private:
  posix_handle const*
  get_handle(std::any const& handle, std::error_code& ec) const {
    auto const* h = std::any_cast<posix_handle>(&handle);

    if (!h) {
      ec = std::make_error_code(std::errc::bad_file_descriptor);
    } else {
      ec.clear();
    }

    return h;
  }
};

} // namespace

std::string_view file_type_name(file_type type) {
  switch (type) {
  case file_type::regular:
    return "regular file";
  case file_type::directory:
    return "directory";
  case file_type::symlink:
    return "symlink";
  case file_type::fifo:
    return "fifo";
  case file_type::socket:
    return "socket";
  case file_type::character_device:
    return "character device";
  case file_type::block_device:
    return "block device";
  case file_type::unknown:
    return "unknown";
  }

  FILEREWRITE_PANIC("invalid file type");
}

std::optional<file_times> get_file_times(file_metadata const& md) {
#if defined(__APPLE__)
  return file_times{md.native.st_atimespec, md.native.st_mtimespec};
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__NetBSD__) ||    \
    defined(__OpenBSD__) || (_POSIX_C_SOURCE >= 200809L)
  return file_times{md.native.st_atim, md.native.st_mtim};
#else
  static_cast<void>(md);
  return std::nullopt;
#endif
}

std::shared_ptr<file_io_ops const> create_native_file_io_ops() {
  return std::make_shared<file_io_ops_posix>();
}

} // namespace filerewrite::internal

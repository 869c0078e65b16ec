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

#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

#include <sys/stat.h>
#include <sys/types.h>

namespace filerewrite::internal {

enum class file_type {
  regular,
  directory,
  symlink,
  fifo,
  socket,
  character_device,
  block_device,
  unknown,
};

std::string_view file_type_name(file_type type);

struct file_metadata {
  file_type type{file_type::unknown};
  uint64_t size{0};
  struct ::stat native{};
};

struct file_times {
  struct ::timespec atime{};
  struct ::timespec mtime{};
};

/**
 * Access and modification times of a stat snapshot.
 *
 * Returns std::nullopt if the platform's stat structure has no known
 * nanosecond timestamp fields.
 */
std::optional<file_times> get_file_times(file_metadata const& md);

class file_io_ops {
 public:
  virtual ~file_io_ops() = default;

  virtual std::any open_nofollow_rw(std::filesystem::path const& path,
                                    std::error_code& ec) const = 0;
  virtual void close(std::any const& handle, std::error_code& ec) const = 0;

  virtual file_metadata
  stat(std::any const& handle, std::error_code& ec) const = 0;

  virtual size_t pread(std::any const& handle, void* buf, size_t size,
                       uint64_t offset, std::error_code& ec) const = 0;
  virtual size_t pwrite(std::any const& handle, void const* buf, size_t size,
                        uint64_t offset, std::error_code& ec) const = 0;

  virtual void set_times(std::any const& handle, file_times const& times,
                         std::error_code& ec) const = 0;

  // Native implementation forwards to get_file_times()
  virtual std::optional<file_times> times(file_metadata const& md) const = 0;
};

std::shared_ptr<file_io_ops const> create_native_file_io_ops();

} // namespace filerewrite::internal

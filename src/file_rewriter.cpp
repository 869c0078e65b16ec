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

#include <any>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <folly/ScopeGuard.h>

#include <filerewrite/error.h>
#include <filerewrite/file_rewriter.h>
#include <filerewrite/logger.h>
#include <filerewrite/util.h>

#include <filerewrite/internal/file_io_ops.h>

namespace filerewrite {

namespace internal {

namespace {

template <typename LoggerPolicy>
class file_rewriter_ final : public file_rewriter::impl {
 public:
  file_rewriter_(logger& lgr, std::shared_ptr<file_io_ops const> ops)
      : LOG_PROXY_INIT(lgr)
      , ops_{std::move(ops)} {}

  bool rewrite(std::filesystem::path const& path,
               rewrite_options const& opts) const override;

 private:
  bool rewrite_open_file(std::string const& name, std::any const& handle,
                         size_t buffer_size) const;
  bool copy_blocks(std::string const& name, std::any const& handle,
                   std::vector<uint8_t>& buffer, uint64_t& offset) const;

  LOG_PROXY_DECL(LoggerPolicy);
  std::shared_ptr<file_io_ops const> ops_;
};

template <typename LoggerPolicy>
bool file_rewriter_<LoggerPolicy>::rewrite(std::filesystem::path const& path,
                                           rewrite_options const& opts) const {
  if (opts.buffer_size == 0) {
    FILEREWRITE_THROW(runtime_error, "buffer size must be greater than 0");
  }

  auto const name = path.string();
  std::error_code ec;

  auto handle = ops_->open_nofollow_rw(path, ec);

  if (ec) {
    LOG_ERROR << "Unable to open " << name << ": " << ec.message();
    return false;
  }

  bool ok = false;

  {
    SCOPE_EXIT {
      std::error_code close_ec;
      ops_->close(handle, close_ec);
      if (close_ec) {
        LOG_ERROR << "Unable to close " << name << ": " << close_ec.message();
        ok = false;
      }
    };

    ok = rewrite_open_file(name, handle, opts.buffer_size);
  }

  return ok;
}

template <typename LoggerPolicy>
bool file_rewriter_<LoggerPolicy>::rewrite_open_file(std::string const& name,
                                                     std::any const& handle,
                                                     size_t buffer_size) const {
  auto ti = LOG_TIMED_VERBOSE;
  std::error_code ec;

  auto const md = ops_->stat(handle, ec);

  if (ec) {
    LOG_ERROR << "Unable to stat " << name << ": " << ec.message();
    return false;
  }

  if (md.type != file_type::regular) {
    LOG_INFO << name << " is not a regular file, skipping";
    LOG_DEBUG << name << " is a " << file_type_name(md.type);
    return false;
  }

  // captured from the same snapshot before any data is written
  auto const times = ops_->times(md);

  std::vector<uint8_t> buffer(buffer_size);
  uint64_t offset{0};

  if (!copy_blocks(name, handle, buffer, offset)) {
    return false;
  }

  if (!times) {
    LOG_ERROR << "Unable to restore access and modification times on " << name
              << ": unsupported stat timestamp fields";
    return false;
  }

  ops_->set_times(handle, *times, ec);

  if (ec) {
    LOG_ERROR << "Unable to restore access and modification times on " << name
              << ": " << ec.message();
    return false;
  }

  LOG_VERBOSE << "Restored access and modification times on " << name;

  ti << "rewrote " << size_with_unit(offset) << " of " << name;

  return true;
}

template <typename LoggerPolicy>
bool file_rewriter_<LoggerPolicy>::copy_blocks(std::string const& name,
                                               std::any const& handle,
                                               std::vector<uint8_t>& buffer,
                                               uint64_t& offset) const {
  std::error_code ec;

  for (;;) {
    auto const nread =
        ops_->pread(handle, buffer.data(), buffer.size(), offset, ec);

    if (ec) {
      LOG_ERROR << "Read from " << name << " at offset " << offset
                << " failed: " << ec.message();
      return false;
    }

    if (nread == 0) {
      break;
    }

    LOG_VERBOSE << "Read " << nread << " from " << name << " at offset "
                << offset;

    auto const nwritten =
        ops_->pwrite(handle, buffer.data(), nread, offset, ec);

    if (ec) {
      LOG_ERROR << "Write " << name << " at offset " << offset
                << " failed: " << ec.message();
      return false;
    }

    if (nwritten == 0) {
      LOG_ERROR << "Wrote nothing to " << name << " at offset " << offset;
      return false;
    }

    LOG_VERBOSE << "Wrote " << nwritten << " to " << name << " at offset "
                << offset;

    // the unwritten tail is read again in the next iteration
    if (nwritten < nread) {
      LOG_WARN << "Short write to " << name << " at offset " << offset
               << " (wrote " << nwritten << " instead of " << nread << ")";
    }

    offset += nwritten;
  }

  return true;
}

} // namespace

} // namespace internal

file_rewriter::file_rewriter(logger& lgr,
                             std::shared_ptr<internal::file_io_ops const> ops)
    : impl_(make_unique_logging_object<impl, internal::file_rewriter_,
                                       logger_policies>(lgr, std::move(ops))) {}

} // namespace filerewrite

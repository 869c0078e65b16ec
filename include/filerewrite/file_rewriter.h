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

#include <filesystem>
#include <memory>

#include <filerewrite/rewrite_options.h>

namespace filerewrite {

class logger;

namespace internal {

class file_io_ops;

} // namespace internal

/**
 * Rewrites the data of a single regular file in place.
 *
 * Every byte is read and written back at the same offset through a buffer
 * of `rewrite_options::buffer_size` bytes, then the original access and
 * modification times are restored. Symlinks are never followed and files
 * that are not regular files are skipped. Failures are logged and reported
 * by returning `false`; the rewriter never throws for per-file errors.
 */
class file_rewriter {
 public:
  file_rewriter(logger& lgr, std::shared_ptr<internal::file_io_ops const> ops);

  bool rewrite(std::filesystem::path const& path,
               rewrite_options const& opts) const {
    return impl_->rewrite(path, opts);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual bool rewrite(std::filesystem::path const& path,
                         rewrite_options const& opts) const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace filerewrite

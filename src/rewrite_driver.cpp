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

#include <exception>

#include <filerewrite/file_rewriter.h>
#include <filerewrite/logger.h>
#include <filerewrite/rewrite_driver.h>
#include <filerewrite/util.h>

namespace filerewrite {

rewrite_summary rewrite_paths(logger& lgr, file_rewriter const& rewriter,
                              std::span<std::filesystem::path const> paths,
                              rewrite_options const& opts) {
  LOG_PROXY(prod_logger_policy, lgr);

  rewrite_summary summary;

  for (auto const& path : paths) {
    LOG_VERBOSE << "Rewriting " << path.string() << "...";

    ++summary.attempted;

    bool ok = false;

    try {
      ok = rewriter.rewrite(path, opts);
    } catch (std::exception const& e) {
      LOG_ERROR << "Unable to rewrite " << path.string() << ": "
                << exception_str(e);
    }

    if (ok) {
      ++summary.succeeded;
    } else {
      ++summary.failed;
    }
  }

  LOG_VERBOSE << "rewrote " << summary.succeeded << " of " << summary.attempted
              << " files";

  if (!summary.ok()) {
    LOG_WARN << "failed to rewrite " << summary.failed << " of "
             << summary.attempted << " files";
  }

  return summary;
}

} // namespace filerewrite

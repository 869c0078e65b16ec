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
#include <iostream>

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>

#include <folly/FileUtil.h>

#include <filerewrite/error.h>
#include <filerewrite/file_util.h>
#include <filerewrite/util.h>

namespace filerewrite {

namespace fs = std::filesystem;

namespace {

fs::path make_tempdir_path(std::string_view prefix) {
  static thread_local boost::uuids::random_generator gen;
  auto dirname = boost::uuids::to_string(gen());
  if (!prefix.empty()) {
    dirname = fmt::format("{}.{}", prefix, dirname);
  }
  return fs::temp_directory_path() / dirname;
}

bool keep_temporary_directories() {
  static bool const keep =
      getenv_is_enabled("FILEREWRITE_KEEP_TEMPORARY_DIRECTORIES");
  return keep;
}

} // namespace

temporary_directory::temporary_directory(std::string_view prefix)
    : path_{make_tempdir_path(prefix)} {
  fs::create_directory(path_);
}

temporary_directory::~temporary_directory() {
  if (keep_temporary_directories()) {
    std::cerr << "keeping temporary directory " << path_ << "\n";
    return;
  }

  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    std::cerr << "failed to remove temporary directory " << path_ << ": "
              << ec.message() << "\n";
  }
}

std::string read_file(fs::path const& path, std::error_code& ec) {
  std::string out;
  if (folly::readFile(path.c_str(), out)) {
    ec.clear();
  } else {
    ec.assign(errno, std::generic_category());
  }
  return out;
}

std::string read_file(fs::path const& path) {
  std::error_code ec;
  auto content = read_file(path, ec);
  if (ec) {
    FILEREWRITE_THROW(system_error, fmt::format("read_file({})", path.string()),
                      ec);
  }
  return content;
}

void write_file(fs::path const& path, std::string_view content,
                std::error_code& ec) {
  if (folly::writeFile(content, path.c_str())) {
    ec.clear();
  } else {
    ec.assign(errno, std::generic_category());
  }
}

void write_file(fs::path const& path, std::string_view content) {
  std::error_code ec;
  write_file(path, content, ec);
  if (ec) {
    FILEREWRITE_THROW(system_error,
                      fmt::format("write_file({})", path.string()), ec);
  }
}

} // namespace filerewrite

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

#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <filerewrite/file_rewriter.h>
#include <filerewrite/logger.h>
#include <filerewrite/rewrite_driver.h>
#include <filerewrite/rewrite_options.h>
#include <filerewrite/util.h>

#include <filerewrite/tool/iolayer.h>
#include <filerewrite/tool/tool.h>

#include <filerewrite_tool_main.h>

namespace filerewrite::tool {

namespace po = boost::program_options;

namespace {

constexpr int kExitFailed{1};
constexpr int kExitUsage{2};

constexpr auto usage = "Usage: filerewrite [OPTIONS...] [--] file...\n";

} // namespace

int filerewrite_main(int argc, char** argv, iolayer const& iol) {
  logger_options logopts;
  bool verbose{false};
  int64_t buffer_size_mib{0};
  std::vector<std::string> files;

  // clang-format off
  po::options_description opts("Command line options");
  opts.add_options()
    ("verbose,v",
        po::value<bool>(&verbose)->zero_tokens(),
        "announce each file and log every read and write")
    ("buffersize,b",
        po::value<int64_t>(&buffer_size_mib)
            ->default_value(rewrite_options::default_buffer_size_mib),
        "buffer size in MiB")
    ;
  // clang-format on

  tool::add_common_options(opts, logopts);

  po::options_description hidden("Hidden options");
  hidden.add_options()("input", po::value<std::vector<std::string>>(&files));

  po::options_description all;
  all.add(opts).add(hidden);

  po::positional_options_description pos;
  pos.add("input", -1);

  po::variables_map vm;

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(pos)
                  .style(po::command_line_style::default_style |
                         po::command_line_style::allow_long_disguise)
                  .run(),
              vm);
    po::notify(vm);
  } catch (po::error const& e) {
    iol.err << "error: " << e.what() << "\n";
    return kExitUsage;
  }

  if (vm.contains("help")) {
    iol.out << tool::tool_header("filerewrite") << usage << "\n"
            << opts << "\n";
    return 0;
  }

  if (files.empty()) {
    iol.err << usage << "\n" << opts << "\n";
    return kExitUsage;
  }

  if (verbose && logopts.threshold < logger::VERBOSE) {
    logopts.threshold = logger::VERBOSE;
  }

  stream_logger lgr(iol.term, iol.err, logopts);
  LOG_PROXY(debug_logger_policy, lgr);

  if (buffer_size_mib <= 0) {
    LOG_ERROR << fmt::format(
        "invalid buffer size {} MB: must be greater than 0", buffer_size_mib);
    return kExitUsage;
  }

  if (static_cast<uint64_t>(buffer_size_mib) >
      (std::numeric_limits<size_t>::max() >> 20)) {
    LOG_ERROR << fmt::format("invalid buffer size {} MB: too large",
                             buffer_size_mib);
    return kExitUsage;
  }

  try {
    rewrite_options ropts;
    ropts.buffer_size = static_cast<size_t>(buffer_size_mib) << 20;

    LOG_DEBUG << "buffer size: " << size_with_unit(ropts.buffer_size);

    std::vector<std::filesystem::path> paths(files.begin(), files.end());

    file_rewriter rewriter(lgr, iol.file_ops);

    auto const summary = rewrite_paths(lgr, rewriter, paths, ropts);

    return summary.ok() ? 0 : kExitFailed;
  } catch (std::exception const& e) {
    LOG_ERROR << exception_str(e);
  }

  return kExitFailed;
}

} // namespace filerewrite::tool

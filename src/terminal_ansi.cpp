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

#include <array>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include <unistd.h>

#include <filerewrite/terminal_ansi.h>

namespace filerewrite {

namespace {

constexpr size_t num_colors{static_cast<size_t>(termcolor::NUM_COLORS)};

// clang-format off
constexpr std::array<std::array<std::string_view, num_colors>, 3> sequences{{
  {{"\033[0m", "\033[31m",   "\033[32m",   "\033[33m",   "\033[34m",
    "\033[35m",   "\033[36m",   "\033[37m",   "\033[90m"}},
  {{"\033[0m", "\033[1;31m", "\033[1;32m", "\033[1;33m", "\033[1;34m",
    "\033[1;35m", "\033[1;36m", "\033[1;37m", "\033[1;90m"}},
  {{"\033[0m", "\033[2;31m", "\033[2;32m", "\033[2;33m", "\033[2;34m",
    "\033[2;35m", "\033[2;36m", "\033[2;37m", "\033[2;90m"}},
}};
// clang-format on

} // namespace

bool terminal_ansi::is_tty(std::ostream& os) const {
  if (&os == &std::cout) {
    return ::isatty(::fileno(stdout));
  }
  if (&os == &std::cerr) {
    return ::isatty(::fileno(stderr));
  }
  return false;
}

bool terminal_ansi::is_fancy() const {
  if (auto term = std::getenv("TERM")) {
    std::string_view term_sv(term);
    return !term_sv.empty() && term_sv != "dumb";
  }
  return false;
}

std::string_view terminal_ansi::color(termcolor color, termstyle style) const {
  return sequences.at(static_cast<size_t>(style))
      .at(static_cast<size_t>(color));
}

} // namespace filerewrite

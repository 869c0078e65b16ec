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

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <filerewrite/terminal.h>

#include <filerewrite/internal/file_io_ops.h>

#include <filerewrite/tool/iolayer.h>
#include <filerewrite/tool/main_adapter.h>

#define EXPECT_NO_ERROR(ec)                                                    \
  EXPECT_FALSE(ec) << "Unexpected error: " << ec.message() << " ("             \
                   << ec.value() << ")"

#define ASSERT_NO_ERROR(ec)                                                    \
  ASSERT_FALSE(ec) << "Unexpected error: " << ec.message() << " ("             \
                   << ec.value() << ")"

namespace filerewrite::test {

class test_terminal : public terminal {
 public:
  void set_fancy(bool fancy) { fancy_ = fancy; }
  void set_is_tty(bool is_tty) { is_tty_ = is_tty; }

  bool is_tty(std::ostream& os) const override;
  bool is_fancy() const override;
  std::string_view color(termcolor color, termstyle style) const override;

 private:
  bool fancy_{false};
  bool is_tty_{false};
};

class test_iolayer {
 public:
  test_iolayer();
  explicit test_iolayer(std::shared_ptr<internal::file_io_ops const> ops);
  ~test_iolayer();

  tool::iolayer const& get();

  std::string out() const;
  std::string err() const;

  void set_terminal_is_tty(bool is_tty);
  void set_terminal_fancy(bool fancy);

 private:
  std::shared_ptr<test_terminal> term_;
  std::shared_ptr<internal::file_io_ops const> ops_;
  std::ostringstream out_;
  std::ostringstream err_;
  std::unique_ptr<tool::iolayer> iol_;
};

// Runs a tool main function against a test_iolayer, prepending the tool name
class tool_tester {
 public:
  tool_tester(tool::main_adapter::main_fn_type mp, std::string toolname,
              std::shared_ptr<internal::file_io_ops const> ops = nullptr);

  int run(std::vector<std::string> args);
  int run(std::initializer_list<std::string> args);

  std::string out() const { return iol->out(); }
  std::string err() const { return iol->err(); }

  std::unique_ptr<test_iolayer> iol;

 private:
  tool::main_adapter::main_fn_type main_;
  std::string toolname_;
};

std::string create_random_string(size_t size, size_t seed = 0);

// Creates a file with deterministic random contents and returns them
std::string make_random_file(std::filesystem::path const& path, size_t size,
                             size_t seed = 0);

} // namespace filerewrite::test

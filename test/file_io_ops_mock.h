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
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <system_error>

#include <filerewrite/internal/file_io_ops.h>

namespace filerewrite::test {

// Forwards to a real file_io_ops implementation and injects faults.
//
// Read and write faults are keyed by the zero-based index of the pread or
// pwrite call, counted across all files opened through this instance.
class file_io_ops_mock : public internal::file_io_ops {
 public:
  file_io_ops_mock();
  explicit file_io_ops_mock(std::shared_ptr<internal::file_io_ops const> real);

  void set_open_error(std::filesystem::path const& path, std::error_code ec);
  void set_stat_error(std::error_code ec) { stat_error_ = ec; }
  void set_file_type(internal::file_type type) { file_type_ = type; }
  void set_read_error(size_t call, std::error_code ec);
  // makes the given pread call throw std::bad_alloc
  void set_read_bad_alloc(size_t call);
  void set_write_error(size_t call, std::error_code ec);
  // caps the number of bytes written by the given pwrite call, 0 writes nothing
  void set_write_limit(size_t call, size_t max_bytes);
  void set_times_error(std::error_code ec) { times_error_ = ec; }
  void set_close_error(std::error_code ec) { close_error_ = ec; }
  void set_times_unsupported(bool unsupported) {
    times_unsupported_ = unsupported;
  }

  size_t open_calls() const { return open_calls_; }
  size_t close_calls() const { return close_calls_; }
  size_t read_calls() const { return read_calls_; }
  size_t write_calls() const { return write_calls_; }

  std::any open_nofollow_rw(std::filesystem::path const& path,
                            std::error_code& ec) const override;
  void close(std::any const& handle, std::error_code& ec) const override;
  internal::file_metadata
  stat(std::any const& handle, std::error_code& ec) const override;
  size_t pread(std::any const& handle, void* buf, size_t size, uint64_t offset,
               std::error_code& ec) const override;
  size_t pwrite(std::any const& handle, void const* buf, size_t size,
                uint64_t offset, std::error_code& ec) const override;
  void set_times(std::any const& handle, internal::file_times const& times,
                 std::error_code& ec) const override;
  std::optional<internal::file_times>
  times(internal::file_metadata const& md) const override;

 private:
  std::shared_ptr<internal::file_io_ops const> real_;
  std::map<std::filesystem::path, std::error_code> open_errors_;
  std::map<size_t, std::error_code> read_errors_;
  std::set<size_t> read_bad_allocs_;
  std::map<size_t, std::error_code> write_errors_;
  std::map<size_t, size_t> write_limits_;
  std::optional<std::error_code> stat_error_;
  std::optional<internal::file_type> file_type_;
  std::optional<std::error_code> times_error_;
  std::optional<std::error_code> close_error_;
  bool times_unsupported_{false};
  size_t mutable open_calls_{0};
  size_t mutable close_calls_{0};
  size_t mutable read_calls_{0};
  size_t mutable write_calls_{0};
};

} // namespace filerewrite::test

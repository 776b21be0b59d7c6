/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "core/status.hpp"
#include "io/source.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zchunked::io {

struct TarTime {
  std::int64_t sec = 0;
  std::uint32_t nsec = 0;
};

struct TarHeader {
  char typeflag = '0';
  std::string name;
  std::string linkname;
  std::string uname;
  std::string gname;

  std::int64_t mode = 0;
  std::int64_t uid = 0;
  std::int64_t gid = 0;
  std::int64_t size = 0;

  TarTime mtime{};
  std::optional<TarTime> atime;
  std::optional<TarTime> ctime;

  std::int64_t devmajor = 0;
  std::int64_t devminor = 0;

  std::map<std::string, std::string> xattrs;
};

// Sequential tar reader with raw accounting: every byte taken from the
// underlying source that is not handed out through read() is kept and can be
// collected with take_raw_bytes(). Concatenating raw bytes and payload in the
// order they were produced reproduces the input.
class TarReader final : public ByteSource {
public:
  explicit TarReader(ByteSource& src, bool validate_header_checksums = true) noexcept;

  // Advances to the next entry, skipping any unread payload of the current
  // one. nullopt at end of archive.
  zchunked::core::Result<std::optional<TarHeader>> next() noexcept;

  std::vector<std::byte> take_raw_bytes() noexcept;

  // Payload of the current entry.
  std::string display_name() const override;
  std::size_t read(std::span<std::byte> out) override;
  zchunked::core::Status status() const noexcept override { return st_; }

private:
  using PaxRecords = std::map<std::string, std::string, std::less<>>;

  static bool header_all_zero(std::span<const std::byte, 512> header) noexcept;
  static bool validate_header_checksum(std::span<const std::byte, 512> header) noexcept;
  static std::uint64_t parse_octal(std::string_view s) noexcept;
  static zchunked::core::Result<std::uint64_t> parse_tar_number(const char* p, std::size_t n) noexcept;
  static std::string cstr_field(const char* p, std::size_t n);
  static std::string join_ustar_name(std::string_view prefix, std::string_view name);
  static zchunked::core::Result<PaxRecords> parse_pax_payload(std::string_view payload) noexcept;
  static zchunked::core::Status apply_pax(const PaxRecords& pax, TarHeader& hdr) noexcept;

  zchunked::core::Result<std::size_t> read_block_(std::span<std::byte, 512> block) noexcept;
  zchunked::core::Status consume_(std::span<std::byte> dst) noexcept;
  zchunked::core::Status skip_(std::uint64_t n) noexcept;
  zchunked::core::Result<std::string> read_meta_payload_(std::uint64_t size, std::string_view what) noexcept;
  zchunked::core::Result<TarHeader> parse_header_(std::span<const std::byte, 512> block) noexcept;

private:
  ByteSource& src_;
  bool validate_ = true;
  bool done_ = false;

  std::vector<std::byte> raw_;
  std::uint64_t remaining_ = 0;
  std::uint64_t pad_ = 0;
  std::string current_name_;

  PaxRecords pax_global_;
  zchunked::core::Status st_{};
};

} // namespace zchunked::io

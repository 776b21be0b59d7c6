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
#include <optional>
#include <vector>

namespace zchunked::io {

// Byte-at-a-time reader over a ByteSource with a single byte of push-back.
class BufferedByteReader {
public:
  static constexpr std::size_t kDefaultCapacity = 4096;

  explicit BufferedByteReader(ByteSource& src, std::size_t capacity = kDefaultCapacity);

  // nullopt means end of stream.
  zchunked::core::Result<std::optional<std::uint8_t>> read_byte() noexcept;

  // Only valid directly after a successful read_byte().
  zchunked::core::Status unread_byte() noexcept;

private:
  zchunked::core::Status fill_() noexcept;

private:
  ByteSource& src_;
  std::vector<std::byte> buf_;
  std::size_t pos_ = 0;
  std::size_t end_ = 0;

  bool eof_ = false;
  bool can_unread_ = false;
  bool has_pushback_ = false;
  std::uint8_t last_ = 0;
};

} // namespace zchunked::io

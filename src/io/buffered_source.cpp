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

#include "io/buffered_source.hpp"

#include <algorithm>

namespace zchunked::io {

BufferedByteReader::BufferedByteReader(ByteSource& src, std::size_t capacity)
  : src_(src), buf_(std::max<std::size_t>(capacity, 16)) {}

zchunked::core::Status BufferedByteReader::fill_() noexcept {
  pos_ = 0;
  end_ = src_.read(buf_);
  if (end_ == 0) {
    auto st = src_.status();
    if (!st) return st;
    eof_ = true;
  }
  return {};
}

zchunked::core::Result<std::optional<std::uint8_t>> BufferedByteReader::read_byte() noexcept {
  if (has_pushback_) {
    has_pushback_ = false;
    can_unread_ = true;
    return std::optional<std::uint8_t>(last_);
  }

  can_unread_ = false;
  if (pos_ >= end_) {
    if (eof_) return std::optional<std::uint8_t>{};
    ZCK_TRY(fill_());
    if (eof_) return std::optional<std::uint8_t>{};
  }

  last_ = static_cast<std::uint8_t>(buf_[pos_++]);
  can_unread_ = true;
  return std::optional<std::uint8_t>(last_);
}

zchunked::core::Status BufferedByteReader::unread_byte() noexcept {
  if (!can_unread_) return zchunked::core::fail("BufferedByteReader: invalid use of unread_byte");
  can_unread_ = false;
  has_pushback_ = true;
  return {};
}

} // namespace zchunked::io

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

#include "chunked/chunk_reader.hpp"

#include <algorithm>
#include <cstring>

namespace zchunked::chunked {

zchunked::core::Result<ChunkRead> RollingChecksumReader::read(std::span<std::byte> buf) noexcept {
  last_chunk_zeros_ = false;

  if (pending_hole_ > 0) {
    const std::size_t n = static_cast<std::size_t>(std::min<std::int64_t>(pending_hole_, static_cast<std::int64_t>(buf.size())));
    std::memset(buf.data(), 0, n);
    pending_hole_ -= static_cast<std::int64_t>(n);
    written_out_ += static_cast<std::int64_t>(n);
    last_chunk_zeros_ = true;
    return ChunkRead{.split = pending_hole_ == 0, .n = n};
  }

  if (closed_) return ChunkRead{.end = true};

  for (std::size_t i = 0; i < buf.size(); ++i) {
    ZCK_TRYV(ev, holes_.next_byte());
    if (ev.end) {
      closed_ = true;
      if (i == 0) return ChunkRead{.end = true};
      return ChunkRead{.n = i};
    }
    if (ev.hole_len > 0) {
      for (std::int64_t j = 0; j < ev.hole_len; ++j) rollsum_.roll(0);
      pending_hole_ = ev.hole_len;
      return ChunkRead{.split = true, .n = i};
    }

    buf[i] = std::byte{ev.value};
    ++written_out_;
    rollsum_.roll(ev.value);
    if (rollsum_.on_split_with_bits(kRollsumBits)) return ChunkRead{.split = true, .n = i + 1};
  }
  return ChunkRead{.n = buf.size()};
}

} // namespace zchunked::chunked

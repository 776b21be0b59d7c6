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

#include "chunked/holes.hpp"
#include "chunked/rollsum.hpp"
#include "core/status.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace zchunked::chunked {

inline constexpr std::uint32_t kRollsumBits = 16;

struct ChunkRead {
  bool split = false;
  std::size_t n = 0;
  bool end = false;
};

// Content-defined chunking over a HoleFinder. A zero run becomes a chunk of
// its own; data chunks end where the rolling checksum says so.
class RollingChecksumReader {
public:
  explicit RollingChecksumReader(HoleFinder& holes) noexcept : holes_(holes) {}

  // Bytes are written to the front of buf. end is reported only by a call
  // that returns no bytes.
  zchunked::core::Result<ChunkRead> read(std::span<std::byte> buf) noexcept;

  std::int64_t written_out() const noexcept { return written_out_; }
  bool last_chunk_zeros() const noexcept { return last_chunk_zeros_; }

private:
  HoleFinder& holes_;
  RollSum rollsum_;
  std::int64_t pending_hole_ = 0;
  bool closed_ = false;

  std::int64_t written_out_ = 0;
  bool last_chunk_zeros_ = false;
};

} // namespace zchunked::chunked

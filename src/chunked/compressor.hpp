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

#include "chunked/manifest.hpp"
#include "chunked/metadata.hpp"
#include "core/status.hpp"
#include "io/sink.hpp"
#include "io/source.hpp"
#include "io/zstd_frame.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace zchunked::chunked {

inline constexpr int kDefaultLevel = 10;
inline constexpr std::size_t kReadBufferSize = 4096;

struct Chunk {
  std::int64_t chunk_offset = 0;
  std::int64_t offset = 0;
  std::string checksum;
  std::int64_t chunk_size = 0;
  ChunkType chunk_type = ChunkType::Data;
};

// Ends the current frame and starts a new one on the same counter. Returns
// the counter value at the frame boundary. Cutting twice with nothing written
// in between emits nothing and returns the same offset.
class FrameCutter {
public:
  FrameCutter(io::FrameSink& frames, io::WriteCounter& dest) noexcept : frames_(frames), dest_(dest) {}

  zchunked::core::Result<std::uint64_t> cut() noexcept;

private:
  io::FrameSink& frames_;
  io::WriteCounter& dest_;
};

// Reads a tar stream from reader and writes it to dest as zstd:chunked: the
// tar framing verbatim, every file chunk in frames of its own, then the
// manifest. The manifest annotations are stored in out_metadata.
zchunked::core::Status write_chunked_stream(io::ByteSink& dest, Annotations& out_metadata, io::ByteSource& reader,
                                            int level) noexcept;

} // namespace zchunked::chunked

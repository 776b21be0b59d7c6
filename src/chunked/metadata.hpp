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
#include "io/tar.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <json/value.h>

namespace zchunked::chunked {

inline constexpr std::string_view kTypeReg = "reg";
inline constexpr std::string_view kTypeChunk = "chunk";
inline constexpr std::string_view kTypeLink = "hardlink";
inline constexpr std::string_view kTypeChar = "char";
inline constexpr std::string_view kTypeBlock = "block";
inline constexpr std::string_view kTypeDir = "dir";
inline constexpr std::string_view kTypeFifo = "fifo";
inline constexpr std::string_view kTypeSymlink = "symlink";

enum class ChunkType { Data, Zeros };

std::string_view chunk_type_name(ChunkType t) noexcept;

// Maps a tar typeflag to the manifest entry type.
zchunked::core::Result<std::string> entry_type(char typeflag) noexcept;

// One manifest record: either a primary entry describing a tar member or a
// "chunk" entry describing one more chunk of the preceding regular file.
struct FileMetadata {
  std::string type;
  std::string name;
  std::string linkname;
  std::int64_t mode = 0;
  std::int64_t size = 0;
  std::int64_t uid = 0;
  std::int64_t gid = 0;

  // Emitted on every non-chunk entry; a missing time renders as the zero time.
  std::optional<io::TarTime> modtime;
  std::optional<io::TarTime> accesstime;
  std::optional<io::TarTime> changetime;

  std::int64_t devmajor = 0;
  std::int64_t devminor = 0;
  // Values are base64 encoded.
  std::map<std::string, std::string> xattrs;

  std::string digest;
  std::int64_t offset = 0;
  std::int64_t end_offset = 0;

  std::int64_t chunk_size = 0;
  std::int64_t chunk_offset = 0;
  std::string chunk_digest;
  ChunkType chunk_type = ChunkType::Data;
};

// RFC 3339 with nanoseconds, UTC, trailing fraction zeros trimmed.
std::string format_rfc3339_nano(const std::optional<io::TarTime>& t);

Json::Value to_json(const FileMetadata& m);

} // namespace zchunked::chunked

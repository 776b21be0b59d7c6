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

#include "chunked/metadata.hpp"
#include "core/status.hpp"
#include "io/sink.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>

namespace zchunked::chunked {

using Annotations = std::map<std::string, std::string>;

inline constexpr const char* kManifestChecksumKey = "io.github.containers.zstd-chunked.manifest-checksum";
inline constexpr const char* kManifestInfoKey = "io.github.containers.zstd-chunked.manifest-position";

inline constexpr std::uint64_t kManifestTypeCrfs = 1;
inline constexpr std::size_t kFooterSize = 40;
inline constexpr std::array<std::byte, 8> kZstdChunkedFrameMagic{
  std::byte{'G'}, std::byte{'n'}, std::byte{'U'}, std::byte{'l'},
  std::byte{'I'}, std::byte{'n'}, std::byte{'U'}, std::byte{'x'}};

struct ManifestFooter {
  std::uint64_t offset = 0;
  std::uint64_t length_compressed = 0;
  std::uint64_t length_uncompressed = 0;
  std::uint64_t manifest_type = kManifestTypeCrfs;
};

std::array<std::byte, kFooterSize> encode_footer(const ManifestFooter& f) noexcept;

std::string serialize_toc(std::span<const FileMetadata> entries);

// Appends the compressed table of contents and the footer as two skippable
// frames. offset is the number of bytes already written to dest. Records the
// manifest checksum and position in out_metadata.
zchunked::core::Status write_manifest(io::ByteSink& dest, Annotations& out_metadata, std::uint64_t offset,
                                      std::span<const FileMetadata> entries, int level) noexcept;

} // namespace zchunked::chunked

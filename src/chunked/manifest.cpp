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

#include "chunked/manifest.hpp"

#include "core/bytes.hpp"
#include "core/endian.hpp"
#include "crypto/digest.hpp"
#include "io/zstd_frame.hpp"

#include <algorithm>
#include <exception>

#include <fmt/format.h>
#include <json/json.h>
#include <spdlog/spdlog.h>

namespace zchunked::chunked {

std::array<std::byte, kFooterSize> encode_footer(const ManifestFooter& f) noexcept {
  std::array<std::byte, kFooterSize> out{};
  std::span<std::byte, kFooterSize> s(out);
  zchunked::core::store_le<std::uint64_t>(s.subspan<0, 8>(), f.offset);
  zchunked::core::store_le<std::uint64_t>(s.subspan<8, 8>(), f.length_compressed);
  zchunked::core::store_le<std::uint64_t>(s.subspan<16, 8>(), f.length_uncompressed);
  zchunked::core::store_le<std::uint64_t>(s.subspan<24, 8>(), f.manifest_type);
  std::copy(kZstdChunkedFrameMagic.begin(), kZstdChunkedFrameMagic.end(), out.begin() + 32);
  return out;
}

std::string serialize_toc(std::span<const FileMetadata> entries) {
  Json::Value root(Json::objectValue);
  root["version"] = 1;
  Json::Value list(Json::arrayValue);
  for (const auto& e : entries) list.append(to_json(e));
  root["entries"] = std::move(list);

  Json::StreamWriterBuilder b;
  b["indentation"] = "";
  b["emitUTF8"] = true;
  return Json::writeString(b, root);
}

zchunked::core::Status write_manifest(io::ByteSink& dest, Annotations& out_metadata, std::uint64_t offset,
                                      std::span<const FileMetadata> entries, int level) noexcept {
  const std::uint64_t manifest_offset = offset + io::kSkippableFrameHeaderSize;

  std::string toc;
  try {
    toc = serialize_toc(entries);
  } catch (const std::exception& e) {
    return zchunked::core::failf("manifest: cannot serialize: {}", e.what());
  }

  ZCK_TRYV(compressed, io::zstd_compress_frame(zchunked::core::bytes(toc), level));

  ZCK_TRYV(digester, crypto::Digester::sha256());
  ZCK_TRY(digester.update(compressed));
  ZCK_TRYV(checksum, digester.finalize());

  const ManifestFooter footer{
    .offset = manifest_offset,
    .length_compressed = compressed.size(),
    .length_uncompressed = toc.size(),
  };

  try {
    out_metadata[kManifestChecksumKey] = checksum;
    out_metadata[kManifestInfoKey] = fmt::format("{}:{}:{}:{}", footer.offset, footer.length_compressed,
                                                 footer.length_uncompressed, footer.manifest_type);
  } catch (const std::exception& e) {
    return zchunked::core::failf("manifest: cannot record annotations: {}", e.what());
  }

  spdlog::debug("manifest: {} entries, {} bytes ({} compressed) at offset {}", entries.size(), toc.size(),
                compressed.size(), manifest_offset);

  ZCK_TRY(io::append_skippable_frame(dest, compressed));
  const auto encoded = encode_footer(footer);
  return io::append_skippable_frame(dest, encoded);
}

} // namespace zchunked::chunked

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

#include "chunked/compressor.hpp"

#include "chunked/chunk_reader.hpp"
#include "chunked/holes.hpp"
#include "core/bytes.hpp"
#include "crypto/digest.hpp"
#include "io/tar.hpp"

#include <exception>
#include <iterator>
#include <span>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace zchunked::chunked {

namespace {

struct PayloadInfo {
  bool started = false;
  std::int64_t start_offset = 0;
  std::int64_t end_offset = 0;
  std::string checksum;
  std::vector<Chunk> chunks;
};

zchunked::core::Result<PayloadInfo> compress_payload(io::TarReader& tr, io::FrameSink& frames, FrameCutter& cutter,
                                                     std::span<std::byte> buf) noexcept {
  ZCK_TRYV(payload_digester, crypto::Digester::sha256());
  ZCK_TRYV(chunk_digester, crypto::Digester::sha256());

  HoleFinder holes(tr, kHolesThreshold);
  RollingChecksumReader rc(holes);

  PayloadInfo p;
  std::int64_t last_offset = 0;
  std::int64_t last_chunk_offset = 0;

  for (;;) {
    ZCK_TRYV(r, rc.read(buf));

    if (r.n) {
      if (!p.started) {
        ZCK_TRYV(off, cutter.cut());
        p.started = true;
        p.start_offset = static_cast<std::int64_t>(off);
        last_offset = p.start_offset;
      }
      const auto data = std::span<const std::byte>(buf.data(), r.n);
      ZCK_TRY(payload_digester.update(data));
      ZCK_TRY(chunk_digester.update(data));
      ZCK_TRY(frames.write(data));
    }

    if ((r.split || r.end) && p.started) {
      ZCK_TRYV(off, cutter.cut());

      const std::int64_t chunk_size = rc.written_out() - last_chunk_offset;
      if (chunk_size > 0) {
        ZCK_TRYV(sum, chunk_digester.finalize());
        try {
          p.chunks.push_back(Chunk{
            .chunk_offset = last_chunk_offset,
            .offset = last_offset,
            .checksum = std::move(sum),
            .chunk_size = chunk_size,
            .chunk_type = rc.last_chunk_zeros() ? ChunkType::Zeros : ChunkType::Data,
          });
        } catch (const std::exception& e) {
          return zchunked::core::failf("chunked: {}", e.what());
        }
      }

      last_offset = static_cast<std::int64_t>(off);
      last_chunk_offset = rc.written_out();
      ZCK_TRY(chunk_digester.reset());
    }

    if (r.end) {
      if (p.started) {
        ZCK_TRYV(sum, payload_digester.finalize());
        p.checksum = std::move(sum);
      }
      break;
    }
  }

  p.end_offset = last_offset;
  return p;
}

std::vector<FileMetadata> build_entries(const io::TarHeader& hdr, std::string type, PayloadInfo& p) {
  std::vector<FileMetadata> entries;
  entries.reserve(p.chunks.empty() ? 1 : p.chunks.size());

  FileMetadata& m = entries.emplace_back();
  m.type = std::move(type);
  m.name = hdr.name;
  m.linkname = hdr.linkname;
  m.mode = hdr.mode;
  m.size = hdr.size;
  m.uid = hdr.uid;
  m.gid = hdr.gid;
  m.modtime = hdr.mtime;
  m.accesstime = hdr.atime;
  m.changetime = hdr.ctime;
  m.devmajor = hdr.devmajor;
  m.devminor = hdr.devminor;
  for (const auto& [k, v] : hdr.xattrs) m.xattrs.emplace(k, crypto::base64_encode(zchunked::core::bytes(v)));
  m.digest = std::move(p.checksum);
  m.offset = p.start_offset;
  m.end_offset = p.end_offset;

  for (std::size_t i = 1; i < p.chunks.size(); ++i) {
    FileMetadata& c = entries.emplace_back();
    c.type = std::string(kTypeChunk);
    c.name = hdr.name;
    c.chunk_offset = p.chunks[i].chunk_offset;
  }

  if (p.chunks.size() > 1) {
    for (std::size_t i = 0; i < p.chunks.size(); ++i) {
      entries[i].chunk_size = p.chunks[i].chunk_size;
      entries[i].offset = p.chunks[i].offset;
      entries[i].chunk_digest = std::move(p.chunks[i].checksum);
      entries[i].chunk_type = p.chunks[i].chunk_type;
    }
  }
  return entries;
}

} // namespace

zchunked::core::Result<std::uint64_t> FrameCutter::cut() noexcept {
  ZCK_TRY(frames_.close());
  ZCK_TRY(frames_.flush());
  const std::uint64_t offset = dest_.count();
  ZCK_TRY(frames_.reset(dest_));
  spdlog::trace("chunked: frame cut at {}", offset);
  return offset;
}

zchunked::core::Status write_chunked_stream(io::ByteSink& dest_file, Annotations& out_metadata, io::ByteSource& reader,
                                            int level) noexcept {
  io::WriteCounter dest(dest_file);
  io::TarReader tr(reader);

  ZCK_TRYV(frames, io::ZstdFrameWriter::open(dest, level));
  FrameCutter cutter(*frames, dest);

  std::vector<std::byte> buf;
  std::vector<FileMetadata> metadata;
  try {
    buf.resize(kReadBufferSize);
  } catch (const std::exception& e) {
    return zchunked::core::failf("chunked: {}", e.what());
  }

  for (;;) {
    ZCK_TRYV(hdr, tr.next());
    if (!hdr) break;

    const auto raw = tr.take_raw_bytes();
    ZCK_TRY(frames->write(raw));

    ZCK_TRYV(type, entry_type(hdr->typeflag));
    ZCK_TRYV(payload, compress_payload(tr, *frames, cutter, buf));

    spdlog::debug("chunked: {} ({}, {} chunks, offsets {}..{})", hdr->name, type, payload.chunks.size(),
                  payload.start_offset, payload.end_offset);

    try {
      auto entries = build_entries(*hdr, std::move(type), payload);
      metadata.insert(metadata.end(), std::make_move_iterator(entries.begin()), std::make_move_iterator(entries.end()));
    } catch (const std::exception& e) {
      return zchunked::core::failf("chunked: {}", e.what());
    }
  }

  const auto raw = tr.take_raw_bytes();
  ZCK_TRY(frames->write(raw));
  ZCK_TRY(frames->flush());
  ZCK_TRY(frames->close());

  spdlog::debug("chunked: {} metadata records, {} compressed bytes before manifest", metadata.size(), dest.count());
  return write_manifest(dest, out_metadata, dest.count(), metadata, level);
}

} // namespace zchunked::chunked

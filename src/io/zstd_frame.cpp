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

#include "io/zstd_frame.hpp"

#include "core/endian.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include <zstd.h>

#include <spdlog/spdlog.h>

namespace zchunked::io {

zchunked::core::Result<std::unique_ptr<ZstdFrameWriter>> ZstdFrameWriter::open(ByteSink& dest, int level) noexcept {
  ZSTD_CCtx* cctx = ZSTD_createCCtx();
  if (!cctx) return zchunked::core::fail("zstd: cannot create compression context");

  const std::size_t rc = ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel, level);
  if (ZSTD_isError(rc)) {
    ZSTD_freeCCtx(cctx);
    return zchunked::core::failf("zstd: invalid compression level {}: {}", level, ZSTD_getErrorName(rc));
  }

  return std::unique_ptr<ZstdFrameWriter>(new ZstdFrameWriter(cctx, dest, level));
}

ZstdFrameWriter::ZstdFrameWriter(ZSTD_CCtx_s* cctx, ByteSink& dest, int level) noexcept
  : cctx_(cctx), dest_(&dest), level_(level) {
  out_.resize(ZSTD_CStreamOutSize());
}

ZstdFrameWriter::~ZstdFrameWriter() {
  if (cctx_) ZSTD_freeCCtx(cctx_);
}

zchunked::core::Status ZstdFrameWriter::drive_(std::span<const std::byte> in, int mode) noexcept {
  const auto directive = static_cast<ZSTD_EndDirective>(mode);
  ZSTD_inBuffer ib{in.data(), in.size(), 0};

  for (;;) {
    ZSTD_outBuffer ob{out_.data(), out_.size(), 0};
    const std::size_t remaining = ZSTD_compressStream2(cctx_, &ob, &ib, directive);
    if (ZSTD_isError(remaining)) return zchunked::core::failf("zstd: {}", ZSTD_getErrorName(remaining));

    if (ob.pos) ZCK_TRY(dest_->write(std::span<const std::byte>(out_.data(), ob.pos)));

    const bool input_done = ib.pos == ib.size;
    if (directive == ZSTD_e_continue) {
      if (input_done) return {};
    } else if (input_done && remaining == 0) {
      return {};
    }
  }
}

zchunked::core::Status ZstdFrameWriter::write(std::span<const std::byte> data) noexcept {
  if (closed_) return zchunked::core::fail("zstd: write on closed frame");
  if (data.empty()) return {};
  frame_open_ = true;
  return drive_(data, ZSTD_e_continue);
}

zchunked::core::Status ZstdFrameWriter::flush() noexcept {
  if (!frame_open_) return {};
  return drive_({}, ZSTD_e_flush);
}

zchunked::core::Status ZstdFrameWriter::close() noexcept {
  closed_ = true;
  if (!frame_open_) return {};
  frame_open_ = false;
  return drive_({}, ZSTD_e_end);
}

zchunked::core::Status ZstdFrameWriter::reset(ByteSink& dest) noexcept {
  const std::size_t rc = ZSTD_CCtx_reset(cctx_, ZSTD_reset_session_only);
  if (ZSTD_isError(rc)) return zchunked::core::failf("zstd: reset failed: {}", ZSTD_getErrorName(rc));
  dest_ = &dest;
  frame_open_ = false;
  closed_ = false;
  return {};
}

zchunked::core::Status append_skippable_frame(ByteSink& dest, std::span<const std::byte> data) noexcept {
  if (data.size() > std::numeric_limits<std::uint32_t>::max())
    return zchunked::core::fail("zstd: skippable frame payload too large");

  std::array<std::byte, kSkippableFrameHeaderSize> hdr{};
  std::copy(kSkippableFrameMagic.begin(), kSkippableFrameMagic.end(), hdr.begin());
  zchunked::core::store_le<std::uint32_t>(std::span<std::byte, 4>(hdr.data() + 4, 4),
                                          static_cast<std::uint32_t>(data.size()));

  ZCK_TRY(dest.write(hdr));
  return dest.write(data);
}

zchunked::core::Result<std::vector<std::byte>> zstd_compress_frame(std::span<const std::byte> data, int level) noexcept {
  VectorSink buf;
  ZCK_TRYV(w, ZstdFrameWriter::open(buf, level));
  ZCK_TRY(w->write(data));
  ZCK_TRY(w->close());
  return buf.take();
}

} // namespace zchunked::io

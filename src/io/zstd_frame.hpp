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
#include "io/sink.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

struct ZSTD_CCtx_s;

namespace zchunked::io {

inline constexpr std::array<std::byte, 4> kSkippableFrameMagic{std::byte{0x50}, std::byte{0x2A}, std::byte{0x4D},
                                                               std::byte{0x18}};
inline constexpr std::size_t kSkippableFrameHeaderSize = 8;

// A compressed-frame writer that can be closed and restarted against a sink
// many times, producing a sequence of independent frames.
class FrameSink {
public:
  virtual ~FrameSink() = default;

  virtual zchunked::core::Status write(std::span<const std::byte> data) noexcept = 0;
  virtual zchunked::core::Status flush() noexcept = 0;
  virtual zchunked::core::Status close() noexcept = 0;
  virtual zchunked::core::Status reset(ByteSink& dest) noexcept = 0;
};

class ZstdFrameWriter final : public FrameSink {
public:
  static zchunked::core::Result<std::unique_ptr<ZstdFrameWriter>> open(ByteSink& dest, int level) noexcept;

  ~ZstdFrameWriter() override;

  ZstdFrameWriter(const ZstdFrameWriter&) = delete;
  ZstdFrameWriter& operator=(const ZstdFrameWriter&) = delete;

  // The frame header is emitted lazily with the first non-empty write.
  zchunked::core::Status write(std::span<const std::byte> data) noexcept override;
  zchunked::core::Status flush() noexcept override;
  // Ends the open frame. No-op when nothing was written since the last reset.
  zchunked::core::Status close() noexcept override;
  zchunked::core::Status reset(ByteSink& dest) noexcept override;

  int level() const noexcept { return level_; }

private:
  ZstdFrameWriter(ZSTD_CCtx_s* cctx, ByteSink& dest, int level) noexcept;

  zchunked::core::Status drive_(std::span<const std::byte> in, int mode) noexcept;

private:
  ZSTD_CCtx_s* cctx_ = nullptr;
  ByteSink* dest_ = nullptr;
  int level_ = 0;

  std::vector<std::byte> out_;
  bool frame_open_ = false;
  bool closed_ = false;
};

zchunked::core::Status append_skippable_frame(ByteSink& dest, std::span<const std::byte> data) noexcept;

zchunked::core::Result<std::vector<std::byte>> zstd_compress_frame(std::span<const std::byte> data, int level) noexcept;

} // namespace zchunked::io

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
#include "core/completion.hpp"
#include "core/status.hpp"
#include "io/pipe.hpp"
#include "io/sink.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <thread>

namespace zchunked::chunked {

// Blocking writer front-end for write_chunked_stream. Bytes written here are
// handed through a bounded pipe to a background thread that produces the
// zstd:chunked stream on `out`.
class ChunkedWriter final : public io::ByteSink {
public:
  ChunkedWriter(io::ByteSink& out, Annotations& metadata, int level,
                std::size_t pipe_capacity = io::kDefaultPipeCapacity);
  ~ChunkedWriter() override;

  ChunkedWriter(const ChunkedWriter&) = delete;
  ChunkedWriter& operator=(const ChunkedWriter&) = delete;

  // Fails without blocking once the producer has failed.
  zchunked::core::Status write(std::span<const std::byte> data) noexcept override;

  // Ends the input and waits for the producer. metadata is complete once
  // this returns success. Later calls return the same result.
  zchunked::core::Status close() noexcept;

private:
  void run_(io::ByteSink& out, Annotations& metadata, int level) noexcept;

private:
  io::PipeEnds pipe_;
  zchunked::core::Completion done_;

  bool closed_ = false;
  zchunked::core::Status close_result_{};

  std::thread worker_;
};

zchunked::core::Result<std::unique_ptr<ChunkedWriter>> zstd_compressor(io::ByteSink& out, Annotations& metadata,
                                                                        std::optional<int> level = std::nullopt) noexcept;

} // namespace zchunked::chunked

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

#include "chunked/chunked_writer.hpp"

#include "chunked/compressor.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace zchunked::chunked {

ChunkedWriter::ChunkedWriter(io::ByteSink& out, Annotations& metadata, int level, std::size_t pipe_capacity)
  : pipe_(io::make_pipe(pipe_capacity)) {
  worker_ = std::thread([this, &out, &metadata, level] { run_(out, metadata, level); });
}

ChunkedWriter::~ChunkedWriter() {
  if (auto st = close(); !st) spdlog::debug("ChunkedWriter: dropped after failure: {}", st.error());
}

void ChunkedWriter::run_(io::ByteSink& out, Annotations& metadata, int level) noexcept {
  auto st = write_chunked_stream(out, metadata, pipe_.reader, level);
  if (!st) spdlog::error("zstd:chunked: {}", st.error());
  done_.set(std::move(st));

  // Keep the writer side from blocking until it closes.
  pipe_.reader.drain();
  pipe_.reader.close();
}

zchunked::core::Status ChunkedWriter::write(std::span<const std::byte> data) noexcept {
  if (auto r = done_.poll(); r && !*r) {
    pipe_.writer.close();
    return *r;
  }
  return pipe_.writer.write(data);
}

zchunked::core::Status ChunkedWriter::close() noexcept {
  if (closed_) return close_result_;
  closed_ = true;

  pipe_.writer.close();
  close_result_ = done_.wait();
  if (worker_.joinable()) worker_.join();
  return close_result_;
}

zchunked::core::Result<std::unique_ptr<ChunkedWriter>> zstd_compressor(io::ByteSink& out, Annotations& metadata,
                                                                        std::optional<int> level) noexcept {
  try {
    return std::make_unique<ChunkedWriter>(out, metadata, level.value_or(kDefaultLevel));
  } catch (const std::exception& e) {
    return zchunked::core::failf("zstd:chunked: cannot start compressor: {}", e.what());
  }
}

} // namespace zchunked::chunked

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
#include "io/source.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace zchunked::io {

inline constexpr std::size_t kDefaultPipeCapacity = 64 * 1024;

// Bounded in-memory byte pipe with one writer and one reader. Writes block
// while the buffer is full; reads block while it is empty.
class Pipe {
public:
  explicit Pipe(std::size_t capacity);

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  zchunked::core::Status write(std::span<const std::byte> data) noexcept;
  zchunked::core::Result<std::size_t> read(std::span<std::byte> out) noexcept;

  // Reader sees end of stream, or `reason` if it carries an error.
  void close_write(zchunked::core::Status reason = {}) noexcept;
  // Pending and future writes fail.
  void close_read() noexcept;

private:
  std::mutex m_;
  std::condition_variable cv_readable_;
  std::condition_variable cv_writable_;

  std::vector<std::byte> buf_;
  std::size_t head_ = 0;
  std::size_t size_ = 0;

  bool write_closed_ = false;
  bool read_closed_ = false;
  zchunked::core::Status write_reason_{};
};

class PipeReader final : public ByteSource {
public:
  explicit PipeReader(std::shared_ptr<Pipe> p) noexcept : pipe_(std::move(p)) {}

  std::string display_name() const override { return "pipe"; }
  std::size_t read(std::span<std::byte> out) override;
  zchunked::core::Status status() const noexcept override { return st_; }

  // Reads and discards everything until the writer closes.
  void drain() noexcept;
  void close() noexcept;

private:
  std::shared_ptr<Pipe> pipe_;
  zchunked::core::Status st_{};
};

class PipeWriter final : public ByteSink {
public:
  explicit PipeWriter(std::shared_ptr<Pipe> p) noexcept : pipe_(std::move(p)) {}

  zchunked::core::Status write(std::span<const std::byte> data) noexcept override;
  void close(zchunked::core::Status reason = {}) noexcept;

private:
  std::shared_ptr<Pipe> pipe_;
};

struct PipeEnds {
  PipeReader reader;
  PipeWriter writer;
};

PipeEnds make_pipe(std::size_t capacity = kDefaultPipeCapacity);

} // namespace zchunked::io

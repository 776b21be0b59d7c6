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

#include "io/pipe.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

namespace zchunked::io {

namespace {

constexpr const char* kClosedPipe = "io: read/write on closed pipe";

} // namespace

Pipe::Pipe(std::size_t capacity) : buf_(std::max<std::size_t>(capacity, 1)) {}

zchunked::core::Status Pipe::write(std::span<const std::byte> data) noexcept {
  std::size_t off = 0;
  while (off < data.size()) {
    std::size_t n = 0;
    {
      std::unique_lock lk(m_);
      cv_writable_.wait(lk, [&] { return read_closed_ || write_closed_ || size_ < buf_.size(); });
      if (read_closed_ || write_closed_) return zchunked::core::fail(kClosedPipe);

      const std::size_t cap = buf_.size();
      const std::size_t tail = (head_ + size_) % cap;
      const std::size_t contiguous = (tail >= head_) ? (cap - tail) : (head_ - tail);
      n = std::min(contiguous, data.size() - off);
      std::memcpy(buf_.data() + tail, data.data() + off, n);
      size_ += n;
    }
    cv_readable_.notify_one();
    off += n;
  }
  return {};
}

zchunked::core::Result<std::size_t> Pipe::read(std::span<std::byte> out) noexcept {
  if (out.empty()) return std::size_t{0};

  std::size_t n = 0;
  {
    std::unique_lock lk(m_);
    cv_readable_.wait(lk, [&] { return read_closed_ || write_closed_ || size_ > 0; });
    if (read_closed_) return zchunked::core::fail(kClosedPipe);
    if (size_ == 0) {
      // write end closed and fully drained
      if (!write_reason_) return zchunked::core::fail(write_reason_.error());
      return std::size_t{0};
    }

    const std::size_t cap = buf_.size();
    const std::size_t contiguous = std::min(size_, cap - head_);
    n = std::min(contiguous, out.size());
    std::memcpy(out.data(), buf_.data() + head_, n);
    head_ = (head_ + n) % cap;
    size_ -= n;
  }
  cv_writable_.notify_one();
  return n;
}

void Pipe::close_write(zchunked::core::Status reason) noexcept {
  {
    std::lock_guard lk(m_);
    if (write_closed_) return;
    write_closed_ = true;
    write_reason_ = std::move(reason);
  }
  cv_readable_.notify_all();
  cv_writable_.notify_all();
}

void Pipe::close_read() noexcept {
  {
    std::lock_guard lk(m_);
    read_closed_ = true;
  }
  cv_readable_.notify_all();
  cv_writable_.notify_all();
}

std::size_t PipeReader::read(std::span<std::byte> out) {
  if (!st_) return 0;
  auto r = pipe_->read(out);
  if (!r) {
    st_ = zchunked::core::fail(std::move(r.error()));
    return 0;
  }
  return *r;
}

void PipeReader::drain() noexcept {
  std::array<std::byte, 4096> scratch{};
  std::size_t discarded = 0;
  for (;;) {
    auto r = pipe_->read(scratch);
    if (!r || *r == 0) break;
    discarded += *r;
  }
  if (discarded) spdlog::debug("pipe: discarded {} unread bytes", discarded);
}

void PipeReader::close() noexcept { pipe_->close_read(); }

zchunked::core::Status PipeWriter::write(std::span<const std::byte> data) noexcept {
  return pipe_->write(data);
}

void PipeWriter::close(zchunked::core::Status reason) noexcept { pipe_->close_write(std::move(reason)); }

PipeEnds make_pipe(std::size_t capacity) {
  auto p = std::make_shared<Pipe>(capacity);
  return PipeEnds{PipeReader(p), PipeWriter(p)};
}

} // namespace zchunked::io

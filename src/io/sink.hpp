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

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace zchunked::io {

// A sink accepts all of the bytes or fails.
class ByteSink {
public:
  virtual ~ByteSink() = default;

  virtual zchunked::core::Status write(std::span<const std::byte> data) noexcept = 0;
};

class VectorSink final : public ByteSink {
public:
  zchunked::core::Status write(std::span<const std::byte> data) noexcept override;

  const std::vector<std::byte>& data() const noexcept { return buf_; }
  std::vector<std::byte> take() noexcept { return std::move(buf_); }

private:
  std::vector<std::byte> buf_;
};

// Counts the bytes that reached the underlying sink successfully.
class WriteCounter final : public ByteSink {
public:
  explicit WriteCounter(ByteSink& dest) noexcept : dest_(dest) {}

  zchunked::core::Status write(std::span<const std::byte> data) noexcept override;

  std::uint64_t count() const noexcept { return count_; }

private:
  ByteSink& dest_;
  std::uint64_t count_ = 0;
};

} // namespace zchunked::io

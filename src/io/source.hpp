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
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace zchunked::io {

// Sequential blocking byte stream. read() returns 0 at end of stream or on
// failure; status() tells the two apart.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual std::string display_name() const = 0;
  virtual std::size_t read(std::span<std::byte> out) = 0;

  virtual zchunked::core::Status status() const noexcept { return {}; }
};

class MemorySource final : public ByteSource {
public:
  explicit MemorySource(std::vector<std::byte> data, std::string name = "memory")
    : data_(std::move(data)), name_(std::move(name)) {}

  std::string display_name() const override { return name_; }
  std::size_t read(std::span<std::byte> out) override;

private:
  std::vector<std::byte> data_;
  std::string name_;
  std::size_t pos_ = 0;
};

} // namespace zchunked::io

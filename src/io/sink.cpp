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

#include "io/sink.hpp"

#include <new>

namespace zchunked::io {

zchunked::core::Status VectorSink::write(std::span<const std::byte> data) noexcept {
  try {
    buf_.insert(buf_.end(), data.begin(), data.end());
  } catch (const std::bad_alloc&) {
    return zchunked::core::fail("VectorSink: out of memory");
  }
  return {};
}

zchunked::core::Status WriteCounter::write(std::span<const std::byte> data) noexcept {
  auto st = dest_.write(data);
  if (!st) return st;
  count_ += data.size();
  return {};
}

} // namespace zchunked::io

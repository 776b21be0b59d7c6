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

#include "io/source.hpp"

#include <algorithm>
#include <cstring>

namespace zchunked::io {

std::size_t MemorySource::read(std::span<std::byte> out) {
  if (out.empty() || pos_ >= data_.size()) return 0;
  const std::size_t want = std::min(out.size(), data_.size() - pos_);
  std::memcpy(out.data(), data_.data() + pos_, want);
  pos_ += want;
  return want;
}

} // namespace zchunked::io

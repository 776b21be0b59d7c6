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
#include "io/buffered_source.hpp"
#include "io/source.hpp"

#include <cstdint>

namespace zchunked::chunked {

inline constexpr std::int64_t kHolesThreshold = 1 << 10;

struct ByteEvent {
  // Length of a zero run of at least the threshold; value is then 0.
  std::int64_t hole_len = 0;
  std::uint8_t value = 0;
  bool end = false;
};

// Turns a byte stream into single bytes and runs of zeros. Zero runs shorter
// than the threshold are handed back as plain zero bytes.
class HoleFinder {
public:
  enum class State { Reading, Accumulating, Found, AtEnd };

  explicit HoleFinder(io::ByteSource& src, std::int64_t threshold = kHolesThreshold);

  zchunked::core::Result<ByteEvent> next_byte() noexcept;

  State state() const noexcept { return state_; }

private:
  io::BufferedByteReader reader_;
  std::int64_t zeros_ = 0;
  std::int64_t threshold_;
  State state_ = State::Reading;
};

} // namespace zchunked::chunked

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

#include <array>
#include <cstddef>
#include <cstdint>

namespace zchunked::chunked {

// bup-style rolling checksum over a 64-byte window.
class RollSum {
public:
  static constexpr std::uint32_t kWindowSize = 64;
  static constexpr std::uint32_t kCharOffset = 31;
  static constexpr std::uint32_t kBlobBits = 13;

  RollSum() noexcept;

  void roll(std::uint8_t ch) noexcept;
  std::uint32_t digest() const noexcept;

  bool on_split() const noexcept { return on_split_with_bits(kBlobBits); }
  // True when the low `bits` bits of s2 are all set.
  bool on_split_with_bits(std::uint32_t bits) const noexcept;

private:
  void add_(std::uint32_t drop, std::uint32_t add) noexcept;

private:
  std::uint32_t s1_ = 0;
  std::uint32_t s2_ = 0;
  std::array<std::uint8_t, kWindowSize> window_{};
  std::size_t wofs_ = 0;
};

} // namespace zchunked::chunked

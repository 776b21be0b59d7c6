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

#include "chunked/rollsum.hpp"

namespace zchunked::chunked {

RollSum::RollSum() noexcept
  : s1_(kWindowSize * kCharOffset), s2_(kWindowSize * (kWindowSize - 1) * kCharOffset) {}

void RollSum::add_(std::uint32_t drop, std::uint32_t add) noexcept {
  s1_ += add - drop;
  s2_ += s1_ - kWindowSize * (drop + kCharOffset);
}

void RollSum::roll(std::uint8_t ch) noexcept {
  add_(window_[wofs_], ch);
  window_[wofs_] = ch;
  wofs_ = (wofs_ + 1) % kWindowSize;
}

std::uint32_t RollSum::digest() const noexcept { return (s1_ << 16) | (s2_ & 0xffff); }

bool RollSum::on_split_with_bits(std::uint32_t bits) const noexcept {
  const std::uint32_t mask = bits >= 32 ? ~std::uint32_t{0} : (std::uint32_t{1} << bits) - 1;
  return (s2_ & mask) == mask;
}

} // namespace zchunked::chunked

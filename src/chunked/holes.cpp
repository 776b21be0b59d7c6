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

#include "chunked/holes.hpp"

#include <algorithm>

namespace zchunked::chunked {

HoleFinder::HoleFinder(io::ByteSource& src, std::int64_t threshold)
  : reader_(src), threshold_(std::max<std::int64_t>(threshold, 1)) {}

zchunked::core::Result<ByteEvent> HoleFinder::next_byte() noexcept {
  for (;;) {
    switch (state_) {
    case State::Reading: {
      if (zeros_ > 0) {
        --zeros_;
        return ByteEvent{};
      }
      ZCK_TRYV(b, reader_.read_byte());
      if (!b) return ByteEvent{.end = true};
      if (*b != 0) return ByteEvent{.value = *b};

      zeros_ = 1;
      state_ = (zeros_ == threshold_) ? State::Found : State::Accumulating;
      break;
    }

    case State::Accumulating: {
      ZCK_TRYV(b, reader_.read_byte());
      if (!b) {
        state_ = State::AtEnd;
        break;
      }
      if (*b == 0) {
        if (++zeros_ == threshold_) state_ = State::Found;
      } else {
        ZCK_TRY(reader_.unread_byte());
        state_ = State::Reading;
      }
      break;
    }

    case State::Found: {
      ZCK_TRYV(b, reader_.read_byte());
      if (b && *b == 0) {
        ++zeros_;
        break;
      }
      if (b) {
        ZCK_TRY(reader_.unread_byte());
        state_ = State::Reading;
      } else {
        state_ = State::AtEnd;
      }
      const std::int64_t hole_len = zeros_;
      zeros_ = 0;
      return ByteEvent{.hole_len = hole_len};
    }

    case State::AtEnd:
      if (zeros_ > 0) {
        --zeros_;
        return ByteEvent{};
      }
      return ByteEvent{.end = true};
    }
  }
}

} // namespace zchunked::chunked

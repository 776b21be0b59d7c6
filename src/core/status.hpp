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

#include <fmt/format.h>

#include <expected>
#include <string>
#include <utility>

namespace zchunked::core {

template <class T>
using Result = std::expected<T, std::string>;

using Status = Result<void>;

inline std::unexpected<std::string> fail(std::string msg) {
  return std::unexpected<std::string>(std::move(msg));
}

template <class... Args>
std::unexpected<std::string> failf(fmt::format_string<Args...> f, Args&&... args) {
  return fail(fmt::format(f, std::forward<Args>(args)...));
}

} // namespace zchunked::core

#define ZCK_TRY(expr)                                                   \
  do {                                                                  \
    auto _st = (expr);                                                  \
    if (!_st) return ::zchunked::core::fail(std::move(_st.error()));    \
  } while (0)

#define ZCK_TRYV(var, expr)                                                           \
  auto var##_r_ = (expr);                                                             \
  if (!var##_r_) return ::zchunked::core::fail(std::move(var##_r_.error()));          \
  auto var = std::move(*var##_r_)

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
#include <memory>
#include <span>
#include <string>

struct evp_md_ctx_st;

namespace zchunked::crypto {

// Streaming sha256 producing "sha256:<hex>" digests.
class Digester {
public:
  static zchunked::core::Result<Digester> sha256() noexcept;

  Digester(Digester&&) noexcept = default;
  Digester& operator=(Digester&&) noexcept = default;

  zchunked::core::Status update(std::span<const std::byte> data) noexcept;
  zchunked::core::Result<std::string> finalize() noexcept;
  zchunked::core::Status reset() noexcept;

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };

  explicit Digester(evp_md_ctx_st* ctx) noexcept : ctx_(ctx) {}

  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

std::string base64_encode(std::span<const std::byte> data);

} // namespace zchunked::crypto

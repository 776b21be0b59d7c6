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

#include "crypto/digest.hpp"

#include <array>

#include <openssl/evp.h>

namespace zchunked::crypto {

namespace {

constexpr const char* kAlgorithm = "sha256";

std::string hex_lower(const unsigned char* d, std::size_t n) {
  static constexpr char hex[] = "0123456789abcdef";
  std::string out(2 * n, '0');
  for (std::size_t i = 0; i < n; ++i) {
    out[2 * i + 0] = hex[(d[i] >> 4) & 0x0F];
    out[2 * i + 1] = hex[d[i] & 0x0F];
  }
  return out;
}

} // namespace

void Digester::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept { EVP_MD_CTX_free(ctx); }

zchunked::core::Result<Digester> Digester::sha256() noexcept {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) return zchunked::core::fail("digest: cannot allocate context");
  Digester d(ctx);
  ZCK_TRY(d.reset());
  return d;
}

zchunked::core::Status Digester::reset() noexcept {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1)
    return zchunked::core::failf("digest: {} init failed", kAlgorithm);
  return {};
}

zchunked::core::Status Digester::update(std::span<const std::byte> data) noexcept {
  if (data.empty()) return {};
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1)
    return zchunked::core::failf("digest: {} update failed", kAlgorithm);
  return {};
}

zchunked::core::Result<std::string> Digester::finalize() noexcept {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), md.data(), &len) != 1)
    return zchunked::core::failf("digest: {} final failed", kAlgorithm);
  return std::string(kAlgorithm) + ":" + hex_lower(md.data(), len);
}

std::string base64_encode(std::span<const std::byte> data) {
  if (data.empty()) return {};
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size()));
  out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
  return out;
}

} // namespace zchunked::crypto

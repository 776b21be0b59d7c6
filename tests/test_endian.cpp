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

#include "core/endian.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <span>

static int g_pass = 0;
static int g_fail = 0;

template <class T>
static void check_eq(const char* label, T got, T expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

// ----- host_to_le wire bytes -----

static void test_host_to_le_bytes_u32() {
  constexpr std::uint32_t v = 0x04030201;
  auto le = zchunked::core::host_to_le(v);

  unsigned char bytes[4];
  std::memcpy(bytes, &le, 4);

  bool ok = bytes[0] == 0x01 && bytes[1] == 0x02 && bytes[2] == 0x03 && bytes[3] == 0x04;
  check_eq("host_to_le_bytes_u32", ok, true);
}

static void test_host_to_le_involution() {
  constexpr std::uint64_t v = 0x0123456789ABCDEFull;
  check_eq("involution_u64", zchunked::core::host_to_le(zchunked::core::host_to_le(v)), v);
}

// ----- store_le / load_le -----

static void test_store_le_u32() {
  std::array<std::byte, 4> buf{};
  zchunked::core::store_le<std::uint32_t>(buf, 0x12345678u);
  bool ok = buf[0] == std::byte{0x78} && buf[1] == std::byte{0x56} && buf[2] == std::byte{0x34} &&
            buf[3] == std::byte{0x12};
  check_eq("store_le_u32", ok, true);
}

static void test_store_le_u64() {
  std::array<std::byte, 8> buf{};
  zchunked::core::store_le<std::uint64_t>(buf, 0x78556e496c556e47ull);
  // "GnUlInUx"
  check_eq("store_le_u64", std::memcmp(buf.data(), "GnUlInUx", 8), 0);
}

static void test_load_le_u32() {
  const std::array<std::byte, 4> buf{std::byte{0x50}, std::byte{0x2A}, std::byte{0x4D}, std::byte{0x18}};
  check_eq("load_le_u32", zchunked::core::load_le<std::uint32_t>(buf), std::uint32_t{0x184D2A50});
}

static void test_load_le_from_larger_buffer() {
  std::array<std::byte, 16> buf{};
  std::span<std::byte, 16> s(buf);
  zchunked::core::store_le<std::uint64_t>(s.subspan<8, 8>(), 40);
  check_eq("load_le_subspan", zchunked::core::load_le<std::uint64_t>(std::span<const std::byte, 16>(buf).subspan<8, 8>()),
           std::uint64_t{40});
  check_eq("store_le_untouched_prefix", zchunked::core::load_le<std::uint64_t>(std::span<const std::byte, 16>(buf).subspan<0, 8>()),
           std::uint64_t{0});
}

// ----- identity on zero / all ones -----

static void test_zero() {
  check_eq("zero_host_to_le_u32", zchunked::core::host_to_le(std::uint32_t{0}), std::uint32_t{0});
}

static void test_all_ones() {
  constexpr std::uint32_t all = 0xFFFFFFFF;
  check_eq("all_ones_host_to_le", zchunked::core::host_to_le(all), all);
}

static void test_constexpr() {
  constexpr auto v = zchunked::core::host_to_le(std::uint32_t{0x12345678});
  check_eq("constexpr_host_to_le", v, v);
}

int main() {
  test_host_to_le_bytes_u32();
  test_host_to_le_involution();
  test_store_le_u32();
  test_store_le_u64();
  test_load_le_u32();
  test_load_le_from_larger_buffer();
  test_zero();
  test_all_ones();
  test_constexpr();

  std::fprintf(stdout, "endian: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}

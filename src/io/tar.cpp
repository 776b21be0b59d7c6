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

#include "io/tar.hpp"

#include "io/read_exact.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace zchunked::io {

namespace {

constexpr std::size_t kBlock = 512;
constexpr std::uint64_t kMaxMetaPayload = 1024ull * 1024ull * 8ull;
constexpr std::string_view kXattrPrefix = "SCHILY.xattr.";

inline std::uint64_t round_up_512(std::uint64_t n) noexcept {
  return (n + (kBlock - 1)) & ~(static_cast<std::uint64_t>(kBlock - 1));
}

inline bool is_header_only(char typeflag) noexcept {
  return typeflag >= '1' && typeflag <= '6';
}

static zchunked::core::Result<std::int64_t> parse_i64_dec(std::string_view s) noexcept {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t'))
    s.remove_suffix(1);

  std::int64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return zchunked::core::fail("PAX: invalid decimal number");
  return v;
}

// "<sec>[.<frac>]" with up to nanosecond precision; extra digits are dropped.
static zchunked::core::Result<TarTime> parse_pax_time(std::string_view s) noexcept {
  const auto dot = s.find('.');
  const auto sec_part = s.substr(0, dot);
  if (sec_part.empty()) return zchunked::core::fail("PAX: invalid time");

  auto sec = parse_i64_dec(sec_part);
  if (!sec) return zchunked::core::fail("PAX: invalid time");

  TarTime t{*sec, 0};
  if (dot == std::string_view::npos) return t;

  const auto frac = s.substr(dot + 1);
  std::uint32_t ns = 0;
  for (std::size_t i = 0; i < 9; ++i) {
    char c = i < frac.size() ? frac[i] : '0';
    if (c < '0' || c > '9') return zchunked::core::fail("PAX: invalid time");
    ns = ns * 10 + static_cast<std::uint32_t>(c - '0');
  }
  if (sec_part.front() == '-' && ns != 0) {
    t.sec -= 1;
    ns = 1'000'000'000u - ns;
  }
  t.nsec = ns;
  return t;
}

} // namespace

TarReader::TarReader(ByteSource& src, bool validate_header_checksums) noexcept
  : src_(src), validate_(validate_header_checksums) {}

std::string TarReader::display_name() const {
  return src_.display_name() + ":" + current_name_;
}

bool TarReader::header_all_zero(std::span<const std::byte, 512> header) noexcept {
  for (auto b : header)
    if (b != std::byte{0}) return false;
  return true;
}

std::string TarReader::cstr_field(const char* p, std::size_t n) {
  const auto* nul = static_cast<const char*>(std::memchr(p, '\0', n));
  const std::size_t len = nul ? static_cast<std::size_t>(nul - p) : n;
  return std::string(p, p + len);
}

std::uint64_t TarReader::parse_octal(std::string_view s) noexcept {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\0')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\0' || s.back() == '\r' || s.back() == '\n'))
    s.remove_suffix(1);

  std::uint64_t v = 0;
  for (char ch : s) {
    if (ch < '0' || ch > '7') break;
    v = (v << 3) + static_cast<std::uint64_t>(ch - '0');
  }
  return v;
}

zchunked::core::Result<std::uint64_t> TarReader::parse_tar_number(const char* p, std::size_t n) noexcept {
  if (n == 0) return std::uint64_t{0};

  const unsigned char b0 = static_cast<unsigned char>(p[0]);

  if (b0 & 0x80) {
    const bool negative = (b0 & 0x40) != 0;
    if (negative) return zchunked::core::fail("Tar: negative base-256 numeric field");

    std::uint64_t val = static_cast<std::uint64_t>(b0 & 0x3Fu);
    for (std::size_t i = 1; i < n; ++i) {
      if (val > (std::numeric_limits<std::uint64_t>::max() >> 8))
        return zchunked::core::fail("Tar: base-256 numeric field too large for uint64");
      val = (val << 8) | static_cast<unsigned char>(p[i]);
    }
    return val;
  }

  return parse_octal(std::string_view(p, n));
}

std::string TarReader::join_ustar_name(std::string_view prefix, std::string_view name) {
  if (prefix.empty()) return std::string(name);
  std::string out;
  out.reserve(prefix.size() + 1 + name.size());
  out.append(prefix);
  if (!out.empty() && out.back() != '/') out.push_back('/');
  out.append(name);
  return out;
}

bool TarReader::validate_header_checksum(std::span<const std::byte, 512> header) noexcept {
  constexpr std::size_t chk_off = 148;
  constexpr std::size_t chk_len = 8;

  const char* chk_field = reinterpret_cast<const char*>(header.data() + chk_off);
  const auto expected = static_cast<unsigned long>(parse_octal(std::string_view(chk_field, chk_len)));

  auto compute = [&](bool signed_mode) -> unsigned long {
    long sum = 0;
    for (std::size_t i = 0; i < header.size(); ++i) {
      unsigned char c = static_cast<unsigned char>(header[i]);
      if (i >= chk_off && i < chk_off + chk_len) c = 0x20;

      sum += signed_mode ? static_cast<signed char>(c) : static_cast<unsigned char>(c);
    }
    return static_cast<unsigned long>(sum);
  };

  return expected == compute(false) || expected == compute(true);
}

zchunked::core::Result<TarReader::PaxRecords> TarReader::parse_pax_payload(std::string_view payload) noexcept {
  PaxRecords kv;

  std::size_t pos = 0;
  while (pos < payload.size()) {
    const auto sp = payload.find(' ', pos);
    if (sp == std::string_view::npos) return zchunked::core::fail("PAX: malformed record");

    auto rl = parse_i64_dec(payload.substr(pos, sp - pos));
    if (!rl) return zchunked::core::fail(std::move(rl.error()));
    if (*rl <= 0 || static_cast<std::uint64_t>(*rl) > payload.size() - pos)
      return zchunked::core::fail("PAX: bad record length");
    const auto rec_len = static_cast<std::size_t>(*rl);
    if (sp - pos >= rec_len) return zchunked::core::fail("PAX: bad record length");

    const auto rec = payload.substr(pos, rec_len);
    std::string_view kvs = rec.substr(sp - pos + 1);
    pos += rec_len;

    if (kvs.empty() || kvs.back() != '\n') return zchunked::core::fail("PAX: record missing newline");
    kvs.remove_suffix(1);

    const auto eq = kvs.find('=');
    if (eq == std::string_view::npos) return zchunked::core::fail("PAX: record missing '='");

    kv.insert_or_assign(std::string(kvs.substr(0, eq)), std::string(kvs.substr(eq + 1)));
  }

  return kv;
}

zchunked::core::Status TarReader::apply_pax(const PaxRecords& pax, TarHeader& hdr) noexcept {
  for (const auto& [key, val] : pax) {
    if (key == "path") {
      hdr.name = val;
    } else if (key == "linkpath") {
      hdr.linkname = val;
    } else if (key == "uname") {
      hdr.uname = val;
    } else if (key == "gname") {
      hdr.gname = val;
    } else if (key == "uid" || key == "gid" || key == "size") {
      ZCK_TRYV(v, parse_i64_dec(val));
      if (v < 0) return zchunked::core::failf("PAX: negative {}", key);
      (key == "uid" ? hdr.uid : key == "gid" ? hdr.gid : hdr.size) = v;
    } else if (key == "mtime") {
      ZCK_TRYV(t, parse_pax_time(val));
      hdr.mtime = t;
    } else if (key == "atime") {
      ZCK_TRYV(t, parse_pax_time(val));
      hdr.atime = t;
    } else if (key == "ctime") {
      ZCK_TRYV(t, parse_pax_time(val));
      hdr.ctime = t;
    } else if (key.starts_with(kXattrPrefix)) {
      hdr.xattrs.insert_or_assign(key.substr(kXattrPrefix.size()), val);
    }
  }
  return {};
}

zchunked::core::Result<std::size_t> TarReader::read_block_(std::span<std::byte, 512> block) noexcept {
  ZCK_TRYV(got, read_full(src_, block));
  if (got != 0 && got != block.size()) return zchunked::core::fail("Tar: unexpected EOF in header");
  raw_.insert(raw_.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(got));
  return got;
}

zchunked::core::Status TarReader::consume_(std::span<std::byte> dst) noexcept {
  ZCK_TRYV(got, read_full(src_, dst));
  raw_.insert(raw_.end(), dst.begin(), dst.begin() + static_cast<std::ptrdiff_t>(got));
  if (got != dst.size()) return zchunked::core::fail("Tar: unexpected EOF");
  return {};
}

zchunked::core::Status TarReader::skip_(std::uint64_t n) noexcept {
  std::array<std::byte, 4096> scratch{};
  while (n) {
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(n, scratch.size()));
    ZCK_TRY(consume_(std::span<std::byte>(scratch.data(), want)));
    n -= want;
  }
  return {};
}

zchunked::core::Result<std::string> TarReader::read_meta_payload_(std::uint64_t size, std::string_view what) noexcept {
  if (size > kMaxMetaPayload) return zchunked::core::failf("Tar: refusing huge {} header", what);

  std::string payload;
  payload.resize(static_cast<std::size_t>(size));
  if (size) ZCK_TRY(consume_(std::span<std::byte>(reinterpret_cast<std::byte*>(payload.data()), payload.size())));
  ZCK_TRY(skip_(round_up_512(size) - size));
  return payload;
}

zchunked::core::Result<TarHeader> TarReader::parse_header_(std::span<const std::byte, 512> block) noexcept {
  const char* h = reinterpret_cast<const char*>(block.data());

  TarHeader hdr;
  hdr.typeflag = h[156];
  hdr.name = cstr_field(h + 0, 100);
  hdr.linkname = cstr_field(h + 157, 100);

  ZCK_TRYV(mode, parse_tar_number(h + 100, 8));
  ZCK_TRYV(uid, parse_tar_number(h + 108, 8));
  ZCK_TRYV(gid, parse_tar_number(h + 116, 8));
  ZCK_TRYV(size, parse_tar_number(h + 124, 12));
  ZCK_TRYV(mtime, parse_tar_number(h + 136, 12));
  if (size > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    return zchunked::core::fail("Tar: entry size out of range");

  hdr.mode = static_cast<std::int64_t>(mode);
  hdr.uid = static_cast<std::int64_t>(uid);
  hdr.gid = static_cast<std::int64_t>(gid);
  hdr.size = static_cast<std::int64_t>(size);
  hdr.mtime = TarTime{static_cast<std::int64_t>(mtime), 0};

  const std::string_view magic(h + 257, 6);
  const std::string_view version(h + 263, 2);
  const bool ustar = magic == std::string_view("ustar\0", 6) && version == "00";
  const bool gnu = magic == "ustar " && version == std::string_view(" \0", 2);

  if (ustar || gnu) {
    hdr.uname = cstr_field(h + 265, 32);
    hdr.gname = cstr_field(h + 297, 32);
    ZCK_TRYV(devmajor, parse_tar_number(h + 329, 8));
    ZCK_TRYV(devminor, parse_tar_number(h + 337, 8));
    hdr.devmajor = static_cast<std::int64_t>(devmajor);
    hdr.devminor = static_cast<std::int64_t>(devminor);
  }

  if (ustar) {
    hdr.name = join_ustar_name(cstr_field(h + 345, 155), hdr.name);
  } else if (gnu) {
    if (h[345] != '\0') {
      ZCK_TRYV(atime, parse_tar_number(h + 345, 12));
      hdr.atime = TarTime{static_cast<std::int64_t>(atime), 0};
    }
    if (h[357] != '\0') {
      ZCK_TRYV(ctime, parse_tar_number(h + 357, 12));
      hdr.ctime = TarTime{static_cast<std::int64_t>(ctime), 0};
    }
  }

  return hdr;
}

zchunked::core::Result<std::optional<TarHeader>> TarReader::next() noexcept {
  if (!st_) return zchunked::core::fail(st_.error());
  if (done_) return std::optional<TarHeader>{};

  auto fail_sticky = [&](std::string msg) -> zchunked::core::Result<std::optional<TarHeader>> {
    st_ = zchunked::core::fail(msg);
    return zchunked::core::fail(std::move(msg));
  };

  if (auto st = skip_(remaining_ + pad_); !st) return fail_sticky(std::move(st.error()));
  remaining_ = 0;
  pad_ = 0;

  PaxRecords pax_next;
  std::optional<std::string> gnu_longname;
  std::optional<std::string> gnu_longlink;

  std::array<std::byte, kBlock> block{};
  for (;;) {
    auto got = read_block_(block);
    if (!got) return fail_sticky(std::move(got.error()));
    if (*got == 0) {
      done_ = true;
      return std::optional<TarHeader>{};
    }

    if (header_all_zero(block)) {
      auto got2 = read_block_(block);
      if (!got2) return fail_sticky(std::move(got2.error()));
      if (*got2 == 0 || header_all_zero(block)) {
        done_ = true;
        return std::optional<TarHeader>{};
      }
      return fail_sticky("Tar: invalid header (zero block followed by data)");
    }

    if (validate_ && !validate_header_checksum(block)) return fail_sticky("Tar: invalid header checksum");

    auto parsed = parse_header_(block);
    if (!parsed) return fail_sticky(std::move(parsed.error()));
    TarHeader hdr = std::move(*parsed);

    if (hdr.typeflag == 'x' || hdr.typeflag == 'g') {
      auto payload = read_meta_payload_(static_cast<std::uint64_t>(hdr.size), "PAX");
      if (!payload) return fail_sticky(std::move(payload.error()));

      auto kvr = parse_pax_payload(*payload);
      if (!kvr) return fail_sticky(std::move(kvr.error()));

      auto& into = (hdr.typeflag == 'g') ? pax_global_ : pax_next;
      for (auto& [k, v] : *kvr) into.insert_or_assign(k, std::move(v));
      continue;
    }

    if (hdr.typeflag == 'L' || hdr.typeflag == 'K') {
      auto payload = read_meta_payload_(static_cast<std::uint64_t>(hdr.size), "GNU long name");
      if (!payload) return fail_sticky(std::move(payload.error()));

      const auto nul = payload->find('\0');
      if (nul != std::string::npos) payload->resize(nul);
      (hdr.typeflag == 'L' ? gnu_longname : gnu_longlink) = std::move(*payload);
      continue;
    }

    if (gnu_longname) hdr.name = std::move(*gnu_longname);
    if (gnu_longlink) hdr.linkname = std::move(*gnu_longlink);

    PaxRecords eff = pax_global_;
    for (auto& [k, v] : pax_next) eff.insert_or_assign(k, std::move(v));
    if (auto st = apply_pax(eff, hdr); !st) return fail_sticky(std::move(st.error()));

    if (hdr.typeflag == '\0') hdr.typeflag = (!hdr.name.empty() && hdr.name.back() == '/') ? '5' : '0';

    if (!is_header_only(hdr.typeflag)) {
      remaining_ = static_cast<std::uint64_t>(hdr.size);
      pad_ = round_up_512(remaining_) - remaining_;
    }
    current_name_ = hdr.name;

    spdlog::trace("TarReader: entry '{}' type '{}' size {}", hdr.name, hdr.typeflag, hdr.size);
    return std::optional<TarHeader>(std::move(hdr));
  }
}

std::vector<std::byte> TarReader::take_raw_bytes() noexcept {
  return std::exchange(raw_, {});
}

std::size_t TarReader::read(std::span<std::byte> out) {
  if (!st_ || out.empty() || remaining_ == 0) return 0;

  const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, out.size()));
  const std::size_t got = src_.read(out.first(want));
  if (!got) {
    auto st = src_.status();
    if (st)
      st_ = zchunked::core::failf("Tar: unexpected EOF in payload of '{}'", current_name_);
    else
      st_ = std::move(st);
    return 0;
  }
  remaining_ -= got;
  return got;
}

} // namespace zchunked::io

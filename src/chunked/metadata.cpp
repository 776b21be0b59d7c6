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

#include "chunked/metadata.hpp"

#include <ctime>

#include <fmt/format.h>
#include <json/json.h>

namespace zchunked::chunked {

namespace {

constexpr const char* kZeroTime = "0001-01-01T00:00:00Z";

void set_nonzero(Json::Value& v, const char* key, std::int64_t n) {
  if (n) v[key] = Json::Int64(n);
}

void set_nonempty(Json::Value& v, const char* key, const std::string& s) {
  if (!s.empty()) v[key] = s;
}

} // namespace

std::string_view chunk_type_name(ChunkType t) noexcept {
  switch (t) {
  case ChunkType::Zeros: return "zeros";
  case ChunkType::Data: break;
  }
  return "";
}

zchunked::core::Result<std::string> entry_type(char typeflag) noexcept {
  switch (typeflag) {
  case '0':
  case '\0': return std::string(kTypeReg);
  case '1': return std::string(kTypeLink);
  case '2': return std::string(kTypeSymlink);
  case '3': return std::string(kTypeChar);
  case '4': return std::string(kTypeBlock);
  case '5': return std::string(kTypeDir);
  case '6': return std::string(kTypeFifo);
  default: break;
  }
  return zchunked::core::failf("unknown tarball type: {}", static_cast<int>(static_cast<unsigned char>(typeflag)));
}

std::string format_rfc3339_nano(const std::optional<io::TarTime>& t) {
  if (!t) return kZeroTime;

  const std::time_t secs = static_cast<std::time_t>(t->sec);
  std::tm tm{};
  if (!gmtime_r(&secs, &tm)) return kZeroTime;

  std::string out = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                                tm.tm_hour, tm.tm_min, tm.tm_sec);
  if (t->nsec) {
    std::string frac = fmt::format("{:09}", t->nsec % 1000000000u);
    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    out += '.';
    out += frac;
  }
  out += 'Z';
  return out;
}

Json::Value to_json(const FileMetadata& m) {
  Json::Value v(Json::objectValue);
  v["type"] = m.type;
  v["name"] = m.name;
  set_nonempty(v, "linkName", m.linkname);
  set_nonzero(v, "mode", m.mode);
  set_nonzero(v, "size", m.size);
  set_nonzero(v, "uid", m.uid);
  set_nonzero(v, "gid", m.gid);

  if (m.type != kTypeChunk) {
    v["modtime"] = format_rfc3339_nano(m.modtime);
    v["accesstime"] = format_rfc3339_nano(m.accesstime);
    v["changetime"] = format_rfc3339_nano(m.changetime);
  }

  set_nonzero(v, "devMajor", m.devmajor);
  set_nonzero(v, "devMinor", m.devminor);

  if (!m.xattrs.empty()) {
    Json::Value x(Json::objectValue);
    for (const auto& [k, val] : m.xattrs) x[k] = val;
    v["xattrs"] = std::move(x);
  }

  set_nonempty(v, "digest", m.digest);
  set_nonzero(v, "offset", m.offset);
  set_nonzero(v, "endOffset", m.end_offset);
  set_nonzero(v, "chunkSize", m.chunk_size);
  set_nonzero(v, "chunkOffset", m.chunk_offset);
  set_nonempty(v, "chunkDigest", m.chunk_digest);
  if (m.chunk_type != ChunkType::Data) v["chunkType"] = std::string(chunk_type_name(m.chunk_type));
  return v;
}

} // namespace zchunked::chunked

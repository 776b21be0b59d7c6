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

#include "chunked/manifest.hpp"
#include "chunked/metadata.hpp"

#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

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

using zchunked::chunked::ChunkType;
using zchunked::chunked::FileMetadata;
using zchunked::chunked::format_rfc3339_nano;
using zchunked::io::TarTime;

static std::string type_of(char flag) {
  auto r = zchunked::chunked::entry_type(flag);
  return r ? *r : "error: " + r.error();
}

static void test_entry_types() {
  check_eq("type_reg", type_of('0'), std::string("reg"));
  check_eq("type_rega", type_of('\0'), std::string("reg"));
  check_eq("type_link", type_of('1'), std::string("hardlink"));
  check_eq("type_symlink", type_of('2'), std::string("symlink"));
  check_eq("type_char", type_of('3'), std::string("char"));
  check_eq("type_block", type_of('4'), std::string("block"));
  check_eq("type_dir", type_of('5'), std::string("dir"));
  check_eq("type_fifo", type_of('6'), std::string("fifo"));
  check_eq("type_unknown", type_of('S').starts_with("error: unknown tarball type"), true);
  check_eq("type_global_pax", type_of('g').starts_with("error: unknown tarball type"), true);
}

static void test_rfc3339() {
  check_eq("time_unknown", format_rfc3339_nano(std::nullopt), std::string("0001-01-01T00:00:00Z"));
  check_eq("time_epoch", format_rfc3339_nano(TarTime{0, 0}), std::string("1970-01-01T00:00:00Z"));
  check_eq("time_plain", format_rfc3339_nano(TarTime{1700000000, 0}), std::string("2023-11-14T22:13:20Z"));
  check_eq("time_leap_day", format_rfc3339_nano(TarTime{951782400, 0}), std::string("2000-02-29T00:00:00Z"));
  check_eq("time_half", format_rfc3339_nano(TarTime{1700000000, 500000000}),
           std::string("2023-11-14T22:13:20.5Z"));
  check_eq("time_nanos", format_rfc3339_nano(TarTime{1700000000, 123456789}),
           std::string("2023-11-14T22:13:20.123456789Z"));
  check_eq("time_leading_zero_frac", format_rfc3339_nano(TarTime{1700000000, 1000}),
           std::string("2023-11-14T22:13:20.000001Z"));
  check_eq("time_before_epoch", format_rfc3339_nano(TarTime{-1, 0}), std::string("1969-12-31T23:59:59Z"));
}

static void test_primary_json_omits_zero_values() {
  FileMetadata m;
  m.type = "reg";
  m.name = "empty";
  m.modtime = TarTime{1700000000, 0};

  const Json::Value v = zchunked::chunked::to_json(m);
  check_eq("json_type", v["type"].asString(), std::string("reg"));
  check_eq("json_name", v["name"].asString(), std::string("empty"));
  check_eq("json_modtime", v["modtime"].asString(), std::string("2023-11-14T22:13:20Z"));
  check_eq("json_accesstime_zero", v["accesstime"].asString(), std::string("0001-01-01T00:00:00Z"));
  check_eq("json_changetime_zero", v["changetime"].asString(), std::string("0001-01-01T00:00:00Z"));
  for (const char* key : {"linkName", "mode", "size", "uid", "gid", "devMajor", "devMinor", "xattrs", "digest",
                          "offset", "endOffset", "chunkSize", "chunkOffset", "chunkDigest", "chunkType"})
    check_eq(key, v.isMember(key), false);
}

static void test_primary_json_fields() {
  FileMetadata m;
  m.type = "reg";
  m.name = "f";
  m.linkname = "target";
  m.mode = 0644;
  m.size = 4096;
  m.uid = 1000;
  m.gid = 100;
  m.devmajor = 8;
  m.devminor = 1;
  m.xattrs = {{"user.a", "dmFsdWU="}};
  m.digest = "sha256:00";
  m.offset = 10;
  m.end_offset = 20;
  m.chunk_size = 30;
  m.chunk_digest = "sha256:11";
  m.chunk_type = ChunkType::Zeros;

  const Json::Value v = zchunked::chunked::to_json(m);
  check_eq("json_link", v["linkName"].asString(), std::string("target"));
  check_eq("json_mode", v["mode"].asInt64(), Json::Int64{0644});
  check_eq("json_size", v["size"].asInt64(), Json::Int64{4096});
  check_eq("json_uid", v["uid"].asInt64(), Json::Int64{1000});
  check_eq("json_gid", v["gid"].asInt64(), Json::Int64{100});
  check_eq("json_devmajor", v["devMajor"].asInt64(), Json::Int64{8});
  check_eq("json_devminor", v["devMinor"].asInt64(), Json::Int64{1});
  check_eq("json_xattr", v["xattrs"]["user.a"].asString(), std::string("dmFsdWU="));
  check_eq("json_digest", v["digest"].asString(), std::string("sha256:00"));
  check_eq("json_offset", v["offset"].asInt64(), Json::Int64{10});
  check_eq("json_end_offset", v["endOffset"].asInt64(), Json::Int64{20});
  check_eq("json_chunk_size", v["chunkSize"].asInt64(), Json::Int64{30});
  check_eq("json_chunk_digest", v["chunkDigest"].asString(), std::string("sha256:11"));
  check_eq("json_chunk_type", v["chunkType"].asString(), std::string("zeros"));
}

static void test_chunk_json_has_no_times() {
  FileMetadata m;
  m.type = "chunk";
  m.name = "big";
  m.chunk_offset = 65536;

  const Json::Value v = zchunked::chunked::to_json(m);
  check_eq("chunk_json_type", v["type"].asString(), std::string("chunk"));
  check_eq("chunk_json_offset", v["chunkOffset"].asInt64(), Json::Int64{65536});
  check_eq("chunk_json_no_modtime", v.isMember("modtime"), false);
  check_eq("chunk_json_no_accesstime", v.isMember("accesstime"), false);
  check_eq("chunk_json_no_changetime", v.isMember("changetime"), false);
}

static void test_toc_document() {
  std::vector<FileMetadata> entries(2);
  entries[0].type = "dir";
  entries[0].name = "d/";
  entries[1].type = "reg";
  entries[1].name = "d/f";

  const std::string toc = zchunked::chunked::serialize_toc(entries);
  Json::Value root;
  Json::CharReaderBuilder b;
  std::unique_ptr<Json::CharReader> r(b.newCharReader());
  std::string errs;
  const bool ok = r->parse(toc.data(), toc.data() + toc.size(), &root, &errs);
  check_eq("toc_parses", ok, true);
  check_eq("toc_version", root["version"].asInt(), 1);
  check_eq("toc_entries", root["entries"].size(), Json::ArrayIndex{2});
  check_eq("toc_second_name", root["entries"][1]["name"].asString(), std::string("d/f"));
  check_eq("toc_compact", toc.find('\n'), std::string::npos);
}

static void test_footer_layout() {
  const auto f = zchunked::chunked::encode_footer({.offset = 0x0102, .length_compressed = 3, .length_uncompressed = 4});
  check_eq("footer_offset_lo", f[0], std::byte{0x02});
  check_eq("footer_offset_hi", f[1], std::byte{0x01});
  check_eq("footer_clen", f[8], std::byte{3});
  check_eq("footer_ulen", f[16], std::byte{4});
  check_eq("footer_type", f[24], std::byte{1});
  check_eq("footer_magic", std::string(reinterpret_cast<const char*>(f.data() + 32), 8), std::string("GnUlInUx"));
}

int main() {
  test_entry_types();
  test_rfc3339();
  test_primary_json_omits_zero_values();
  test_primary_json_fields();
  test_chunk_json_has_no_times();
  test_toc_document();
  test_footer_layout();

  std::fprintf(stdout, "metadata: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}

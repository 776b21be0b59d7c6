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

#include "chunked/chunked_writer.hpp"
#include "chunked/compressor.hpp"
#include "io/sink.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

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

static void check_contains(const char* label, const std::string& got, const char* needle) {
  if (got.find(needle) != std::string::npos) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s: '%s' not in '%s'\n", label, needle, got.c_str());
    ++g_fail;
  }
}

using zchunked::chunked::Annotations;
using zchunked::chunked::ChunkedWriter;
using zchunked::test::TarBuilder;

static zchunked::core::Status write_in_pieces(zchunked::io::ByteSink& w, std::span<const std::byte> data,
                                              std::size_t piece) {
  for (std::size_t off = 0; off < data.size(); off += piece) {
    const std::size_t n = std::min(piece, data.size() - off);
    ZCK_TRY(w.write(data.subspan(off, n)));
  }
  return {};
}

static TarBuilder sample_archive() {
  TarBuilder tb;
  tb.dir("app/");
  tb.file("app/config", "key = value\n");
  tb.file("app/blob", zchunked::test::random_bytes(400000, 17));
  tb.symlink("app/current", "blob");
  tb.end();
  return tb;
}

static void test_success_path() {
  const auto tb = sample_archive();
  zchunked::io::VectorSink out;
  Annotations ann;

  auto w = zchunked::chunked::zstd_compressor(out, ann, std::nullopt);
  if (!w) {
    check_eq("success_create", false, true);
    return;
  }
  auto wst = write_in_pieces(**w, tb.bytes(), 1000);
  auto cst = (*w)->close();
  check_eq("success_writes", wst.has_value(), true);
  check_eq("success_close", cst.has_value(), true);

  auto again = (*w)->close();
  check_eq("success_close_repeat", again.has_value(), true);

  const auto m = zchunked::test::read_manifest(out.data());
  check_eq("success_manifest", m.ok, true);
  check_eq("success_annotations", ann.size(), std::size_t{2});
  check_eq("success_entries", m.ok && m.root["entries"].size() > 4, true);

  auto plain = zchunked::test::zstd_decompress_all(out.data());
  check_eq("success_round_trip", plain && *plain == tb.bytes(), true);
}

static void test_trailing_padding_is_discarded() {
  auto tb = sample_archive();
  auto bytes = tb.bytes();
  bytes.resize(bytes.size() + 8192, std::byte{0});

  zchunked::io::VectorSink out;
  Annotations ann;
  ChunkedWriter w(out, ann, 3);
  auto wst = write_in_pieces(w, bytes, 4096);
  auto cst = w.close();
  check_eq("padding_writes", wst.has_value(), true);
  check_eq("padding_close", cst.has_value(), true);

  auto plain = zchunked::test::zstd_decompress_all(out.data());
  check_eq("padding_stops_at_end_marker", plain && *plain == tb.bytes(), true);
}

static void test_small_pipe_backpressure() {
  const auto tb = sample_archive();
  zchunked::io::VectorSink out;
  Annotations ann;
  ChunkedWriter w(out, ann, 1, 64);
  auto wst = write_in_pieces(w, tb.bytes(), 65536);
  auto cst = w.close();
  check_eq("backpressure_writes", wst.has_value(), true);
  check_eq("backpressure_close", cst.has_value(), true);
  auto plain = zchunked::test::zstd_decompress_all(out.data());
  check_eq("backpressure_round_trip", plain && *plain == tb.bytes(), true);
}

static void test_failure_reported_by_close_then_write() {
  TarBuilder tb;
  tb.file("fine", "ok\n");
  tb.header(TarBuilder::Entry{.name = "weird", .typeflag = 'S'});
  tb.file("after", std::string(10000, 'a'));
  tb.end();

  zchunked::io::VectorSink out;
  Annotations ann;
  ChunkedWriter w(out, ann, 3);
  (void)write_in_pieces(w, tb.bytes(), 512);

  auto cst = w.close();
  check_eq("failure_close", cst.has_value(), false);
  if (!cst) check_contains("failure_close_message", cst.error(), "unknown tarball type");

  const auto t0 = std::chrono::steady_clock::now();
  auto wst = w.write(zchunked::test::to_bytes("more"));
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  check_eq("failure_write", wst.has_value(), false);
  if (!wst && !cst) check_eq("failure_write_same_error", wst.error(), cst.error());
  check_eq("failure_write_does_not_block", elapsed < std::chrono::seconds(1), true);

  auto again = w.close();
  check_eq("failure_close_repeat", !again.has_value() && !cst.has_value() && again.error() == cst.error(), true);
  check_eq("failure_no_annotations", ann.empty(), true);
}

static void test_failure_surfaces_on_write() {
  TarBuilder tb;
  tb.header(TarBuilder::Entry{.name = "weird", .typeflag = 'S'});
  tb.end();
  const auto filler = zchunked::test::random_bytes(4096, 5);

  zchunked::io::VectorSink out;
  Annotations ann;
  ChunkedWriter w(out, ann, 3);
  (void)w.write(tb.bytes());

  // The producer fails on the first entry and drains the rest; keep writing
  // until the failure is reported.
  zchunked::core::Status st{};
  for (int i = 0; i < 10000 && st; ++i) st = w.write(filler);
  check_eq("write_reports_failure", st.has_value(), false);
  if (!st) check_contains("write_failure_message", st.error(), "unknown tarball type");

  auto cst = w.close();
  check_eq("write_failure_close", !cst.has_value() && !st.has_value() && cst.error() == st.error(), true);
}

static void test_close_on_truncated_archive() {
  const auto tb = sample_archive();
  // First two entries only, no end marker: a clean block boundary.
  std::vector<std::byte> head(tb.bytes().begin(), tb.bytes().begin() + 512 + 512 + 512);

  zchunked::io::VectorSink out;
  Annotations ann;
  ChunkedWriter w(out, ann, 3);
  auto wst = w.write(head);
  auto cst = w.close();
  check_eq("truncated_write", wst.has_value(), true);
  check_eq("truncated_close", cst.has_value(), true);
  const auto m = zchunked::test::read_manifest(out.data());
  check_eq("truncated_manifest", m.ok && m.root["entries"].size() == 2, true);
}

static void test_close_mid_block_fails() {
  const auto tb = sample_archive();
  std::vector<std::byte> head(tb.bytes().begin(), tb.bytes().begin() + 512 + 100);

  zchunked::io::VectorSink out;
  Annotations ann;
  ChunkedWriter w(out, ann, 3);
  (void)w.write(head);
  auto cst = w.close();
  check_eq("mid_block_close_fails", cst.has_value(), false);
}

static void test_destroy_without_close() {
  const auto tb = sample_archive();
  zchunked::io::VectorSink out;
  Annotations ann;
  {
    ChunkedWriter w(out, ann, 3);
    (void)w.write(std::span<const std::byte>(tb.bytes()).first(2048));
  }
  check_eq("destroy_without_close_returns", true, true);
}

static void test_empty_input() {
  zchunked::io::VectorSink out;
  Annotations ann;
  ChunkedWriter w(out, ann, 3);
  auto cst = w.close();
  check_eq("empty_input_close", cst.has_value(), true);
  const auto m = zchunked::test::read_manifest(out.data());
  check_eq("empty_input_manifest", m.ok && m.root["entries"].size() == 0, true);
}

int main() {
  test_success_path();
  test_trailing_padding_is_discarded();
  test_small_pipe_backpressure();
  test_failure_reported_by_close_then_write();
  test_failure_surfaces_on_write();
  test_close_on_truncated_archive();
  test_close_mid_block_fails();
  test_destroy_without_close();
  test_empty_input();

  std::fprintf(stdout, "chunked_writer: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}

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

#include "core/completion.hpp"
#include "io/pipe.hpp"
#include "io/read_exact.hpp"
#include "test_support.hpp"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>
#include <thread>
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

static void test_ordering_through_small_buffer() {
  const auto data = zchunked::test::random_bytes(100000, 3);
  auto p = zchunked::io::make_pipe(16);

  std::thread writer([&] {
    std::size_t off = 0;
    std::size_t step = 1;
    while (off < data.size()) {
      const std::size_t n = std::min(step, data.size() - off);
      if (!p.writer.write(std::span<const std::byte>(data.data() + off, n))) break;
      off += n;
      step = step % 97 + 1;
    }
    p.writer.close();
  });

  std::vector<std::byte> got;
  std::byte buf[33];
  for (;;) {
    const std::size_t n = p.reader.read(buf);
    if (!n) break;
    got.insert(got.end(), buf, buf + n);
  }
  writer.join();

  check_eq("ordering_equal", got == data, true);
  check_eq("ordering_clean_eof", p.reader.status().has_value(), true);
}

static void test_close_with_error() {
  auto p = zchunked::io::make_pipe();
  (void)p.writer.write(zchunked::test::to_bytes("abc"));
  p.writer.close(zchunked::core::fail("producer went away"));

  std::byte buf[8];
  auto got = zchunked::io::read_full(p.reader, buf);
  check_eq("close_error_fails", got.has_value(), false);
  if (!got) check_eq("close_error_message", got.error(), std::string("producer went away"));
}

static void test_write_after_reader_closed() {
  auto p = zchunked::io::make_pipe();
  p.reader.close();
  auto st = p.writer.write(zchunked::test::to_bytes("x"));
  check_eq("closed_reader_write_fails", st.has_value(), false);
  if (!st) check_eq("closed_reader_message", st.error(), std::string("io: read/write on closed pipe"));
}

static void test_blocked_writer_released_by_reader_close() {
  auto p = zchunked::io::make_pipe(4);
  zchunked::core::Status result{};
  std::thread writer([&] { result = p.writer.write(zchunked::test::random_bytes(64, 1)); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  p.reader.close();
  writer.join();
  check_eq("released_writer_fails", result.has_value(), false);
}

static void test_write_after_writer_closed() {
  auto p = zchunked::io::make_pipe();
  p.writer.close();
  auto st = p.writer.write(zchunked::test::to_bytes("x"));
  check_eq("closed_writer_write_fails", st.has_value(), false);
}

static void test_drain_unblocks_writer() {
  auto p = zchunked::io::make_pipe(8);
  const auto data = zchunked::test::random_bytes(10000, 9);
  zchunked::core::Status result{};
  std::thread writer([&] {
    result = p.writer.write(data);
    p.writer.close();
  });
  p.reader.drain();
  writer.join();
  check_eq("drain_writer_ok", result.has_value(), true);
}

static void test_completion_first_wins() {
  zchunked::core::Completion c;
  check_eq("completion_initially_empty", c.poll().has_value(), false);
  check_eq("completion_not_done", c.done(), false);

  c.set(zchunked::core::fail("first"));
  c.set({});

  auto r = c.poll();
  check_eq("completion_done", c.done(), true);
  check_eq("completion_poll", r.has_value() && !r->has_value() && r->error() == "first", true);
  auto w = c.wait();
  check_eq("completion_wait_sticky", !w.has_value() && w.error() == "first", true);
}

static void test_completion_wait_across_threads() {
  zchunked::core::Completion c;
  std::thread t([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    c.set({});
  });
  auto st = c.wait();
  t.join();
  check_eq("completion_wait_ok", st.has_value(), true);
}

int main() {
  test_ordering_through_small_buffer();
  test_close_with_error();
  test_write_after_reader_closed();
  test_blocked_writer_released_by_reader_close();
  test_write_after_writer_closed();
  test_drain_unblocks_writer();
  test_completion_first_wins();
  test_completion_wait_across_threads();

  std::fprintf(stdout, "pipe: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}

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

#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace zchunked::core {

// Single-slot, single-producer result channel. The first set() wins; the
// stored result is sticky and can be observed any number of times.
class Completion {
public:
  Completion() = default;

  Completion(const Completion&) = delete;
  Completion& operator=(const Completion&) = delete;

  void set(Status st) noexcept {
    {
      std::lock_guard lk(m_);
      if (result_) return;
      result_.emplace(std::move(st));
    }
    cv_.notify_all();
  }

  std::optional<Status> poll() const {
    std::lock_guard lk(m_);
    return result_;
  }

  Status wait() const {
    std::unique_lock lk(m_);
    cv_.wait(lk, [&] { return result_.has_value(); });
    return *result_;
  }

  bool done() const noexcept {
    std::lock_guard lk(m_);
    return result_.has_value();
  }

private:
  mutable std::mutex m_;
  mutable std::condition_variable cv_;
  std::optional<Status> result_{};
};

} // namespace zchunked::core

//  AirCast - Local Network Audio Streaming
//  Copyright (C) 2022  Tim Hughey
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//  https://www.wisslanding.com

#include "base/elapsed.hpp"

#include <ctime>
#include <fmt/format.h>
#include <iterator>

namespace aircast {

Nanos Elapsed::monotonic() noexcept {
  struct timespec tn;
  clock_gettime(CLOCK_MONOTONIC_RAW, &tn);

  return Nanos(tn.tv_sec * 1'000'000'000 + tn.tv_nsec);
}

const string Elapsed::humanize() const noexcept {
  using namespace std::chrono;

  auto d = elapsed();
  string msg;
  auto w = std::back_inserter(msg);

  if (d < 1ms) {
    fmt::format_to(w, "{}us", duration_cast<Micros>(d).count());
    return msg;
  }

  if (d < 1s) {
    fmt::format_to(w, "{:.1f}ms", duration_cast<millis_fp>(d).count());
    return msg;
  }

  if (const auto h = duration_cast<hours>(d); h.count() > 0) {
    fmt::format_to(w, "{}h ", h.count());
    d -= h;
  }

  if (const auto m = duration_cast<Minutes>(d); m.count() > 0) {
    fmt::format_to(w, "{}m ", m.count());
    d -= m;
  }

  fmt::format_to(w, "{}s", duration_cast<Seconds>(d).count());

  return msg;
}

} // namespace aircast

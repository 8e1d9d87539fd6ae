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

#pragma once

#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <cstdint>
#include <type_traits>

namespace aircast {

/// @brief Monotonic stopwatch started at construction
class Elapsed {
public:
  Elapsed(void) noexcept : nanos(monotonic()) {}

  /// @brief function object to return elapsed duration as the
  ///        default precision
  /// @return Nanos
  Nanos operator()() const noexcept { return elapsed(); }

  /// @brief return the elapsed duration as an explicit type
  /// @tparam TO requested return type
  /// @return elapsed duration as requested type
  template <typename TO> inline TO as() const noexcept {
    if constexpr (std::same_as<TO, Nanos>) {
      return elapsed();
    } else if constexpr (std::same_as<TO, millis_fp>) {
      return std::chrono::duration_cast<millis_fp>(elapsed());
    } else if constexpr (IsDuration<TO>) {
      return std::chrono::duration_cast<TO>(elapsed());
    } else if constexpr (std::signed_integral<TO>) {
      return elapsed().count();
    } else {
      static_assert(AlwaysFalse<TO>, "unsupported type");
      return TO{};
    }
  }

  /// @brief Create a humanized (e.g. 1m 20s) of the elapsed duration
  /// @return const string
  const string humanize() const noexcept;

  /// @brief Reset the elapsed duration
  /// @return true (for use in if statements)
  bool reset() noexcept {
    *this = Elapsed();
    return true;
  }

private:
  static Nanos monotonic() noexcept;
  Nanos elapsed() const noexcept { return monotonic() - nanos; }

private:
  Nanos nanos;
};

} // namespace aircast

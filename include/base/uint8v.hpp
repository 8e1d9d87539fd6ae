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

#include "base/types.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace aircast {

/// @brief Byte container with big-endian (network order) helpers
class uint8v : public std::vector<uint8_t> {

public:
  using std::vector<uint8_t>::vector;

  /// @brief Construct an empty container
  uint8v() = default;

  /// @brief Construct from a span of bytes (copied)
  /// @param src bytes to copy
  explicit uint8v(std::span<const uint8_t> src) noexcept
      : std::vector<uint8_t>(src.begin(), src.end()) {}

  /// @brief Append an unsigned integral in network byte order
  /// @tparam T unsigned integral type, appends sizeof(T) bytes
  /// @param val value to append
  template <typename T>
    requires std::unsigned_integral<T>
  void append_be(T val) noexcept {
    for (int shift = (sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
      push_back(static_cast<uint8_t>((val >> shift) & 0xff));
    }
  }

  /// @brief Append raw bytes
  void append(std::span<const uint8_t> src) noexcept { insert(end(), src.begin(), src.end()); }

  /// @brief Append the characters of a string view
  void append(csv src) noexcept { insert(end(), src.begin(), src.end()); }

  /// @brief Read only view of the container from offset to end
  std::span<const uint8_t> span(size_t offset = 0) const noexcept {
    return std::span<const uint8_t>(data(), size()).subspan(offset);
  }
};

/// @brief Read an unsigned integral stored in network byte order
/// @tparam T unsigned integral type, consumes sizeof(T) bytes
/// @param src source bytes, caller guarantees offset + sizeof(T) <= size
/// @param offset offset of the first byte
/// @return value in host order
template <typename T>
  requires std::unsigned_integral<T>
inline T load_be(std::span<const uint8_t> src, size_t offset) noexcept {
  T val{0};

  for (size_t i = 0; i < sizeof(T); i++) {
    val = static_cast<T>((val << 8) | src[offset + i]);
  }

  return val;
}

} // namespace aircast

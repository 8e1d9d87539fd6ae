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
#include "base/uint8v.hpp"
#include "packet/ext.hpp"
#include "packet/rfc3550/hdr.hpp"

#include <cstdint>
#include <utility>

namespace aircast {
namespace packet {

/// @brief Transport header + extension header + opaque payload.
///        Immutable once constructed.
class Audio {
public:
  Audio(rfc3550::hdr h, ext x, uint8v payload = uint8v()) noexcept
      : h(std::move(h)), x(std::move(x)), data(std::move(payload)) {}

  static constexpr size_t min_size() noexcept { return rfc3550::hdr::size() + ext::size(); }

  const rfc3550::hdr &header() const noexcept { return h; }
  const ext &extension() const noexcept { return x; }
  const uint8v &payload() const noexcept { return data; }

  bool end_of_stream() const noexcept { return x.end_of_stream(); }
  bool sync() const noexcept { return x.sync(); }

  /// @brief Total encoded size
  size_t size() const noexcept { return min_size() + data.size(); }

  bool operator==(const Audio &) const = default;

  const string inspect() const noexcept;

private:
  rfc3550::hdr h;
  ext x;
  uint8v data;
};

} // namespace packet
} // namespace aircast

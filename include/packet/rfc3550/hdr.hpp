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

#include "base/asio.hpp"
#include "base/types.hpp"
#include "base/uint8v.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace aircast {
namespace packet {
namespace rfc3550 {

/// @brief Transport header, the first twelve bytes of every datagram
struct hdr {
  /*
       0                   1                   2                   3
       0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
       ---------------------------------------------------------------
 0x0  | V |P|X|  CC   |M|     PT      |       Sequence Number         |
      |---------------------------------------------------------------|
 0x4  |                           Timestamp                           |
      |---------------------------------------------------------------|
 0x8  |                             SSRC                              |
       ---------------------------------------------------------------
  */

  static constexpr uint8_t VERSION{2};

  uint8_t version{VERSION};
  bool padding{false};
  bool extension{true};
  uint8_t csrc_count{0}; // 4 bits
  bool marker{false};
  uint8_t payload_type{0}; // 7 bits
  seq_num_t seq_num{0};
  rtp_ts_t timestamp{0};
  ssrc_t ssrc{0};

  static constexpr size_t size() noexcept { return 12; }

  // validation determined by observation, decode is permissive
  bool is_valid() const noexcept { return version == VERSION; }

  /// @brief Append the big-endian wire form (always version 2)
  /// @param dest container to append to
  void encode_to(uint8v &dest) const noexcept;

  /// @brief Decode the first twelve bytes of src
  /// @param src received bytes
  /// @param ec set to DecodeError::TooShort when src is too short
  /// @return decoded header or nullopt
  static std::optional<hdr> decode(std::span<const uint8_t> src, error_code &ec) noexcept;

  bool operator==(const hdr &) const = default;

  const string inspect() const noexcept;
};

} // namespace rfc3550
} // namespace packet
} // namespace aircast

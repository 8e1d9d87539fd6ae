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

/// @brief Audio codec identifiers as carried on the wire (and used as
///        the transport header payload type)
enum class Codec : uint8_t { PCM = 96, AAC = 97, ALAC = 98 };

csv codec_name(Codec codec) noexcept;

/// @brief Typical bit rate (kbps) of a codec, informational only
int codec_bitrate(Codec codec) noexcept;

std::optional<Codec> codec_from_id(uint8_t id) noexcept;
std::optional<Codec> codec_from_name(csv name) noexcept;

/// @brief Extension header, the eight bytes following the transport header
///
///   byte0: codec id      byte1: channels     bytes2-3: sample rate
///   byte4: volume        byte5: flags        bytes6-7: reserved
struct ext {
  // flags
  static constexpr uint8_t SYNC{0x01};
  static constexpr uint8_t KEY_FRAME{0x02};
  static constexpr uint8_t END_OF_STREAM{0x04};

  static constexpr uint8_t DEFAULT_VOLUME{83};

  Codec codec{Codec::AAC};
  uint8_t channels{2};
  uint16_t sample_rate{44100};
  uint8_t volume{DEFAULT_VOLUME};
  uint8_t flags{0};
  uint16_t reserved{0}; // passed through unchanged

  static constexpr size_t size() noexcept { return 8; }

  bool sync() const noexcept { return flags & SYNC; }
  bool key_frame() const noexcept { return flags & KEY_FRAME; }
  bool end_of_stream() const noexcept { return flags & END_OF_STREAM; }

  void encode_to(uint8v &dest) const noexcept;

  /// @brief Decode the first eight bytes of src
  /// @param src bytes following the transport header
  /// @param ec DecodeError::TooShort or DecodeError::UnknownCodec
  /// @return decoded extension header or nullopt
  static std::optional<ext> decode(std::span<const uint8_t> src, error_code &ec) noexcept;

  bool operator==(const ext &) const = default;

  const string inspect() const noexcept;
};

} // namespace packet
} // namespace aircast

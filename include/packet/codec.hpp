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
#include "packet/audio.hpp"
#include "packet/error.hpp"
#include "packet/ext.hpp"
#include "packet/rfc3550/hdr.hpp"

#include <optional>
#include <span>

namespace aircast {
namespace packet {

/// @brief Wire codec, bit exact big-endian encode and decode of the
///        transport header (12 bytes), extension header (8 bytes) and
///        audio packet (header ++ extension ++ payload, no length prefix).
///
///        Decoding failures are reported through ec as a DecodeError,
///        the returned optional is empty on failure.

uint8v encode(const rfc3550::hdr &h) noexcept;
uint8v encode(const ext &x) noexcept;
uint8v encode(const Audio &a) noexcept;

std::optional<rfc3550::hdr> decode_hdr(std::span<const uint8_t> src, error_code &ec) noexcept;
std::optional<ext> decode_ext(std::span<const uint8_t> src, error_code &ec) noexcept;

/// @brief Decode a complete datagram, bytes beyond the first twenty are
///        the payload (a zero length payload is legal)
std::optional<Audio> decode_packet(std::span<const uint8_t> src, error_code &ec) noexcept;

} // namespace packet
} // namespace aircast

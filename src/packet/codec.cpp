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

#include "packet/codec.hpp"

namespace aircast {
namespace packet {

uint8v encode(const rfc3550::hdr &h) noexcept {
  uint8v buf;
  buf.reserve(rfc3550::hdr::size());

  h.encode_to(buf);

  return buf;
}

uint8v encode(const ext &x) noexcept {
  uint8v buf;
  buf.reserve(ext::size());

  x.encode_to(buf);

  return buf;
}

uint8v encode(const Audio &a) noexcept {
  uint8v buf;
  buf.reserve(a.size());

  a.header().encode_to(buf);
  a.extension().encode_to(buf);
  buf.append(a.payload().span());

  return buf;
}

std::optional<rfc3550::hdr> decode_hdr(std::span<const uint8_t> src, error_code &ec) noexcept {
  return rfc3550::hdr::decode(src, ec);
}

std::optional<ext> decode_ext(std::span<const uint8_t> src, error_code &ec) noexcept {
  return ext::decode(src, ec);
}

std::optional<Audio> decode_packet(std::span<const uint8_t> src, error_code &ec) noexcept {
  if (src.size() < Audio::min_size()) {
    ec = DecodeError::TooShort;
    return std::nullopt;
  }

  auto h = rfc3550::hdr::decode(src, ec);
  if (!h.has_value()) return std::nullopt;

  auto x = ext::decode(src.subspan(rfc3550::hdr::size()), ec);
  if (!x.has_value()) return std::nullopt;

  return Audio(*h, *x, uint8v(src.subspan(Audio::min_size())));
}

} // namespace packet
} // namespace aircast

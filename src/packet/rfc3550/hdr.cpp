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

#include "packet/rfc3550/hdr.hpp"
#include "packet/error.hpp"

#include <fmt/format.h>

namespace aircast {
namespace packet {
namespace rfc3550 {

void hdr::encode_to(uint8v &dest) const noexcept {
  uint8_t vpxcc = VERSION << 6;
  if (padding) vpxcc |= 0x20;
  if (extension) vpxcc |= 0x10;
  vpxcc |= (csrc_count & 0x0f);

  uint8_t mpt = payload_type & 0x7f;
  if (marker) mpt |= 0x80;

  dest.push_back(vpxcc);
  dest.push_back(mpt);
  dest.append_be(seq_num);
  dest.append_be(timestamp);
  dest.append_be(ssrc);
}

std::optional<hdr> hdr::decode(std::span<const uint8_t> src, error_code &ec) noexcept {
  if (src.size() < size()) {
    ec = DecodeError::TooShort;
    return std::nullopt;
  }

  ec.clear();

  const auto vpxcc = src[0];
  const auto mpt = src[1];

  return hdr{.version = static_cast<uint8_t>((vpxcc & 0xc0) >> 6),
             .padding = (vpxcc & 0x20) != 0,
             .extension = (vpxcc & 0x10) != 0,
             .csrc_count = static_cast<uint8_t>(vpxcc & 0x0f),
             .marker = (mpt & 0x80) != 0,
             .payload_type = static_cast<uint8_t>(mpt & 0x7f),
             .seq_num = load_be<seq_num_t>(src, 2),
             .timestamp = load_be<rtp_ts_t>(src, 4),
             .ssrc = load_be<ssrc_t>(src, 8)};
}

const string hdr::inspect() const noexcept {
  return fmt::format("v={} pt={:>3} marker={:<5} seq={:>5} ts={:>10} ssrc={:#010x}", version,
                     payload_type, marker, seq_num, timestamp, ssrc);
}

} // namespace rfc3550
} // namespace packet
} // namespace aircast

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

#include "packet/sequencer.hpp"
#include "base/logger.hpp"
#include "base/random.hpp"

#include <algorithm>

namespace aircast {
namespace packet {

static constexpr uint32_t SEQ_MODULUS{0x1'0000};
static constexpr uint64_t TS_MODULUS{0x1'0000'0000};

Sequencer::Sequencer(Codec codec, uint8_t channels, uint16_t sample_rate) noexcept
    : codec_id(codec),          //
      channels(channels),       //
      sample_rate(sample_rate), //
      stream_id(aircast::random()()) //
{
  INFO_INIT("codec={} channels={} rate={} ssrc={:#010x}", codec_name(codec_id), channels,
            sample_rate, stream_id);
}

Audio Sequencer::build_data(uint8v payload, uint32_t sample_count) noexcept {
  Audio packet(make_hdr(false), make_ext(0), std::move(payload));

  seq = static_cast<seq_num_t>((uint32_t{seq} + 1) % SEQ_MODULUS);
  ts = static_cast<rtp_ts_t>((uint64_t{ts} + sample_count) % TS_MODULUS);

  return packet;
}

Audio Sequencer::build_sync() noexcept {
  Audio packet(make_hdr(true), make_ext(ext::SYNC));

  seq = static_cast<seq_num_t>((uint32_t{seq} + 1) % SEQ_MODULUS);

  return packet;
}

Audio Sequencer::build_end_of_stream() noexcept {
  return Audio(make_hdr(true), make_ext(ext::END_OF_STREAM));
}

void Sequencer::volume(int v) noexcept { vol = static_cast<uint8_t>(std::clamp(v, 0, 100)); }

rfc3550::hdr Sequencer::make_hdr(bool marker) const noexcept {
  return rfc3550::hdr{.padding = false,
                      .extension = true,
                      .csrc_count = 0,
                      .marker = marker,
                      .payload_type = static_cast<uint8_t>(codec_id),
                      .seq_num = seq,
                      .timestamp = ts,
                      .ssrc = stream_id};
}

ext Sequencer::make_ext(uint8_t flags) const noexcept {
  return ext{.codec = codec_id,
             .channels = channels,
             .sample_rate = sample_rate,
             .volume = vol,
             .flags = flags};
}

} // namespace packet
} // namespace aircast

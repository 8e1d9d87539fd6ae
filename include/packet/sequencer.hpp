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
#include "packet/audio.hpp"
#include "packet/ext.hpp"
#include "packet/rfc3550/hdr.hpp"

#include <cstdint>

namespace aircast {
namespace packet {

/// @brief Builds a well formed, monotonically ordered packet stream
///        for a single stream identifier.
///
///        Sequence numbers wrap modulo 2^16, timestamps (in samples)
///        wrap modulo 2^32.  Not thread safe, a single producer drives it.
class Sequencer {
public:
  Sequencer(Codec codec, uint8_t channels, uint16_t sample_rate) noexcept;

  /// @brief Build a data packet stamped with the current sequence number
  ///        and timestamp then advance both
  /// @param payload encoded audio (opaque)
  /// @param sample_count samples represented by payload
  /// @return data packet (marker clear, flags clear)
  Audio build_data(uint8v payload, uint32_t sample_count) noexcept;

  /// @brief Build an empty sync packet, consumes one sequence number,
  ///        timestamp unchanged
  Audio build_sync() noexcept;

  /// @brief Build an empty end of stream packet.  The sequence number
  ///        is not consumed so the same marker may be sent repeatedly.
  Audio build_end_of_stream() noexcept;

  /// @brief Set the volume (clamped to 0-100) for subsequent packets
  void volume(int v) noexcept;
  uint8_t volume() const noexcept { return vol; }

  /// @brief Restart sequence number and timestamp at zero,
  ///        stream identifier is unchanged
  void reset() noexcept {
    seq = 0;
    ts = 0;
  }

  Codec codec() const noexcept { return codec_id; }
  seq_num_t seq_num() const noexcept { return seq; }
  ssrc_t ssrc() const noexcept { return stream_id; }
  rtp_ts_t timestamp() const noexcept { return ts; }

private:
  rfc3550::hdr make_hdr(bool marker) const noexcept;
  ext make_ext(uint8_t flags) const noexcept;

private:
  // order dependent
  const Codec codec_id;
  const uint8_t channels;
  const uint16_t sample_rate;
  const ssrc_t stream_id;

  // order independent
  seq_num_t seq{0};
  rtp_ts_t ts{0};
  uint8_t vol{ext::DEFAULT_VOLUME};

public:
  MOD_ID("packet.seq");
};

} // namespace packet
} // namespace aircast

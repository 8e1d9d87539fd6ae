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
#include "base/elapsed.hpp"
#include "base/types.hpp"
#include "packet/audio.hpp"

#include <array>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <cstdint>
#include <functional>
#include <optional>

namespace aircast {
namespace stream {

/// @brief Receives audio packets on a UDP port, decodes them and keeps
///        reception counters.  Packets with a new stream identifier
///        start tracking a new stream, gaps in the sequence numbers of
///        the current stream are counted as lost.
class Receiver {
public:
  struct Stats {
    uint64_t packets{0};
    uint64_t decode_errors{0};
    uint64_t lost{0};
    uint64_t streams{0};
    uint64_t ended{0};
  };

  using Handler = std::function<void(const packet::Audio &)>;

public:
  /// @brief Bind the receive socket
  ///        NOTE: throws boost::system::system_error when the port is unavailable
  Receiver(asio::io_context &io_ctx, Port port, int report_every = 50,
           Handler handler = Handler());

  void start() noexcept { async_recv(); }
  void stop() noexcept;

  const Stats &stats() const noexcept { return counters; }
  Port port() const noexcept { return sock.local_endpoint().port(); }

private:
  void async_recv() noexcept;
  void received(size_t bytes) noexcept;
  void track(const packet::Audio &pkt) noexcept;

private:
  // order dependent
  asio::io_context &io_ctx;
  udp_socket sock;
  const int report_every;
  Handler handler;

  // order independent
  std::array<uint8_t, 65536> buf{};
  udp_endpoint remote;
  std::optional<udp_endpoint> current_sender;
  std::optional<ssrc_t> current_ssrc;
  seq_num_t expected_seq{0};
  Elapsed stream_e;
  Stats counters;

public:
  MOD_ID("stream.receiver");
};

} // namespace stream
} // namespace aircast

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
#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "base/elapsed.hpp"
#include "base/types.hpp"
#include "base/uint8v.hpp"
#include "mdns/device.hpp"
#include "packet/audio.hpp"
#include "packet/ext.hpp"
#include "packet/sequencer.hpp"

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <memory>

namespace aircast {
namespace stream {

/// @brief Streams a synthetic tone to a discovered device, one data packet
///        per interval.  All member functions must be called from the
///        thread running io_ctx.  Pending completions hold a reference so
///        the owner may release the Sender at any time after stop().
class Sender : public std::enable_shared_from_this<Sender> {
public:
  struct Opts {
    Millis interval{20};
    uint32_t samples{1024}; // frames per packet
    packet::Codec codec{packet::Codec::AAC};
    uint8_t channels{2};
    uint16_t sample_rate{44100};
    int volume{packet::ext::DEFAULT_VOLUME};
    double tone_hz{440.0};

    /// @brief Options from configuration, missing values use the defaults
    static Opts load(const conf::token &tokc) noexcept;
  };

private:
  Sender(asio::io_context &io_ctx, const mdns::Device &device, Opts opts) noexcept;

  auto ptr() noexcept { return shared_from_this(); }

public:
  static std::shared_ptr<Sender> create(asio::io_context &io_ctx, const mdns::Device &device,
                                        Opts opts) noexcept;

  ~Sender() noexcept;

  /// @brief Open the socket, send a sync packet and begin streaming
  /// @return error encountered opening the socket (if any)
  error_code start() noexcept;

  /// @brief Send the end of stream marker and close the socket
  void stop() noexcept;

  uint64_t packets_sent() const noexcept { return sent; }
  bool streaming() const noexcept { return sock.is_open(); }

private:
  void next_tick() noexcept;
  void send(packet::Audio &&pkt) noexcept;
  uint8v make_payload() noexcept;

private:
  // order dependent
  asio::io_context &io_ctx;
  const string device_name;
  const string device_addr;
  const Port device_port;
  const Opts opts;
  udp_socket sock;
  steady_timer timer;
  packet::Sequencer seq;

  // order independent
  udp_endpoint dest;
  std::atomic<uint64_t> sent{0};
  double phase{0.0};
  Elapsed streaming_e;

public:
  MOD_ID("stream.sender");
};

} // namespace stream
} // namespace aircast

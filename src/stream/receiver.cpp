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

#include "stream/receiver.hpp"
#include "base/logger.hpp"
#include "packet/codec.hpp"
#include "packet/ext.hpp"

#include <boost/asio/buffer.hpp>
#include <algorithm>
#include <span>

namespace aircast {
namespace stream {

Receiver::Receiver(asio::io_context &io_ctx, Port port, int report_every, Handler handler)
    : io_ctx(io_ctx),                              //
      sock(io_ctx, udp_endpoint(ip_udp::v4(), port)), //
      report_every(std::max(report_every, 1)),     //
      handler(std::move(handler))                  //
{
  INFO_INIT("sizeof={:>5} listening on port={}", sizeof(Receiver), sock.local_endpoint().port());
}

void Receiver::stop() noexcept {
  INFO_AUTO_CAT("stop");

  if (!sock.is_open()) return;

  error_code ec;
  sock.close(ec);

  INFO_AUTO("packets={} streams={} lost={} decode_errors={}", counters.packets, counters.streams,
            counters.lost, counters.decode_errors);
}

void Receiver::async_recv() noexcept {
  sock.async_receive_from(asio::buffer(buf), remote, [this](const error_code &ec, size_t bytes) {
    INFO_AUTO_CAT("recv");

    if (ec) {
      if (ec != asio::error::operation_aborted) INFO_AUTO("failed: {}", ec.message());
      return;
    }

    received(bytes);
    async_recv();
  });
}

void Receiver::received(size_t bytes) noexcept {
  INFO_AUTO_CAT("recv");

  error_code ec;
  auto pkt = packet::decode_packet(std::span<const uint8_t>(buf.data(), bytes), ec);

  if (!pkt.has_value()) {
    counters.decode_errors++;
    INFO_AUTO("{} bytes from {}: {}", bytes, remote.address().to_string(), ec.message());
    return;
  }

  track(*pkt);

  if (handler) handler(*pkt);
}

void Receiver::track(const packet::Audio &pkt) noexcept {
  INFO_AUTO_CAT("track");

  const auto &h = pkt.header();
  const auto &x = pkt.extension();

  counters.packets++;

  if (!current_ssrc.has_value() || (*current_ssrc != h.ssrc)) {
    counters.streams++;
    current_ssrc = h.ssrc;
    current_sender = remote;
    expected_seq = h.seq_num;
    stream_e.reset();

    INFO_AUTO("new stream ssrc={:#010x} from {}:{} {}", h.ssrc, remote.address().to_string(),
              remote.port(), x.inspect());
  }

  if (pkt.end_of_stream()) {
    counters.ended++;

    INFO_AUTO("end of stream ssrc={:#010x} after {} packets={} lost={}", h.ssrc,
              stream_e.humanize(), counters.packets, counters.lost);

    current_ssrc.reset();
    current_sender.reset();
    return;
  }

  // sequence numbers wrap, a forward distance below half the space is loss
  if (const seq_num_t gap = h.seq_num - expected_seq; (gap != 0) && (gap < 0x8000)) {
    counters.lost += gap;
  }

  expected_seq = static_cast<seq_num_t>(h.seq_num + 1);

  if ((counters.packets % report_every) == 0) {
    INFO_AUTO("packets={} seq={} ts={} volume={} payload={}", counters.packets, h.seq_num,
              h.timestamp, x.volume, pkt.payload().size());
  }
}

} // namespace stream
} // namespace aircast

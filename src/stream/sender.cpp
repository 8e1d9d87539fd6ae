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

#include "stream/sender.hpp"
#include "base/logger.hpp"
#include "packet/codec.hpp"

#include <boost/asio/buffer.hpp>
#include <cmath>
#include <numbers>

namespace aircast {
namespace stream {

Sender::Opts Sender::Opts::load(const conf::token &tokc) noexcept {
  Opts opts;

  opts.interval = tokc.val<Millis>("interval_ms", opts.interval);
  opts.samples = tokc.val<uint32_t>("samples", opts.samples);
  opts.channels = tokc.val<uint8_t>("channels", opts.channels);
  opts.sample_rate = tokc.val<uint16_t>("sample_rate", opts.sample_rate);
  opts.volume = tokc.val<int>("volume", opts.volume);
  opts.tone_hz = tokc.val<double>("tone_hz", opts.tone_hz);

  // zero channels, rate or frames can not make a stream
  const Opts def;
  if (opts.channels == 0) opts.channels = def.channels;
  if (opts.sample_rate == 0) opts.sample_rate = def.sample_rate;
  if (opts.samples == 0) opts.samples = def.samples;

  const auto codec_name = tokc.val<string>("codec", packet::codec_name(opts.codec));
  opts.codec = packet::codec_from_name(codec_name).value_or(opts.codec);

  return opts;
}

Sender::Sender(asio::io_context &io_ctx, const mdns::Device &device, Opts opts) noexcept
    : io_ctx(io_ctx),                                            //
      device_name(device.name),                                  //
      device_addr(device.address),                               //
      device_port(device.port),                                  //
      opts(opts),                                                //
      sock(io_ctx),                                              //
      timer(io_ctx),                                             //
      seq(opts.codec, opts.channels, opts.sample_rate)           //
{
  seq.volume(opts.volume);

  INFO_INIT("sizeof={:>5} device={} interval={} samples={}", sizeof(Sender), device_name,
            opts.interval, opts.samples);
}

std::shared_ptr<Sender> Sender::create(asio::io_context &io_ctx, const mdns::Device &device,
                                       Opts opts) noexcept {
  return std::shared_ptr<Sender>(new Sender(io_ctx, device, opts));
}

Sender::~Sender() noexcept { stop(); }

error_code Sender::start() noexcept {
  INFO_AUTO_CAT("start");

  error_code ec;
  const auto addr = asio::ip::make_address(device_addr, ec);

  if (ec) {
    INFO_AUTO("bad address {}: {}", device_addr, ec.message());
    return ec;
  }

  dest = udp_endpoint(addr, device_port);

  if (sock.open(dest.protocol(), ec); ec) {
    INFO_AUTO("open failed: {}", ec.message());
    return ec;
  }

  INFO_AUTO("streaming to {} at {}:{} ssrc={:#010x}", device_name, addr.to_string(), device_port,
            seq.ssrc());

  streaming_e.reset();

  send(seq.build_sync());
  next_tick();

  return ec;
}

void Sender::stop() noexcept {
  INFO_AUTO_CAT("stop");

  if (!sock.is_open()) return;

  timer.cancel();

  // the end of stream marker is sent synchronously, the socket closes next
  const auto buf = packet::encode(seq.build_end_of_stream());

  error_code ec;
  sock.send_to(asio::buffer(buf), dest, 0, ec);

  INFO_AUTO("sent={} in {} end_of_stream={}", sent.load(), streaming_e.humanize(),
            ec ? ec.message() : "ok"s);

  error_code close_ec;
  sock.close(close_ec);
}

void Sender::next_tick() noexcept {
  timer.expires_after(opts.interval);

  timer.async_wait([this, s = ptr()](const error_code &ec) {
    if (ec || !sock.is_open()) return;

    send(seq.build_data(make_payload(), opts.samples));
    next_tick();
  });
}

void Sender::send(packet::Audio &&pkt) noexcept {
  INFO_AUTO_CAT("send");

  auto buf = std::make_shared<uint8v>(packet::encode(pkt));

  sock.async_send_to(asio::buffer(*buf), dest,
                     [this, s = ptr(), buf, seq_num = pkt.header().seq_num](const error_code &ec,
                                                                            size_t) {
                       if (ec) {
                         INFO_AUTO("seq={} failed: {}", seq_num, ec.message());
                         return;
                       }

                       if ((++sent % 50) == 0) INFO_AUTO("sent={} seq={}", sent.load(), seq_num);
                     });
}

uint8v Sender::make_payload() noexcept {
  // interleaved 16-bit big-endian samples, identical on every channel
  uint8v payload;
  payload.reserve(opts.samples * opts.channels * sizeof(int16_t));

  const double step = 2.0 * std::numbers::pi * opts.tone_hz / opts.sample_rate;

  for (uint32_t i = 0; i < opts.samples; i++) {
    const auto sample = static_cast<int16_t>(std::sin(phase) * 0x3fff);
    phase = std::fmod(phase + step, 2.0 * std::numbers::pi);

    for (uint8_t ch = 0; ch < opts.channels; ch++) {
      payload.append_be(static_cast<uint16_t>(sample));
    }
  }

  return payload;
}

} // namespace stream
} // namespace aircast

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

#include "base/asio.hpp"
#include "mdns/device.hpp"
#include "packet/codec.hpp"
#include "stream/receiver.hpp"
#include "stream/sender.hpp"

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace aircast;
using namespace std::chrono_literals;

namespace {

mdns::Device loopback_device(Port port) {
  mdns::Device device;

  device.name = "Loopback";
  device.hostname = "localhost";
  device.address = "127.0.0.1";
  device.port = port;

  return device;
}

void send_raw(asio::io_context &ioc, Port port, const uint8v &buf) {
  udp_socket sock(ioc, udp_endpoint(ip_udp::v4(), 0));

  sock.send_to(asio::buffer(buf), udp_endpoint(asio::ip::make_address("127.0.0.1"), port));
}

} // namespace

TEST(StreamTests, ReceiverCountsDecodeErrors) {
  asio::io_context ioc;
  stream::Receiver receiver(ioc, 0);

  receiver.start();

  send_raw(ioc, receiver.port(), uint8v{0x80, 0x61, 0x00});
  ioc.run_for(100ms);

  EXPECT_EQ(receiver.stats().decode_errors, 1u);
  EXPECT_EQ(receiver.stats().packets, 0u);
}

TEST(StreamTests, ReceiverDetectsSequenceGaps) {
  asio::io_context ioc;
  std::vector<uint16_t> seen;

  stream::Receiver receiver(ioc, 0, 50,
                            [&](const packet::Audio &pkt) { seen.push_back(pkt.header().seq_num); });
  receiver.start();

  packet::Sequencer seq(packet::Codec::PCM, 2, 48000);

  send_raw(ioc, receiver.port(), packet::encode(seq.build_sync()));    // seq 0
  seq.build_data(uint8v(), 16);                                       // seq 1 dropped
  seq.build_data(uint8v(), 16);                                       // seq 2 dropped
  send_raw(ioc, receiver.port(), packet::encode(seq.build_data(uint8v(), 16))); // seq 3

  ioc.run_for(100ms);

  EXPECT_EQ(seen, (std::vector<uint16_t>{0, 3}));
  EXPECT_EQ(receiver.stats().streams, 1u);
  EXPECT_EQ(receiver.stats().lost, 2u);
}

TEST(StreamTests, SenderStreamsToReceiver) {
  asio::io_context ioc;
  stream::Receiver receiver(ioc, 0);

  receiver.start();

  stream::Sender::Opts opts;
  opts.interval = 5ms;
  opts.samples = 64;
  opts.codec = packet::Codec::PCM;

  auto sender = stream::Sender::create(ioc, loopback_device(receiver.port()), opts);

  ASSERT_FALSE(sender->start());
  EXPECT_TRUE(sender->streaming());

  ioc.run_for(150ms);

  sender->stop();
  EXPECT_FALSE(sender->streaming());

  ioc.restart();
  ioc.run_for(100ms);

  const auto &stats = receiver.stats();

  EXPECT_EQ(stats.streams, 1u);
  EXPECT_EQ(stats.ended, 1u);
  EXPECT_EQ(stats.decode_errors, 0u);
  EXPECT_EQ(stats.lost, 0u);
  EXPECT_GE(stats.packets, 2u);
}

TEST(StreamTests, SenderRejectsBadAddress) {
  asio::io_context ioc;

  auto device = loopback_device(7000);
  device.address = "not-an-address";

  auto sender = stream::Sender::create(ioc, device, stream::Sender::Opts());

  EXPECT_TRUE(sender->start());
  EXPECT_FALSE(sender->streaming());
}

TEST(StreamTests, PendingCompletionsOutliveReleasedSender) {
  asio::io_context ioc;
  stream::Receiver receiver(ioc, 0);

  receiver.start();

  std::weak_ptr<stream::Sender> watch;

  {
    auto sender = stream::Sender::create(ioc, loopback_device(receiver.port()), stream::Sender::Opts());

    ASSERT_FALSE(sender->start());
    watch = sender;

    // the sync packet completion and the first tick are still queued
    sender->stop();
  }

  EXPECT_FALSE(watch.expired());

  ioc.run_for(100ms);

  EXPECT_TRUE(watch.expired());
  EXPECT_EQ(receiver.stats().ended, 1u);
}

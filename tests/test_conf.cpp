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

#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "stream/sender.hpp"

#include <gtest/gtest.h>
#include <string_view>

using namespace aircast;
using namespace std::string_view_literals;

namespace {

toml::table sample_config() {
  return toml::parse(R"(
[mdns.browser]
resolve_timeout_ms = 1500

[mdns.advertiser.txt]
codecs = "PCM"

[stream.sender]
interval_ms = 10
samples = 256
codec = "ALAC"
channels = 1
sample_rate = 48000
volume = 40
tone_hz = 880.0
)"sv);
}

} // namespace

TEST(ConfTests, TokenReadsSubtable) {
  const auto cfg = sample_config();

  const conf::token tokc("mdns.browser", cfg);

  ASSERT_FALSE(tokc.empty());
  EXPECT_EQ(tokc.val<Millis>("resolve_timeout_ms", Millis(5000)), Millis(1500));
  EXPECT_EQ(tokc.val<int>("missing", 7), 7);
}

TEST(ConfTests, TokenNestedRoot) {
  const auto cfg = sample_config();

  const conf::token tokc("mdns.advertiser.txt", cfg);

  EXPECT_EQ(tokc.val<string>("codecs", "AAC,PCM"), "PCM");
  EXPECT_EQ(tokc.val<string>("features", "sync,eq"), "sync,eq");
}

TEST(ConfTests, MissingRootIsEmpty) {
  const auto cfg = sample_config();

  const conf::token tokc("stream.receiver", cfg);

  EXPECT_TRUE(tokc.empty());
  EXPECT_EQ(tokc.val<int>("report_every", 50), 50);
}

TEST(ConfTests, SenderOptionsFromConfig) {
  const auto cfg = sample_config();

  const auto opts = stream::Sender::Opts::load(conf::token("stream.sender", cfg));

  EXPECT_EQ(opts.interval, Millis(10));
  EXPECT_EQ(opts.samples, 256u);
  EXPECT_EQ(opts.codec, packet::Codec::ALAC);
  EXPECT_EQ(opts.channels, 1);
  EXPECT_EQ(opts.sample_rate, 48000);
  EXPECT_EQ(opts.volume, 40);
  EXPECT_DOUBLE_EQ(opts.tone_hz, 880.0);
}

TEST(ConfTests, SenderOptionsDefaults) {
  const auto opts = stream::Sender::Opts::load(conf::token());

  EXPECT_EQ(opts.interval, Millis(20));
  EXPECT_EQ(opts.samples, 1024u);
  EXPECT_EQ(opts.codec, packet::Codec::AAC);
  EXPECT_EQ(opts.volume, 83);
}

TEST(ConfTests, SenderIgnoresUnknownCodec) {
  const auto cfg = toml::parse(R"(
[stream.sender]
codec = "MP3"
)"sv);

  const auto opts = stream::Sender::Opts::load(conf::token("stream.sender", cfg));

  EXPECT_EQ(opts.codec, packet::Codec::AAC);
}

TEST(ConfTests, OutOfRangeIntegralUsesDefault) {
  const auto cfg = toml::parse(R"(
[stream.sender]
channels = 300
sample_rate = 70000
samples = -1
)"sv);

  const conf::token tokc("stream.sender", cfg);

  EXPECT_EQ(tokc.val<uint8_t>("channels", 2), 2);
  EXPECT_EQ(tokc.val<int>("channels", 2), 300);

  const auto opts = stream::Sender::Opts::load(tokc);

  EXPECT_EQ(opts.channels, 2);
  EXPECT_EQ(opts.sample_rate, 44100);
  EXPECT_EQ(opts.samples, 1024u);
}

TEST(ConfTests, SenderZeroValuesUseDefaults) {
  const auto cfg = toml::parse(R"(
[stream.sender]
channels = 0
sample_rate = 0
samples = 0
)"sv);

  const auto opts = stream::Sender::Opts::load(conf::token("stream.sender", cfg));

  EXPECT_EQ(opts.channels, 2);
  EXPECT_EQ(opts.sample_rate, 44100);
  EXPECT_EQ(opts.samples, 1024u);
}

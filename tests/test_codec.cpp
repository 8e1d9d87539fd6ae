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
#include "packet/error.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace aircast;
using namespace aircast::packet;

namespace {

rfc3550::hdr sample_hdr() {
  return rfc3550::hdr{.marker = true,
                      .payload_type = 97,
                      .seq_num = 0x1234,
                      .timestamp = 0x01020304,
                      .ssrc = 0xdeadbeef};
}

ext sample_ext() {
  return ext{.codec = Codec::AAC, .channels = 2, .sample_rate = 44100, .volume = 83, .flags = ext::SYNC};
}

} // namespace

//==============================================================================
// Transport header
//==============================================================================

TEST(CodecTests, HeaderBitLayout) {
  const auto buf = encode(sample_hdr());

  const std::vector<uint8_t> expect{0x90, 0xe1, 0x12, 0x34, 0x01, 0x02,
                                    0x03, 0x04, 0xde, 0xad, 0xbe, 0xef};

  ASSERT_EQ(buf.size(), rfc3550::hdr::size());
  EXPECT_EQ(std::vector<uint8_t>(buf.begin(), buf.end()), expect);
}

TEST(CodecTests, HeaderAlwaysEncodesVersionTwo) {
  auto h = sample_hdr();
  h.version = 3;
  h.csrc_count = 0x1f; // only 4 bits travel

  const auto buf = encode(h);

  EXPECT_EQ(buf[0] >> 6, 2);
  EXPECT_EQ(buf[0] & 0x0f, 0x0f);
}

TEST(CodecTests, HeaderRoundTrip) {
  const auto h = sample_hdr();
  error_code ec;

  auto decoded = decode_hdr(encode(h).span(), ec);

  ASSERT_TRUE(decoded.has_value());
  EXPECT_FALSE(ec);
  EXPECT_EQ(*decoded, h);
  EXPECT_TRUE(decoded->is_valid());
}

TEST(CodecTests, HeaderTooShort) {
  const auto buf = encode(sample_hdr());
  error_code ec;

  auto decoded = decode_hdr(buf.span().first(11), ec);

  EXPECT_FALSE(decoded.has_value());
  EXPECT_EQ(ec, DecodeError::TooShort);
}

TEST(CodecTests, HeaderDecodeIsPermissiveAboutVersion) {
  auto buf = encode(sample_hdr());
  buf[0] = static_cast<uint8_t>((buf[0] & 0x3f) | 0x40); // version 1

  error_code ec;
  auto decoded = decode_hdr(buf.span(), ec);

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->version, 1);
  EXPECT_FALSE(decoded->is_valid());
}

//==============================================================================
// Extension header
//==============================================================================

TEST(CodecTests, ExtensionBitLayout) {
  auto x = sample_ext();
  x.reserved = 0xabcd;

  const auto buf = encode(x);

  const std::vector<uint8_t> expect{0x61, 0x02, 0xac, 0x44, 0x53, 0x01, 0xab, 0xcd};

  ASSERT_EQ(buf.size(), ext::size());
  EXPECT_EQ(std::vector<uint8_t>(buf.begin(), buf.end()), expect);
}

TEST(CodecTests, ExtensionReservedPassesThrough) {
  auto x = sample_ext();
  x.reserved = 0x0102;

  error_code ec;
  auto decoded = decode_ext(encode(x).span(), ec);

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->reserved, 0x0102);
  EXPECT_EQ(*decoded, x);
}

TEST(CodecTests, ExtensionTooShort) {
  const auto buf = encode(sample_ext());
  error_code ec;

  EXPECT_FALSE(decode_ext(buf.span().first(7), ec).has_value());
  EXPECT_EQ(ec, DecodeError::TooShort);
}

TEST(CodecTests, ExtensionUnknownCodec) {
  auto buf = encode(sample_ext());
  buf[0] = 99;

  error_code ec;

  EXPECT_FALSE(decode_ext(buf.span(), ec).has_value());
  EXPECT_EQ(ec, DecodeError::UnknownCodec);
}

TEST(CodecTests, CodecLookups) {
  EXPECT_EQ(codec_from_id(96), Codec::PCM);
  EXPECT_EQ(codec_from_id(98), Codec::ALAC);
  EXPECT_FALSE(codec_from_id(95).has_value());

  EXPECT_EQ(codec_from_name("ALAC"), Codec::ALAC);
  EXPECT_FALSE(codec_from_name("MP3").has_value());

  EXPECT_EQ(codec_name(Codec::PCM), "PCM");
  EXPECT_EQ(codec_bitrate(Codec::PCM), 1411);
  EXPECT_EQ(codec_bitrate(Codec::AAC), 256);
  EXPECT_EQ(codec_bitrate(Codec::ALAC), 600);
}

//==============================================================================
// Audio packet
//==============================================================================

TEST(CodecTests, PacketRoundTripWithPayload) {
  const Audio pkt(sample_hdr(), sample_ext(), uint8v{0x00, 0x01, 0xfe, 0xff});
  error_code ec;

  const auto buf = encode(pkt);
  ASSERT_EQ(buf.size(), 24u);

  auto decoded = decode_packet(buf.span(), ec);

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, pkt);
  EXPECT_EQ(decoded->payload().size(), 4u);
}

TEST(CodecTests, PacketMinimumSizeHasEmptyPayload) {
  const Audio pkt(sample_hdr(), sample_ext());
  error_code ec;

  const auto buf = encode(pkt);
  ASSERT_EQ(buf.size(), Audio::min_size());

  auto decoded = decode_packet(buf.span(), ec);

  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->payload().empty());
  EXPECT_TRUE(decoded->sync());
  EXPECT_FALSE(decoded->end_of_stream());
}

TEST(CodecTests, PacketTooShort) {
  const auto buf = encode(Audio(sample_hdr(), sample_ext()));
  error_code ec;

  EXPECT_FALSE(decode_packet(buf.span().first(19), ec).has_value());
  EXPECT_EQ(ec, DecodeError::TooShort);

  EXPECT_FALSE(decode_packet(std::span<const uint8_t>(), ec).has_value());
  EXPECT_EQ(ec, DecodeError::TooShort);
}

TEST(CodecTests, PacketUnknownCodec) {
  auto buf = encode(Audio(sample_hdr(), sample_ext(), uint8v{1, 2, 3}));
  buf[12] = 99;

  error_code ec;

  EXPECT_FALSE(decode_packet(buf.span(), ec).has_value());
  EXPECT_EQ(ec, DecodeError::UnknownCodec);
}

TEST(CodecTests, ErrorCategory) {
  const error_code ec = DecodeError::UnknownCodec;

  EXPECT_STREQ(ec.category().name(), "aircast.packet");
  EXPECT_EQ(ec.message(), "unknown codec");
}

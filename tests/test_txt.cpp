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

#include "mdns/txt.hpp"

#include <avahi-common/strlst.h>
#include <gtest/gtest.h>
#include <vector>

using namespace aircast;
using namespace aircast::mdns;

namespace {

uint8v wire(std::initializer_list<csv> entries) {
  uint8v buf;

  for (const auto e : entries) {
    buf.push_back(static_cast<uint8_t>(e.size()));
    buf.append(e);
  }

  return buf;
}

} // namespace

//==============================================================================
// Encode
//==============================================================================

TEST(TxtTests, EncodeLengthPrefixedEntries) {
  const txt::Record rec{{"codecs", "AAC,PCM"}, {"channels", "2"}};

  const auto buf = txt::encode(rec);

  EXPECT_EQ(buf, wire({"channels=2", "codecs=AAC,PCM"}));
}

TEST(TxtTests, EncodeEmptyRecordIsOneEmptyString) {
  EXPECT_EQ(txt::encode(txt::Record()), uint8v{0x00});
}

TEST(TxtTests, EncodeKeyWithoutValuesIsBare) {
  txt::Record rec;
  rec.set("eq", txt::Values());

  EXPECT_EQ(txt::encode(rec), wire({"eq"}));
}

TEST(TxtTests, EncodeSkipsOversizedEntries) {
  txt::Record rec{{"codecs", "AAC"}};
  rec.set("big", txt::Values{string(300, 'x')});

  EXPECT_EQ(txt::encode(rec), wire({"codecs=AAC"}));
}

TEST(TxtTests, EncodeSkipsKeysHoldingEquals) {
  txt::Record rec{{"codecs", "AAC"}};
  rec.set("a=b", txt::Values{"c"});

  EXPECT_EQ(txt::encode(rec), wire({"codecs=AAC"}));
}

TEST(TxtTests, StringListCarriesEveryEntry) {
  const txt::Record rec{{"codecs", "AAC,PCM"}, {"channels", "2"}};

  auto sl = txt::string_list(rec);

  EXPECT_EQ(avahi_string_list_length(sl), 2u);
  EXPECT_EQ(txt::from_string_list(sl), rec);

  avahi_string_list_free(sl);
}

TEST(TxtTests, StringListOfEmptyRecordIsNull) {
  EXPECT_EQ(txt::string_list(txt::Record()), nullptr);
}

//==============================================================================
// Decode
//==============================================================================

TEST(TxtTests, DecodeCapabilityRecord) {
  const auto rec = txt::decode(
      wire({"txtvers=1", "codecs=AAC,PCM", "channels=2", "samplerate=44100,48000", "features=sync,eq"})
          .span());

  EXPECT_EQ(rec.size(), 5u);
  EXPECT_EQ(rec.first(txt::key::txtvers), "1");
  EXPECT_EQ(rec.find(txt::key::codecs), (txt::Values{"AAC", "PCM"}));
  EXPECT_EQ(rec.joined(txt::key::samplerate), "44100,48000");
  EXPECT_EQ(rec.find(txt::key::features), (txt::Values{"sync", "eq"}));
}

TEST(TxtTests, DecodeBareKeyIsPresentWithoutValues) {
  const auto rec = txt::decode(wire({"eq", "codecs="}).span());

  ASSERT_TRUE(rec.contains("eq"));
  EXPECT_TRUE(rec.find("eq")->empty());

  ASSERT_TRUE(rec.contains("codecs"));
  EXPECT_TRUE(rec.find("codecs")->empty());
  EXPECT_FALSE(rec.first("codecs").has_value());
}

TEST(TxtTests, DecodeDropsInvalidUtf8Values) {
  auto buf = wire({"codecs=AAC"});
  buf.push_back(7);
  buf.append(csv{"name="});
  buf.push_back(0xc3);
  buf.push_back(0x28); // bad continuation byte

  const auto rec = txt::decode(buf.span());

  EXPECT_TRUE(rec.contains("codecs"));
  EXPECT_FALSE(rec.contains("name"));
}

TEST(TxtTests, DecodeDropsValuesWithEmbeddedNul) {
  auto buf = wire({"channels=2"});
  buf.push_back(8);
  buf.append(csv{"name=a"});
  buf.push_back(0x00);
  buf.push_back('b');

  const auto rec = txt::decode(buf.span());

  EXPECT_TRUE(rec.contains("channels"));
  EXPECT_FALSE(rec.contains("name"));
}

TEST(TxtTests, DecodeAcceptsUtf8Values) {
  const auto rec = txt::decode(wire({"name=K\xc3\xbc" "che"}).span());

  EXPECT_EQ(rec.first("name"), "K\xc3\xbc" "che");
}

TEST(TxtTests, DecodeStopsAtLengthOverrun) {
  auto buf = wire({"channels=2"});
  buf.push_back(40); // claims more bytes than remain
  buf.append(csv{"codecs=AAC"});

  const auto rec = txt::decode(buf.span());

  EXPECT_EQ(rec.size(), 1u);
  EXPECT_TRUE(rec.contains("channels"));
}

TEST(TxtTests, DecodeFirstDuplicateWins) {
  const auto rec = txt::decode(wire({"codecs=AAC", "codecs=PCM"}).span());

  EXPECT_EQ(rec.find("codecs"), (txt::Values{"AAC"}));
}

TEST(TxtTests, DecodeSkipsEmptyEntriesAndEmptyKeys) {
  const auto rec = txt::decode(wire({"", "=orphan", "channels=1"}).span());

  EXPECT_EQ(rec.size(), 1u);
  EXPECT_EQ(rec.first("channels"), "1");
}

TEST(TxtTests, DecodeKeepsUnknownKeys) {
  const auto rec = txt::decode(wire({"vendor=acme"}).span());

  EXPECT_EQ(rec.first("vendor"), "acme");
}

TEST(TxtTests, EncodedRecordDecodesToSameRecord) {
  const txt::Record rec{{"codecs", "AAC,PCM"}, {"samplerate", "44100,48000"}, {"features", "sync"}};

  EXPECT_EQ(txt::decode(txt::encode(rec).span()), rec);
}

//==============================================================================
// Record helpers
//==============================================================================

TEST(TxtTests, SplitTrimsAndDropsEmpty) {
  EXPECT_EQ(txt::split(" AAC , ,PCM ,"), (txt::Values{"AAC", "PCM"}));
  EXPECT_TRUE(txt::split("").empty());
}

TEST(TxtTests, SampleRatesSkipUnparseable) {
  EXPECT_EQ(txt::parse_sample_rates("44100, x, 48000, 96k"), (std::vector<int>{44100, 48000}));
}

TEST(TxtTests, SetDefaultOnlyWhenAbsent) {
  txt::Record rec{{"txtvers", "2"}};

  EXPECT_FALSE(rec.set_default(txt::key::txtvers, "1"));
  EXPECT_TRUE(rec.set_default(txt::key::channels, "2"));

  EXPECT_EQ(rec.first(txt::key::txtvers), "2");
  EXPECT_EQ(rec.first(txt::key::channels), "2");
}

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

#include "fake_backend.hpp"
#include "mdns/advertiser.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace aircast;
using namespace aircast::mdns;

TEST(AdvertiserTests, PublishesAnnouncement) {
  test::FakeBackend backend;
  Advertiser advertiser(backend);

  advertiser.start_advertising("Kitchen", 7010, txt::Record{{"codecs", "AAC,PCM"}});

  ASSERT_TRUE(advertiser.advertising());

  const auto anns = backend.published();
  ASSERT_EQ(anns.size(), 1u);

  const auto &ann = anns.front();
  EXPECT_EQ(ann.name, "Kitchen");
  EXPECT_EQ(ann.type, "_aircast._tcp.");
  EXPECT_EQ(ann.domain, "local.");
  EXPECT_EQ(ann.port, 7010);
  EXPECT_EQ(ann.record.find("codecs"), (txt::Values{"AAC", "PCM"}));
}

TEST(AdvertiserTests, AddsRecordVersion) {
  test::FakeBackend backend;
  Advertiser advertiser(backend);

  advertiser.start_advertising("Kitchen", 7000, txt::Record());
  EXPECT_EQ(backend.published().back().record.first(txt::key::txtvers), "1");
  EXPECT_EQ(advertiser.record().first(txt::key::txtvers), "1");

  advertiser.start_advertising("Kitchen", 7000, txt::Record{{"txtvers", "3"}});
  EXPECT_EQ(backend.published().back().record.first(txt::key::txtvers), "3");
}

TEST(AdvertiserTests, RestartWithdrawsFirst) {
  test::FakeBackend backend;
  Advertiser advertiser(backend);

  advertiser.start_advertising("Kitchen", 7000, txt::Record());
  EXPECT_EQ(backend.withdraw_count(), 0);

  advertiser.start_advertising("Kitchen", 7001, txt::Record());

  EXPECT_EQ(backend.withdraw_count(), 1);
  EXPECT_EQ(backend.published().size(), 2u);
  EXPECT_TRUE(advertiser.advertising());
}

TEST(AdvertiserTests, HandlerReceivesOutcome) {
  test::FakeBackend backend;
  Advertiser advertiser(backend);
  std::vector<PublishEvent> events;

  advertiser.start_advertising("Kitchen", 7000, txt::Record(),
                               [&](const PublishEvent &e) { events.push_back(e); });

  backend.last_publish_sink()(evt::Published{.name = "Kitchen"});
  backend.last_publish_sink()(evt::PublishFailed{.name = "Kitchen", .reason = "collision"});

  ASSERT_EQ(events.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<evt::Published>(events[0]));
  EXPECT_EQ(std::get<evt::PublishFailed>(events[1]).reason, "collision");
}

TEST(AdvertiserTests, NoHandlerCallsAfterStop) {
  test::FakeBackend backend;
  Advertiser advertiser(backend);
  int calls{0};

  advertiser.start_advertising("Kitchen", 7000, txt::Record(), [&](const PublishEvent &) { calls++; });

  auto sink = backend.last_publish_sink();
  advertiser.stop_advertising();

  EXPECT_FALSE(advertiser.advertising());
  EXPECT_EQ(backend.withdraw_count(), 1);

  sink(evt::Published{.name = "Kitchen"});
  EXPECT_EQ(calls, 0);
}

TEST(AdvertiserTests, SupersededPublishIsIgnored) {
  test::FakeBackend backend;
  Advertiser advertiser(backend);
  std::vector<string> names;

  auto handler = [&](const PublishEvent &e) {
    std::visit([&](const auto &v) { names.push_back(v.name); }, e);
  };

  advertiser.start_advertising("First", 7000, txt::Record(), handler);
  auto first_sink = backend.last_publish_sink();

  advertiser.start_advertising("Second", 7000, txt::Record(), handler);

  first_sink(evt::Published{.name = "First"});
  backend.last_publish_sink()(evt::Published{.name = "Second"});

  EXPECT_EQ(names, (std::vector<string>{"Second"}));
}

TEST(AdvertiserTests, StopIsIdempotent) {
  test::FakeBackend backend;

  {
    Advertiser advertiser(backend);

    advertiser.stop_advertising();
    EXPECT_EQ(backend.withdraw_count(), 0);

    advertiser.start_advertising("Kitchen", 7000, txt::Record());
    advertiser.stop_advertising();
    advertiser.stop_advertising();
    EXPECT_EQ(backend.withdraw_count(), 1);
  }

  // destruction after stop does not withdraw again
  EXPECT_EQ(backend.withdraw_count(), 1);
}

TEST(AdvertiserTests, DestructionWithdraws) {
  test::FakeBackend backend;

  {
    Advertiser advertiser(backend);
    advertiser.start_advertising("Kitchen", 7000, txt::Record());
  }

  EXPECT_EQ(backend.withdraw_count(), 1);
}

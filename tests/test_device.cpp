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
#include "mdns/device.hpp"
#include "mdns/dual_resolve.hpp"

#include <gtest/gtest.h>

using namespace aircast;
using namespace aircast::mdns;

TEST(DeviceTests, CreateFromFullRecord) {
  const txt::Record rec{{"codecs", "PCM,ALAC"},
                        {"channels", "1"},
                        {"samplerate", "48000,96000"},
                        {"features", "sync,eq"}};

  auto device = Device::create("Kitchen", test::make_resolution("kitchen.local.", "10.0.0.5", 7001, rec));

  ASSERT_TRUE(device.has_value());
  EXPECT_EQ(device->name, "Kitchen");
  EXPECT_EQ(device->hostname, "kitchen.local.");
  EXPECT_EQ(device->address, "10.0.0.5");
  EXPECT_EQ(device->port, 7001);
  EXPECT_EQ(device->codecs, (txt::Values{"PCM", "ALAC"}));
  EXPECT_EQ(device->channels, 1);
  EXPECT_EQ(device->sample_rates, (std::vector<int>{48000, 96000}));
  EXPECT_EQ(device->features, (txt::Values{"sync", "eq"}));
  EXPECT_TRUE(device->available);
}

TEST(DeviceTests, MissingKeysUseDefaults) {
  auto device = Device::create("Den", test::make_resolution("den.local.", "10.0.0.6", 7000, txt::Record()));

  ASSERT_TRUE(device.has_value());
  EXPECT_EQ(device->codecs, (txt::Values{"AAC"}));
  EXPECT_EQ(device->channels, 2);
  EXPECT_EQ(device->sample_rates, (std::vector<int>{44100}));
  EXPECT_TRUE(device->features.empty());
}

TEST(DeviceTests, MalformedValuesFallBack) {
  const txt::Record rec{{"channels", "stereo"}, {"samplerate", "fast"}};

  auto device = Device::create("Den", test::make_resolution("den.local.", "10.0.0.6", 7000, rec));

  ASSERT_TRUE(device.has_value());
  EXPECT_EQ(device->channels, 2);

  // present but unparseable sample rates leave the list empty
  EXPECT_TRUE(device->sample_rates.empty());
}

TEST(DeviceTests, RequiresHostnameAndAddress) {
  auto res = test::make_resolution("", "10.0.0.7", 7000, txt::Record());
  EXPECT_FALSE(Device::create("NoHost", res).has_value());

  res.hostname = "host.local.";
  res.addresses.clear();
  EXPECT_FALSE(Device::create("NoAddr", res).has_value());
}

TEST(DeviceTests, PrefersIPv4Address) {
  const Addresses addrs{{.family = AddrFamily::IPv6, .text = "fe80::1"},
                        {.family = AddrFamily::IPv4, .text = "192.168.1.20"}};

  EXPECT_EQ(pick_address(addrs), "192.168.1.20");
}

TEST(DeviceTests, FallsBackToIPv6Address) {
  const Addresses addrs{{.family = AddrFamily::IPv6, .text = "fe80::1"}};

  EXPECT_EQ(pick_address(addrs), "fe80::1");
  EXPECT_FALSE(pick_address(Addresses()).has_value());
}

TEST(DeviceTests, EachDeviceHasUniqueId) {
  const auto res = test::make_resolution("a.local.", "10.0.0.8", 7000, txt::Record());

  auto a = Device::create("A", res);
  auto b = Device::create("A", res);

  ASSERT_TRUE(a.has_value() && b.has_value());
  EXPECT_NE(a->id(), b->id());
  EXPECT_EQ(a->id().size(), 36u);
}

//==============================================================================
// Paired IPv4 / IPv6 resolution
//==============================================================================

namespace {

Resolution v6_resolution() {
  auto res = test::make_resolution("dual.local.", "fe80::2", 7000, txt::Record());
  res.addresses.front().family = AddrFamily::IPv6;

  return res;
}

} // namespace

TEST(DualResolveTests, IPv4SettlesImmediately) {
  DualResolve pair;

  auto settled = pair.found("Dual", AddrFamily::IPv4,
                        test::make_resolution("dual.local.", "10.0.0.9", 7000, txt::Record()));

  ASSERT_TRUE(settled.has_value());
  ASSERT_EQ(kind(*settled), EventKind::Resolved);
  EXPECT_EQ(std::get<evt::Resolved>(*settled).resolution.addresses.size(), 1u);
}

TEST(DualResolveTests, IPv6FirstStillPrefersIPv4) {
  DualResolve pair;

  EXPECT_FALSE(pair.found("Dual", AddrFamily::IPv6, v6_resolution()).has_value());

  auto settled = pair.found("Dual", AddrFamily::IPv4,
                        test::make_resolution("dual.local.", "10.0.0.9", 7000, txt::Record()));

  ASSERT_TRUE(settled.has_value());
  const auto &resolved = std::get<evt::Resolved>(*settled);
  EXPECT_EQ(resolved.resolution.addresses.size(), 2u);

  auto device = Device::create(resolved.name, resolved.resolution);
  ASSERT_TRUE(device.has_value());
  EXPECT_EQ(device->address, "10.0.0.9");
}

TEST(DualResolveTests, IPv6UsedOnceIPv4Fails) {
  DualResolve pair;

  EXPECT_FALSE(pair.found("Dual", AddrFamily::IPv6, v6_resolution()).has_value());

  auto settled = pair.failed("Dual", AddrFamily::IPv4, "Timeout reached");

  ASSERT_TRUE(settled.has_value());
  ASSERT_EQ(kind(*settled), EventKind::Resolved);

  auto device = Device::create("Dual", std::get<evt::Resolved>(*settled).resolution);
  ASSERT_TRUE(device.has_value());
  EXPECT_EQ(device->address, "fe80::2");
}

TEST(DualResolveTests, IPv6AfterIPv4FailureSettles) {
  DualResolve pair;

  EXPECT_FALSE(pair.failed("Dual", AddrFamily::IPv4, "Timeout reached").has_value());

  auto settled = pair.found("Dual", AddrFamily::IPv6, v6_resolution());

  ASSERT_TRUE(settled.has_value());
  EXPECT_EQ(kind(*settled), EventKind::Resolved);
}

TEST(DualResolveTests, BothFamiliesFailing) {
  DualResolve pair;

  EXPECT_FALSE(pair.failed("Dual", AddrFamily::IPv6, "Timeout reached").has_value());

  auto settled = pair.failed("Dual", AddrFamily::IPv4, "Not found");

  ASSERT_TRUE(settled.has_value());
  ASSERT_EQ(kind(*settled), EventKind::ResolveFailed);
  EXPECT_EQ(std::get<evt::ResolveFailed>(*settled).reason, "Not found");
}

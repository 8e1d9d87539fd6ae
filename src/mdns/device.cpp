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

#include "mdns/device.hpp"

#include <algorithm>
#include <charconv>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace aircast {
namespace mdns {

static constexpr auto def_codec{"AAC"};
static constexpr int def_channels{2};
static constexpr int def_sample_rate{44100};

std::optional<string> pick_address(const Addresses &addrs) noexcept {
  for (const auto family : {AddrFamily::IPv4, AddrFamily::IPv6}) {
    auto it = std::find_if(addrs.begin(), addrs.end(), [family](const auto &a) {
      return (a.family == family) && !a.text.empty();
    });

    if (it != addrs.end()) return it->text;
  }

  return std::nullopt;
}

std::optional<Device> Device::create(csv name, const Resolution &res) noexcept {
  auto address = pick_address(res.addresses);

  if (res.hostname.empty() || !address.has_value()) return std::nullopt;

  const auto rec = txt::decode(res.txt.span());

  Device device{.name = string(name),
                .hostname = res.hostname,
                .address = std::move(*address),
                .port = res.port,
                .last_seen = system_clock::now()};

  device.codecs = rec.find(txt::key::codecs).value_or(txt::Values());
  if (device.codecs.empty()) device.codecs.emplace_back(def_codec);

  device.channels = def_channels;
  if (auto ch = rec.first(txt::key::channels); ch.has_value()) {
    int val{0};
    const auto *last = ch->data() + ch->size();

    if (auto [ptr, ec] = std::from_chars(ch->data(), last, val);
        (ec == std::errc()) && (ptr == last)) {
      device.channels = val;
    }
  }

  if (auto sr = rec.joined(txt::key::samplerate); sr.has_value()) {
    device.sample_rates = txt::parse_sample_rates(*sr);
  } else {
    device.sample_rates.push_back(def_sample_rate);
  }

  device.features = rec.find(txt::key::features).value_or(txt::Values());

  return device;
}

const string Device::inspect() const noexcept {
  return fmt::format("id={} name='{}' host={} addr={} port={} codecs={} channels={} rates={} "
                     "features={}",
                     id, name, hostname, address, port, fmt::join(codecs, ","), channels,
                     fmt::join(sample_rates, ","), fmt::join(features, ","));
}

} // namespace mdns
} // namespace aircast

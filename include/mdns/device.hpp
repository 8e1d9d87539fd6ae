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

#include "base/dura_t.hpp"
#include "base/types.hpp"
#include "base/uuid.hpp"
#include "mdns/txt.hpp"
#include "mdns/types.hpp"

#include <optional>
#include <vector>

namespace aircast {
namespace mdns {

/// @brief A discovered peer, created when resolution completes
struct Device {
  UUID id;
  string name;
  string hostname;
  string address;
  Port port{0};
  txt::Values codecs;
  int channels{2};
  std::vector<int> sample_rates;
  txt::Values features;
  bool available{true};
  system_clock::time_point last_seen;

  /// @brief Create a Device from a resolution.  Missing capability keys
  ///        fall back to codecs AAC, two channels, 44100 Hz and no features.
  /// @param name announcement name
  /// @param res resolution (hostname, addresses, port, raw capability record)
  /// @return Device or nullopt when the hostname or a usable address is missing
  static std::optional<Device> create(csv name, const Resolution &res) noexcept;

  const string inspect() const noexcept;
};

/// @brief Choose the address to reach a device, IPv4 preferred, IPv6 otherwise
std::optional<string> pick_address(const Addresses &addrs) noexcept;

} // namespace mdns
} // namespace aircast

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

#include "base/types.hpp"

#include <vector>

namespace aircast {

using Hostname = std::string;
using IpAddr = std::string;
using IpAddrs = std::vector<IpAddr>;

class Host {
public:
  Host() noexcept;

  csv hostname() const noexcept { return csv{name.c_str()}; }

  /// @brief IPv4 addresses of the up, non-loopback interfaces
  const IpAddrs &ip_addresses() const noexcept { return ip_addrs; }

private:
  void discover_ip_addrs() noexcept;

public:
  // order dependent
  Hostname name;

  // order independent
  IpAddrs ip_addrs;

public:
  MOD_ID("host");
};

} // namespace aircast

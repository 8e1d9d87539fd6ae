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

#include "base/host.hpp"

#include <arpa/inet.h>
#include <array>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace aircast {

Host::Host() noexcept : name(255, 0x00) {
  discover_ip_addrs();

  if (gethostname(name.data(), name.size()) == 0) {
    name.resize(csv(name.c_str()).size());

    // strip any domain, mdns appends .local itself
    if (auto dot = name.find('.'); dot != string::npos) name.resize(dot);

  } else {
    // gethostname() has failed, fallback to something recognizable
    name.assign("aircast");
  }
}

void Host::discover_ip_addrs() noexcept {
  struct ifaddrs *addrs;

  if (getifaddrs(&addrs) < 0) return;

  for (auto iap = addrs; iap != nullptr; iap = iap->ifa_next) {

    if (iap->ifa_addr                                // an actual address
        && iap->ifa_netmask                          // non-zero netmask
        && (iap->ifa_flags & IFF_UP)                 // iterface is up
        && ((iap->ifa_flags & IFF_LOOPBACK) == 0)    // not loopback
        && (iap->ifa_addr->sa_family == AF_INET)) {  // ipv4 only
      std::array<char, INET_ADDRSTRLEN + 1> buf{0}; // zero the buffer

      auto addr = reinterpret_cast<struct sockaddr_in *>(iap->ifa_addr);
      inet_ntop(AF_INET, &addr->sin_addr, buf.data(), buf.size());

      if (buf[0] != 0x00) ip_addrs.emplace_back(buf.data());
    }
  }

  freeifaddrs(addrs);
}

} // namespace aircast

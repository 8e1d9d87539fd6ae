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

#include "mdns/dual_resolve.hpp"

#include <iterator>

namespace aircast {
namespace mdns {

static constexpr size_t idx(AddrFamily family) noexcept { return static_cast<size_t>(family); }

std::optional<Event> DualResolve::found(csv name, AddrFamily family, Resolution res) noexcept {
  if (family == AddrFamily::IPv4) {
    if (v6.has_value()) {
      std::move(v6->addresses.begin(), v6->addresses.end(), std::back_inserter(res.addresses));
      v6.reset();
    }

    return evt::Resolved{.name = string(name), .resolution = std::move(res)};
  }

  if (failures[idx(AddrFamily::IPv4)]) {
    return evt::Resolved{.name = string(name), .resolution = std::move(res)};
  }

  v6.emplace(std::move(res));
  return std::nullopt;
}

std::optional<Event> DualResolve::failed(csv name, AddrFamily family, string reason) noexcept {
  failures[idx(family)] = true;
  last_reason = std::move(reason);

  if ((family == AddrFamily::IPv4) && v6.has_value()) {
    auto res = std::move(*v6);
    v6.reset();

    return evt::Resolved{.name = string(name), .resolution = std::move(res)};
  }

  if (failures[idx(AddrFamily::IPv4)] && failures[idx(AddrFamily::IPv6)]) {
    return evt::ResolveFailed{.name = string(name), .reason = last_reason};
  }

  return std::nullopt;
}

} // namespace mdns
} // namespace aircast

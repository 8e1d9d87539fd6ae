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
#include "mdns/types.hpp"

#include <array>
#include <optional>

namespace aircast {
namespace mdns {

/// @brief Settles the paired IPv4 and IPv6 resolutions of one announcement.
///        An IPv4 result is reported as soon as it arrives (carrying any
///        IPv6 address already known), an IPv6 result only once IPv4 failed.
class DualResolve {
public:
  /// @brief Record a family that resolved
  /// @return the Resolved event once the pair is settled
  std::optional<Event> found(csv name, AddrFamily family, Resolution res) noexcept;

  /// @brief Record a family that failed (or could not be started)
  /// @return Resolved when the other family already resolved, ResolveFailed
  ///         when both failed, otherwise nullopt
  std::optional<Event> failed(csv name, AddrFamily family, string reason) noexcept;

private:
  std::optional<Resolution> v6;
  std::array<bool, 2> failures{false, false};
  string last_reason;
};

} // namespace mdns
} // namespace aircast

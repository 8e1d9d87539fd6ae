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
#include "base/uint8v.hpp"
#include "mdns/txt.hpp"

#include <cstdint>
#include <functional>
#include <variant>
#include <vector>

namespace aircast {
namespace mdns {

/// @brief The fixed service class (and domain) devices announce themselves under
struct service {
  static constexpr csv type{"_aircast._tcp."};
  static constexpr csv domain{"local."};
  static constexpr Port default_port{7000};
};

/// @brief Where an announcement was seen, opaque outside the backend
///        but required to resolve it
struct Origin {
  int32_t iface{-1};
  int32_t protocol{-1};
  string type;
  string domain;
};

enum class AddrFamily : uint8_t { IPv4 = 0, IPv6 };

struct Address {
  AddrFamily family{AddrFamily::IPv4};
  string text;
};

using Addresses = std::vector<Address>;

/// @brief Result of a successful resolution: network endpoint plus
///        the raw capability record (DNS-SD TXT wire form)
struct Resolution {
  string hostname;
  Addresses addresses;
  Port port{0};
  uint8v txt;
};

namespace evt {
struct Found {
  string name;
  Origin origin;
};

struct Removed {
  string name;
};

struct Resolved {
  string name;
  Resolution resolution;
};

struct ResolveFailed {
  string name;
  string reason;
};

struct ResolveTimedOut {
  string name;
};

struct SearchFailed {
  string reason;
};

struct Published {
  string name;
};

struct PublishFailed {
  string name;
  string reason;
};
} // namespace evt

// note: alternative order must match EventKind
using Event = std::variant<evt::Found, evt::Removed, evt::Resolved, evt::ResolveFailed,
                           evt::ResolveTimedOut, evt::SearchFailed>;

enum class EventKind : uint8_t {
  Found = 0,
  Removed,
  Resolved,
  ResolveFailed,
  ResolveTimedOut,
  SearchFailed
};

inline EventKind kind(const Event &e) noexcept { return static_cast<EventKind>(e.index()); }

csv to_string(EventKind k) noexcept;

using PublishEvent = std::variant<evt::Published, evt::PublishFailed>;

using EventSink = std::function<void(Event)>;
using PublishSink = std::function<void(PublishEvent)>;

/// @brief Everything required to publish this device's announcement
struct Announcement {
  string name;
  string type{service::type};
  string domain{service::domain};
  Port port{service::default_port};
  txt::Record record;
};

} // namespace mdns
} // namespace aircast

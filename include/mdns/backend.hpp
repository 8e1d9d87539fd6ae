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

namespace aircast {
namespace mdns {

/// @brief Abstract local network announcement namespace.
///
///        Browse, resolve and publish results are delivered asynchronously
///        through the supplied sinks, possibly from a backend owned thread.
///        browse_stop() and withdraw() are synchronous: once they return no
///        sink invocation is in progress for the stopped activity.
class Backend {
public:
  virtual ~Backend() = default;

  /// @brief Begin browsing for announcements of a service type,
  ///        replaces any active browse
  /// @param type service type (e.g. _aircast._tcp.)
  /// @param domain browse domain (e.g. local.)
  /// @param sink receives Found, Removed, Resolved, ResolveFailed and
  ///        SearchFailed events
  virtual void browse(csv type, csv domain, EventSink sink) noexcept = 0;

  /// @brief Stop browsing, cancels all in flight resolutions
  virtual void browse_stop() noexcept = 0;

  /// @brief Resolve a found announcement, the outcome is delivered to
  ///        the browse sink as Resolved or ResolveFailed
  virtual void resolve(const evt::Found &found) noexcept = 0;

  /// @brief Abandon the in flight resolution of an announcement
  virtual void resolve_cancel(csv name) noexcept = 0;

  /// @brief Publish an announcement, replaces any active announcement
  virtual void publish(const Announcement &ann, PublishSink sink) noexcept = 0;

  /// @brief Withdraw the active announcement (no-op when none)
  virtual void withdraw() noexcept = 0;
};

} // namespace mdns
} // namespace aircast

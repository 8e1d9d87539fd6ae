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
#include "mdns/backend.hpp"
#include "mdns/txt.hpp"
#include "mdns/types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>

namespace aircast {
namespace mdns {

/// @brief Publishes (and withdraws) this device's announcement under the
///        service class, carrying its capability record
class Advertiser {
public:
  using Handler = std::function<void(const PublishEvent &)>;

public:
  Advertiser(Backend &backend) noexcept : backend(backend) {}
  ~Advertiser() noexcept { stop_advertising(); }

  Advertiser(const Advertiser &) = delete;
  Advertiser &operator=(const Advertiser &) = delete;

  /// @brief Publish an announcement, an active announcement is withdrawn first.
  ///        txtvers=1 is added to the capability record when absent.
  /// @param name announcement (device) name
  /// @param port audio data port
  /// @param record capability record (copied)
  /// @param handler receives Published or PublishFailed, never after
  ///        stop_advertising() returns
  void start_advertising(csv name, Port port, txt::Record record,
                         Handler handler = Handler()) noexcept;

  /// @brief Withdraw the announcement, no-op when not advertising
  void stop_advertising() noexcept;

  bool advertising() const noexcept {
    std::lock_guard lck(mtx);
    return active;
  }

  /// @brief The capability record most recently published
  txt::Record record() const noexcept {
    std::lock_guard lck(mtx);
    return last_record;
  }

private:
  // order dependent
  Backend &backend;

  // order independent
  mutable std::mutex mtx;
  uint64_t generation{0};
  bool active{false};
  txt::Record last_record;

public:
  MOD_ID("mdns.advertiser");
};

} // namespace mdns
} // namespace aircast

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

#include "mdns/advertiser.hpp"
#include "base/logger.hpp"

namespace aircast {
namespace mdns {

void Advertiser::start_advertising(csv name, Port port, txt::Record record,
                                   Handler handler) noexcept {
  INFO_AUTO_CAT("start");

  stop_advertising();

  record.set_default(txt::key::txtvers, "1");

  Announcement ann{.name = string(name), .port = port, .record = std::move(record)};

  uint64_t gen{0};

  {
    std::lock_guard lck(mtx);

    gen = ++generation;
    active = true;
    last_record = ann.record;
  }

  INFO_AUTO("name={} port={} txt={}", ann.name, ann.port, ann.record.inspect());

  backend.publish(ann, [this, gen, handler = std::move(handler)](PublishEvent e) {
    INFO_AUTO_CAT("publish");

    {
      std::lock_guard lck(mtx);
      if (gen != generation) return;
    }

    std::visit(overloaded{[&](const evt::Published &v) { INFO_AUTO("published {}", v.name); },
                          [&](const evt::PublishFailed &v) {
                            INFO_AUTO("failed {} reason={}", v.name, v.reason);
                          }},
               e);

    if (handler) handler(e);
  });
}

void Advertiser::stop_advertising() noexcept {
  INFO_AUTO_CAT("stop");

  {
    std::lock_guard lck(mtx);

    if (!active) return;

    ++generation;
    active = false;
  }

  // synchronous, an in progress publish callback completes before this returns
  backend.withdraw();

  INFO_AUTO("withdrawn");
}

} // namespace mdns
} // namespace aircast

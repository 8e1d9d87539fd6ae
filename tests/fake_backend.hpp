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

#include "mdns/backend.hpp"
#include "mdns/types.hpp"

#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace aircast {
namespace test {

// Records every call made by the browser or advertiser and hands events
// back through the captured sinks on the calling (test) thread.
class FakeBackend : public mdns::Backend {
public:
  void browse(csv type, csv domain, mdns::EventSink sink) noexcept override {
    std::lock_guard lck(mtx);

    browse_calls.emplace_back(string(type), string(domain));
    browse_sink = std::move(sink);
  }

  void browse_stop() noexcept override {
    std::lock_guard lck(mtx);

    browse_stops++;
    browse_sink = nullptr;
  }

  void resolve(const mdns::evt::Found &found) noexcept override {
    std::lock_guard lck(mtx);
    resolves.push_back(found.name);
  }

  void resolve_cancel(csv name) noexcept override {
    std::lock_guard lck(mtx);
    cancels.emplace_back(name);
  }

  void publish(const mdns::Announcement &ann, mdns::PublishSink sink) noexcept override {
    std::lock_guard lck(mtx);

    announcements.push_back(ann);
    publish_sink = std::move(sink);
  }

  void withdraw() noexcept override {
    std::lock_guard lck(mtx);
    withdraws++;
  }

  // delivery helpers

  mdns::EventSink sink() {
    std::lock_guard lck(mtx);
    return browse_sink;
  }

  void emit(mdns::Event e) {
    if (auto s = sink(); s) s(std::move(e));
  }

  void found(csv name) {
    emit(mdns::evt::Found{.name = string(name), .origin = mdns::Origin{}});
  }

  void resolved(csv name, const mdns::Resolution &res) {
    emit(mdns::evt::Resolved{.name = string(name), .resolution = res});
  }

  void removed(csv name) { emit(mdns::evt::Removed{.name = string(name)}); }

  mdns::PublishSink last_publish_sink() {
    std::lock_guard lck(mtx);
    return publish_sink;
  }

  // observations

  size_t browse_count() {
    std::lock_guard lck(mtx);
    return browse_calls.size();
  }

  std::pair<string, string> last_browse() {
    std::lock_guard lck(mtx);
    return browse_calls.back();
  }

  int browse_stop_count() {
    std::lock_guard lck(mtx);
    return browse_stops;
  }

  std::vector<string> resolve_names() {
    std::lock_guard lck(mtx);
    return resolves;
  }

  std::vector<string> cancel_names() {
    std::lock_guard lck(mtx);
    return cancels;
  }

  std::vector<mdns::Announcement> published() {
    std::lock_guard lck(mtx);
    return announcements;
  }

  int withdraw_count() {
    std::lock_guard lck(mtx);
    return withdraws;
  }

private:
  std::mutex mtx;

  std::vector<std::pair<string, string>> browse_calls;
  mdns::EventSink browse_sink;
  int browse_stops{0};
  std::vector<string> resolves;
  std::vector<string> cancels;

  std::vector<mdns::Announcement> announcements;
  mdns::PublishSink publish_sink;
  int withdraws{0};
};

inline mdns::Resolution make_resolution(csv host, csv addr, Port port, const mdns::txt::Record &rec) {
  mdns::Resolution res;

  res.hostname = string(host);
  res.addresses.push_back(mdns::Address{.family = mdns::AddrFamily::IPv4, .text = string(addr)});
  res.port = port;
  res.txt = mdns::txt::encode(rec);

  return res;
}

} // namespace test
} // namespace aircast

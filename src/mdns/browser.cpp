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

#include "mdns/browser.hpp"
#include "base/logger.hpp"

#include <algorithm>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <pthread.h>

namespace aircast {
namespace mdns {

Browser::Browser(Backend &backend, Handlers handlers, Millis resolve_timeout) noexcept
    : backend(backend),                       //
      handlers(std::move(handlers)),          //
      resolve_timeout(resolve_timeout),       //
      local_strand(asio::make_strand(io_ctx)), //
      guard(asio::make_work_guard(io_ctx))    //
{
  thread = std::jthread([this]() {
    pthread_setname_np(pthread_self(), thread_name.data());

    io_ctx.run();
  });

  INFO_INIT("sizeof={:>5} resolve_timeout={}", sizeof(Browser), resolve_timeout);
}

Browser::~Browser() noexcept {
  stop_scanning();

  guard.reset();
  io_ctx.stop();

  if (thread.joinable()) thread.join();
}

void Browser::start_scanning() noexcept {
  run_sync([this]() {
    if (state == Scanning) stop_now();

    start_now();
  });
}

void Browser::stop_scanning() noexcept {
  run_sync([this]() {
    if (state == Scanning) stop_now();
  });
}

void Browser::refresh() noexcept {
  INFO_AUTO_CAT("refresh");

  run_sync([this]() {
    INFO_AUTO("forgetting {} devices", std::ssize(discovered));

    discovered.clear();

    if (state == Scanning) stop_now();
    start_now();
  });
}

Browser::Devices Browser::devices() noexcept {
  return run_sync([this]() { return discovered; });
}

std::optional<Device> Browser::find(csv name) noexcept {
  return run_sync([this, name]() -> std::optional<Device> {
    auto it = std::find_if(discovered.begin(), discovered.end(),
                           [name](const auto &d) { return d.name == name; });

    if (it != discovered.end()) return *it;

    return std::nullopt;
  });
}

bool Browser::scanning() noexcept {
  return run_sync([this]() { return state == Scanning; });
}

std::vector<string> Browser::resolving() noexcept {
  return run_sync([this]() {
    std::vector<string> names;

    for (const auto &[name, _] : inflight) {
      names.push_back(name);
    }

    return names;
  });
}

void Browser::start_now() noexcept {
  INFO_AUTO_CAT("start");

  const auto gen = ++generation;
  state = Scanning;

  INFO_AUTO("generation={} type={} domain={}", gen, service::type, service::domain);

  // the sink may be invoked from a backend thread, hop onto the strand
  backend.browse(service::type, service::domain, [this, gen](Event e) {
    asio::post(local_strand, [this, gen, e = std::move(e)]() mutable { handle(gen, std::move(e)); });
  });
}

void Browser::stop_now() noexcept {
  INFO_AUTO_CAT("stop");

  ++generation;
  state = Idle;

  // synchronous, once it returns the backend will not invoke the old sink
  backend.browse_stop();

  INFO_AUTO("abandoned {} resolutions", std::ssize(inflight));

  // destroying the timers cancels them
  inflight.clear();
}

void Browser::handle(uint64_t gen, Event &&e) noexcept {
  INFO_AUTO_CAT("event");

  if (gen != generation) {
    INFO_AUTO("discarding stale {} (generation {} != {})", to_string(kind(e)), gen, generation);
    return;
  }

  std::visit(overloaded{[this](evt::Found &v) { on_found(std::move(v)); },
                        [this](evt::Removed &v) { on_removed(std::move(v)); },
                        [this](evt::Resolved &v) { on_resolved(std::move(v)); },
                        [this](evt::ResolveFailed &v) { on_resolve_failed(std::move(v)); },
                        [this](evt::ResolveTimedOut &v) { on_resolve_timed_out(std::move(v)); },
                        [this](evt::SearchFailed &v) { on_search_failed(std::move(v)); }},
             e);
}

bool Browser::inflight_erase(csv name) noexcept {
  if (auto it = inflight.find(name); it != inflight.end()) {
    inflight.erase(it);
    return true;
  }

  return false;
}

void Browser::on_found(evt::Found &&e) noexcept {
  INFO_AUTO_CAT("found");

  if (inflight.contains(e.name)) {
    INFO_AUTO("already resolving {}", e.name);
    return;
  }

  const auto s = ++serial;
  const auto gen = generation;

  auto timer = std::make_unique<steady_timer>(local_strand, resolve_timeout);

  timer->async_wait(
      asio::bind_executor(local_strand, [this, gen, s, name = e.name](const error_code &ec) {
        if (ec) return;

        // a newer resolution of the same name owns its own timer
        if (auto it = inflight.find(name); (it != inflight.end()) && (it->second.serial == s)) {
          handle(gen, evt::ResolveTimedOut{.name = name});
        }
      }));

  inflight.emplace(e.name, Inflight{.serial = s, .timer = std::move(timer)});

  INFO_AUTO("resolving {}", e.name);

  backend.resolve(e);
}

void Browser::on_removed(evt::Removed &&e) noexcept {
  INFO_AUTO_CAT("removed");

  if (inflight_erase(e.name)) backend.resolve_cancel(e.name);

  const auto erased = std::erase_if(discovered, [&](const auto &d) { return d.name == e.name; });

  INFO_AUTO("{} {}", e.name, erased ? "forgotten" : "was not known");

  if (erased && handlers.removed) handlers.removed(e.name);
}

void Browser::on_resolved(evt::Resolved &&e) noexcept {
  INFO_AUTO_CAT("resolved");

  if (!inflight_erase(e.name)) {
    INFO_AUTO("{} not resolving, ignoring", e.name);
    return;
  }

  auto device = Device::create(e.name, e.resolution);

  if (!device.has_value()) {
    INFO_AUTO("{} has no hostname or address", e.name);
    return;
  }

  const auto known = std::any_of(discovered.begin(), discovered.end(),
                                 [&](const auto &d) { return d.name == e.name; });

  if (known) {
    INFO_AUTO("already know {}", e.name);
    return;
  }

  INFO_AUTO("{}", device->inspect());

  discovered.emplace_back(std::move(*device));

  if (handlers.added) handlers.added(discovered.back());
}

void Browser::on_resolve_failed(evt::ResolveFailed &&e) noexcept {
  INFO_AUTO_CAT("resolve_failed");

  inflight_erase(e.name);

  INFO_AUTO("{} reason={}", e.name, e.reason);
}

void Browser::on_resolve_timed_out(evt::ResolveTimedOut &&e) noexcept {
  INFO_AUTO_CAT("resolve_timeout");

  if (inflight_erase(e.name)) backend.resolve_cancel(e.name);

  INFO_AUTO("{} after {}", e.name, resolve_timeout);
}

void Browser::on_search_failed(evt::SearchFailed &&e) noexcept {
  INFO_AUTO_CAT("search_failed");

  INFO_AUTO("reason={}", e.reason);

  stop_now();

  if (handlers.search_failed) handlers.search_failed(e.reason);
}

} // namespace mdns
} // namespace aircast

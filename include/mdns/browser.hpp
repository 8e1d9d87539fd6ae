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

#include "base/asio.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"
#include "mdns/backend.hpp"
#include "mdns/device.hpp"
#include "mdns/types.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace aircast {
namespace mdns {

/// @brief Discovers peers announcing the service class and turns them into
///        Devices.
///
///        Scanning:  Idle -> Scanning -> Idle
///        Per name:  Found -> Resolving -> {Resolved, Failed, TimedOut}
///
///        All state lives on a private strand.  Backend events are tagged with
///        the scan generation that requested them and discarded when stale.
///        Public member functions are synchronous from the caller's view.
class Browser {
public:
  using Devices = std::vector<Device>;

  enum State : uint8_t { Idle = 0, Scanning };

  /// @brief Optional observers, invoked on the browser strand
  struct Handlers {
    std::function<void(const Device &)> added;
    std::function<void(const string &name)> removed;
    std::function<void(const string &reason)> search_failed;
  };

  static constexpr Millis def_resolve_timeout{5000};

public:
  Browser(Backend &backend, Handlers handlers = Handlers(),
          Millis resolve_timeout = def_resolve_timeout) noexcept;
  ~Browser() noexcept;

  Browser(const Browser &) = delete;
  Browser &operator=(const Browser &) = delete;

  /// @brief Begin (or restart) browsing, discovered devices are kept
  void start_scanning() noexcept;

  /// @brief Stop browsing and abandon in flight resolutions,
  ///        discovered devices are kept.  No-op when idle.
  void stop_scanning() noexcept;

  /// @brief Forget discovered devices and restart browsing
  void refresh() noexcept;

  /// @brief Snapshot of discovered devices in discovery order
  Devices devices() noexcept;

  std::optional<Device> find(csv name) noexcept;

  bool scanning() noexcept;

  /// @brief Names with a resolution in flight
  std::vector<string> resolving() noexcept;

  /// @brief Wait until events already delivered to the browser are handled
  void drain() noexcept {
    run_sync([]() {});
  }

private:
  void handle(uint64_t gen, Event &&e) noexcept;

  void on_found(evt::Found &&e) noexcept;
  void on_removed(evt::Removed &&e) noexcept;
  void on_resolved(evt::Resolved &&e) noexcept;
  void on_resolve_failed(evt::ResolveFailed &&e) noexcept;
  void on_resolve_timed_out(evt::ResolveTimedOut &&e) noexcept;
  void on_search_failed(evt::SearchFailed &&e) noexcept;

  /// @brief Clear in flight tracking for a name
  /// @return true when the name was being resolved
  bool inflight_erase(csv name) noexcept;

  // strand only
  void start_now() noexcept;
  void stop_now() noexcept;

  /// @brief Run f on the strand and wait for the result (inline when
  ///        already on the strand)
  template <typename F> auto run_sync(F &&f) noexcept -> std::invoke_result_t<F> {
    using R = std::invoke_result_t<F>;

    if (local_strand.running_in_this_thread()) return f();

    std::packaged_task<R()> task(std::forward<F>(f));
    auto fut = task.get_future();

    asio::post(local_strand, [&task]() { task(); });

    return fut.get();
  }

private:
  struct Inflight {
    uint64_t serial;
    std::unique_ptr<steady_timer> timer;
  };

  // order dependent
  Backend &backend;
  Handlers handlers;
  const Millis resolve_timeout;
  asio::io_context io_ctx;
  strand_ioc local_strand;
  work_guard_ioc guard;
  std::jthread thread;

  // order independent (strand only)
  State state{Idle};
  uint64_t generation{0};
  uint64_t serial{0};
  Devices discovered;
  std::map<string, Inflight, std::less<>> inflight;

public:
  MOD_ID("mdns.browser");
  static constexpr csv thread_name{"aircast_browse"};
};

} // namespace mdns
} // namespace aircast

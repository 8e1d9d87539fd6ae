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
#include "base/types.hpp"
#include "mdns/advertiser.hpp"
#include "mdns/browser.hpp"
#include "mdns/mdns_ctx.hpp"
#include "stream/receiver.hpp"
#include "stream/sender.hpp"

#include <boost/asio/signal_set.hpp>
#include <boost/asio/system_timer.hpp>
#include <memory>
#include <stop_token>
#include <thread>

namespace aircast {

/// @brief AirCast Application Object
class App {
public:
  /// @brief Construct the App object.
  ///        CLI arguments and the configuration file have already been
  ///        handled and the application is on the cusp of starting.
  App() noexcept;

  /// @brief Similar to 'C' main.  Starts the subsystems for the requested
  ///        mode and runs io_ctx.  Returns when io work is exhausted
  ///        (primarily by a shutdown request).
  /// @return exit code
  int main();

private:
  /// @brief Advertise this host and receive audio
  bool start_receiver() noexcept;

  /// @brief Browse for a receiver and stream a test tone to the first found
  bool start_sender() noexcept;

  /// @brief Browse and log devices as they come and go
  bool start_browse() noexcept;

  /// @brief Starts a timer to periodically watch for a stop request
  /// @param stoken stop_token returned by thread that runs io_ctx
  void stop_request_watcher(std::stop_token stoken) noexcept;

private:
  // order dependent
  asio::io_context io_ctx;
  asio::signal_set ss_shutdown;

  // order independent
  std::unique_ptr<mdns::Ctx> ctx;
  std::unique_ptr<mdns::Advertiser> advertiser;
  std::unique_ptr<mdns::Browser> browser;
  std::unique_ptr<stream::Receiver> receiver;
  std::shared_ptr<stream::Sender> sender;
  string target; // device the sender streams to (io_ctx only)
  std::jthread thread;

public:
  MOD_ID("app");
};

} // namespace aircast

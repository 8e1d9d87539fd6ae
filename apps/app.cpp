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

#include "app.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/master.hpp"
#include "base/conf/token.hpp"
#include "base/host.hpp"
#include "base/logger.hpp"
#include "base/types.hpp"
#include "mdns/device.hpp"
#include "mdns/txt.hpp"

#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fmt/ranges.h>
#include <pthread.h>
#include <variant>

namespace aircast {

using system_error = boost::system::system_error;

App::App() noexcept : ss_shutdown(io_ctx, SIGINT, SIGTERM) {

  // set up our shutdown signal handler
  ss_shutdown.async_wait([this](const error_code &ec, int sig) {
    INFO_AUTO_CAT("ss_shutdown");

    if (ec) return;

    INFO_AUTO("caught signal({}), requesting stop...", sig);

    thread.request_stop();
  });
}

int App::main() {
  INFO_AUTO_CAT("main");

  Logger::create(io_ctx);

  INFO_AUTO("{} {} mode={}", conf::fixed::app_name(), conf::fixed::version(), conf::fixed::mode());
  _logger->info(conf::master::module_id, "init", conf::mptr->get_msg(conf::master::InitMsg));

  // mDNS uses AvahiThreadedPoll (spawns a thread)
  ctx = std::make_unique<mdns::Ctx>();

  if (!ctx->error().empty()) {
    Logger::synchronous();
    INFO_AUTO("mdns unavailable: {}", ctx->error());

    ctx.reset();
    Logger::shutdown();
    return 1;
  }

  const auto mode = conf::fixed::mode();

  bool started{false};

  if (mode == "receiver"sv) {
    started = start_receiver();
  } else if (mode == "sender"sv) {
    started = start_sender();
  } else {
    started = start_browse();
  }

  if (started) {
    thread = std::jthread([this](std::stop_token stoken) mutable {
      INFO_INIT("sizeof={:>5} mode={}", sizeof(App), conf::fixed::mode());

      constexpr auto tname{"aircast_app"};
      auto tid = pthread_self();
      if (auto rc = pthread_setname_np(tid, tname); rc != 0) {
        INFO_AUTO("failed to set thread name: {}", std::strerror(errno));
      }

      stop_request_watcher(std::move(stoken));

      io_ctx.run();
    });

    if (thread.joinable()) thread.join();

    INFO_AUTO("primary io_ctx has finished all work");
  }

  // order dependent: discovery stops delivering before the consumers go away
  browser.reset();
  advertiser.reset();
  if (sender) sender->stop();
  sender.reset();
  receiver.reset();
  ctx.reset();

  Logger::shutdown();

  return started ? 0 : 1;
}

bool App::start_receiver() noexcept {
  INFO_AUTO_CAT("receiver");

  const conf::token tokc_rcv("stream.receiver");
  const conf::token tokc_txt("mdns.advertiser.txt");

  const auto port = conf::fixed::port();

  try {
    // port may already be in use
    receiver = std::make_unique<stream::Receiver>(io_ctx, port, tokc_rcv.val<int>("report_every", 50));

  } catch (const system_error &e) {
    Logger::synchronous();
    INFO_AUTO("port={} {}", port, e.what());

    return false;
  }

  receiver->start();

  const Host host;

  auto name = conf::fixed::name();
  if (name.empty()) name = string(host.hostname());

  INFO_AUTO("name={} port={} addrs={}", name, receiver->port(), fmt::join(host.ip_addresses(), ","));

  mdns::txt::Record rec{
      {mdns::txt::key::codecs, tokc_txt.val<string>("codecs", "AAC,PCM")},
      {mdns::txt::key::channels, tokc_txt.val<string>("channels", "2")},
      {mdns::txt::key::samplerate, tokc_txt.val<string>("samplerate", "44100,48000")},
      {mdns::txt::key::features, tokc_txt.val<string>("features", "sync,eq")},
  };

  advertiser = std::make_unique<mdns::Advertiser>(*ctx);
  advertiser->start_advertising(name, receiver->port(), std::move(rec),
                                [](const mdns::PublishEvent &pe) {
                                  INFO_AUTO_CAT("published");

                                  std::visit(overloaded{
                                                 [](const mdns::evt::Published &e) {
                                                   INFO_AUTO("{} is visible", e.name);
                                                 },
                                                 [](const mdns::evt::PublishFailed &e) {
                                                   INFO_AUTO("{} failed: {}", e.name, e.reason);
                                                 },
                                             },
                                             pe);
                                });

  return true;
}

bool App::start_sender() noexcept {
  INFO_AUTO_CAT("sender");

  const conf::token tokc_browse("mdns.browser");
  const auto opts = stream::Sender::Opts::load(conf::token("stream.sender"));

  mdns::Browser::Handlers handlers;

  // handlers run on the browser strand, the sender lives on io_ctx
  handlers.added = [this, opts](const mdns::Device &device) {
    asio::post(io_ctx, [this, opts, device]() {
      INFO_AUTO_CAT("added");

      if (sender) return;

      sender = stream::Sender::create(io_ctx, device, opts);

      if (auto ec = sender->start(); ec) {
        INFO_AUTO("{} start failed: {}", device.name, ec.message());
        sender.reset();
        return;
      }

      target = device.name;
    });
  };

  handlers.removed = [this](const string &name) {
    asio::post(io_ctx, [this, name]() {
      INFO_AUTO_CAT("removed");

      if (!sender || (name != target)) return;

      INFO_AUTO("{} went away, packets_sent={}", name, sender->packets_sent());

      sender->stop();
      sender.reset();
      target.clear();

      // another device may already be known
      if (auto devs = browser->devices(); !devs.empty()) {
        INFO_AUTO("{} devices remain, refreshing", devs.size());
        browser->refresh();
      }
    });
  };

  handlers.search_failed = [](const string &reason) {
    INFO_AUTO_CAT("search_failed");
    INFO_AUTO("{}", reason);
  };

  browser = std::make_unique<mdns::Browser>(
      *ctx, std::move(handlers),
      tokc_browse.val<Millis>("resolve_timeout_ms", mdns::Browser::def_resolve_timeout));

  browser->start_scanning();

  return true;
}

bool App::start_browse() noexcept {
  const conf::token tokc_browse("mdns.browser");

  mdns::Browser::Handlers handlers;

  handlers.added = [](const mdns::Device &device) {
    INFO_AUTO_CAT("added");
    INFO_AUTO("{}", device.inspect());
  };

  handlers.removed = [](const string &name) {
    INFO_AUTO_CAT("removed");
    INFO_AUTO("{}", name);
  };

  handlers.search_failed = [](const string &reason) {
    INFO_AUTO_CAT("search_failed");
    INFO_AUTO("{}", reason);
  };

  browser = std::make_unique<mdns::Browser>(
      *ctx, std::move(handlers),
      tokc_browse.val<Millis>("resolve_timeout_ms", mdns::Browser::def_resolve_timeout));

  browser->start_scanning();

  return true;
}

void App::stop_request_watcher(std::stop_token stoken) noexcept {

  auto sr_timer = std::make_unique<asio::system_timer>(io_ctx, 1s);

  sr_timer->expires_after(250ms);
  sr_timer->async_wait([this, stoken = std::move(stoken),
                        sr_timer = std::move(sr_timer)](const error_code &ec) mutable {
    if (ec) return;

    if (stoken.stop_requested()) {
      asio::post(io_ctx, [this]() {
        INFO("stop_request", "detected");

        // the sender and receiver close their sockets, the advertisement is
        // withdrawn, remaining io work is then exhausted
        if (sender) sender->stop();
        if (receiver) receiver->stop();
        if (advertiser) advertiser->stop_advertising();
        if (browser) browser->stop_scanning();

        ss_shutdown.cancel();
        io_ctx.stop();
      });
    } else {
      stop_request_watcher(std::move(stoken));
    }
  });
}

} // namespace aircast

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
#include "mdns/dual_resolve.hpp"
#include "mdns/types.hpp"

#include <array>
#include <atomic>
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-client/publish.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>
#include <avahi-common/thread-watch.h>
#include <map>
#include <optional>
#include <type_traits>

namespace aircast {
namespace mdns {

/// @brief Backend implemented with avahi-client and an AvahiThreadedPoll.
///
///        All avahi callbacks run on the poll thread with the poll lock held,
///        public member functions take the poll lock.  Browse and publish
///        requests made before the client reaches RUNNING are held and
///        started once it does.
class Ctx : public Backend {
public:
  Ctx() noexcept;
  ~Ctx() noexcept override;

  Ctx(const Ctx &) = delete;
  Ctx &operator=(const Ctx &) = delete;

  /// @brief Error encountered during construction (empty when none)
  const string &error() const noexcept { return err_msg; }

  void browse(csv type, csv domain, EventSink sink) noexcept override;
  void browse_stop() noexcept override;
  void resolve(const evt::Found &found) noexcept override;
  void resolve_cancel(csv name) noexcept override;
  void publish(const Announcement &ann, PublishSink sink) noexcept override;
  void withdraw() noexcept override;

private:
  struct browse_req {
    string type;
    string domain;
    EventSink sink;
  };

  // one resolver per address family, indexed by AddrFamily
  struct resolve_req {
    std::array<AvahiServiceResolver *, 2> r{nullptr, nullptr};
    DualResolve pair;
  };

  // the following require the poll lock
  void browse_start() noexcept;
  void browse_free() noexcept;
  static void resolve_free(resolve_req &req) noexcept;
  void publish_commit() noexcept;
  void publish_failed(const string reason) noexcept;

  // avahi callbacks
  static void cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                        AvahiBrowserEvent event, ccs name, ccs type, ccs domain,
                        AvahiLookupResultFlags flags, void *d);
  static void cb_client(AvahiClient *client, AvahiClientState state, void *d);
  static void cb_entry_group(AvahiEntryGroup *group, AvahiEntryGroupState state, void *d);
  static void cb_resolve(AvahiServiceResolver *r, AvahiIfIndex iface, AvahiProtocol protocol,
                         AvahiResolverEvent event, ccs name, ccs type, ccs domain, ccs host_name,
                         const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                         AvahiLookupResultFlags flags, void *d);

  template <typename T> string error_string(T t) const noexcept {
    using U = std::remove_pointer<T>::type;

    if constexpr (std::is_same_v<U, AvahiClient>) {
      return string(avahi_strerror(avahi_client_errno(t)));
    } else if constexpr (std::is_same_v<U, AvahiServiceBrowser>) {
      return error_string(avahi_service_browser_get_client(t));
    } else if constexpr (std::is_same_v<U, AvahiServiceResolver>) {
      return error_string(avahi_service_resolver_get_client(t));
    } else if constexpr (std::is_same_v<U, AvahiEntryGroup>) {
      return error_string(avahi_entry_group_get_client(t));
    } else {
      static_assert(AlwaysFalse<U>, "unhandled Avahi type");
    }
  }

  void lock() noexcept;
  void unlock() noexcept;

private:
  // order dependent
  std::atomic_bool client_running;
  AvahiThreadedPoll *tpoll{nullptr};
  AvahiClient *client{nullptr};

  // order independent
  string err_msg;

  // browse and resolve (poll lock)
  std::optional<browse_req> browse_active;
  AvahiServiceBrowser *browser{nullptr};
  std::map<string, resolve_req, std::less<>> resolvers;

  // publish (poll lock)
  std::optional<Announcement> announcement;
  PublishSink publish_sink;
  AvahiEntryGroup *entry_group{nullptr};

public:
  MOD_ID("mdns.ctx");
  static constexpr csv thread_name{"aircast_mdns"};
};

} // namespace mdns
} // namespace aircast

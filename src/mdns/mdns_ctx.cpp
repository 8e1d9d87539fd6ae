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

#include "mdns/mdns_ctx.hpp"
#include "base/logger.hpp"
#include "mdns/txt.hpp"

#include <array>
#include <avahi-common/address.h>
#include <pthread.h>

namespace aircast {
namespace mdns {

namespace {

// true while the current thread is executing an avahi callback, the poll
// lock is already held (and must not be taken again)
thread_local bool in_callback{false};

struct callback_scope {
  callback_scope() noexcept { in_callback = true; }
  ~callback_scope() noexcept { in_callback = false; }
};

// avahi wants names without the trailing dot
string avahi_name(csv n) noexcept {
  return string(n.ends_with('.') ? n.substr(0, n.size() - 1) : n);
}

} // namespace

Ctx::Ctx() noexcept : client_running{false} {
  INFO_AUTO_CAT("init");

  tpoll = avahi_threaded_poll_new();

  if (tpoll == nullptr) {
    err_msg.assign("failed to allocate threaded_poll");
    return;
  }

  auto poll = avahi_threaded_poll_get(tpoll);
  int err{0};

  // notes:
  //  1. the client pointer is also captured by cb_client() since the callback
  //     may fire before avahi_client_new() returns
  //  2. AVAHI_CLIENT_NO_FAIL ensures the client is created even if the
  //     daemon is unavailable (it connects once the daemon appears)
  client = avahi_client_new(poll, AVAHI_CLIENT_NO_FAIL, Ctx::cb_client, this, &err);

  if (client == nullptr) {
    err_msg = fmt::format("failed to allocate client: {}", avahi_strerror(err));
    return;
  }

  if (err = avahi_threaded_poll_start(tpoll); err < 0) {
    err_msg.assign(avahi_strerror(err));
    return;
  }

  INFO_AUTO("sizeof={:>5} tpoll={}", sizeof(Ctx), fmt::ptr(tpoll));
}

Ctx::~Ctx() noexcept {
  INFO_AUTO_CAT("shutdown");

  if (tpoll != nullptr) {
    lock();
    browse_free();

    if (entry_group) {
      avahi_entry_group_free(entry_group);
      entry_group = nullptr;
    }

    announcement.reset();
    publish_sink = nullptr;
    client_running = false;
    unlock();

    avahi_threaded_poll_stop(tpoll);
  }

  if (client) avahi_client_free(client);
  if (tpoll) avahi_threaded_poll_free(tpoll);

  INFO_AUTO("complete");
}

void Ctx::lock() noexcept {
  if (!in_callback && tpoll) avahi_threaded_poll_lock(tpoll);
}

void Ctx::unlock() noexcept {
  if (!in_callback && tpoll) avahi_threaded_poll_unlock(tpoll);
}

void Ctx::browse(csv type, csv domain, EventSink sink) noexcept {
  lock();

  browse_free();
  browse_active.emplace(browse_req{string(type), string(domain), std::move(sink)});

  if (client_running) browse_start();

  unlock();
}

void Ctx::browse_free() noexcept {
  for (auto &[name, req] : resolvers) {
    resolve_free(req);
  }

  resolvers.clear();

  if (browser) {
    avahi_service_browser_free(browser);
    browser = nullptr;
  }

  browse_active.reset();
}

void Ctx::browse_start() noexcept {
  INFO_AUTO_CAT("browse");

  if (!browse_active.has_value() || browser) return;

  const auto stype = avahi_name(browse_active->type);
  const auto domain = avahi_name(browse_active->domain);

  browser = avahi_service_browser_new(client,              // client
                                      AVAHI_IF_UNSPEC,     // network interface
                                      AVAHI_PROTO_UNSPEC,  // any protocol
                                      stype.c_str(),       // service type
                                      domain.c_str(),      // domain
                                      (AvahiLookupFlags)0, // lookup flags
                                      Ctx::cb_browse,      // callback
                                      this);               // userdata

  if (browser == nullptr) {
    const auto reason = error_string(client);
    INFO_AUTO("create failed {} reason={}", stype, reason);

    browse_active->sink(evt::SearchFailed{.reason = reason});
  } else {
    INFO_AUTO("initiated browse for {} in {}", stype, domain);
  }
}

void Ctx::browse_stop() noexcept {
  lock();
  browse_free();
  unlock();
}

void Ctx::resolve(const evt::Found &found) noexcept {
  INFO_AUTO_CAT("resolve");

  lock();

  if (browse_active.has_value() && client_running) {
    if (auto it = resolvers.find(found.name); it != resolvers.end()) {
      resolve_free(it->second);
      resolvers.erase(it);
    }

    resolve_req req;
    std::optional<Event> settled;

    // both families are resolved so IPv4 can be preferred
    for (const auto family : {AddrFamily::IPv4, AddrFamily::IPv6}) {
      const AvahiProtocol aproto =
          (family == AddrFamily::IPv4) ? AVAHI_PROTO_INET : AVAHI_PROTO_INET6;

      auto r = avahi_service_resolver_new(client,                      // the client
                                          found.origin.iface,          // same interface
                                          found.origin.protocol,       // same protocol
                                          found.name.c_str(),          // same service name
                                          found.origin.type.c_str(),   // same service type
                                          found.origin.domain.c_str(), // same domain
                                          aproto,                      // address family
                                          (AvahiLookupFlags)0,         // resolve flags
                                          Ctx::cb_resolve,             // callback when resolved
                                          this);                       // userdata

      if (r) {
        req.r[static_cast<size_t>(family)] = r;
      } else {
        auto reason = error_string(client);
        INFO_AUTO("resolver failed, name={} proto={} reason={}", found.name, aproto, reason);

        settled = req.pair.failed(found.name, family, std::move(reason));
      }
    }

    if (settled.has_value()) {
      browse_active->sink(std::move(*settled));
    } else {
      resolvers.emplace(found.name, std::move(req));
    }
  }

  unlock();
}

void Ctx::resolve_free(resolve_req &req) noexcept {
  for (auto &r : req.r) {
    if (r) avahi_service_resolver_free(r);
    r = nullptr;
  }
}

void Ctx::resolve_cancel(csv name) noexcept {
  lock();

  if (auto it = resolvers.find(name); it != resolvers.end()) {
    resolve_free(it->second);
    resolvers.erase(it);
  }

  unlock();
}

void Ctx::publish(const Announcement &ann, PublishSink sink) noexcept {
  lock();

  if (entry_group) avahi_entry_group_reset(entry_group);

  announcement.emplace(ann);
  publish_sink = std::move(sink);

  if (client_running) publish_commit();

  unlock();
}

void Ctx::publish_commit() noexcept {
  INFO_AUTO_CAT("publish");

  if (!announcement.has_value()) return;

  if (entry_group == nullptr) {
    entry_group = avahi_entry_group_new(client, Ctx::cb_entry_group, this);

    if (entry_group == nullptr) {
      publish_failed(error_string(client));
      return;
    }
  }

  // already populated (e.g. client RUNNING after REGISTERING)
  if (!avahi_entry_group_is_empty(entry_group)) return;

  const auto &ann = *announcement;
  const auto stype = avahi_name(ann.type);
  const auto domain = avahi_name(ann.domain);
  AvahiStringList *sl = txt::string_list(ann.record);

  constexpr AvahiPublishFlags flags = static_cast<AvahiPublishFlags>(0);
  constexpr ccs DEFAULT_HOST{nullptr};

  auto rc = avahi_entry_group_add_service_strlst(entry_group, AVAHI_IF_UNSPEC,
                                                 AVAHI_PROTO_UNSPEC, flags, ann.name.c_str(),
                                                 stype.c_str(), domain.c_str(), DEFAULT_HOST,
                                                 ann.port, sl);
  avahi_string_list_free(sl);

  if (rc == AVAHI_ERR_COLLISION) {
    INFO_AUTO("name in use, name={}", ann.name);
    publish_failed(avahi_strerror(rc));
    return;
  } else if (rc != AVAHI_OK) {
    publish_failed(avahi_strerror(rc));
    return;
  }

  if (rc = avahi_entry_group_commit(entry_group); rc != AVAHI_OK) {
    publish_failed(avahi_strerror(rc));
    return;
  }

  INFO_AUTO("committed name={} type={} port={} txt={}", ann.name, stype, ann.port,
            ann.record.inspect());
}

void Ctx::publish_failed(const string reason) noexcept {
  INFO_AUTO_CAT("publish");

  const auto name = announcement.has_value() ? announcement->name : string();
  INFO_AUTO("FAILED, name={} reason={}", name, reason);

  if (publish_sink) publish_sink(evt::PublishFailed{.name = name, .reason = reason});
}

void Ctx::withdraw() noexcept {
  lock();

  if (entry_group) {
    avahi_entry_group_free(entry_group);
    entry_group = nullptr;
  }

  announcement.reset();
  publish_sink = nullptr;

  unlock();
}

void Ctx::cb_client(AvahiClient *client, AvahiClientState state, void *user_data) {
  INFO_AUTO_CAT("cb_client");
  callback_scope scope;

  auto ctx = static_cast<Ctx *>(user_data);

  // the callback may fire before avahi_client_new() returns
  if (ctx->client == nullptr) ctx->client = client;

  switch (state) {
  case AVAHI_CLIENT_CONNECTING: {
    INFO_AUTO("CONNECTING, client={}", fmt::ptr(client));
  } break;

  case AVAHI_CLIENT_S_REGISTERING:
  case AVAHI_CLIENT_S_COLLISION: {
    INFO_AUTO("{}, client={}", state == AVAHI_CLIENT_S_COLLISION ? "COLLISION" : "REGISTERING",
              fmt::ptr(client));

    // services are added again once the client is RUNNING
    if (ctx->entry_group) avahi_entry_group_reset(ctx->entry_group);
  } break;

  case AVAHI_CLIENT_S_RUNNING: {
    pthread_setname_np(pthread_self(), thread_name.data());

    INFO_AUTO("RUNNING, vsn='{}' host={}", avahi_client_get_version_string(client),
              avahi_client_get_host_name_fqdn(client));

    ctx->client_running = true;

    ctx->browse_start();
    ctx->publish_commit();
  } break;

  case AVAHI_CLIENT_FAILURE: {
    const auto reason = ctx->error_string(client);
    INFO_AUTO("FAILED, reason={}", reason);

    ctx->client_running = false;

    if (ctx->browse_active.has_value()) {
      ctx->browse_active->sink(evt::SearchFailed{.reason = reason});
    }

    if (ctx->announcement.has_value()) ctx->publish_failed(reason);
  } break;
  }
}

void Ctx::cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                    AvahiBrowserEvent event, ccs name, ccs type, ccs domain, AvahiLookupResultFlags,
                    void *user_data) {
  INFO_AUTO_CAT("cb_browse");
  callback_scope scope;

  auto ctx = static_cast<Ctx *>(user_data);

  if (!ctx->browse_active.has_value() || (b != ctx->browser)) return;

  auto &sink = ctx->browse_active->sink;

  switch (event) {
  case AVAHI_BROWSER_FAILURE: {
    const auto reason = ctx->error_string(b);
    INFO_AUTO("browser={} error={}", fmt::ptr(b), reason);

    sink(evt::SearchFailed{.reason = reason});
  } break;

  case AVAHI_BROWSER_NEW: {
    INFO_AUTO("NEW {} {} iface={} proto={}", type, name, iface, protocol);

    sink(evt::Found{.name = name,
                    .origin = Origin{.iface = iface,
                                     .protocol = protocol,
                                     .type = type,
                                     .domain = domain}});
  } break;

  case AVAHI_BROWSER_REMOVE: {
    INFO_AUTO("REMOVE {} {} {}", name, type, domain);

    sink(evt::Removed{.name = name});
  } break;

  case AVAHI_BROWSER_ALL_FOR_NOW:
  case AVAHI_BROWSER_CACHE_EXHAUSTED: {
    INFO_AUTO("{}", event == AVAHI_BROWSER_ALL_FOR_NOW ? "ALL_FOR_NOW" : "CACHE_EXHAUSTED");
  } break;
  }
}

void Ctx::cb_entry_group(AvahiEntryGroup *group, AvahiEntryGroupState state, void *user_data) {
  INFO_AUTO_CAT("cb_entry_group");
  callback_scope scope;

  auto ctx = static_cast<Ctx *>(user_data);

  // the group may be reported during avahi_entry_group_new()
  if (ctx->entry_group && (group != ctx->entry_group)) return;

  switch (state) {
  case AVAHI_ENTRY_GROUP_ESTABLISHED: {
    INFO_AUTO("ESTABLISHED, group={}", fmt::ptr(group));

    if (ctx->publish_sink && ctx->announcement.has_value()) {
      ctx->publish_sink(evt::Published{.name = ctx->announcement->name});
    }
  } break;

  case AVAHI_ENTRY_GROUP_COLLISION: {
    INFO_AUTO("COLLISION, group={}", fmt::ptr(group));
    ctx->publish_failed("name collision");
  } break;

  case AVAHI_ENTRY_GROUP_FAILURE: {
    INFO_AUTO("FAILURE, group={}", fmt::ptr(group));
    ctx->publish_failed(ctx->error_string(group));
  } break;

  case AVAHI_ENTRY_GROUP_UNCOMMITED:
  case AVAHI_ENTRY_GROUP_REGISTERING: {
    INFO_AUTO("{}, group={}",
              state == AVAHI_ENTRY_GROUP_UNCOMMITED ? "UNCOMMITTED" : "REGISTERING",
              fmt::ptr(group));
  } break;
  }
}

void Ctx::cb_resolve(AvahiServiceResolver *r, AvahiIfIndex, AvahiProtocol,
                     AvahiResolverEvent event, ccs name, ccs, ccs, ccs host_name,
                     const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                     AvahiLookupResultFlags, void *user_data) {
  INFO_AUTO_CAT("cb_resolve");
  callback_scope scope;

  auto ctx = static_cast<Ctx *>(user_data);

  auto it = ctx->resolvers.find(csv{name});

  // resolvers are owned by the map, anything else was already freed
  if ((it == ctx->resolvers.end()) || !ctx->browse_active.has_value()) return;

  auto &req = it->second;
  const auto family = (req.r[0] == r) ? AddrFamily::IPv4 : AddrFamily::IPv6;
  auto &slot = req.r[static_cast<size_t>(family)];

  if (slot != r) return;

  slot = nullptr;
  std::optional<Event> settled;

  switch (event) {
  case AVAHI_RESOLVER_FAILURE: {
    auto reason = ctx->error_string(r);
    INFO_AUTO("FAILED, name={} family={} reason={}", name, static_cast<int>(family), reason);

    settled = req.pair.failed(name, family, std::move(reason));
  } break;

  case AVAHI_RESOLVER_FOUND: {
    std::array<char, AVAHI_ADDRESS_STR_MAX> addr_str{0};
    avahi_address_snprint(addr_str.data(), addr_str.size(), address);

    Resolution res{.hostname = host_name ? host_name : "", .port = port};

    res.addresses.emplace_back(Address{
        .family = (address->proto == AVAHI_PROTO_INET6) ? AddrFamily::IPv6 : AddrFamily::IPv4,
        .text = addr_str.data()});

    res.txt.resize(avahi_string_list_serialize(txt, nullptr, 0));
    avahi_string_list_serialize(txt, res.txt.data(), res.txt.size());

    INFO_AUTO("FOUND, name={} host={} addr={} port={}", name, res.hostname, addr_str.data(),
              port);

    settled = req.pair.found(name, family, std::move(res));
  } break;
  }

  avahi_service_resolver_free(r);

  if (settled.has_value()) {
    resolve_free(req);
    ctx->resolvers.erase(it);

    ctx->browse_active->sink(std::move(*settled));
  }
}

} // namespace mdns
} // namespace aircast

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

#include "mdns/txt.hpp"

#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>
#include <avahi-common/utf8.h>
#include <charconv>
#include <cstring>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iterator>

namespace aircast {
namespace mdns {
namespace txt {

static constexpr size_t ENTRY_MAX{255};
static constexpr csv WHITESPACE{" \t\r\n"};

static csv trim(csv s) noexcept {
  const auto first = s.find_first_not_of(WHITESPACE);
  if (first == csv::npos) return csv{};

  const auto last = s.find_last_not_of(WHITESPACE);

  return s.substr(first, last - first + 1);
}

// keys become the left side of "key=value" on the wire
static bool valid_key(csv k) noexcept { return !k.empty() && (k.find('=') == csv::npos); }

// length of the leading run of whole entries, avahi rejects a
// buffer with any entry running past the end
static size_t complete_entries(std::span<const uint8_t> src) noexcept {
  size_t pos{0};

  while ((pos < src.size()) && ((pos + 1 + src[pos]) <= src.size())) {
    pos += 1 + src[pos];
  }

  return pos;
}

std::optional<Values> Record::find(csv k) const noexcept {
  if (auto it = kv.find(k); it != kv.end()) return it->second;

  return std::nullopt;
}

std::optional<string> Record::first(csv k) const noexcept {
  if (auto it = kv.find(k); (it != kv.end()) && !it->second.empty()) {
    return it->second.front();
  }

  return std::nullopt;
}

std::optional<string> Record::joined(csv k) const noexcept {
  if (auto it = kv.find(k); it != kv.end()) return fmt::format("{}", fmt::join(it->second, ","));

  return std::nullopt;
}

void Record::set(csv k, csv comma_list) noexcept { set(k, split(comma_list)); }

bool Record::set_default(csv k, csv comma_list) noexcept {
  if (contains(k)) return false;

  set(k, comma_list);
  return true;
}

const string Record::inspect() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  for (const auto &[k, vals] : kv) {
    fmt::format_to(w, "{}{}={}", msg.empty() ? "" : " ", k, fmt::join(vals, ","));
  }

  return msg;
}

AvahiStringList *string_list(const Record &rec) noexcept {
  AvahiStringList *sl{nullptr};

  for (const auto &[k, vals] : rec) {
    if (!valid_key(k) || (k.size() > ENTRY_MAX)) continue;

    if (vals.empty()) {
      sl = avahi_string_list_add(sl, k.c_str());
      continue;
    }

    const auto v = fmt::format("{}", fmt::join(vals, ","));

    // avahi truncates longer entries, skip them instead
    if ((k.size() + 1 + v.size()) > ENTRY_MAX) continue;

    sl = avahi_string_list_add_pair(sl, k.c_str(), v.c_str());
  }

  return sl;
}

Record from_string_list(AvahiStringList *sl) noexcept {
  Record rec;

  for (AvahiStringList *e = sl; e != nullptr; e = avahi_string_list_get_next(e)) {
    char *key{nullptr};
    char *val{nullptr};
    size_t val_size{0};

    if (avahi_string_list_get_pair(e, &key, &val, &val_size) != 0) continue;

    if (valid_key(key) && !rec.contains(key)) {
      if (val == nullptr) {
        rec.set(key, Values());
      } else if (avahi_utf8_valid(val) && (std::strlen(val) == val_size)) {
        rec.set(key, csv{val, val_size});
      }
    }

    avahi_free(key);
    avahi_free(val);
  }

  return rec;
}

uint8v encode(const Record &rec) noexcept {
  auto sl = string_list(rec);

  // an empty list serializes as a single empty string
  uint8v buf(avahi_string_list_serialize(sl, nullptr, 0));
  buf.resize(avahi_string_list_serialize(sl, buf.data(), buf.size()));

  avahi_string_list_free(sl);

  return buf;
}

Record decode(std::span<const uint8_t> src) noexcept {
  AvahiStringList *sl{nullptr};

  if (avahi_string_list_parse(src.data(), complete_entries(src), &sl) < 0) return Record();

  // parse builds the list in reverse, wire order decides duplicates
  sl = avahi_string_list_reverse(sl);
  auto rec = from_string_list(sl);

  avahi_string_list_free(sl);

  return rec;
}

Values split(csv comma_list) noexcept {
  Values vals;

  for (size_t start = 0; start <= comma_list.size();) {
    auto comma = comma_list.find(',', start);
    if (comma == csv::npos) comma = comma_list.size();

    if (auto token = trim(comma_list.substr(start, comma - start)); !token.empty()) {
      vals.emplace_back(token);
    }

    start = comma + 1;
  }

  return vals;
}

std::vector<int> parse_sample_rates(csv comma_list) noexcept {
  std::vector<int> rates;

  for (const auto &token : split(comma_list)) {
    int rate{0};
    const auto *last = token.data() + token.size();

    if (auto [ptr, ec] = std::from_chars(token.data(), last, rate);
        (ec == std::errc()) && (ptr == last)) {
      rates.push_back(rate);
    }
  }

  return rates;
}

} // namespace txt
} // namespace mdns
} // namespace aircast

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
#include "base/uint8v.hpp"

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <span>
#include <utility>
#include <vector>

struct AvahiStringList;

namespace aircast {
namespace mdns {
namespace txt {

using Values = std::vector<string>;

/// @brief Well known capability keys
struct key {
  static constexpr csv txtvers{"txtvers"};
  static constexpr csv codecs{"codecs"};
  static constexpr csv channels{"channels"};
  static constexpr csv samplerate{"samplerate"};
  static constexpr csv features{"features"};
};

/// @brief Capability record, the key / value metadata attached to an
///        announcement.  Each key maps to a list of values that travel
///        comma separated on the wire.  Unknown keys are preserved.
class Record {
public:
  using map_t = std::map<string, Values, std::less<>>;

public:
  Record() = default;

  /// @brief Construct from key / comma separated value pairs
  Record(std::initializer_list<std::pair<csv, csv>> kvs) noexcept {
    for (const auto &[k, v] : kvs) set(k, v);
  }

  auto begin() const noexcept { return kv.begin(); }
  auto end() const noexcept { return kv.end(); }

  bool contains(csv k) const noexcept { return kv.find(k) != kv.end(); }
  bool empty() const noexcept { return kv.empty(); }
  auto size() const noexcept { return kv.size(); }

  /// @brief Values of a key, nullopt when the key is absent
  std::optional<Values> find(csv k) const noexcept;

  /// @brief First value of a key, nullopt when absent or without values
  std::optional<string> first(csv k) const noexcept;

  /// @brief Values of a key joined by commas (wire form of the value)
  std::optional<string> joined(csv k) const noexcept;

  /// @brief Set (replace) a key from a comma separated list
  void set(csv k, csv comma_list) noexcept;

  /// @brief Set (replace) a key from a list of values
  void set(csv k, Values vals) noexcept { kv.insert_or_assign(string(k), std::move(vals)); }

  /// @brief Set a key only when absent
  /// @return true when the key was added
  bool set_default(csv k, csv comma_list) noexcept;

  bool operator==(const Record &) const = default;

  const string inspect() const noexcept;

private:
  map_t kv;
};

/// @brief Build an avahi string list, one "key=v1,v2" entry per key.
///        Entries longer than 255 bytes and keys that are empty or hold
///        '=' are skipped.  The caller frees the list.
AvahiStringList *string_list(const Record &rec) noexcept;

/// @brief Collect a record from an avahi string list in list order
Record from_string_list(AvahiStringList *sl) noexcept;

/// @brief Encode to the DNS-SD TXT wire form: a series of length
///        prefixed "key=v1,v2" strings.  Entries longer than 255 bytes
///        can not be represented and are skipped.  An empty record
///        encodes as a single empty string (one zero byte).
uint8v encode(const Record &rec) noexcept;

/// @brief Decode the DNS-SD TXT wire form, never fails.
///        Entries with a value that is not valid UTF-8 are dropped, an
///        entry running past the end of the buffer ends parsing and the
///        first occurrence of a repeated key wins.
Record decode(std::span<const uint8_t> src) noexcept;

/// @brief Split a comma separated list, tokens are whitespace trimmed
///        and empty tokens are dropped
Values split(csv comma_list) noexcept;

/// @brief Parse a comma separated list of sample rates, non numeric
///        tokens are skipped
std::vector<int> parse_sample_rates(csv comma_list) noexcept;

} // namespace txt
} // namespace mdns
} // namespace aircast

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

#include <array>
#include <compare>
#include <fmt/format.h>
#include <uuid/uuid.h>

namespace aircast {

struct UUID {
  friend struct fmt::formatter<UUID>;

  /// @brief Construct a random UUID
  UUID() noexcept : storage(36, 0x00) {
    uuid_t binuuid;
    uuid_generate_random(binuuid);

    // uuid_unparse writes 36 chars plus the terminating null
    std::array<char, 37> buf{0};
    uuid_unparse_lower(binuuid, buf.data());
    storage.assign(buf.data());
  }

  /// @brief Return object as string
  /// @return string
  const string &operator()() const noexcept { return storage; }

  auto operator<=>(const UUID &rhs) const = default;

private:
  string storage;
};

} // namespace aircast

/// @brief Format a UUID, 's' (default) for the last group only, 'f' for all of it
template <> struct fmt::formatter<aircast::UUID> {
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();

    if ((it != end) && ((*it == 'f') || (*it == 's'))) presentation = *it++;

    if ((it != end) && (*it != '}')) throw format_error("invalid format");

    return it;
  }

  template <typename FormatContext>
  auto format(const aircast::UUID &uuid, FormatContext &ctx) const -> decltype(ctx.out()) {
    const auto &s = uuid.storage;

    if (presentation == 'f') return fmt::format_to(ctx.out(), "{}", s);

    return fmt::format_to(ctx.out(), "{}", std::string_view(s).substr(s.find_last_of('-') + 1));
  }
};

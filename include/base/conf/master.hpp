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

#include "base/conf/keys.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"

#include <array>
#include <memory>

namespace aircast {
namespace conf {

class master;
extern std::unique_ptr<master> mptr;

/// @brief Owner of the merged application configuration:
///        command line args (root "cli"), build info (root "build")
///        and the parsed toml configuration file (all other roots)
class master {
public:
  // note: ordered by relevance
  enum MSG_TYPE : uint8_t { HelpMsg = 0, ArgsErrMsg, ParseMsg, InitMsg };

public:
  master(int argc, char *argv[]) noexcept;
  ~master() = default;

  static master *create(int argc, char *argv[]) noexcept {
    mptr = std::make_unique<master>(argc, argv);

    return mptr.get();
  }

  const string &get_first_msg() const noexcept;
  const string &get_msg(MSG_TYPE t) const noexcept { return msgs[t]; }

  /// @brief Start up should proceed (no help requested, args and config file ok)
  /// @return boolean
  bool nominal_start() const noexcept;

  bool parse_ok() const noexcept { return msgs[ParseMsg].empty(); }
  const string &parse_error() const noexcept { return msgs[ParseMsg]; }

  /// @brief Direct (read only) access to the merged configuration
  /// @return reference to toml::table
  static const toml::table &table_direct() noexcept { return ttable; }

private:
  bool parse() noexcept;

protected:
  // order dependent
  static toml::table ttable;

  // order independent
  std::array<string, 4> msgs;

public:
  MOD_ID("conf.master");
};

} // namespace conf
} // namespace aircast

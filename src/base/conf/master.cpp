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

#include "base/conf/master.hpp"
#include "base/conf/build_info.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/toml.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>

namespace aircast {
namespace conf {

std::unique_ptr<master> mptr;

namespace fs = std::filesystem;

toml::table master::ttable;

master::master(int argc, char *argv[]) noexcept {

  // first, parse the command line args
  cli_args cli(argc, argv);

  msgs[HelpMsg] = cli_args::help_msg();
  msgs[ArgsErrMsg] = cli_args::error_msg();

  // when there aren't any error messages proceed with parsing
  if (std::all_of(msgs.begin(), msgs.end(), [](const auto &m) { return m.empty(); })) {

    // populate the cli args and build info before parsing
    ttable.insert_or_assign(root::cli, cli_args::table());
    ttable.insert_or_assign(root::build, build_info::ttable());

    parse();

    msgs[InitMsg] = fmt::format("sizeof={:>5} table_size={}", sizeof(master), ttable.size());
  }
}

const string &master::get_first_msg() const noexcept {

  static const string empty{"no first message"};

  auto it = std::find_if(msgs.begin(), msgs.end(), [](auto &m) { return !m.empty(); });

  if (it < msgs.end()) return *it;

  return empty;
}

bool master::nominal_start() const noexcept {
  return msgs[HelpMsg].empty() && msgs[ArgsErrMsg].empty() && msgs[ParseMsg].empty();
}

bool master::parse() noexcept {

  msgs[ParseMsg].clear();

  const fs::path cff_path{fixed::cfg_file()};

  // the default configuration file is optional, an explicit one is not
  if (!fs::exists(cff_path)) {
    if (cli_args::cfg_file_explicit()) {
      msgs[ParseMsg] = fmt::format("{}: not found", cff_path.string());
    }

    return parse_ok();
  }

  try {
    const toml::table t = toml::parse_file(cff_path.string());

    // merge the parsed config to our local table
    t.for_each([](const toml::key &key, auto &&val) { ttable.insert_or_assign(key, val); });

  } catch (const toml::parse_error &err) {
    msgs[ParseMsg] = fmt::format("{} parse failed: {}", cff_path.string(), err.description());
  }

  return parse_ok();
}

} // namespace conf
} // namespace aircast

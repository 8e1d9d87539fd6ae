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
#include "base/conf/master.hpp"

#include <iostream>

/// @brief primary entry point for application
/// @param argc number of cli args
/// @param argv actual cli args
/// @return exit code returned to starting process
int main(int argc, char *argv[]) {
  using namespace aircast;

  // handle cli args, config parse
  auto *master = conf::master::create(argc, argv);

  if (!master->nominal_start()) {
    // the app isn't runnable for one of the following reasons:
    //  -cli help requested
    //  -cli args bad
    //  -configuration file missing or failed to parse

    std::cout << master->get_first_msg() << std::endl;

    return master->get_msg(conf::master::HelpMsg).empty() ? 1 : 0;
  }

  App app;

  return app.main();
}

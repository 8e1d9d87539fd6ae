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

#include <filesystem>

namespace aircast {
namespace conf {

struct fixed {

  using fs_path = std::filesystem::path;

  /// @brief Application name from CMakeList project definition (e.g. aircast)
  /// @return constant string view
  static csv app_name() noexcept;

  /// @brief Full path and filename of the configuration file as determined
  ///        based on cli args (or default).
  /// @return modifiable string copy
  static string cfg_file() noexcept;

  /// @brief Log file path determined using cli args, empty for stdout
  /// @return modifiable string copy
  static string log_file() noexcept;

  /// @brief Operating mode requested on the command line
  ///        (receiver, sender or browse)
  static string mode() noexcept;

  /// @brief Advertised name requested on the command line, empty when
  ///        the host name should be used
  static string name() noexcept;

  /// @brief Audio data port
  static Port port() noexcept;

  /// @brief Project version as determined at build time
  static string version() noexcept;
};

} // namespace conf
} // namespace aircast

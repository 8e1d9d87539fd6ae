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

#include "base/conf/token.hpp"
#include "base/conf/master.hpp"

namespace aircast {
namespace conf {

token::token(csv mid) noexcept : token(mid, master::table_direct()) {}

token::token(csv mid, const toml::table &src) noexcept : root(mid) {
  if (const auto *t = src.at_path(root).as_table(); t != nullptr) {
    ttable = *t;
  }
}

} // namespace conf
} // namespace aircast

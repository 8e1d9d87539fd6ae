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

#include "base/random.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace aircast {

std::mutex random::mtx;
std::random_device random::dev_rand;
std::mt19937 random::rnd32(random::dev_rand());

random::random() noexcept {
  std::lock_guard lck(mtx);

  rnd32.discard(dev_rand() % 4096);
}

uint32_t random::operator()() noexcept {
  std::lock_guard lck(mtx);

  std::uniform_int_distribution<uint32_t> dist;

  return dist(rnd32);
}

} // namespace aircast

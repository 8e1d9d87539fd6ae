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

#include "packet/error.hpp"

namespace aircast {
namespace packet {

namespace {

class decode_category_impl : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "aircast.packet"; }

  string message(int ev) const override {
    switch (static_cast<DecodeError>(ev)) {
    case DecodeError::TooShort:
      return "packet too short";
    case DecodeError::UnknownCodec:
      return "unknown codec";
    }

    return "unknown decode error";
  }
};

} // namespace

const boost::system::error_category &decode_category() noexcept {
  static const decode_category_impl category;

  return category;
}

} // namespace packet
} // namespace aircast

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

#include "base/asio.hpp"
#include "base/types.hpp"

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace aircast {
namespace packet {

/// @brief Reasons a received datagram can not be decoded.
///        Decoding is all or nothing, a failure never yields
///        a partially populated value.
enum class DecodeError : int {
  TooShort = 1, // fewer bytes than the fixed layout requires
  UnknownCodec  // extension codec id is not PCM, AAC or ALAC
};

const boost::system::error_category &decode_category() noexcept;

inline error_code make_error_code(DecodeError e) noexcept {
  return error_code(static_cast<int>(e), decode_category());
}

} // namespace packet
} // namespace aircast

namespace boost {
namespace system {
template <> struct is_error_code_enum<aircast::packet::DecodeError> : std::true_type {};
} // namespace system
} // namespace boost

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

#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <utility> // boost 1.74 asio/awaitable.hpp uses std::exchange

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

namespace aircast {

namespace asio = boost::asio;

using error_code = boost::system::error_code;

using strand_ioc = asio::strand<asio::io_context::executor_type>;
using steady_timer = asio::steady_timer;
using work_guard_ioc = asio::executor_work_guard<asio::io_context::executor_type>;

using ip_udp = asio::ip::udp;
using udp_endpoint = asio::ip::udp::endpoint;
using udp_socket = asio::ip::udp::socket;

} // namespace aircast

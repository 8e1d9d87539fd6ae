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

#include "base/logger.hpp"
#include "base/conf/fixed.hpp"
#include "base/elapsed.hpp"

#include <algorithm>
#include <array>
#include <system_error>

namespace aircast {

std::unique_ptr<Logger> _logger;

Elapsed Logger::e;

static constexpr auto flags{fmt::file::WRONLY | fmt::file::APPEND | fmt::file::CREATE};
static constexpr ccs stdout_path{"/dev/stdout"};

// an unusable log file falls back to stdout, the reason is kept for the START line
static fmt::ostream open_out(string &fallback_reason) noexcept {
  const auto path = conf::fixed::log_file();

  if (!path.empty()) {
    try {
      return fmt::output_file(path, flags);
    } catch (const std::system_error &err) {
      fallback_reason = fmt::format("{}: {}", path, err.code().message());
    }
  }

  return fmt::output_file(stdout_path, flags);
}

Logger::Logger(asio::io_context &app_io_ctx) noexcept
    : tokc(module_id), app_io_ctx(app_io_ctx), //
      out(open_out(fallback_reason))           //
{
  const auto now = std::chrono::system_clock::now();
  out.print("\n{:%FT%H:%M:%S} START\n", now);

  if (!fallback_reason.empty()) out.print("log file unavailable ({}), using stdout\n", fallback_reason);

  asio::post(app_io_ctx, [this]() { async_active = true; });
}

Logger::~Logger() noexcept {
  async_active = false;

  std::lock_guard lck(out_mtx);

  const auto now = std::chrono::system_clock::now();
  out.print("\n{:%FT%H:%M:%S} STOP after {}\n", now, e.humanize());
  out.close();
}

bool Logger::should_log(csv mod, csv cat) const noexcept {

  if ((cat == csv{"info"}) || tokc.empty()) return true;

  // every matching flag must allow the message:
  //  1. logger.<cat>       == boolean
  //  2. logger.<mod>       == boolean
  //  3. logger.<mod>.<cat> == boolean
  std::array paths{toml::path(cat), toml::path(mod), toml::path(mod).append(toml::path(cat))};

  return std::all_of(paths.begin(), paths.end(), [&t = tokc.table()](const auto &p) {
    const auto node = t.at_path(p);

    return node.is_boolean() ? node.value_or(true) : true;
  });
}

} // namespace aircast

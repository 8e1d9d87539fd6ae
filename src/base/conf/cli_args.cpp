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

#include "base/conf/cli_args.hpp"
#include "base/conf/keys.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"
#include "build_inject.hpp"

#include <boost/program_options.hpp>
#include <filesystem>
#include <fmt/format.h>
#include <sstream>

namespace aircast {
namespace conf {

namespace po = boost::program_options;
namespace fs = std::filesystem;

using fs_path = fs::path;

constexpr auto def_cfg_toml_file{"aircast.toml"};
constexpr auto def_log_file{""};
constexpr auto def_mode{"receiver"};
constexpr auto def_name{""};
constexpr Port def_port{7000};

constexpr auto desc_cfg_file{"toml configuration file"};
constexpr auto desc_help{"command line help"};
constexpr auto desc_log_file{"full path to log file (default stdout)"};
constexpr auto desc_mode{"receiver, sender or browse"};
constexpr auto desc_name{"advertised device name (default hostname)"};
constexpr auto desc_port{"audio data port"};

toml::table cli_args::ttable;
string cli_args::error_str;
bool cli_args::help_requested{false};
bool cli_args::cfg_file_given{false};
std::ostringstream cli_args::help_ss;

cli_args::cli_args(int argc, char **argv) noexcept {
  po::options_description desc(build::info.project);
  po::variables_map args;

  // get some base info and place into toml table
  fs_path fs_arg0{argv[0]};

  // note: order dependent -- to get exec_path we must modify fs_arg0
  ttable.insert_or_assign(key::app_name, fs_arg0.filename().string());
  ttable.insert_or_assign(key::parent_dir, fs_arg0.parent_path().string());
  ttable.insert_or_assign(key::exec_dir, fs_arg0.remove_filename().string());

  fs_path def_cfg_fs_file(build::info.sysconf_dir);
  def_cfg_fs_file /= build::info.project;
  def_cfg_fs_file /= def_cfg_toml_file;

  auto cfg_file_v = po::value<string>()
                        ->notifier([](const string p) {
                          fs_path p_fs(p);

                          if (p_fs.is_relative() && !fs::exists(p_fs)) {
                            p_fs = fs_path(build::info.sysconf_dir) / build::info.project / p;
                          }

                          ttable.insert_or_assign(key::cfg_file, p_fs.string());
                        })
                        ->default_value(def_cfg_fs_file.string());

  auto log_file_v = po::value<string>()
                        ->notifier([](const string f) { ttable.insert_or_assign(key::log_file, f); })
                        ->default_value(def_log_file);

  auto mode_v = po::value<string>()
                    ->notifier([](const string m) {
                      if ((m != "receiver"sv) && (m != "sender"sv) && (m != "browse"sv)) {
                        throw po::invalid_option_value(m);
                      }

                      ttable.insert_or_assign(key::mode, m);
                    })
                    ->default_value(def_mode);

  auto name_v = po::value<string>()
                    ->notifier([](const string n) { ttable.insert_or_assign(key::name, n); })
                    ->default_value(def_name);

  auto port_v = po::value<Port>()
                    ->notifier([](Port p) { ttable.insert_or_assign(key::port, int64_t{p}); })
                    ->default_value(def_port);

  auto help_v = po::bool_switch()
                    ->notifier([](bool e) { ttable.insert_or_assign(key::help, e); })
                    ->default_value(false);

  desc.add_options()                             //
      (key::cfg_file, cfg_file_v, desc_cfg_file) //
      (key::log_file, log_file_v, desc_log_file) //
      (key::mode, mode_v, desc_mode)             //
      (key::name, name_v, desc_name)             //
      (key::port, port_v, desc_port)             //
      (key::help, help_v, desc_help);            //

  try {
    // this will throw if parsing fails
    auto parsed_opts = po::parse_command_line(argc, argv, desc);

    // good, we parsed command line args, store them
    po::store(parsed_opts, args);

    // notify all args (populate toml table)
    po::notify(args);

    cfg_file_given = (args.count(key::cfg_file) > 0) && !args[key::cfg_file].defaulted();

  } catch (const po::error &ex) {
    error_str = fmt::format("bad args: {}", ex.what());
  }

  if (ttable[key::help].value_or(false)) {
    help_requested = true;

    desc.print(help_ss);
  }
}

} // namespace conf
} // namespace aircast

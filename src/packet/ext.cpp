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

#include "packet/ext.hpp"
#include "packet/error.hpp"

#include <array>
#include <fmt/format.h>

namespace aircast {
namespace packet {

namespace {

struct codec_info {
  Codec codec;
  csv name;
  int kbps;
};

constexpr std::array codec_table{codec_info{Codec::PCM, "PCM"sv, 1411},
                                 codec_info{Codec::AAC, "AAC"sv, 256},
                                 codec_info{Codec::ALAC, "ALAC"sv, 600}};

} // namespace

csv codec_name(Codec codec) noexcept {
  for (const auto &ci : codec_table) {
    if (ci.codec == codec) return ci.name;
  }

  return "UNKNOWN"sv;
}

int codec_bitrate(Codec codec) noexcept {
  for (const auto &ci : codec_table) {
    if (ci.codec == codec) return ci.kbps;
  }

  return 0;
}

std::optional<Codec> codec_from_id(uint8_t id) noexcept {
  for (const auto &ci : codec_table) {
    if (static_cast<uint8_t>(ci.codec) == id) return ci.codec;
  }

  return std::nullopt;
}

std::optional<Codec> codec_from_name(csv name) noexcept {
  for (const auto &ci : codec_table) {
    if (ci.name == name) return ci.codec;
  }

  return std::nullopt;
}

void ext::encode_to(uint8v &dest) const noexcept {
  dest.push_back(static_cast<uint8_t>(codec));
  dest.push_back(channels);
  dest.append_be(sample_rate);
  dest.push_back(volume);
  dest.push_back(flags);
  dest.append_be(reserved);
}

std::optional<ext> ext::decode(std::span<const uint8_t> src, error_code &ec) noexcept {
  if (src.size() < size()) {
    ec = DecodeError::TooShort;
    return std::nullopt;
  }

  const auto codec = codec_from_id(src[0]);

  if (!codec.has_value()) {
    ec = DecodeError::UnknownCodec;
    return std::nullopt;
  }

  ec.clear();

  return ext{.codec = *codec,
             .channels = src[1],
             .sample_rate = load_be<uint16_t>(src, 2),
             .volume = src[4],
             .flags = src[5],
             .reserved = load_be<uint16_t>(src, 6)};
}

const string ext::inspect() const noexcept {
  return fmt::format("codec={} channels={} rate={} volume={} flags={:#04x}", codec_name(codec),
                     channels, sample_rate, volume, flags);
}

} // namespace packet
} // namespace aircast

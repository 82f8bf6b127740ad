// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#pragma once

#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include "bus/can_frame.hpp"

#include <cstdint>
#include <string>
#include <string_view>

using canusb_json = nlohmann::json;

namespace canusb::util::json
{
    inline auto to_hex = [](const uint8_t *d, size_t len)
    {
      return fmt::format("{:02X}", fmt::join(d, d + len, " "));
    };

    /// "/dev/ttyUSB0" -> "ttyUSB0"
    inline std::string PortName(std::string_view port)
    {
      auto pos = port.find_last_of('/');
      return std::string(pos == std::string_view::npos ? port : port.substr(pos + 1));
    }

    /// cl: anything with Get(section, key, default), normally config::ConfigLoader
    bool BuildJson(canusb_json &j_canFrame, const bus::Frame &frame, const auto &cl)
    {
        j_canFrame = canusb_json::object();
        j_canFrame["ts"]   = frame.ts.count();
        j_canFrame["port"] = PortName(cl.Get("serial", "port", ""));
        j_canFrame["id"]   = frame.id;
        j_canFrame["ext"]  = frame.extended;
        j_canFrame["dlc"]  = static_cast<int>(frame.dlc);
        j_canFrame["raw"]  = to_hex(frame.data.data(), frame.data.size());
        return frame.data.size() == frame.dlc;
    }

    inline std::string BuildTopic(std::string_view prefix, std::string_view port, uint32_t id)
    {
        return fmt::format("{}/{}/{:08X}", prefix, PortName(port), id);
    }

} // namespace

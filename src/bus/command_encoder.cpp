// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// src/bus/command_encoder.cpp
#include "bus/command_encoder.hpp"
#include "bus/frame_decoder.hpp"

#include <numeric>
#include <utility>

namespace canusb::bus {

namespace {

enum Layout : std::size_t {
    START      = 0,
    HEADER     = 1,
    TYPE       = 2,
    SPEED      = 3,
    FRAME_TYPE = 4,
    FILTER     = 5,
    MASK       = 9,
    MODE       = 13,
    FIXED_01   = 14,
    CHECKSUM   = 19,
};

constexpr uint8_t kSettingCommand   = 0x12;   // variable length protocol setting
constexpr uint8_t kStandardFrames   = 0x01;

// Bus speed table of the USB-CAN adapter (bit/s -> code)
constexpr std::array<std::pair<uint32_t, uint8_t>, 12> kSpeedTable {{
    {1000000, 0x01},
    { 800000, 0x02},
    { 500000, 0x03},
    { 400000, 0x04},
    { 250000, 0x05},
    { 200000, 0x06},
    { 125000, 0x07},
    { 100000, 0x08},
    {  50000, 0x09},
    {  20000, 0x0A},
    {  10000, 0x0B},
    {   5000, 0x0C},
}};

} // namespace

bool isSupportedSpeed(uint32_t bps)
{
    for (const auto& [speed, code] : kSpeedTable)
        if (speed == bps) return true;
    return false;
}

uint8_t speedCode(uint32_t bps)
{
    for (const auto& [speed, code] : kSpeedTable)
        if (speed == bps) return code;
    return speedCode(kDefaultCanSpeed);
}

uint8_t checksum(std::span<const uint8_t> bytes)
{
    return static_cast<uint8_t>(std::accumulate(bytes.begin(), bytes.end(), 0u) & 0xFF);
}

InitCommand encodeInitCommand(uint32_t bps)
{
    InitCommand cmd{};   // filter, mask, mode (normal) and reserved stay 0
    cmd[START]      = kStartByte;
    cmd[HEADER]     = kCommandHeader;
    cmd[TYPE]       = kSettingCommand;
    cmd[SPEED]      = speedCode(bps);
    cmd[FRAME_TYPE] = kStandardFrames;
    cmd[FIXED_01]   = 0x01;
    cmd[CHECKSUM]   = checksum(std::span<const uint8_t>(cmd).subspan(TYPE, CHECKSUM - TYPE));
    return cmd;
}

} // namespace canusb::bus

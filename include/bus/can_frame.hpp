// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// -----------------------------------------------------------------------------
// CAN frame value type (header-only)
// -----------------------------------------------------------------------------

#pragma  once

#include <cstdint>
#include <vector>
#include <chrono>

namespace canusb::bus
{

struct Frame {
    uint32_t id                 {};                       ///< identifier, 16 bits on the CANUSB wire
    uint8_t  dlc                {};                       ///< length as carried on the wire (0-15)
    std::vector<uint8_t> data   {};                       ///< exactly dlc payload bytes
    bool extended               {};                       ///< type byte bit 0x20
    std::chrono::microseconds ts{};                       ///< wall clock, taken at the terminator byte
};

}

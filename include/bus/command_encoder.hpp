// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// include/bus/command_encoder.hpp
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace canusb::bus {

// Adapter setting command (20 bytes):
// [AA][55][TYPE][SPEED][FRAME_TYPE][FILTER(4)][MASK(4)][MODE][0x01][RESERVED(4)][CHECKSUM]
inline constexpr std::size_t kInitCommandSize = 20;
using InitCommand = std::array<uint8_t, kInitCommandSize>;

inline constexpr uint32_t kDefaultCanSpeed = 500000;

/// Adapter speed code for a bus speed in bit/s. Unknown speeds map to the 500K code.
uint8_t speedCode(uint32_t bps);
bool isSupportedSpeed(uint32_t bps);

/// Low 8 bits of the byte sum.
uint8_t checksum(std::span<const uint8_t> bytes);

InitCommand encodeInitCommand(uint32_t bps);

} // namespace canusb::bus

// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// -----------------------------------------------------------------------------
// CANUSB variable-length protocol decoder
// -----------------------------------------------------------------------------
//
//   data frame     : AA | 0xC<dlc> (+0x20 ext) | ID_L | ID_H | DATA[dlc] | 55
//                    type byte: 11 E R LLLL (E extended, R remote, L dlc)
//   command frame  : AA | 55 | 18 bytes                      (20 bytes total)
//
// decode() walks the buffer from the head and stops at the first frame that
// is not complete yet. Bytes before that point are reported as consumed; the
// caller drops them and keeps the rest for the next call.

#pragma once

#include "bus/can_frame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace canusb::bus {

inline constexpr uint8_t     kStartByte        = 0xAA;
inline constexpr uint8_t     kEndByte          = 0x55;
inline constexpr uint8_t     kCommandHeader    = 0x55;   ///< second byte of a command frame
inline constexpr uint8_t     kDataTypeMask     = 0xC0;   ///< bits 7-6 set on every data frame type byte
inline constexpr uint8_t     kExtendedFlag     = 0x20;
inline constexpr std::size_t kCommandFrameSize = 20;
inline constexpr std::size_t kDataFrameOverhead = 5;     ///< start + type + 2 id + end

struct DecodeResult {
    std::vector<Frame> frames;          ///< in buffer order
    std::size_t consumed        {0};    ///< bytes to drop from the buffer head
    std::size_t skipped         {0};    ///< single-byte resync discards
    std::size_t bad_terminators {0};    ///< data spans dropped for a missing 0x55
    std::size_t command_frames  {0};    ///< AA 55 frames consumed without decoding
};

using Clock = std::function<std::chrono::microseconds()>;

/// Microseconds since the Unix epoch.
std::chrono::microseconds wallClock();

DecodeResult decode(std::span<const uint8_t> buffer, const Clock& clock = wallClock);

} // namespace canusb::bus

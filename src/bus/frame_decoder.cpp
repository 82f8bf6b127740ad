// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// src/bus/frame_decoder.cpp

#include "bus/frame_decoder.hpp"

#include <utility>

namespace canusb::bus {

std::chrono::microseconds wallClock()
{
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch());
}

DecodeResult decode(std::span<const uint8_t> buffer, const Clock& clock)
{
    DecodeResult result;
    std::size_t pos = 0;

    while (pos < buffer.size()) {
        const auto rest = buffer.subspan(pos);

        if (rest[0] != kStartByte) {
            ++pos; ++result.skipped;
            continue;
        }
        if (rest.size() < 2) break;

        const uint8_t type = rest[1];

        /* ───── AA 55 : fixed 20 byte command / response ───── */
        if (type == kCommandHeader) {
            if (rest.size() < kCommandFrameSize) break;
            pos += kCommandFrameSize;
            ++result.command_frames;
            continue;
        }

        /* ───── AA Cx : data frame ───── */
        if ((type & kDataTypeMask) == kDataTypeMask) {
            const uint8_t dlc = type & 0x0F;
            const std::size_t frame_len = dlc + kDataFrameOverhead;
            if (rest.size() < frame_len) break;

            if (rest[frame_len - 1] == kEndByte) {
                Frame frame;
                frame.id       = static_cast<uint32_t>(rest[2]) | (static_cast<uint32_t>(rest[3]) << 8);
                frame.dlc      = dlc;
                frame.data.assign(rest.begin() + 4, rest.begin() + 4 + dlc);
                frame.extended = (type & kExtendedFlag) != 0;
                frame.ts       = clock ? clock() : wallClock();
                result.frames.push_back(std::move(frame));
            } else {
                // the whole span goes, even though the length byte is now suspect
                ++result.bad_terminators;
            }
            pos += frame_len;
            continue;
        }

        // unknown type byte: treat the AA as noise
        ++pos; ++result.skipped;
    }

    result.consumed = pos;
    return result;
}

} // namespace canusb::bus

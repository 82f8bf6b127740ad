// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// -----------------------------------------------------------------------------
// Serial transport *interface* layer (header-only)
// -----------------------------------------------------------------------------

#pragma  once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace canusb::serial
{

class ISerialPort {
    public:
        virtual ~ISerialPort() = default;
        virtual bool open(std::string_view port, uint32_t baudrate, uint8_t stop_bits = 2) = 0;
        /// Bytes waiting in the driver; false when the query itself fails.
        virtual bool available(std::size_t& out) = 0;
        /// Replaces out with up to n bytes. Never blocks longer than the native read timeout.
        virtual bool read(std::vector<uint8_t>& out, std::size_t n) = 0;
        virtual bool write(std::span<const uint8_t> bytes) = 0;
        virtual void close() = 0;
        virtual bool isOpen() const = 0;

        // non-copyable
        ISerialPort(const ISerialPort&)            = delete;
        ISerialPort& operator=(const ISerialPort&) = delete;

        // movable
        ISerialPort(ISerialPort&&) noexcept            = default;
        ISerialPort& operator=(ISerialPort&&) noexcept = default;
    protected:
        ISerialPort() = default;  ///< protected constructor to prevent instantiation
};

}

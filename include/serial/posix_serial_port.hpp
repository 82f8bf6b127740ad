// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#pragma once

#include "serial/serial_port.hpp"

#include <string>

namespace canusb::serial {

// termios backed tty: raw 8 data bits, no parity, no flow control,
// VMIN=0 / VTIME=1 so a read returns after at most 100 ms.
class PosixSerialPort final: public ISerialPort {
    public:
        PosixSerialPort() = default;
        PosixSerialPort(const PosixSerialPort&)            = delete; // non-copyable
        PosixSerialPort& operator=(const PosixSerialPort&) = delete; // non-copyable

        ~PosixSerialPort() override { close(); }

        bool open(std::string_view port, uint32_t baudrate, uint8_t stop_bits = 2) override;
        bool available(std::size_t& out) override;
        bool read(std::vector<uint8_t>& out, std::size_t n) override;
        bool write(std::span<const uint8_t> bytes) override;
        void close() override;
        bool isOpen() const override { return fd_ != -1; }
    private:
        bool configure(uint32_t baudrate, uint8_t stop_bits);
        int fd_ = -1;
        std::string port_;
    };
}

// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// src/serial/posix_serial_port.cpp

#include "serial/posix_serial_port.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace canusb::serial {

namespace {

bool mapBaudrate(uint32_t baudrate, speed_t& out) {
    switch (baudrate) {
        case 9600:    out = B9600;    return true;
        case 19200:   out = B19200;   return true;
        case 38400:   out = B38400;   return true;
        case 57600:   out = B57600;   return true;
        case 115200:  out = B115200;  return true;
        case 230400:  out = B230400;  return true;
#ifdef B460800
        case 460800:  out = B460800;  return true;
#endif
#ifdef B921600
        case 921600:  out = B921600;  return true;
#endif
#ifdef B1000000
        case 1000000: out = B1000000; return true;
#endif
#ifdef B2000000
        case 2000000: out = B2000000; return true;  // CANUSB default
#endif
#ifdef B3000000
        case 3000000: out = B3000000; return true;
#endif
        default: return false;
    }
}

} // namespace

bool PosixSerialPort::open(std::string_view port, uint32_t baudrate, uint8_t stop_bits) {
    if (fd_ != -1)
    {
        std::cerr << "[SerialPort] " << port_ << " already open.\n";
        return false;
    }
    port_.assign(port);
    fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY);
    if (fd_ < 0)
    {
        std::cerr << "[SerialPort] Cannot open " << port_ << ": " << strerror(errno) << "\n";
        fd_ = -1;
        return false;
    }

    if (!configure(baudrate, stop_bits)) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    std::cout << "[SerialPort] " << port_ << " opened (" << baudrate << " baud, "
              << int(stop_bits) << " stop bits)" << std::endl;
    return true;
}

bool PosixSerialPort::configure(uint32_t baudrate, uint8_t stop_bits) {
    speed_t speed{};
    if (!mapBaudrate(baudrate, speed)) {
        std::cerr << "[SerialPort] Unsupported baudrate: " << baudrate << "\n";
        return false;
    }

    termios tio{};
    if (tcgetattr(fd_, &tio) < 0) {
        std::cerr << "[SerialPort] tcgetattr failed: " << strerror(errno) << "\n";
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag |= CLOCAL | CREAD;
    tio.c_cflag &= ~(PARENB | CRTSCTS | CSIZE);
    tio.c_cflag |= CS8;
    if (stop_bits == 2) tio.c_cflag |= CSTOPB;
    else                tio.c_cflag &= ~CSTOPB;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 1;   // 100 ms

    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    if (tcsetattr(fd_, TCSANOW, &tio) < 0) {
        std::cerr << "[SerialPort] tcsetattr failed: " << strerror(errno) << "\n";
        return false;
    }
    tcflush(fd_, TCIOFLUSH);
    return true;
}

bool PosixSerialPort::available(std::size_t& out) {
    if (fd_ == -1) return false;
    int n = 0;
    if (ioctl(fd_, FIONREAD, &n) < 0) {
        std::cerr << "[SerialPort] FIONREAD failed: " << strerror(errno) << "\n";
        return false;
    }
    out = static_cast<std::size_t>(n);
    return true;
}

bool PosixSerialPort::read(std::vector<uint8_t>& out, std::size_t n) {
    out.resize(n);
    if (fd_ == -1) { out.clear(); return false; }

    std::size_t got = 0;
    while (got < n) {
        ssize_t r = ::read(fd_, out.data() + got, n - got);
        if (r < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[SerialPort] read failed: " << strerror(errno) << "\n";
            out.clear();
            return false;
        }
        if (r == 0) break;   // VTIME expired
        got += static_cast<std::size_t>(r);
    }
    out.resize(got);
    return true;
}

bool PosixSerialPort::write(std::span<const uint8_t> bytes) {
    if (fd_ == -1) return false;

    std::size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t w = ::write(fd_, bytes.data() + sent, bytes.size() - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[SerialPort] write failed: " << strerror(errno) << "\n";
            return false;
        }
        sent += static_cast<std::size_t>(w);
    }
    return tcdrain(fd_) == 0;
}

void PosixSerialPort::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
        std::cout << "[SerialPort] " << port_ << " closed" << std::endl;
    }
}

} // namespace canusb::serial

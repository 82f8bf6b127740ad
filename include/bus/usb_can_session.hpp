// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// include/bus/usb_can_session.hpp
#pragma once

#include "bus/can_frame.hpp"
#include "bus/command_encoder.hpp"
#include "serial/serial_port.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace canusb::bus {

struct SessionOptions {
    std::string port;
    uint32_t baudrate                   {2000000};
    uint32_t can_speed                  {kDefaultCanSpeed};
    std::chrono::microseconds idle_sleep{500};
};

struct SessionStats {
    uint64_t frames          {0};
    uint64_t bytes_received  {0};
    uint64_t skipped_bytes   {0};
    uint64_t bad_terminators {0};
    uint64_t command_frames  {0};
    std::size_t observers    {0};
};

/// One adapter connection: writes the init command, then reads, decodes and
/// dispatches frames on its own thread until disconnect() or a transport error.
class UsbCanSession {
public:
    using FrameCallback = std::function<void(const Frame&)>;
    using EndedCallback = std::function<void(const std::string& reason)>;
    using ObserverId    = uint64_t;

    explicit UsbCanSession(std::unique_ptr<serial::ISerialPort> port);
    ~UsbCanSession();

    UsbCanSession(const UsbCanSession&)            = delete; // non-copyable
    UsbCanSession& operator=(const UsbCanSession&) = delete; // non-copyable

    bool connect(const SessionOptions& options);
    void disconnect();
    bool connected() const { return connected_.load(); }

    /// Callbacks run on the session thread, in frame order.
    ObserverId addObserver(FrameCallback cb);
    bool removeObserver(ObserverId id);

    /// Called once from the session thread when the loop dies on a transport error.
    void addEndedObserver(EndedCallback cb);

    SessionStats stats() const;

private:
    void run(std::stop_token st);
    void drain();
    void fail(const std::string& reason);

    std::unique_ptr<serial::ISerialPort> port_;
    std::jthread loop_;
    std::atomic<bool> connected_ {false};
    std::chrono::microseconds idle_sleep_{500};

    std::vector<uint8_t> rx_;     ///< touched by the session thread only

    mutable std::mutex observers_mutex_;
    std::vector<std::pair<ObserverId, std::shared_ptr<const FrameCallback>>> observers_;
    std::vector<EndedCallback> ended_observers_;
    ObserverId next_id_ {1};

    std::atomic<uint64_t> frames_          {0};
    std::atomic<uint64_t> bytes_received_  {0};
    std::atomic<uint64_t> skipped_bytes_   {0};
    std::atomic<uint64_t> bad_terminators_ {0};
    std::atomic<uint64_t> command_frames_  {0};
};

} // namespace canusb::bus

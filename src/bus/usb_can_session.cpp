// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// src/bus/usb_can_session.cpp

#include "bus/usb_can_session.hpp"
#include "bus/frame_decoder.hpp"

#include <exception>
#include <iostream>
#include <system_error>

namespace canusb::bus {

UsbCanSession::UsbCanSession(std::unique_ptr<serial::ISerialPort> port)
    : port_(std::move(port))
{
}

UsbCanSession::~UsbCanSession()
{
    disconnect();
}

bool UsbCanSession::connect(const SessionOptions& options)
{
    if (connected_) {
        std::cerr << "[Session] Already connected.\n";
        return false;
    }
    // loop may have died on a transport error; reap it before reopening
    disconnect();

    if (!port_) return false;
    if (!port_->open(options.port, options.baudrate, 2)) {
        std::cerr << "[Session] Cannot open " << options.port << "\n";
        return false;
    }

    if (!isSupportedSpeed(options.can_speed))
        std::cerr << "[Session] Unsupported CAN speed " << options.can_speed
                  << ", falling back to " << kDefaultCanSpeed << "\n";

    const InitCommand cmd = encodeInitCommand(options.can_speed);
    if (!port_->write(cmd)) {
        std::cerr << "[Session] Adapter init command could not be written\n";
        port_->close();
        return false;
    }

    idle_sleep_ = options.idle_sleep;
    connected_  = true;
    try {
        loop_ = std::jthread([this](std::stop_token st) { run(st); });
    } catch (const std::system_error& e) {
        std::cerr << "[Session] Cannot start read thread: " << e.what() << "\n";
        connected_ = false;
        port_->close();
        return false;
    }

    std::cout << "[Session] Connected to " << options.port
              << " (CAN " << options.can_speed << " bit/s)" << std::endl;
    return true;
}

void UsbCanSession::disconnect()
{
    if (loop_.joinable()) {
        if (loop_.get_id() == std::this_thread::get_id()) {
            // called from an observer; the owner has to reap the thread later
            connected_ = false;
            loop_.request_stop();
            return;
        }
        loop_.request_stop();
        loop_.join();
    }
    const bool was_connected = connected_.exchange(false);
    if (port_ && port_->isOpen()) port_->close();
    if (was_connected) std::cout << "[Session] Disconnected" << std::endl;
}

UsbCanSession::ObserverId UsbCanSession::addObserver(FrameCallback cb)
{
    std::lock_guard lock(observers_mutex_);
    const ObserverId id = next_id_++;
    observers_.emplace_back(id, std::make_shared<const FrameCallback>(std::move(cb)));
    return id;
}

bool UsbCanSession::removeObserver(ObserverId id)
{
    std::lock_guard lock(observers_mutex_);
    for (auto it = observers_.begin(); it != observers_.end(); ++it) {
        if (it->first == id) {
            observers_.erase(it);
            return true;
        }
    }
    return false;
}

void UsbCanSession::addEndedObserver(EndedCallback cb)
{
    std::lock_guard lock(observers_mutex_);
    ended_observers_.push_back(std::move(cb));
}

SessionStats UsbCanSession::stats() const
{
    SessionStats s;
    s.frames          = frames_.load();
    s.bytes_received  = bytes_received_.load();
    s.skipped_bytes   = skipped_bytes_.load();
    s.bad_terminators = bad_terminators_.load();
    s.command_frames  = command_frames_.load();

    std::lock_guard lock(observers_mutex_);
    s.observers = observers_.size();
    return s;
}

/* ───── session thread ───── */
void UsbCanSession::run(std::stop_token st)
{
    rx_.clear();
    std::vector<uint8_t> chunk;

    while (!st.stop_requested()) {
        std::size_t pending = 0;
        if (!port_->available(pending)) {
            fail("transport availability query failed");
            return;
        }
        if (pending == 0) {
            std::this_thread::sleep_for(idle_sleep_);
            continue;
        }
        if (!port_->read(chunk, pending)) {
            fail("transport read failed");
            return;
        }
        bytes_received_ += chunk.size();
        rx_.insert(rx_.end(), chunk.begin(), chunk.end());
        drain();
    }
}

void UsbCanSession::drain()
{
    DecodeResult result = decode(rx_);
    rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(result.consumed));

    skipped_bytes_   += result.skipped;
    bad_terminators_ += result.bad_terminators;
    command_frames_  += result.command_frames;
    frames_          += result.frames.size();

    if (result.frames.empty()) return;

    std::vector<std::shared_ptr<const FrameCallback>> snapshot;
    {
        std::lock_guard lock(observers_mutex_);
        snapshot.reserve(observers_.size());
        for (const auto& [id, cb] : observers_) snapshot.push_back(cb);
    }

    for (const Frame& frame : result.frames) {
        for (const auto& cb : snapshot) {
            try {
                (*cb)(frame);
            } catch (const std::exception& e) {
                std::cerr << "[Session] Observer threw: " << e.what() << "\n";
            }
        }
    }
}

void UsbCanSession::fail(const std::string& reason)
{
    connected_ = false;
    std::cerr << "[Session] Session ended: " << reason << "\n";

    std::vector<EndedCallback> ended;
    {
        std::lock_guard lock(observers_mutex_);
        ended = ended_observers_;
    }
    for (const auto& cb : ended) {
        try {
            cb(reason);
        } catch (const std::exception& e) {
            std::cerr << "[Session] Ended observer threw: " << e.what() << "\n";
        }
    }
}

} // namespace canusb::bus

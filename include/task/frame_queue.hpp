// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#pragma once

#include "bus/can_frame.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace canusb::task {

// Bounded hand-off between the session thread and consumer threads.
// A full queue drops its oldest frame so the session thread never waits.
class FrameQueue {
public:
    explicit FrameQueue(std::size_t capacity = 4096);

    FrameQueue(const FrameQueue&)            = delete; // non-copyable
    FrameQueue& operator=(const FrameQueue&) = delete; // non-copyable

    void push(const bus::Frame& frame);
    bool pop(bus::Frame& out, std::chrono::milliseconds timeout);

    /// Wakes every waiter; pop() drains what is left and then returns false.
    void close();
    /// Accepts frames again after close().
    void reopen();
    bool closed() const;

    std::size_t size() const;
    uint64_t dropped() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<bus::Frame> frames_;
    uint64_t dropped_ {0};
    bool closed_ {false};
};

} // namespace canusb::task

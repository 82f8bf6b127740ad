// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#include "task/frame_queue.hpp"

#include <utility>

namespace canusb::task {

FrameQueue::FrameQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{
}

void FrameQueue::push(const bus::Frame& frame)
{
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        if (frames_.size() >= capacity_) {
            frames_.pop_front();
            ++dropped_;
        }
        frames_.push_back(frame);
    }
    cv_.notify_one();
}

bool FrameQueue::pop(bus::Frame& out, std::chrono::milliseconds timeout)
{
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !frames_.empty() || closed_; }))
        return false;
    if (frames_.empty()) return false;   // closed and drained
    out = std::move(frames_.front());
    frames_.pop_front();
    return true;
}

void FrameQueue::close()
{
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void FrameQueue::reopen()
{
    std::lock_guard lock(mutex_);
    closed_ = false;
}

bool FrameQueue::closed() const
{
    std::lock_guard lock(mutex_);
    return closed_;
}

std::size_t FrameQueue::size() const
{
    std::lock_guard lock(mutex_);
    return frames_.size();
}

uint64_t FrameQueue::dropped() const
{
    std::lock_guard lock(mutex_);
    return dropped_;
}

} // namespace canusb::task

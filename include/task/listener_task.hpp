// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#pragma once

#include "bus/usb_can_session.hpp"
#include "task/frame_queue.hpp"

namespace canusb::task {

bus::UsbCanSession& Session();
FrameQueue& Queue();

/// Connects the adapter, keeps it connected and fans decoded frames out to
/// the console and MQTT sinks from a consumer thread.
void StartListener();
void StopListener();

}

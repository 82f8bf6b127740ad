// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#include "task/periodic_task.hpp"
#include "task/listener_task.hpp"

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>
#include <stop_token>
#include <absl/base/no_destructor.h>
#include <fmt/core.h>

#include "config/config_loader.hpp"

namespace canusb::task {

namespace {

std::jthread& PeriodicThread() {
  static absl::NoDestructor<std::jthread> thread;
  return *thread;
}

}  // namespace

void StartPeriodic() {
  auto interval = std::chrono::milliseconds(
      canusb::config::ConfigLoader::getInstance().GetInt("os",
                                         "periodic_task_interval_ms",
                                         5000));
  if (interval.count() <= 0) return;

  PeriodicThread() = std::jthread
  {
    [interval](std::stop_token st)
    {
      std::mutex m;
      std::condition_variable_any cv;
      while (!st.stop_requested()) {
        std::unique_lock lock(m);
        if (cv.wait_for(lock, st, interval, [] { return false; })) break;
        if (st.stop_requested()) break;

        const auto s = Session().stats();
        std::cout << fmt::format("[Periodic] {} | frames={} bytes={} resync={} bad_end={} cmd={} observers={} queued={} dropped={}",
                                 Session().connected() ? "connected" : "disconnected",
                                 s.frames, s.bytes_received, s.skipped_bytes,
                                 s.bad_terminators, s.command_frames, s.observers,
                                 Queue().size(), Queue().dropped())
                  << std::endl;
      }
    }
  };
}

void StopPeriodic() {
  auto& thread = PeriodicThread();
  if (thread.joinable()) {
    thread.request_stop();
    thread.join();
  }
}

}  // namespace canusb::task

// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#include "task/task_macros.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <chrono>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_stop{false};

void onSignal(int) { g_stop = true; }
}

// usage: canusb-monitor [config.ini]
int main(int argc, char** argv) {
  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  std::cout.setf(std::ios::unitbuf); // frames are streamed line by line
  std::cout << "canusb-monitor starting..." << std::endl;
  CU_INIT_TASK(argc > 1 ? std::string(argv[1]) : std::string());
  CU_LISTENER_TASK();
  CU_PERIODIC_TASK();
  std::cout << "Initialization done. Waiting for CAN frames (Ctrl-C to quit)..." << std::endl;

  while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(100));

  CU_SHUTDOWN_TASK();
  return 0;
}

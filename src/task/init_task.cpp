// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// task/init_task.cpp
#include "task/init_task.hpp"
#include "task/listener_task.hpp"
#include "task/periodic_task.hpp"

#include "config/config_loader.hpp"
#include "mqtt/mqtt_publisher.hpp"

#include <iostream>

namespace canusb::task {
void Init(const std::string& config_path) {

  auto& cfg = canusb::config::ConfigLoader::getInstance();
  std::cout << "[Init] Starting init..." << std::endl;

  bool loaded = false;
  if (!config_path.empty()) {
    loaded = cfg.Load(config_path);
    if (!loaded) std::cerr << "[Init] Config not readable: " << config_path << std::endl;
  } else {
    // run from the repo root (./conf) or from build/ (../conf)
    loaded = cfg.Load("conf/config.ini") || cfg.Load("../conf/config.ini");
    if (!loaded) std::cerr << "[Init] Config not found (conf/config.ini or ../conf/config.ini)" << std::endl;
  }
  if (!loaded) std::cerr << "[Init] Continuing with built-in defaults" << std::endl;

  if (!cfg.GetBool("mqtt", "enabled", false)) {
    std::cout << "[Init] MQTT forwarding disabled" << std::endl;
    return;
  }

  auto& mqtt_pub = canusb::mqtt::Publisher::getInstance();
  auto uri = cfg.Get("mqtt", "uri", "tcp://localhost:1883");
  auto cid = cfg.Get("mqtt", "client_id", "canusb-monitor");
  int keepAlive = static_cast<int>(cfg.GetInt("mqtt", "keep_alive", 60));
  std::cout << "[Init] MQTT uri=" << uri << " client_id=" << cid << " keep=" << keepAlive << std::endl;
  if (!mqtt_pub.Init(uri, cid, keepAlive))
    std::cerr << "[Init] MQTT unavailable, frames will not be forwarded" << std::endl;
}

void Shutdown() {
  std::cout << "[Init] Shutting down..." << std::endl;
  StopPeriodic();
  StopListener();
  canusb::mqtt::Publisher::getInstance().Close();
}
}

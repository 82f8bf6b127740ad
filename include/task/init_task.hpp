// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#pragma once

#include <string>

namespace canusb::task {

/// Loads the INI config (explicit path, else conf/ or ../conf/) and brings up MQTT if enabled.
void Init(const std::string& config_path = "");

/// Stops periodic and listener tasks, disconnects the adapter, closes MQTT.
void Shutdown();

}

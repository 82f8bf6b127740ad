// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#pragma once

namespace canusb::task {

void StartPeriodic();
void StopPeriodic();

}

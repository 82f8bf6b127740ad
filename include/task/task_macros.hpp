// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#pragma once

#include "task/init_task.hpp"
#include "task/listener_task.hpp"
#include "task/periodic_task.hpp"
#include <thread>

#define CU_INIT_TASK(path)  ::canusb::task::Init(path)
#define CU_LISTENER_TASK()  ::canusb::task::StartListener()
#define CU_PERIODIC_TASK()  ::canusb::task::StartPeriodic()
#define CU_SHUTDOWN_TASK()  ::canusb::task::Shutdown()

// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#include "task/listener_task.hpp"
#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using canusb::config::ConfigLoader;
namespace task = canusb::task;

namespace {

// Points the listener at a port that never opens, so the supervisor only retries.
class ListenerTaskTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "canusb_listener_test.ini";
        std::ofstream out(path_);
        out << "[serial]\n"
               "port=/nonexistent/canusb-tty\n"
               "[os]\n"
               "reconnect_interval_ms=20\n"
               "queue_capacity=-5\n"
               "idle_sleep_us=-1\n"
               "[output]\n"
               "console=false\n";
        out.close();
        auto& cl = ConfigLoader::getInstance();
        cl.Clear();
        ASSERT_TRUE(cl.Load(path_.string()));
    }

    void TearDown() override {
        task::StopListener();
        ConfigLoader::getInstance().Clear();
        std::filesystem::remove(path_);
    }

    std::filesystem::path path_;
};

} // namespace

TEST_F(ListenerTaskTest, RestartRegistersQueueObserverOnce)
{
    task::StartListener();
    EXPECT_EQ(task::Session().stats().observers, 1u);
    task::StartListener();   // already running
    EXPECT_EQ(task::Session().stats().observers, 1u);

    task::StopListener();
    EXPECT_EQ(task::Session().stats().observers, 0u);
    EXPECT_TRUE(task::Queue().closed());

    task::StartListener();
    EXPECT_EQ(task::Session().stats().observers, 1u);
    EXPECT_FALSE(task::Queue().closed());
    EXPECT_FALSE(task::Session().connected());
}

TEST_F(ListenerTaskTest, NegativeCapacityKeepsQueueBounded)
{
    auto& queue = task::Queue();
    queue.reopen();   // a previous test may have stopped the listener
    const auto dropped_before = queue.dropped();
    for (uint32_t i = 0; i < 5000; ++i) {
        canusb::bus::Frame f;
        f.id = i;
        queue.push(f);
    }
    EXPECT_EQ(queue.size(), 4096u);
    EXPECT_EQ(queue.dropped() - dropped_before, 5000u - 4096u);
}

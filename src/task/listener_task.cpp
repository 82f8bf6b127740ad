// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#include "task/listener_task.hpp"
#include "serial/posix_serial_port.hpp"
#include "mqtt/mqtt_publisher.hpp"
#include "config/config_loader.hpp"
#include "util/json_utils.inl"

#include <absl/base/no_destructor.h>
#include <condition_variable>
#include <iostream>
#include <chrono>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

using canusb::bus::Frame;

namespace cfg = canusb::config;
namespace bus = canusb::bus;
namespace mqtt = canusb::mqtt;
namespace build_json = canusb::util::json;

namespace canusb::task
{
  namespace
  {
    struct ListenerState
    {
      std::jthread supervisor;
      std::jthread consumer;
      std::optional<bus::UsbCanSession::ObserverId> queue_observer;
      bool ended_logger {false};
    };

    ListenerState& State()
    {
      static absl::NoDestructor<ListenerState> state;
      return *state;
    }

    bus::SessionOptions LoadSessionOptions(const cfg::ConfigLoader& cl)
    {
      constexpr int64_t kMaxU32 = std::numeric_limits<uint32_t>::max();
      bus::SessionOptions opts;
      opts.port       = cl.Get("serial", "port", "/dev/ttyUSB0");
      opts.baudrate   = static_cast<uint32_t>(cl.GetIntInRange("serial", "baudrate", 2000000, 1, kMaxU32));
      opts.can_speed  = static_cast<uint32_t>(cl.GetIntInRange("can", "speed", bus::kDefaultCanSpeed, 1, kMaxU32));
      opts.idle_sleep = std::chrono::microseconds(cl.GetIntInRange("os", "idle_sleep_us", 500, 1, 1000000));
      return opts;
    }

    // Keeps the adapter connected; a dead session is reopened every reconnect interval.
    void Supervise(std::stop_token st, bus::SessionOptions opts, std::chrono::milliseconds retry)
    {
      auto& session = Session();
      std::mutex m;
      std::condition_variable_any cv;

      while (!st.stop_requested())
      {
        if (!session.connected() && !session.connect(opts))
          std::cerr << "[Listener] Connect to " << opts.port << " failed, retrying in "
                    << retry.count() << " ms\n";

        std::unique_lock lock(m);
        cv.wait_for(lock, st, retry, [] { return false; });
      }
    }

    void Consume(std::stop_token st)
    {
      auto &cl = cfg::ConfigLoader::getInstance();
      auto &mqtt_pub = mqtt::Publisher::getInstance();
      auto &queue = Queue();

      const bool console = cl.GetBool("output", "console", true);
      const std::string prefix = cl.Get("mqtt", "topic_prefix", "can");
      const std::string port = cl.Get("serial", "port", "/dev/ttyUSB0");
      const int qos = static_cast<int>(cl.GetInt("mqtt", "qos", 0));

      Frame frame;
      canusb_json j_canFrame;

      // a closed queue still hands out what it holds; pop() fails once it is drained
      while (true)
      {
        if (!queue.pop(frame, std::chrono::milliseconds(200)))
        {
          if (queue.closed() || st.stop_requested()) break;
          continue;
        }

        if (!build_json::BuildJson(j_canFrame, frame, cl))
        {
          std::cerr << "[Listener] Inconsistent frame, ID: " << frame.id << '\n';
          continue;
        }

        if (console)
          std::cout << j_canFrame.dump() << '\n';

        if (mqtt_pub.Connected())
          mqtt_pub.Publish(build_json::BuildTopic(prefix, port, frame.id), j_canFrame.dump(), qos);
      }
    }
  } // namespace

  bus::UsbCanSession& Session()
  {
    static absl::NoDestructor<bus::UsbCanSession> session(
        std::make_unique<canusb::serial::PosixSerialPort>());
    return *session;
  }

  FrameQueue& Queue()
  {
    static absl::NoDestructor<FrameQueue> queue(static_cast<std::size_t>(
        cfg::ConfigLoader::getInstance().GetIntInRange("os", "queue_capacity", 4096, 1, 1000000)));
    return *queue;
  }

  void StartListener()
  {
    auto &cl = cfg::ConfigLoader::getInstance();
    auto &session = Session();
    auto &queue = Queue();
    auto &state = State();

    if (state.supervisor.joinable())
    {
      std::cerr << "[Listener] Already running\n";
      return;
    }

    const auto opts = LoadSessionOptions(cl);
    const auto retry = std::chrono::milliseconds(
        cl.GetIntInRange("os", "reconnect_interval_ms", 2000, 1, 3600000));

    queue.reopen();
    state.queue_observer = session.addObserver([&queue](const Frame &f) { queue.push(f); });

    // ended observers cannot be removed, so this one outlives a restart
    if (!state.ended_logger)
    {
      session.addEndedObserver([](const std::string &reason) {
        std::cerr << "[Listener] Session lost (" << reason << "), supervisor will reconnect\n";
      });
      state.ended_logger = true;
    }

    state.consumer = std::jthread(Consume);
    state.supervisor = std::jthread(Supervise, opts, retry);
  }

  void StopListener()
  {
    auto &state = State();
    if (state.supervisor.joinable())
    {
      state.supervisor.request_stop();
      state.supervisor.join();
    }
    Session().disconnect();
    if (state.queue_observer)
    {
      Session().removeObserver(*state.queue_observer);
      state.queue_observer.reset();
    }
    Queue().close();
    if (state.consumer.joinable())
    {
      state.consumer.request_stop();
      state.consumer.join();
    }
  }

} // namespace canusb::task

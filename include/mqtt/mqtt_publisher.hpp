// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <MQTTClient.h>
#include <absl/base/no_destructor.h>

namespace canusb::mqtt
{

    class Publisher
    {
    public:
        Publisher(const Publisher&) = delete; // non-copyable
        Publisher& operator=(const Publisher&) = delete; // non-copyable

        ~Publisher() { Close(); }

        bool Init(const std::string &uri,
                  const std::string &client_id,
                  int keep_alive = 20);
        bool Publish(const std::string &topic,
                     const std::string &payload,
                     int qos = 0);
        void Close();
        bool Connected() const { return connected_; }
        static Publisher& getInstance();
    private:
        friend class absl::NoDestructor<Publisher>;
        Publisher() = default;
        MQTTClient client_{nullptr};
        bool connected_{false};
    };

} // namespace canusb::mqtt

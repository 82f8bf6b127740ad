// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#include "mqtt/mqtt_publisher.hpp"
#include <iostream>

namespace canusb::mqtt
{
    Publisher& Publisher::getInstance()
    {
        static absl::NoDestructor<Publisher> instance;

        return *instance;
    }

    bool Publisher::Init(const std::string &uri,
                         const std::string &client_id,
                         int keep_alive)
    {
        if (connected_) return true;

        int rc = MQTTClient_create(&client_, uri.c_str(), client_id.c_str(),
                                   MQTTCLIENT_PERSISTENCE_NONE, nullptr);
        if (rc != MQTTCLIENT_SUCCESS)
        {
            std::cerr << "[MQTT] create failed for " << uri << ", rc=" << rc << '\n';
            client_ = nullptr;
            return false;
        }

        MQTTClient_connectOptions opts = MQTTClient_connectOptions_initializer;
        opts.keepAliveInterval = keep_alive;
        opts.cleansession = 1;

        rc = MQTTClient_connect(client_, &opts);
        if (rc != MQTTCLIENT_SUCCESS)
        {
            std::cerr << "[MQTT] connect failed, rc=" << rc << '\n';
            MQTTClient_destroy(&client_);
            client_ = nullptr;
            return false;
        }
        connected_ = true;
        std::cout << "[MQTT] Connected to " << uri << " as " << client_id << std::endl;
        return true;
    }

    bool Publisher::Publish(const std::string &topic,
                            const std::string &payload,
                            int qos)
    {
        if (!connected_) return false;

        MQTTClient_message msg = MQTTClient_message_initializer;
        msg.payload = const_cast<char *>(payload.data());
        msg.payloadlen = static_cast<int>(payload.size());
        msg.qos = qos;
        msg.retained = 0;

        int rc = MQTTClient_publishMessage(client_, topic.c_str(), &msg, nullptr);
        if (rc != MQTTCLIENT_SUCCESS)
        {
            std::cerr << "[MQTT] publish to " << topic << " failed, rc=" << rc << '\n';
            return false;
        }
        return true;
    }

    void Publisher::Close()
    {
        if (!client_) return;
        if (connected_)
        {
            MQTTClient_disconnect(client_, 1000);
            connected_ = false;
        }
        MQTTClient_destroy(&client_);
        client_ = nullptr;
    }

} // namespace canusb::mqtt

#pragma once

#include "publisher.hpp"
#include <mqtt/async_client.h>
#include <memory>
#include <string>

namespace mavtrack {

struct MqttSettings {
    std::string host;
    int port = 1883;
    std::string topic;
    std::string client_id = "mavtrack";
    int qos = 0;
    bool retain = false;
};

// Paho async client used synchronously: every token is waited on with the
// publisher timeout, so a hung broker costs at most one timeout per call.
class MqttPublisher : public Publisher {
public:
    MqttPublisher(std::string name, const MqttSettings& settings);
    ~MqttPublisher() override;

    std::string endpoint() const override;
    std::string server_uri() const;
    const MqttSettings& settings() const { return _settings; }

protected:
    Result<Empty, Error> open_connection() override;
    Result<Empty, Error> send(const std::string& payload, const TrackingUpdate& update) override;
    void close_connection() override;

private:
    MqttSettings _settings;
    std::unique_ptr<mqtt::async_client> _client;
};

} // namespace mavtrack

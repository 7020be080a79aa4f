#include "mqtt_publisher.hpp"
#include "zf_log.h"
#include <stdexcept>

namespace mavtrack {

MqttPublisher::MqttPublisher(std::string name, const MqttSettings& settings)
    : Publisher(std::move(name), SinkKind::Mqtt), _settings(settings) {
    if (_settings.host.empty() || _settings.topic.empty()) {
        throw std::invalid_argument("MqttPublisher requires host and topic");
    }
    if (_settings.port < 1 || _settings.port > 65535) {
        throw std::invalid_argument("MqttPublisher port out of range (1-65535)");
    }
    if (_settings.qos < 0 || _settings.qos > 2) {
        throw std::invalid_argument("MqttPublisher QoS must be 0, 1 or 2");
    }
}

MqttPublisher::~MqttPublisher() {
    close_connection();
}

std::string MqttPublisher::server_uri() const {
    return "tcp://" + _settings.host + ":" + std::to_string(_settings.port);
}

std::string MqttPublisher::endpoint() const {
    return server_uri() + "/" + _settings.topic;
}

Result<Empty, Error> MqttPublisher::open_connection() {
    close_connection();

    try {
        _client = std::make_unique<mqtt::async_client>(server_uri(), _settings.client_id);

        auto options = mqtt::connect_options_builder()
            .clean_session(true)
            .connect_timeout(timeout())
            .keep_alive_interval(std::chrono::seconds(20))
            .automatic_reconnect(false)
            .finalize();

        mqtt::token_ptr tok = _client->connect(options);
        if (!tok->wait_for(timeout())) {
            ZF_LOGW("%s: connect to %s timed out after %lld ms", name().c_str(), server_uri().c_str(),
                    static_cast<long long>(timeout().count()));
            return Error::Timeout;
        }
    } catch (const mqtt::exception& e) {
        ZF_LOGW("%s: cannot connect to %s: %s", name().c_str(), server_uri().c_str(), e.what());
        return Error::BrokerUnavailable;
    }
    return Empty{};
}

Result<Empty, Error> MqttPublisher::send(const std::string& payload, const TrackingUpdate& update) {
    if (!_client || !_client->is_connected()) {
        ZF_LOGW("%s: connection to %s lost", name().c_str(), server_uri().c_str());
        return Error::BrokerUnavailable;
    }

    try {
        auto msg = mqtt::make_message(_settings.topic, payload, _settings.qos, _settings.retain);
        mqtt::delivery_token_ptr tok = _client->publish(msg);
        if (!tok->wait_for(timeout())) {
            ZF_LOGW("%s: publish for '%s' timed out", name().c_str(), update.uav_id.c_str());
            return Error::Timeout;
        }
    } catch (const mqtt::exception& e) {
        ZF_LOGW("%s: publish for '%s' failed: %s", name().c_str(), update.uav_id.c_str(), e.what());
        return Error::BrokerUnavailable;
    }
    return Empty{};
}

void MqttPublisher::close_connection() {
    if (!_client) {
        return;
    }
    try {
        if (_client->is_connected()) {
            _client->disconnect()->wait_for(timeout());
        }
    } catch (const mqtt::exception& e) {
        ZF_LOGD("%s: disconnect from %s: %s", name().c_str(), server_uri().c_str(), e.what());
    }
    _client.reset();
}

} // namespace mavtrack

#include "bridge_config.hpp"
#include "zf_log.h"
#include <yaml-cpp/yaml.h>

namespace mavtrack {

namespace {

template <typename T>
bool read_value(const YAML::Node& section, const char* key, T& out, const char* section_name) {
    const YAML::Node value = section[key];
    if (!value.IsDefined() || value.IsNull()) {
        return false;
    }
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value for '") + section_name + key + "': " + e.msg);
    }
    return true;
}

YAML::Node map_section(const YAML::Node& root, const char* key) {
    const YAML::Node section = root[key];
    if (!section.IsDefined() || section.IsNull()) {
        return YAML::Node(YAML::NodeType::Map);
    }
    if (!section.IsMap()) {
        throw ConfigError(std::string("Section '") + key + "' must be a mapping");
    }
    return section;
}

bool section_present(const YAML::Node& root, const char* key) {
    return root[key].IsDefined();
}

void parse_mavlink(const YAML::Node& root, BridgeConfig& config) {
    const YAML::Node mav = map_section(root, "mavlink");
    read_value(mav, "device", config.mavlink.device, "mavlink.");
    read_value(mav, "baud", config.mavlink.baud, "mavlink.");

    const YAML::Node messages = mav["positionMessages"];
    if (messages.IsDefined() && !messages.IsNull()) {
        if (!messages.IsSequence()) {
            throw ConfigError("'mavlink.positionMessages' must be a list");
        }
        config.mavlink.position_messages.clear();
        for (const auto& item : messages) {
            try {
                config.mavlink.position_messages.push_back(item.as<std::string>());
            } catch (const YAML::Exception& e) {
                throw ConfigError(std::string("Invalid entry in 'mavlink.positionMessages': ") + e.msg);
            }
        }
    }
}

void parse_amqp(const YAML::Node& root, BridgeConfig& config) {
    config.amqp_present = section_present(root, "amqp");
    if (!config.amqp_present) {
        return;
    }
    const YAML::Node amqp = map_section(root, "amqp");
    read_value(amqp, "host", config.amqp.host, "amqp.");
    read_value(amqp, "username", config.amqp.username, "amqp.");
    read_value(amqp, "password", config.amqp.password, "amqp.");
    read_value(amqp, "queue", config.amqp.queue, "amqp.");
    read_value(amqp, "port", config.amqp.port, "amqp.");
    read_value(amqp, "vhost", config.amqp.vhost, "amqp.");
    read_value(amqp, "exchange", config.amqp.exchange, "amqp.");
    read_value(amqp, "tls", config.amqp.tls, "amqp.");
    read_value(amqp, "verifyPeer", config.amqp.verify_peer, "amqp.");
}

void parse_mqtt(const YAML::Node& root, BridgeConfig& config) {
    config.mqtt_present = section_present(root, "mqtt");
    if (!config.mqtt_present) {
        return;
    }
    const YAML::Node mqtt = map_section(root, "mqtt");
    read_value(mqtt, "host", config.mqtt.host, "mqtt.");
    config.mqtt_port_set = read_value(mqtt, "port", config.mqtt.port, "mqtt.");
    read_value(mqtt, "topic", config.mqtt.topic, "mqtt.");
    read_value(mqtt, "clientId", config.mqtt.client_id, "mqtt.");
    read_value(mqtt, "qos", config.mqtt.qos, "mqtt.");
}

void parse_tuning(const YAML::Node& root, BridgeConfig& config) {
    read_value(root, "altitudeOffsetMeters", config.altitude_offset_m, "");
    read_value(root, "setFlyingWhenGrounded", config.set_flying_when_grounded, "");
    read_value(root, "flightOperationId", config.flight_operation_id, "");
    read_value(root, "groundedAltitudeMeters", config.grounded.altitude_m, "");
    read_value(root, "groundedSpeedMetersPerSecond", config.grounded.speed_mps, "");
    read_value(root, "uavIdleTimeoutSeconds", config.uav_idle_timeout_s, "");
    read_value(root, "shutdownGraceMilliseconds", config.shutdown_grace_ms, "");
    read_value(root, "publishTimeoutMilliseconds", config.publish_timeout_ms, "");

    const YAML::Node reconnect = map_section(root, "reconnect");
    long long initial_ms = config.reconnect.initial.count();
    long long max_ms = config.reconnect.max.count();
    read_value(reconnect, "initialMilliseconds", initial_ms, "reconnect.");
    read_value(reconnect, "maxMilliseconds", max_ms, "reconnect.");
    config.reconnect.initial = std::chrono::milliseconds(initial_ms);
    config.reconnect.max = std::chrono::milliseconds(max_ms);

    const YAML::Node logging = map_section(root, "logging");
    read_value(logging, "file", config.logging.file, "logging.");
    read_value(logging, "rotateBytes", config.logging.rotate_bytes, "logging.");
    read_value(logging, "backups", config.logging.backups, "logging.");
}

} // namespace

BridgeConfig parse_config(const YAML::Node& root) {
    BridgeConfig config;
    if (!root.IsDefined() || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Settings must be a YAML mapping");
    }

    parse_mavlink(root, config);
    parse_amqp(root, config);
    parse_mqtt(root, config);
    parse_tuning(root, config);
    return config;
}

BridgeConfig load_config_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot read settings file '" + path + "'");
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse settings file '" + path + "': " + e.what());
    }
    return parse_config(root);
}

BridgeConfig load_config_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Cannot parse settings: ") + e.what());
    }
    return parse_config(root);
}

std::vector<std::string> missing_amqp_keys(const BridgeConfig& config) {
    std::vector<std::string> missing;
    if (config.amqp.host.empty()) missing.push_back("host");
    if (config.amqp.username.empty()) missing.push_back("username");
    if (config.amqp.password.empty()) missing.push_back("password");
    if (config.amqp.queue.empty()) missing.push_back("queue");
    return missing;
}

std::vector<std::string> missing_mqtt_keys(const BridgeConfig& config) {
    std::vector<std::string> missing;
    if (config.mqtt.host.empty()) missing.push_back("host");
    if (!config.mqtt_port_set) missing.push_back("port");
    if (config.mqtt.topic.empty()) missing.push_back("topic");
    return missing;
}

void validate_config(BridgeConfig& config) {
    config.enable_amqp = false;
    if (config.amqp_present) {
        auto missing = missing_amqp_keys(config);
        for (const auto& key : missing) {
            ZF_LOGE("Key '%s' missing from AMQP config", key.c_str());
        }
        config.enable_amqp = missing.empty();
    }

    config.enable_mqtt = false;
    if (config.mqtt_present) {
        auto missing = missing_mqtt_keys(config);
        for (const auto& key : missing) {
            ZF_LOGE("Key '%s' missing from MQTT config", key.c_str());
        }
        config.enable_mqtt = missing.empty();
    }

    if (!config.enable_amqp && !config.enable_mqtt) {
        throw ConfigError("A valid AMQP or MQTT config is required");
    }

    if (config.enable_amqp && (config.amqp.port < 0 || config.amqp.port > 65535)) {
        throw ConfigError("amqp.port out of range (1-65535)");
    }
    if (config.enable_mqtt && (config.mqtt.port < 1 || config.mqtt.port > 65535)) {
        throw ConfigError("mqtt.port out of range (1-65535)");
    }
    if (config.enable_mqtt && (config.mqtt.qos < 0 || config.mqtt.qos > 2)) {
        throw ConfigError("mqtt.qos must be 0, 1 or 2");
    }

    if (config.mavlink.device.empty()) {
        throw ConfigError("No MAVLink device specified in config or CLI options");
    }
    try {
        config.connection = parse_connection_string(config.mavlink.device, config.mavlink.baud);
        config.position_messages = parse_position_messages(config.mavlink.position_messages);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    if (config.grounded.altitude_m < 0.0 || config.grounded.speed_mps < 0.0) {
        throw ConfigError("Grounded thresholds must not be negative");
    }
    if (config.uav_idle_timeout_s < 0) {
        throw ConfigError("uavIdleTimeoutSeconds must not be negative");
    }
    if (config.shutdown_grace_ms < 0 || config.publish_timeout_ms <= 0) {
        throw ConfigError("shutdownGraceMilliseconds must not be negative and publishTimeoutMilliseconds must be positive");
    }
    if (config.reconnect.initial.count() <= 0 || config.reconnect.max < config.reconnect.initial) {
        throw ConfigError("reconnect needs 0 < initialMilliseconds <= maxMilliseconds");
    }
}

PublisherBuilders default_publisher_builders() {
    PublisherBuilders builders;
    builders.amqp = [](const AmqpSettings& settings) {
        return std::unique_ptr<Publisher>(std::make_unique<AmqpPublisher>("AMQP Sink", settings));
    };
    builders.mqtt = [](const MqttSettings& settings) {
        return std::unique_ptr<Publisher>(std::make_unique<MqttPublisher>("MQTT Sink", settings));
    };
    return builders;
}

std::vector<std::unique_ptr<Publisher>> make_publishers(const BridgeConfig& config,
                                                        const PublisherBuilders& builders) {
    std::vector<std::unique_ptr<Publisher>> publishers;
    if (config.enable_amqp) {
        if (!builders.amqp) {
            throw std::logic_error("AMQP sink enabled without an AMQP builder");
        }
        publishers.push_back(builders.amqp(config.amqp));
    }
    if (config.enable_mqtt) {
        if (!builders.mqtt) {
            throw std::logic_error("MQTT sink enabled without an MQTT builder");
        }
        publishers.push_back(builders.mqtt(config.mqtt));
    }
    return publishers;
}

} // namespace mavtrack

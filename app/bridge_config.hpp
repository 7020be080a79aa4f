#pragma once

#include "mavtrack_utils.hpp"
#include "desktop_blocks/mavlink/mavlink_decoder.hpp"
#include "desktop_blocks/mavlink/mavlink_link.hpp"
#include "desktop_blocks/sinks/amqp_publisher.hpp"
#include "desktop_blocks/sinks/mqtt_publisher.hpp"
#include "desktop_blocks/tracking/flight_state_policy.hpp"
#include "desktop_blocks/tracking/tracking_builder.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace YAML { class Node; }

namespace mavtrack {

// Anything that must stop the bridge before it opens a connection
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr const char* DEFAULT_SETTINGS_FILE = "settings.yml";

struct MavlinkSection {
    std::string device;
    int baud = DEFAULT_SERIAL_BAUD;
    std::vector<std::string> position_messages{"UTM_GLOBAL_POSITION"};
};

struct LoggingSection {
    std::string file;
    size_t rotate_bytes = 0;        // 0 disables rotation
    int backups = 5;
};

// Settings file merged with command line overrides. Broker sections keep
// whatever keys were given; validate_config() decides which sinks survive.
struct BridgeConfig {
    MavlinkSection mavlink;

    bool amqp_present = false;
    AmqpSettings amqp;
    bool mqtt_present = false;
    bool mqtt_port_set = false;
    MqttSettings mqtt;

    double altitude_offset_m = 0.0;
    bool set_flying_when_grounded = false;
    std::string flight_operation_id = DEFAULT_FLIGHT_OPERATION_ID;
    GroundedThresholds grounded;
    int uav_idle_timeout_s = 0;
    int shutdown_grace_ms = 2000;
    int publish_timeout_ms = 2000;
    BackoffPolicy reconnect;
    LoggingSection logging;

    // Filled in by validate_config()
    bool enable_amqp = false;
    bool enable_mqtt = false;
    ConnectionSpec connection;
    PositionMessageSet position_messages;
};

// Throws ConfigError on unreadable files, YAML syntax errors and wrongly typed values
BridgeConfig load_config_file(const std::string& path);
BridgeConfig load_config_string(const std::string& yaml);
BridgeConfig parse_config(const YAML::Node& root);

// Required AMQP keys: host, username, password, queue. Required MQTT keys:
// host, port, topic. An incomplete section is logged and disabled; no
// remaining sink, no MAVLink device or a malformed device is a ConfigError.
void validate_config(BridgeConfig& config);

std::vector<std::string> missing_amqp_keys(const BridgeConfig& config);
std::vector<std::string> missing_mqtt_keys(const BridgeConfig& config);

// Seams for tests: the builders decide what a configured sink turns into
struct PublisherBuilders {
    std::function<std::unique_ptr<Publisher>(const AmqpSettings&)> amqp;
    std::function<std::unique_ptr<Publisher>(const MqttSettings&)> mqtt;
};

PublisherBuilders default_publisher_builders();

// One publisher per enabled sink, AMQP first. Requires a validated config.
std::vector<std::unique_ptr<Publisher>> make_publishers(const BridgeConfig& config,
                                                        const PublisherBuilders& builders);

} // namespace mavtrack

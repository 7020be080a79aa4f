#pragma once

#include "bridge_config.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace mavtrack {

struct CliOptions {
    std::string config_path = DEFAULT_SETTINGS_FILE;
    bool config_path_given = false;
    int verbosity = 0;
    bool help = false;

    std::optional<std::string> device;
    std::optional<std::string> log_file;
    std::optional<double> altitude_offset;
    bool set_flying_when_grounded = false;

    std::optional<std::string> amqp_host;
    std::optional<std::string> amqp_username;
    std::optional<std::string> amqp_password;
    std::optional<std::string> amqp_queue;

    std::optional<std::string> mqtt_host;
    std::optional<int> mqtt_port;
    std::optional<std::string> mqtt_topic;
};

// Accepts "--flag value" and "--flag=value". Throws ConfigError on unknown
// flags, missing values and malformed numbers.
CliOptions parse_cli(int argc, const char* const* argv);

void print_usage(std::ostream& out, const char* program);

// Command line values win over the settings file
void apply_cli_overrides(const CliOptions& cli, BridgeConfig& config);

// Settings file + overrides + validation. A missing default settings file is
// tolerated (everything may come from the command line); a missing file that
// was named with -c is not.
BridgeConfig load_bridge_config(const CliOptions& cli);

} // namespace mavtrack

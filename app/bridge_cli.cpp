#include "bridge_cli.hpp"
#include "zf_log.h"
#include <cstring>
#include <fstream>

namespace mavtrack {

namespace {

class ArgReader {
public:
    ArgReader(int argc, const char* const* argv) : _argc(argc), _argv(argv) {}

    bool done() const { return _index >= _argc; }

    // Splits "--flag=value"; value() then returns the inline part
    std::string next_flag() {
        std::string arg = _argv[_index++];
        _inline_value.reset();
        if (arg.compare(0, 2, "--") == 0) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                _inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }
        return arg;
    }

    std::string value(const std::string& flag) {
        if (_inline_value) {
            std::string v = *_inline_value;
            _inline_value.reset();
            return v;
        }
        if (_index >= _argc) {
            throw ConfigError("Missing value for " + flag);
        }
        return _argv[_index++];
    }

    void expect_no_value(const std::string& flag) const {
        if (_inline_value) {
            throw ConfigError(flag + " does not take a value");
        }
    }

private:
    int _argc;
    const char* const* _argv;
    int _index = 1;
    std::optional<std::string> _inline_value;
};

double to_double(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used == text.size()) {
            return v;
        }
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range, reported below
    }
    throw ConfigError("Invalid number for " + flag + ": '" + text + "'");
}

int to_int(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used == text.size()) {
            return v;
        }
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range, reported below
    }
    throw ConfigError("Invalid integer for " + flag + ": '" + text + "'");
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

} // namespace

CliOptions parse_cli(int argc, const char* const* argv) {
    CliOptions cli;
    ArgReader args(argc, argv);

    while (!args.done()) {
        const std::string flag = args.next_flag();

        if (flag == "-h" || flag == "--help") {
            cli.help = true;
        } else if (flag == "-c" || flag == "--config") {
            cli.config_path = args.value(flag);
            cli.config_path_given = true;
        } else if (flag == "-d" || flag == "--device") {
            cli.device = args.value(flag);
        } else if (flag == "--verbose") {
            args.expect_no_value(flag);
            cli.verbosity++;
        } else if (flag.size() >= 2 && flag[0] == '-' && flag[1] == 'v' &&
                   flag.find_first_not_of('v', 1) == std::string::npos) {
            cli.verbosity += static_cast<int>(flag.size() - 1);
        } else if (flag == "--log-file") {
            cli.log_file = args.value(flag);
        } else if (flag == "--altitude-offset") {
            cli.altitude_offset = to_double(flag, args.value(flag));
        } else if (flag == "--set-flying-when-grounded") {
            args.expect_no_value(flag);
            cli.set_flying_when_grounded = true;
        } else if (flag == "--amqp-host") {
            cli.amqp_host = args.value(flag);
        } else if (flag == "--amqp-username") {
            cli.amqp_username = args.value(flag);
        } else if (flag == "--amqp-password") {
            cli.amqp_password = args.value(flag);
        } else if (flag == "--amqp-queue") {
            cli.amqp_queue = args.value(flag);
        } else if (flag == "--mqtt-host") {
            cli.mqtt_host = args.value(flag);
        } else if (flag == "--mqtt-port") {
            cli.mqtt_port = to_int(flag, args.value(flag));
        } else if (flag == "--mqtt-topic") {
            cli.mqtt_topic = args.value(flag);
        } else {
            throw ConfigError("Unknown argument: " + flag);
        }
    }
    return cli;
}

void print_usage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " [options]\n"
        << "\nMAVLink Network Remote ID (Tracking) Bridge\n"
        << "\nOptions:\n"
        << "  -h, --help                    show this help and exit\n"
        << "  -c, --config PATH             path to settings file (default: " << DEFAULT_SETTINGS_FILE << ")\n"
        << "  -d, --device ADDRESS          connection address, e.g. tcp:$ip:$port, udpin:$ip:$port,\n"
        << "                                udpout:$ip:$port or /dev/ttyUSB0[,baud]\n"
        << "  -v, --verbose                 increase output and logging verbosity (-v info, -vv debug)\n"
        << "      --log-file PATH           also append log output to PATH\n"
        << "      --altitude-offset METERS  added to every reported altitude\n"
        << "      --set-flying-when-grounded\n"
        << "                                always report the UAV as flying\n"
        << "      --amqp-host HOST          AMQP broker host\n"
        << "      --amqp-username NAME      AMQP user\n"
        << "      --amqp-password SECRET    AMQP password\n"
        << "      --amqp-queue QUEUE        AMQP routing key / queue\n"
        << "      --mqtt-host HOST          MQTT broker host\n"
        << "      --mqtt-port PORT          MQTT broker port\n"
        << "      --mqtt-topic TOPIC        MQTT topic\n"
        << "\nExamples:\n"
        << "  " << program << " -c settings.yml -d udpin:0.0.0.0:14550 -v\n"
        << "  " << program << " -d /dev/ttyACM0,115200 --mqtt-host localhost --mqtt-port 1883 --mqtt-topic tracking\n";
}

void apply_cli_overrides(const CliOptions& cli, BridgeConfig& config) {
    if (cli.device) config.mavlink.device = *cli.device;
    if (cli.log_file) config.logging.file = *cli.log_file;
    if (cli.altitude_offset) config.altitude_offset_m = *cli.altitude_offset;
    if (cli.set_flying_when_grounded) config.set_flying_when_grounded = true;

    if (cli.amqp_host || cli.amqp_username || cli.amqp_password || cli.amqp_queue) {
        config.amqp_present = true;
    }
    if (cli.amqp_host) config.amqp.host = *cli.amqp_host;
    if (cli.amqp_username) config.amqp.username = *cli.amqp_username;
    if (cli.amqp_password) config.amqp.password = *cli.amqp_password;
    if (cli.amqp_queue) config.amqp.queue = *cli.amqp_queue;

    if (cli.mqtt_host || cli.mqtt_port || cli.mqtt_topic) {
        config.mqtt_present = true;
    }
    if (cli.mqtt_host) config.mqtt.host = *cli.mqtt_host;
    if (cli.mqtt_port) {
        config.mqtt.port = *cli.mqtt_port;
        config.mqtt_port_set = true;
    }
    if (cli.mqtt_topic) config.mqtt.topic = *cli.mqtt_topic;
}

BridgeConfig load_bridge_config(const CliOptions& cli) {
    BridgeConfig config;
    if (cli.config_path_given || file_exists(cli.config_path)) {
        config = load_config_file(cli.config_path);
    } else {
        ZF_LOGW("Settings file '%s' not found, using command line options only", cli.config_path.c_str());
    }

    apply_cli_overrides(cli, config);
    validate_config(config);
    return config;
}

} // namespace mavtrack

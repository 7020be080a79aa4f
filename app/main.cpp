#include "bridge_cli.hpp"
#include "bridge_controller.hpp"
#include "desktop_logger/desktop_logger.hpp"
#include "zf_log.h"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested = true;
}

int setup_logging(const mavtrack::BridgeConfig& config, int verbosity) {
    mavtrack::set_log_level(mavtrack::log_level_from_verbosity(verbosity));
    if (config.logging.file.empty()) {
        return 0;
    }

    auto ret = mavtrack::reset_logfile(config.logging.file.c_str());
    if (ret != mavtrack::LOGGER_SUCCESS) {
        ZF_LOGE("Cannot open log file '%s': %s", config.logging.file.c_str(), mavtrack::logger_retval_to_cstr(ret));
        return 1;
    }
    if (config.logging.rotate_bytes > 0) {
        mavtrack::enable_log_rotation(config.logging.rotate_bytes, config.logging.backups);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    mavtrack::start_logging();
    mavtrack::set_log_level(mavtrack::LOG_WARN);

    mavtrack::CliOptions cli;
    try {
        cli = mavtrack::parse_cli(argc, argv);
    } catch (const mavtrack::ConfigError& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n\n";
        mavtrack::print_usage(std::cerr, argv[0]);
        return 1;
    }

    if (cli.help) {
        mavtrack::print_usage(std::cout, argv[0]);
        return 0;
    }
    mavtrack::set_log_level(mavtrack::log_level_from_verbosity(cli.verbosity));

    try {
        mavtrack::BridgeConfig config = mavtrack::load_bridge_config(cli);
        if (setup_logging(config, cli.verbosity) != 0) {
            return 1;
        }

        mavtrack::BridgeController bridge(config);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        return bridge.run(&g_stop_requested);
    } catch (const mavtrack::ConfigError& e) {
        ZF_LOGE("%s", e.what());
        if (!cli.device) {
            mavtrack::print_usage(std::cerr, argv[0]);
        }
        return 1;
    } catch (const std::exception& e) {
        ZF_LOGF(ZF_ADD_LOCATION("Unrecoverable startup failure: %s", e.what()));
        return 1;
    }
}

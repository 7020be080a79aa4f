#pragma once

#include "bridge_config.hpp"
#include "mavtrack_utils.hpp"
#include "desktop_blocks/mavlink/source_mavlink.hpp"
#include "desktop_blocks/sinks/sink_manager.hpp"
#include "desktop_blocks/tracking/system_state_tracker.hpp"
#include <atomic>
#include <memory>
#include <vector>

namespace mavtrack {

struct BridgeRunSummary {
    size_t connects = 0;
    size_t link_failures = 0;
    DecoderStats decoder;
    size_t tracked = 0;
    std::vector<SinkStats> sinks;
};

// source -> tracking -> sinks, one flowgraph task each. Everything that can
// fail without a network is checked in the constructor.
class BridgeController {
public:
    // Throws ConfigError when the config enables no sink
    explicit BridgeController(const BridgeConfig& config,
                              const PublisherBuilders& builders = default_publisher_builders(),
                              SourceMavlinkBlock::LinkOpener opener = open_link);

    BridgeController(const BridgeController&) = delete;
    BridgeController& operator=(const BridgeController&) = delete;

    // Blocks until request_stop(), `interrupt` turning true (polled, so a
    // signal handler may set it) or a fatal block error. Returns the exit code.
    int run(const std::atomic<bool>* interrupt = nullptr);

    void request_stop() { _shutdown.request(); }
    bool stop_requested() const { return _shutdown.requested(); }

    size_t sink_count() const { return _publishers_built; }
    const BridgeConfig& config() const { return _config; }
    const BridgeRunSummary& summary() const { return _summary; }

private:
    static void on_flowgraph_terminate(void* context);

    BridgeConfig _config;
    SourceMavlinkBlock::LinkOpener _opener;
    ShutdownSignal _shutdown;
    std::vector<std::unique_ptr<Publisher>> _publishers;
    size_t _publishers_built = 0;
    std::unique_ptr<SystemStateTracker> _tracker;
    std::atomic<bool> _fatal{false};
    bool _ran = false;
    BridgeRunSummary _summary;
};

} // namespace mavtrack

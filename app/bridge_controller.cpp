#include "bridge_controller.hpp"
#include "task_policies/mavtrack_desktop_tpolicy.hpp"
#include "desktop_blocks/tracking/tracking_block.hpp"
#include "desktop_logger/desktop_logger.hpp"
#include "zf_log.h"

namespace mavtrack {

BridgeController::BridgeController(const BridgeConfig& config,
                                   const PublisherBuilders& builders,
                                   SourceMavlinkBlock::LinkOpener opener)
    : _config(config),
      _opener(std::move(opener)) {
    if (!_config.enable_amqp && !_config.enable_mqtt) {
        throw ConfigError("A valid AMQP or MQTT config is required");
    }
    if (!_opener) {
        throw std::invalid_argument("BridgeController requires a link opener");
    }

    _publishers = make_publishers(_config, builders);
    if (_publishers.empty()) {
        throw ConfigError("A valid AMQP or MQTT config is required");
    }
    _publishers_built = _publishers.size();

    _tracker = std::make_unique<SystemStateTracker>(
        std::make_unique<ReportedFlightStatePolicy>(_config.grounded),
        _config.set_flying_when_grounded,
        std::chrono::seconds(_config.uav_idle_timeout_s));
}

void BridgeController::on_flowgraph_terminate(void* context) {
    auto* self = static_cast<BridgeController*>(context);
    ZF_LOGE(ZF_ADD_LOCATION("A pipeline block failed fatally, shutting down"));
    self->_fatal.store(true);
    self->_shutdown.request();
}

int BridgeController::run(const std::atomic<bool>* interrupt) {
    if (_ran) {
        throw std::logic_error("BridgeController::run may only be called once");
    }
    _ran = true;

    TrackingBuilderConfig builder_config;
    builder_config.altitude_offset_m = _config.altitude_offset_m;
    builder_config.flight_operation_id = _config.flight_operation_id;

    SinkManagerConfig sink_config;
    sink_config.reconnect = _config.reconnect;
    sink_config.publish_timeout = std::chrono::milliseconds(_config.publish_timeout_ms);
    sink_config.shutdown_grace = std::chrono::milliseconds(_config.shutdown_grace_ms);

    SourceMavlinkBlock source("MAVLink Source", _config.connection, _config.position_messages,
                              _config.reconnect, _shutdown, _opener);
    TrackingBlock tracking("Tracking", *_tracker, builder_config);
    SinkManagerBlock sinks("Sink Manager", std::move(_publishers), sink_config);

    ZF_LOGI("Starting MAVLink connection to %s", _config.connection.text.c_str());
    sinks.start();

    auto flowgraph = make_desktop_flowgraph(
        BlockRunner(&source, &tracking.in),
        BlockRunner(&tracking, &sinks.in),
        BlockRunner(&sinks)
    );
    flowgraph.set_on_err_terminate_cb(on_flowgraph_terminate, this);

    FlowGraphConfig fg_config;
    fg_config.adaptive_sleep = true;
    flowgraph.run(fg_config);

    while (!_shutdown.wait_for(std::chrono::milliseconds(100))) {
        if (interrupt && interrupt->load()) {
            ZF_LOGW("Stop requested, shutting down");
            _shutdown.request();
        }
    }

    // Bounded: the source polls its link with a short timeout and every
    // reconnect wait ends on the shutdown signal.
    flowgraph.stop();
    source.close();
    sinks.drain_status();
    sinks.shutdown(std::chrono::milliseconds(_config.shutdown_grace_ms));

    _summary.connects = source.connects();
    _summary.link_failures = source.link_failures();
    _summary.decoder = source.decoder_stats();
    _summary.tracked = tracking.tracked();
    _summary.sinks = sinks.all_stats();

    ZF_LOGI("MAVLink: %zu frames, %zu ignored, %zu decode errors, %zu link failures",
            _summary.decoder.frames, _summary.decoder.ignored,
            _summary.decoder.decode_errors, _summary.link_failures);
    for (const auto& s : _summary.sinks) {
        ZF_LOGI("%s: %zu delivered, %zu skipped, %zu failed, %zu dropped, %zu connects",
                s.name.c_str(), s.counters.delivered, s.counters.skipped, s.counters.failed,
                s.dropped_inbox_full, s.counters.connects);
    }

    return _fatal.load() ? 1 : 0;
}

} // namespace mavtrack

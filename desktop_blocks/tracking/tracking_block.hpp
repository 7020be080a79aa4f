#pragma once

#include "mavtrack.hpp"
#include "system_state_tracker.hpp"
#include "tracking_builder.hpp"

namespace mavtrack {

// Single sequential stage between the telemetry source and the sinks.
// It is the only holder of the SystemStateTracker.
struct TrackingBlock : public BlockBase {
    Channel<TelemetryFrame> in;

    typedef void (*OnTrackedCallback)(const TrackingUpdate&, void* context);

    TrackingBlock(const char* name,
                  SystemStateTracker& tracker,
                  const TrackingBuilderConfig& config,
                  size_t in_capacity = 256,
                  OnTrackedCallback callback = nullptr,
                  void* callback_context = nullptr);

    Result<Empty, Error> procedure(ChannelBase<TrackingUpdate>* out);

    size_t tracked() const { return _tracked; }
    const TrackingBuilderConfig& config() const { return _config; }

private:
    static constexpr size_t MAX_BATCH = 32;

    SystemStateTracker& _tracker;
    TrackingBuilderConfig _config;
    OnTrackedCallback _callback;
    void* _callback_context;
    size_t _tracked = 0;
    SystemStateTracker::Clock::time_point _last_eviction{};
};

// Tracked '7': +53.5500 N,  +9.9930 E at 105.00 m flying 3.20 m/s @  90°
void log_tracking_update(const TrackingUpdate& update);

} // namespace mavtrack

#include "tracking_block.hpp"
#include "zf_log.h"
#include <algorithm>

namespace mavtrack {

TrackingBlock::TrackingBlock(const char* name,
                             SystemStateTracker& tracker,
                             const TrackingBuilderConfig& config,
                             size_t in_capacity,
                             OnTrackedCallback callback,
                             void* callback_context)
    : BlockBase(name),
      in(in_capacity),
      _tracker(tracker),
      _config(config),
      _callback(callback),
      _callback_context(callback_context) {}

Result<Empty, Error> TrackingBlock::procedure(ChannelBase<TrackingUpdate>* out) {
    const auto now = SystemStateTracker::Clock::now();
    if (now - _last_eviction >= std::chrono::seconds(1)) {
        _tracker.evict_idle(now);
        _last_eviction = now;
    }

    size_t available = in.size();
    if (available == 0) {
        return Error::NoData;
    }

    size_t space = out->space();
    if (space == 0) {
        return Error::NotEnoughSpace;
    }

    size_t to_process = std::min({available, space, MAX_BATCH});
    for (size_t i = 0; i < to_process; ++i) {
        TelemetryFrame frame;
        if (!in.try_pop(frame)) {
            break;
        }

        const UavTrackState& state = _tracker.update(frame, now);
        TrackingUpdate update = build_tracking_update(frame, state, _config);
        log_tracking_update(update);

        if (_callback) {
            _callback(update, _callback_context);
        }
        out->push(update);
        _tracked++;
    }

    return Empty{};
}

void log_tracking_update(const TrackingUpdate& update) {
    ZF_LOGI("Tracked '%s': %+9.4f N, %+9.4f E at %+6.2f m %s %4.2f m/s @ %3.0f\xC2\xB0",
            update.uav_id.c_str(),
            update.latitude_deg,
            update.longitude_deg,
            update.altitude_m,
            update.flying ? "flying" : "grounded",
            update.speed_mps,
            update.heading_deg);
}

} // namespace mavtrack

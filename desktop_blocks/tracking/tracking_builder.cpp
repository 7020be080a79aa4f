#include "tracking_builder.hpp"

namespace mavtrack {

TrackingUpdate build_tracking_update(const TelemetryFrame& frame,
                                     const UavTrackState& state,
                                     const TrackingBuilderConfig& config) {
    TrackingUpdate update;
    update.uav_id = std::to_string(static_cast<unsigned>(frame.system_id));
    update.system_id = frame.system_id;
    update.flight_operation_id = config.flight_operation_id;
    update.timestamp_s = static_cast<double>(frame.timestamp_us) / 1e6;
    update.latitude_deg = frame.latitude_deg;
    update.longitude_deg = frame.longitude_deg;
    update.altitude_m = frame.altitude_m + config.altitude_offset_m;
    update.heading_deg = frame.has_heading ? frame.heading_deg : 0.0;
    update.speed_mps = frame.has_ground_speed ? frame.ground_speed_mps : 0.0;
    update.vertical_speed_mps = frame.has_vertical_speed ? frame.vertical_speed_mps : 0.0;
    update.flying = state.is_flying;
    return update;
}

} // namespace mavtrack

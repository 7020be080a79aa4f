#pragma once

#include "tracking_types.hpp"
#include <string>

namespace mavtrack {

constexpr const char* DEFAULT_FLIGHT_OPERATION_ID = "USSP-HH-unknwon";

struct TrackingBuilderConfig {
    double altitude_offset_m = 0.0;
    std::string flight_operation_id = DEFAULT_FLIGHT_OPERATION_ID;
};

// Pure: frame + state snapshot + config -> update. Absent optional fields become 0.
TrackingUpdate build_tracking_update(const TelemetryFrame& frame,
                                     const UavTrackState& state,
                                     const TrackingBuilderConfig& config);

} // namespace mavtrack

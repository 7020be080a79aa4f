#include "tracking_payload.hpp"

namespace mavtrack {

nlohmann::json to_json(const TrackingUpdate& update) {
    nlohmann::json j;
    j["uavId"] = update.uav_id;
    j["flightOperationId"] = update.flight_operation_id;
    j["timeStamp"] = update.timestamp_s;
    j["coordinate"] = {
        {"type", "Point"},
        {"coordinates", {update.longitude_deg, update.latitude_deg}},
    };
    j["heading"] = update.heading_deg;
    j["altitudeInMeters"] = update.altitude_m;
    j["speedInMetersPerSecond"] = update.speed_mps;
    j["verticalSpeedInMetersPerSecond"] = update.vertical_speed_mps;
    j["isFlying"] = update.flying;
    return j;
}

std::string serialize_tracking_update(const TrackingUpdate& update) {
    return to_json(update).dump();
}

} // namespace mavtrack

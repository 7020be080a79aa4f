#include "flight_state_policy.hpp"
#include <stdexcept>

namespace mavtrack {

namespace {

void check_thresholds(const GroundedThresholds& t) {
    if (t.altitude_m < 0.0 || t.speed_mps < 0.0) {
        throw std::invalid_argument("Grounded thresholds must not be negative");
    }
}

bool exceeds_thresholds(const TelemetryFrame& frame, const GroundedThresholds& t) {
    if (frame.has_relative_altitude && frame.relative_altitude_m > t.altitude_m) {
        return true;
    }
    if (frame.has_ground_speed && frame.ground_speed_mps > t.speed_mps) {
        return true;
    }
    return false;
}

} // namespace

ReportedFlightStatePolicy::ReportedFlightStatePolicy(const GroundedThresholds& thresholds)
    : _thresholds(thresholds) {
    check_thresholds(_thresholds);
}

bool ReportedFlightStatePolicy::is_flying(const TelemetryFrame& frame) const {
    switch (frame.reported_state) {
        case FlightState::Ground:
            return false;
        case FlightState::Airborne:
        case FlightState::Emergency:
        case FlightState::NoControl:
            return true;
        case FlightState::Unknown:
        default:
            break;
    }
    // A UTM message that says UNKNOWN is an explicit "not flying"
    if (frame.source == PositionSource::UtmGlobalPosition) {
        return false;
    }
    return exceeds_thresholds(frame, _thresholds);
}

ThresholdFlightStatePolicy::ThresholdFlightStatePolicy(const GroundedThresholds& thresholds)
    : _thresholds(thresholds) {
    check_thresholds(_thresholds);
}

bool ThresholdFlightStatePolicy::is_flying(const TelemetryFrame& frame) const {
    return exceeds_thresholds(frame, _thresholds);
}

} // namespace mavtrack

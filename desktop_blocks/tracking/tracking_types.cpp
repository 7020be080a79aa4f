#include "tracking_types.hpp"

namespace mavtrack {

const char* to_str(FlightState state) {
    switch (state) {
        case FlightState::Unknown: return "unknown";
        case FlightState::Ground: return "ground";
        case FlightState::Airborne: return "airborne";
        case FlightState::Emergency: return "emergency";
        case FlightState::NoControl: return "no-control";
        default: return "invalid";
    }
}

const char* to_str(PositionSource source) {
    switch (source) {
        case PositionSource::UtmGlobalPosition: return "UTM_GLOBAL_POSITION";
        case PositionSource::GlobalPositionInt: return "GLOBAL_POSITION_INT";
        default: return "invalid";
    }
}

} // namespace mavtrack

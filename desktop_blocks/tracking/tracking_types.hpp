#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mavtrack {

// Flight state as reported by the autopilot (UTM_FLIGHT_STATE)
enum class FlightState : uint8_t {
    Unknown,
    Ground,
    Airborne,
    Emergency,
    NoControl,
};

enum class PositionSource : uint8_t {
    UtmGlobalPosition,
    GlobalPositionInt,
};

const char* to_str(FlightState state);
const char* to_str(PositionSource source);

// One decoded position report. Optional fields carry an explicit has_* flag and
// are zero when absent; nothing here is ever guessed.
struct TelemetryFrame {
    uint8_t system_id;
    uint8_t component_id;
    PositionSource source;

    double latitude_deg;            // WGS84
    double longitude_deg;           // WGS84
    double altitude_m;              // MSL, as emitted by the source message
    bool has_relative_altitude;
    double relative_altitude_m;     // above home

    bool has_heading;
    double heading_deg;             // [0, 360)
    bool has_ground_speed;
    double ground_speed_mps;
    bool has_vertical_speed;
    double vertical_speed_mps;      // climb rate, positive up

    FlightState reported_state;     // Unknown when the message carries none

    uint64_t timestamp_us;          // Unix epoch

    TelemetryFrame()
        : system_id(0), component_id(0), source(PositionSource::UtmGlobalPosition),
          latitude_deg(0.0), longitude_deg(0.0), altitude_m(0.0),
          has_relative_altitude(false), relative_altitude_m(0.0),
          has_heading(false), heading_deg(0.0),
          has_ground_speed(false), ground_speed_mps(0.0),
          has_vertical_speed(false), vertical_speed_mps(0.0),
          reported_state(FlightState::Unknown), timestamp_us(0) {}
};

// Per-UAV derived state, owned by SystemStateTracker
struct UavTrackState {
    uint8_t system_id = 0;
    bool is_flying = false;
    std::chrono::steady_clock::time_point last_seen{};
    uint64_t last_timestamp_us = 0;
    size_t frames = 0;
};

// Outbound record. Built once per frame and never modified afterwards.
struct TrackingUpdate {
    std::string uav_id;
    uint8_t system_id = 0;
    std::string flight_operation_id;
    double timestamp_s = 0.0;
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double altitude_m = 0.0;        // offset applied
    double heading_deg = 0.0;
    double speed_mps = 0.0;
    double vertical_speed_mps = 0.0;
    bool flying = false;
};

} // namespace mavtrack

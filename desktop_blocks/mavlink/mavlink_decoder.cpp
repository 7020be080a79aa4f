#include "mavlink_decoder.hpp"
#include "zf_log.h"
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace mavtrack {

namespace {

FlightState to_flight_state(uint8_t utm_state) {
    switch (utm_state) {
        case UTM_FLIGHT_STATE_GROUND: return FlightState::Ground;
        case UTM_FLIGHT_STATE_AIRBORNE: return FlightState::Airborne;
        case UTM_FLIGHT_STATE_EMERGENCY: return FlightState::Emergency;
        case UTM_FLIGHT_STATE_NOCTRL: return FlightState::NoControl;
        case UTM_FLIGHT_STATE_UNKNOWN:
        default:
            return FlightState::Unknown;
    }
}

// atan2(vy, vx) in [0, 360); NED velocities so 0 is north
double heading_from_velocity(double vx, double vy) {
    double heading = std::atan2(vy, vx) * 180.0 / M_PI;
    if (heading < 0.0) {
        heading += 360.0;
    }
    return heading;
}

void decode_utm(const mavlink_message_t& msg, uint64_t receive_time_us, TelemetryFrame& out) {
    mavlink_utm_global_position_t utm;
    mavlink_msg_utm_global_position_decode(&msg, &utm);

    out.source = PositionSource::UtmGlobalPosition;
    out.latitude_deg = utm.lat / 1e7;
    out.longitude_deg = utm.lon / 1e7;
    out.altitude_m = utm.alt / 1000.0;

    if (utm.flags & UTM_DATA_AVAIL_FLAGS_RELATIVE_ALTITUDE_AVAILABLE) {
        out.has_relative_altitude = true;
        out.relative_altitude_m = utm.relative_alt / 1000.0;
    }
    if (utm.flags & UTM_DATA_AVAIL_FLAGS_HORIZONTAL_VELO_AVAILABLE) {
        const double vx = utm.vx / 100.0;
        const double vy = utm.vy / 100.0;
        out.has_ground_speed = true;
        out.ground_speed_mps = std::sqrt(vx * vx + vy * vy);
        out.has_heading = true;
        out.heading_deg = heading_from_velocity(vx, vy);
    }
    if (utm.flags & UTM_DATA_AVAIL_FLAGS_VERTICAL_VELO_AVAILABLE) {
        out.has_vertical_speed = true;
        out.vertical_speed_mps = -utm.vz / 100.0;
    }

    out.reported_state = to_flight_state(utm.flight_state);
    out.timestamp_us = (utm.flags & UTM_DATA_AVAIL_FLAGS_TIME_VALID) ? utm.time : receive_time_us;
}

void decode_global_position_int(const mavlink_message_t& msg, uint64_t receive_time_us, TelemetryFrame& out) {
    mavlink_global_position_int_t pos;
    mavlink_msg_global_position_int_decode(&msg, &pos);

    out.source = PositionSource::GlobalPositionInt;
    out.latitude_deg = pos.lat / 1e7;
    out.longitude_deg = pos.lon / 1e7;
    out.altitude_m = pos.alt / 1000.0;
    out.has_relative_altitude = true;
    out.relative_altitude_m = pos.relative_alt / 1000.0;

    const double vx = pos.vx / 100.0;
    const double vy = pos.vy / 100.0;
    out.has_ground_speed = true;
    out.ground_speed_mps = std::sqrt(vx * vx + vy * vy);
    out.has_vertical_speed = true;
    out.vertical_speed_mps = -pos.vz / 100.0;

    if (pos.hdg != UINT16_MAX) {
        out.has_heading = true;
        out.heading_deg = pos.hdg / 100.0;
    }

    // time_boot_ms is relative to autopilot boot, not usable as a wall clock
    out.reported_state = FlightState::Unknown;
    out.timestamp_us = receive_time_us;
}

} // namespace

PositionMessageSet parse_position_messages(const std::vector<std::string>& names) {
    PositionMessageSet set;
    set.utm_global_position = false;
    set.global_position_int = false;
    for (const auto& name : names) {
        if (name == "UTM_GLOBAL_POSITION") {
            set.utm_global_position = true;
        } else if (name == "GLOBAL_POSITION_INT") {
            set.global_position_int = true;
        } else {
            throw std::invalid_argument("Unsupported position message: " + name);
        }
    }
    if (set.empty()) {
        throw std::invalid_argument("At least one position message must be enabled");
    }
    return set;
}

bool decode_position_message(const mavlink_message_t& msg, uint64_t receive_time_us, TelemetryFrame& out) {
    out = TelemetryFrame();
    out.system_id = msg.sysid;
    out.component_id = msg.compid;

    switch (msg.msgid) {
        case MAVLINK_MSG_ID_UTM_GLOBAL_POSITION:
            decode_utm(msg, receive_time_us, out);
            return true;
        case MAVLINK_MSG_ID_GLOBAL_POSITION_INT:
            decode_global_position_int(msg, receive_time_us, out);
            return true;
        default:
            return false;
    }
}

MavlinkDecoder::MavlinkDecoder(const PositionMessageSet& enabled)
    : _enabled(enabled) {
    if (_enabled.empty()) {
        throw std::invalid_argument("MavlinkDecoder: no position message enabled");
    }
    reset();
}

void MavlinkDecoder::reset() {
    std::memset(&_rx_msg, 0, sizeof(_rx_msg));
    std::memset(&_rx_status, 0, sizeof(_rx_status));
}

size_t MavlinkDecoder::feed(const uint8_t* data, size_t len, uint64_t receive_time_us, std::vector<TelemetryFrame>& out) {
    size_t produced = 0;
    mavlink_message_t msg;
    mavlink_status_t status;

    for (size_t i = 0; i < len; ++i) {
        uint8_t rc = mavlink_frame_char_buffer(&_rx_msg, &_rx_status, data[i], &msg, &status);
        if (rc == MAVLINK_FRAMING_INCOMPLETE) {
            continue;
        }
        if (rc != MAVLINK_FRAMING_OK) {
            _stats.decode_errors++;
            ZF_LOGD("Dropped MAVLink frame (%s), %zu so far",
                    rc == MAVLINK_FRAMING_BAD_CRC ? "bad CRC" : "bad signature",
                    _stats.decode_errors);
            continue;
        }

        if (!_enabled.accepts(msg.msgid)) {
            _stats.ignored++;
            continue;
        }

        TelemetryFrame frame;
        if (decode_position_message(msg, receive_time_us, frame)) {
            ZF_LOGD("Message from %u/%u: %s", msg.sysid, msg.compid, to_str(frame.source));
            out.push_back(frame);
            _stats.frames++;
            produced++;
        }
    }
    return produced;
}

} // namespace mavtrack

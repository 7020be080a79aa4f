#pragma once

#include "desktop_blocks/tracking/tracking_types.hpp"
#include <common/mavlink.h>
#include <string>
#include <vector>

namespace mavtrack {

// Which members of the global-position family become TelemetryFrames
struct PositionMessageSet {
    bool utm_global_position = true;
    bool global_position_int = false;

    bool accepts(uint32_t msgid) const {
        return (msgid == MAVLINK_MSG_ID_UTM_GLOBAL_POSITION && utm_global_position) ||
               (msgid == MAVLINK_MSG_ID_GLOBAL_POSITION_INT && global_position_int);
    }
    bool empty() const { return !utm_global_position && !global_position_int; }
};

// "UTM_GLOBAL_POSITION" / "GLOBAL_POSITION_INT"; throws std::invalid_argument otherwise
PositionMessageSet parse_position_messages(const std::vector<std::string>& names);

// Converts one decoded position message. Returns false for any other message id.
bool decode_position_message(const mavlink_message_t& msg, uint64_t receive_time_us, TelemetryFrame& out);

struct DecoderStats {
    size_t frames = 0;              // position frames produced
    size_t ignored = 0;             // valid messages outside the position set
    size_t decode_errors = 0;       // bad CRC / bad signature
};

// Byte stream -> TelemetryFrames. Each instance keeps its own parser state,
// so several decoders may run side by side.
class MavlinkDecoder {
public:
    explicit MavlinkDecoder(const PositionMessageSet& enabled = PositionMessageSet{});

    // Appends every complete position frame in data[0..len) to out.
    // Returns the number of frames appended.
    size_t feed(const uint8_t* data, size_t len, uint64_t receive_time_us, std::vector<TelemetryFrame>& out);

    // Drops any partially received message, e.g. after a reconnect
    void reset();

    const DecoderStats& stats() const { return _stats; }
    const PositionMessageSet& enabled() const { return _enabled; }

private:
    PositionMessageSet _enabled;
    mavlink_message_t _rx_msg;
    mavlink_status_t _rx_status;
    DecoderStats _stats;
};

} // namespace mavtrack

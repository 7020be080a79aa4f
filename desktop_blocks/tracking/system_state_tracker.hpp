#pragma once

#include "flight_state_policy.hpp"
#include <chrono>
#include <memory>
#include <unordered_map>

namespace mavtrack {

// Owns every UavTrackState, keyed by MAVLink system id. Not thread safe:
// exactly one pipeline stage calls update() and evict_idle().
class SystemStateTracker {
public:
    using Clock = std::chrono::steady_clock;

    // idle_timeout of zero disables eviction
    SystemStateTracker(std::unique_ptr<FlightStatePolicy> policy,
                       bool set_flying_when_grounded,
                       std::chrono::seconds idle_timeout = std::chrono::seconds(0));

    SystemStateTracker(const SystemStateTracker&) = delete;
    SystemStateTracker& operator=(const SystemStateTracker&) = delete;

    // last_seen records the call time, not the frame timestamp; out-of-order
    // frames are accepted as they come.
    const UavTrackState& update(const TelemetryFrame& frame, Clock::time_point now = Clock::now());

    // Returns the number of evicted entries
    size_t evict_idle(Clock::time_point now = Clock::now());

    const UavTrackState* find(uint8_t system_id) const;
    size_t size() const { return _states.size(); }
    bool set_flying_when_grounded() const { return _set_flying_when_grounded; }
    const FlightStatePolicy& policy() const { return *_policy; }

private:
    std::unique_ptr<FlightStatePolicy> _policy;
    bool _set_flying_when_grounded;
    std::chrono::seconds _idle_timeout;
    std::unordered_map<uint8_t, UavTrackState> _states;
};

} // namespace mavtrack

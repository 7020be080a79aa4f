#include "system_state_tracker.hpp"
#include "zf_log.h"
#include <stdexcept>

namespace mavtrack {

SystemStateTracker::SystemStateTracker(std::unique_ptr<FlightStatePolicy> policy,
                                       bool set_flying_when_grounded,
                                       std::chrono::seconds idle_timeout)
    : _policy(std::move(policy)),
      _set_flying_when_grounded(set_flying_when_grounded),
      _idle_timeout(idle_timeout) {
    if (!_policy) {
        throw std::invalid_argument("SystemStateTracker requires a flight state policy");
    }
    if (_idle_timeout.count() < 0) {
        throw std::invalid_argument("SystemStateTracker idle timeout must not be negative");
    }
}

const UavTrackState& SystemStateTracker::update(const TelemetryFrame& frame, Clock::time_point now) {
    auto it = _states.find(frame.system_id);
    if (it == _states.end()) {
        UavTrackState fresh;
        fresh.system_id = frame.system_id;
        it = _states.emplace(frame.system_id, fresh).first;
        ZF_LOGI("New UAV with system id %u (policy: %s)", frame.system_id, _policy->name());
    }

    UavTrackState& state = it->second;
    if (frame.timestamp_us < state.last_timestamp_us) {
        ZF_LOGD("System %u: frame timestamp %llu older than previous %llu",
                frame.system_id,
                static_cast<unsigned long long>(frame.timestamp_us),
                static_cast<unsigned long long>(state.last_timestamp_us));
    }

    state.is_flying = _set_flying_when_grounded ? true : _policy->is_flying(frame);
    state.last_seen = now;
    state.last_timestamp_us = frame.timestamp_us;
    state.frames++;
    return state;
}

size_t SystemStateTracker::evict_idle(Clock::time_point now) {
    if (_idle_timeout.count() == 0) {
        return 0;
    }

    size_t evicted = 0;
    for (auto it = _states.begin(); it != _states.end();) {
        if (now - it->second.last_seen > _idle_timeout) {
            ZF_LOGI("Forgetting UAV %u after %lld s without position",
                    it->first, static_cast<long long>(_idle_timeout.count()));
            it = _states.erase(it);
            evicted++;
        } else {
            ++it;
        }
    }
    return evicted;
}

const UavTrackState* SystemStateTracker::find(uint8_t system_id) const {
    auto it = _states.find(system_id);
    return it == _states.end() ? nullptr : &it->second;
}

} // namespace mavtrack

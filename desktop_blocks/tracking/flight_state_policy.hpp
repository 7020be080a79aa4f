#pragma once

#include "tracking_types.hpp"

namespace mavtrack {

// Decides whether a single frame describes a UAV in the air.
// Implementations must be pure: same frame, same answer.
class FlightStatePolicy {
public:
    virtual ~FlightStatePolicy() = default;
    virtual bool is_flying(const TelemetryFrame& frame) const = 0;
    virtual const char* name() const = 0;
};

struct GroundedThresholds {
    double altitude_m = 2.0;        // relative altitude above home
    double speed_mps = 1.0;         // horizontal ground speed
};

// Trusts the autopilot's reported flight state when there is one
// (anything but GROUND and UNKNOWN counts as flying). Frames without a
// reported state fall back to the altitude / speed thresholds.
class ReportedFlightStatePolicy : public FlightStatePolicy {
public:
    explicit ReportedFlightStatePolicy(const GroundedThresholds& thresholds = GroundedThresholds{});

    bool is_flying(const TelemetryFrame& frame) const override;
    const char* name() const override { return "reported-state"; }

    const GroundedThresholds& thresholds() const { return _thresholds; }

private:
    GroundedThresholds _thresholds;
};

// Ignores the reported state entirely.
class ThresholdFlightStatePolicy : public FlightStatePolicy {
public:
    explicit ThresholdFlightStatePolicy(const GroundedThresholds& thresholds = GroundedThresholds{});

    bool is_flying(const TelemetryFrame& frame) const override;
    const char* name() const override { return "thresholds"; }

private:
    GroundedThresholds _thresholds;
};

} // namespace mavtrack

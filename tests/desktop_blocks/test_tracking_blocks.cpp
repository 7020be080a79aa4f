#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "desktop_blocks/tracking/flight_state_policy.hpp"
#include "desktop_blocks/tracking/system_state_tracker.hpp"
#include "desktop_blocks/tracking/tracking_block.hpp"
#include "desktop_blocks/tracking/tracking_builder.hpp"

using namespace mavtrack;

class TrackingBlocksTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static TelemetryFrame utm_frame(uint8_t system_id, FlightState state, uint64_t timestamp_us = 1634567890500000ULL) {
        TelemetryFrame frame;
        frame.system_id = system_id;
        frame.component_id = 1;
        frame.source = PositionSource::UtmGlobalPosition;
        frame.latitude_deg = 53.55;
        frame.longitude_deg = 9.993;
        frame.altitude_m = 100.0;
        frame.has_heading = true;
        frame.heading_deg = 90.0;
        frame.has_ground_speed = true;
        frame.ground_speed_mps = 3.2;
        frame.has_vertical_speed = true;
        frame.vertical_speed_mps = 1.5;
        frame.reported_state = state;
        frame.timestamp_us = timestamp_us;
        return frame;
    }

    static std::unique_ptr<FlightStatePolicy> reported_policy() {
        return std::unique_ptr<FlightStatePolicy>(std::make_unique<ReportedFlightStatePolicy>());
    }
};

// Reported flight states map to flying / grounded
TEST_F(TrackingBlocksTest, ReportedStatePolicy) {
    ReportedFlightStatePolicy policy;
    EXPECT_FALSE(policy.is_flying(utm_frame(1, FlightState::Ground)));
    EXPECT_TRUE(policy.is_flying(utm_frame(1, FlightState::Airborne)));
    EXPECT_TRUE(policy.is_flying(utm_frame(1, FlightState::Emergency)));
    EXPECT_TRUE(policy.is_flying(utm_frame(1, FlightState::NoControl)));
    EXPECT_FALSE(policy.is_flying(utm_frame(1, FlightState::Unknown)));
}

// Without a reported state the altitude / speed thresholds decide
TEST_F(TrackingBlocksTest, ThresholdFallbackForStatelessSources) {
    ReportedFlightStatePolicy policy;
    TelemetryFrame frame;
    frame.source = PositionSource::GlobalPositionInt;
    frame.has_relative_altitude = true;
    frame.relative_altitude_m = 0.5;
    frame.has_ground_speed = true;
    frame.ground_speed_mps = 0.2;
    EXPECT_FALSE(policy.is_flying(frame));

    frame.relative_altitude_m = 12.0;
    EXPECT_TRUE(policy.is_flying(frame));

    frame.relative_altitude_m = 0.5;
    frame.ground_speed_mps = 4.0;
    EXPECT_TRUE(policy.is_flying(frame));

    ThresholdFlightStatePolicy thresholds;
    TelemetryFrame airborne_on_ground = utm_frame(1, FlightState::Airborne);
    airborne_on_ground.ground_speed_mps = 0.0;
    EXPECT_FALSE(thresholds.is_flying(airborne_on_ground));

    GroundedThresholds negative;
    negative.altitude_m = -1.0;
    EXPECT_THROW(ReportedFlightStatePolicy bad(negative), std::invalid_argument);
}

// Altitude offset is added and uavId is the decimal system id
TEST_F(TrackingBlocksTest, BuilderAppliesOffsetAndIds) {
    TrackingBuilderConfig config;
    config.altitude_offset_m = 5.0;
    config.flight_operation_id = "OP-42";

    UavTrackState state;
    state.system_id = 7;
    state.is_flying = true;

    TrackingUpdate update = build_tracking_update(utm_frame(7, FlightState::Airborne), state, config);
    EXPECT_EQ(update.uav_id, "7");
    EXPECT_EQ(update.system_id, 7);
    EXPECT_EQ(update.flight_operation_id, "OP-42");
    EXPECT_DOUBLE_EQ(update.altitude_m, 105.0);
    EXPECT_DOUBLE_EQ(update.timestamp_s, 1634567890.5);
    EXPECT_DOUBLE_EQ(update.latitude_deg, 53.55);
    EXPECT_DOUBLE_EQ(update.longitude_deg, 9.993);
    EXPECT_DOUBLE_EQ(update.heading_deg, 90.0);
    EXPECT_DOUBLE_EQ(update.speed_mps, 3.2);
    EXPECT_DOUBLE_EQ(update.vertical_speed_mps, 1.5);
    EXPECT_TRUE(update.flying);
}

// Missing optional fields become zero; default operation id is used
TEST_F(TrackingBlocksTest, BuilderZeroesMissingFields) {
    TelemetryFrame frame;
    frame.system_id = 200;
    frame.heading_deg = 45.0;   // ignored without has_heading
    frame.altitude_m = 12.0;

    UavTrackState state;
    TrackingUpdate update = build_tracking_update(frame, state, TrackingBuilderConfig{});
    EXPECT_EQ(update.uav_id, "200");
    EXPECT_EQ(update.flight_operation_id, DEFAULT_FLIGHT_OPERATION_ID);
    EXPECT_EQ(update.heading_deg, 0.0);
    EXPECT_EQ(update.speed_mps, 0.0);
    EXPECT_EQ(update.vertical_speed_mps, 0.0);
    EXPECT_DOUBLE_EQ(update.altitude_m, 12.0);
    EXPECT_FALSE(update.flying);
}

// The tracker keeps one entry per system id and follows the reported state
TEST_F(TrackingBlocksTest, TrackerFollowsReportedState) {
    SystemStateTracker tracker(reported_policy(), false);

    EXPECT_FALSE(tracker.update(utm_frame(7, FlightState::Ground)).is_flying);
    EXPECT_TRUE(tracker.update(utm_frame(7, FlightState::Airborne)).is_flying);
    EXPECT_FALSE(tracker.update(utm_frame(7, FlightState::Ground)).is_flying);
    tracker.update(utm_frame(9, FlightState::Airborne));

    EXPECT_EQ(tracker.size(), 2u);
    ASSERT_NE(tracker.find(7), nullptr);
    EXPECT_EQ(tracker.find(7)->frames, 3u);
    EXPECT_EQ(tracker.find(42), nullptr);
}

// The override reports every UAV as flying, whatever the frames say
TEST_F(TrackingBlocksTest, FlyingOverrideIsSticky) {
    SystemStateTracker tracker(reported_policy(), true);
    EXPECT_TRUE(tracker.set_flying_when_grounded());
    EXPECT_TRUE(tracker.update(utm_frame(3, FlightState::Ground)).is_flying);
    EXPECT_TRUE(tracker.update(utm_frame(3, FlightState::Unknown)).is_flying);
    EXPECT_TRUE(tracker.update(utm_frame(3, FlightState::Ground)).is_flying);
}

// Out-of-order timestamps are accepted and recorded as they come
TEST_F(TrackingBlocksTest, OutOfOrderTimestampsAccepted) {
    SystemStateTracker tracker(reported_policy(), false);
    tracker.update(utm_frame(5, FlightState::Airborne, 2000000));
    const UavTrackState& state = tracker.update(utm_frame(5, FlightState::Ground, 1000000));
    EXPECT_FALSE(state.is_flying);
    EXPECT_EQ(state.last_timestamp_us, 1000000u);
    EXPECT_EQ(state.frames, 2u);
}

// Idle entries are forgotten only when a timeout is configured
TEST_F(TrackingBlocksTest, IdleEviction) {
    using Clock = SystemStateTracker::Clock;
    const auto t0 = Clock::now();

    SystemStateTracker never(reported_policy(), false);
    never.update(utm_frame(1, FlightState::Ground), t0);
    EXPECT_EQ(never.evict_idle(t0 + std::chrono::hours(24)), 0u);
    EXPECT_EQ(never.size(), 1u);

    SystemStateTracker tracker(reported_policy(), false, std::chrono::seconds(10));
    tracker.update(utm_frame(1, FlightState::Ground), t0);
    tracker.update(utm_frame(2, FlightState::Ground), t0 + std::chrono::seconds(8));

    EXPECT_EQ(tracker.evict_idle(t0 + std::chrono::seconds(5)), 0u);
    EXPECT_EQ(tracker.evict_idle(t0 + std::chrono::seconds(12)), 1u);
    EXPECT_EQ(tracker.find(1), nullptr);
    ASSERT_NE(tracker.find(2), nullptr);

    EXPECT_THROW(SystemStateTracker(nullptr, false), std::invalid_argument);
    EXPECT_THROW(SystemStateTracker(reported_policy(), false, std::chrono::seconds(-1)), std::invalid_argument);
}

// The tracking stage turns frames into updates in order
TEST_F(TrackingBlocksTest, TrackingBlockProcedure) {
    SystemStateTracker tracker(reported_policy(), false);
    TrackingBuilderConfig config;
    config.altitude_offset_m = 5.0;

    struct CallbackData {
        std::vector<std::string> ids;
    } callback_data;
    auto callback = [](const TrackingUpdate& update, void* context) {
        static_cast<CallbackData*>(context)->ids.push_back(update.uav_id);
    };

    TrackingBlock block("test_tracking", tracker, config, 16, callback, &callback_data);
    Channel<TrackingUpdate> out(16);

    auto idle = block.procedure(&out);
    ASSERT_TRUE(idle.is_err());
    EXPECT_EQ(idle.unwrap_err(), Error::NoData);

    block.in.push(utm_frame(7, FlightState::Ground));
    block.in.push(utm_frame(7, FlightState::Airborne));
    block.in.push(utm_frame(8, FlightState::Ground));

    EXPECT_TRUE(block.procedure(&out).is_ok());
    EXPECT_EQ(block.tracked(), 3u);
    EXPECT_EQ(block.in.size(), 0u);
    ASSERT_EQ(out.size(), 3u);

    TrackingUpdate update;
    out.try_pop(update);
    EXPECT_EQ(update.uav_id, "7");
    EXPECT_FALSE(update.flying);
    EXPECT_DOUBLE_EQ(update.altitude_m, 105.0);
    out.try_pop(update);
    EXPECT_TRUE(update.flying);
    out.try_pop(update);
    EXPECT_EQ(update.uav_id, "8");

    EXPECT_EQ(callback_data.ids, (std::vector<std::string>{"7", "7", "8"}));
}

// A full output channel leaves frames queued
TEST_F(TrackingBlocksTest, TrackingBlockRespectsOutputSpace) {
    SystemStateTracker tracker(reported_policy(), false);
    TrackingBlock block("test_tracking_full", tracker, TrackingBuilderConfig{});
    Channel<TrackingUpdate> out(2);

    for (int i = 0; i < 5; ++i) {
        block.in.push(utm_frame(1, FlightState::Ground));
    }
    EXPECT_TRUE(block.procedure(&out).is_ok());
    EXPECT_EQ(out.size(), 2u);
    EXPECT_EQ(block.in.size(), 3u);

    auto blocked = block.procedure(&out);
    ASSERT_TRUE(blocked.is_err());
    EXPECT_EQ(blocked.unwrap_err(), Error::NotEnoughSpace);
}

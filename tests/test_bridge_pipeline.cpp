#include <gtest/gtest.h>
#include <atomic>
#include <thread>

#include "test_doubles.hpp"
#include "app/bridge_controller.hpp"

using namespace mavtrack;
using mavtrack_test::BrokerRecorder;
using mavtrack_test::RecordingPublisher;
using mavtrack_test::UtmFix;
using mavtrack_test::wait_until;

class BridgePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = std::make_shared<mavtrack_test::LinkScript>();
        amqp = std::make_shared<BrokerRecorder>();
        mqtt = std::make_shared<BrokerRecorder>();

        config.mavlink.device = "udpin:0.0.0.0:14550";
        config.amqp_present = true;
        config.amqp.host = "broker";
        config.amqp.username = "bridge";
        config.amqp.password = "secret";
        config.amqp.queue = "tracking";
        config.mqtt_present = true;
        config.mqtt_port_set = true;
        config.mqtt.host = "localhost";
        config.mqtt.topic = "tracking";
        config.altitude_offset_m = 5.0;
        config.reconnect.initial = std::chrono::milliseconds(5);
        config.reconnect.max = std::chrono::milliseconds(20);
        config.shutdown_grace_ms = 1000;
    }
    void TearDown() override {}

    PublisherBuilders recording_builders() {
        PublisherBuilders builders;
        auto amqp_broker = amqp;
        auto mqtt_broker = mqtt;
        auto amqp_calls = &amqp_builds;
        builders.amqp = [amqp_broker, amqp_calls](const AmqpSettings&) {
            (*amqp_calls)++;
            return std::unique_ptr<Publisher>(std::make_unique<RecordingPublisher>("AMQP Sink", SinkKind::Amqp, amqp_broker));
        };
        builders.mqtt = [mqtt_broker](const MqttSettings&) {
            return std::unique_ptr<Publisher>(std::make_unique<RecordingPublisher>("MQTT Sink", SinkKind::Mqtt, mqtt_broker));
        };
        return builders;
    }

    // Runs the bridge on a thread until `done` holds or a timeout passes
    template <typename Pred>
    int run_until(BridgeController& bridge, Pred done) {
        int exit_code = -1;
        std::thread runner([&]() { exit_code = bridge.run(); });
        EXPECT_TRUE(wait_until(done, std::chrono::milliseconds(5000)));
        bridge.request_stop();
        runner.join();
        return exit_code;
    }

    std::shared_ptr<mavtrack_test::LinkScript> script;
    std::shared_ptr<BrokerRecorder> amqp;
    std::shared_ptr<BrokerRecorder> mqtt;
    std::atomic<int> amqp_builds{0};
    BridgeConfig config;
};

// GROUND, AIRBORNE, GROUND frames reach both brokers in order with the right flying flag
TEST_F(BridgePipelineTest, FramesReachEveryBroker) {
    validate_config(config);
    BridgeController bridge(config, recording_builders(), mavtrack_test::scripted_opener(script));
    EXPECT_EQ(bridge.sink_count(), 2u);

    // Let both sinks connect before the vehicle starts talking
    std::thread feeder([this]() {
        wait_until([this] { return amqp->connect_attempts.load() > 0 && mqtt->connect_attempts.load() > 0; });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        const uint8_t states[] = {UTM_FLIGHT_STATE_GROUND, UTM_FLIGHT_STATE_AIRBORNE, UTM_FLIGHT_STATE_GROUND};
        uint64_t t = 1634567890000000ULL;
        for (uint8_t state : states) {
            UtmFix fix;
            fix.flight_state = state;
            fix.time_us = t;
            t += 1000000;
            script->push(mavtrack_test::pack_utm(fix));
            script->push(mavtrack_test::pack_vehicle_heartbeat(7));
        }
    });

    int exit_code = run_until(bridge, [this] { return amqp->count() == 3 && mqtt->count() == 3; });
    feeder.join();
    EXPECT_EQ(exit_code, 0);

    for (auto broker : {amqp, mqtt}) {
        auto updates = broker->snapshot();
        ASSERT_EQ(updates.size(), 3u);
        EXPECT_FALSE(updates[0].flying);
        EXPECT_TRUE(updates[1].flying);
        EXPECT_FALSE(updates[2].flying);
        for (const auto& update : updates) {
            EXPECT_EQ(update.uav_id, "7");
            EXPECT_DOUBLE_EQ(update.altitude_m, 105.0);
        }
        EXPECT_DOUBLE_EQ(updates[1].timestamp_s, 1634567891.0);
    }

    const BridgeRunSummary& summary = bridge.summary();
    EXPECT_EQ(summary.decoder.frames, 3u);
    EXPECT_EQ(summary.decoder.ignored, 3u);
    EXPECT_EQ(summary.tracked, 3u);
    ASSERT_EQ(summary.sinks.size(), 2u);
    EXPECT_EQ(summary.sinks[0].counters.delivered, 3u);
    EXPECT_EQ(summary.sinks[1].counters.delivered, 3u);
}

// With the override every update is flying
TEST_F(BridgePipelineTest, SetFlyingWhenGrounded) {
    config.set_flying_when_grounded = true;
    config.amqp_present = false;
    validate_config(config);
    BridgeController bridge(config, recording_builders(), mavtrack_test::scripted_opener(script));

    std::thread feeder([this]() {
        wait_until([this] { return mqtt->connect_attempts.load() > 0; });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        UtmFix fix;
        fix.flight_state = UTM_FLIGHT_STATE_GROUND;
        script->push(mavtrack_test::pack_utm(fix));
        script->push(mavtrack_test::pack_utm(fix));
    });

    run_until(bridge, [this] { return mqtt->count() == 2; });
    feeder.join();

    for (const auto& update : mqtt->snapshot()) {
        EXPECT_TRUE(update.flying);
    }
}

// MQTT-only configuration never builds an AMQP publisher
TEST_F(BridgePipelineTest, MqttOnly) {
    config.amqp.password.clear();
    validate_config(config);
    EXPECT_FALSE(config.enable_amqp);

    BridgeController bridge(config, recording_builders(), mavtrack_test::scripted_opener(script));
    EXPECT_EQ(bridge.sink_count(), 1u);
    EXPECT_EQ(amqp_builds.load(), 0);

    std::thread feeder([this]() {
        wait_until([this] { return mqtt->connect_attempts.load() > 0; });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        script->push(mavtrack_test::pack_utm(UtmFix{}));
    });
    run_until(bridge, [this] { return mqtt->count() == 1; });
    feeder.join();

    EXPECT_EQ(amqp->connect_attempts.load(), 0);
    EXPECT_EQ(bridge.summary().sinks.size(), 1u);
}

// Without a sink nothing is opened at all
TEST_F(BridgePipelineTest, NoSinkFailsBeforeOpeningLink) {
    BridgeConfig empty = config;
    empty.enable_amqp = false;
    empty.enable_mqtt = false;

    EXPECT_THROW({
        BridgeController bridge(empty, recording_builders(), mavtrack_test::scripted_opener(script));
    }, ConfigError);
    EXPECT_EQ(script->opens.load(), 0);
    EXPECT_EQ(amqp_builds.load(), 0);
}

// Link loss is retried while the bridge keeps running
TEST_F(BridgePipelineTest, SurvivesLinkLoss) {
    config.amqp_present = false;
    validate_config(config);
    script->refuse_opens = 2;
    script->fail_reads = 0;
    BridgeController bridge(config, recording_builders(), mavtrack_test::scripted_opener(script));

    std::thread feeder([this]() {
        wait_until([this] { return script->opens.load() >= 3; });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        script->push(mavtrack_test::pack_utm(UtmFix{}));
        wait_until([this] { return mqtt->count() == 1; });
        script->fail_reads = 1;
        wait_until([this] { return script->opens.load() >= 4; });
        script->push(mavtrack_test::pack_utm(UtmFix{}));
    });

    int exit_code = run_until(bridge, [this] { return mqtt->count() == 2; });
    feeder.join();

    EXPECT_EQ(exit_code, 0);
    EXPECT_EQ(bridge.summary().connects, 2u);
    EXPECT_EQ(bridge.summary().link_failures, 3u);
}

// An external interrupt flag stops the bridge
TEST_F(BridgePipelineTest, InterruptFlagStopsRun) {
    config.amqp_present = false;
    validate_config(config);
    BridgeController bridge(config, recording_builders(), mavtrack_test::scripted_opener(script));

    std::atomic<bool> interrupt{false};
    int exit_code = -1;
    std::thread runner([&]() { exit_code = bridge.run(&interrupt); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    interrupt = true;
    runner.join();

    EXPECT_EQ(exit_code, 0);
    EXPECT_TRUE(bridge.stop_requested());
    EXPECT_THROW(bridge.run(), std::logic_error);
}

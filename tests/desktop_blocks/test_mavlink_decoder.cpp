#include <gtest/gtest.h>
#include <vector>

#include "test_doubles.hpp"
#include "desktop_blocks/mavlink/mavlink_decoder.hpp"
#include "desktop_blocks/mavlink/mavlink_link.hpp"

using namespace mavtrack;
using mavtrack_test::UtmFix;

class MavlinkDecoderTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static constexpr uint64_t RECEIVE_TIME_US = 1700000000000000ULL;
};

// UTM_GLOBAL_POSITION units are converted to degrees, metres and m/s
TEST_F(MavlinkDecoderTest, UtmGlobalPositionConversion) {
    UtmFix fix;
    fix.flight_state = UTM_FLIGHT_STATE_AIRBORNE;
    fix.relative_alt_mm = 25000;
    fix.vx = 0;
    fix.vy = 320;
    fix.vz = -150;
    auto bytes = mavtrack_test::pack_utm(fix);

    MavlinkDecoder decoder;
    std::vector<TelemetryFrame> frames;
    EXPECT_EQ(decoder.feed(bytes.data(), bytes.size(), RECEIVE_TIME_US, frames), 1u);
    ASSERT_EQ(frames.size(), 1u);

    const TelemetryFrame& f = frames[0];
    EXPECT_EQ(f.system_id, 7);
    EXPECT_EQ(f.component_id, 1);
    EXPECT_EQ(f.source, PositionSource::UtmGlobalPosition);
    EXPECT_NEAR(f.latitude_deg, 53.55, 1e-7);
    EXPECT_NEAR(f.longitude_deg, 9.993, 1e-7);
    EXPECT_NEAR(f.altitude_m, 100.0, 1e-9);
    EXPECT_TRUE(f.has_relative_altitude);
    EXPECT_NEAR(f.relative_altitude_m, 25.0, 1e-9);
    EXPECT_TRUE(f.has_ground_speed);
    EXPECT_NEAR(f.ground_speed_mps, 3.2, 1e-9);
    EXPECT_TRUE(f.has_heading);
    EXPECT_NEAR(f.heading_deg, 90.0, 1e-9);
    EXPECT_TRUE(f.has_vertical_speed);
    EXPECT_NEAR(f.vertical_speed_mps, 1.5, 1e-9);
    EXPECT_EQ(f.reported_state, FlightState::Airborne);
    EXPECT_EQ(f.timestamp_us, fix.time_us);
    EXPECT_EQ(decoder.stats().frames, 1u);
}

// Heading from a westward velocity wraps into [0, 360)
TEST_F(MavlinkDecoderTest, UtmHeadingWrapsPositive) {
    UtmFix fix;
    fix.vx = 0;
    fix.vy = -200;
    auto bytes = mavtrack_test::pack_utm(fix);

    MavlinkDecoder decoder;
    std::vector<TelemetryFrame> frames;
    decoder.feed(bytes.data(), bytes.size(), RECEIVE_TIME_US, frames);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_NEAR(frames[0].heading_deg, 270.0, 1e-9);
}

// Fields whose availability flag is cleared stay absent; an invalid time falls back to receive time
TEST_F(MavlinkDecoderTest, UtmUnavailableFieldsAreAbsent) {
    UtmFix fix;
    fix.flags = UTM_DATA_AVAIL_FLAGS_POSITION_AVAILABLE | UTM_DATA_AVAIL_FLAGS_ALTITUDE_AVAILABLE;
    fix.vx = 500;
    fix.relative_alt_mm = 8000;
    auto bytes = mavtrack_test::pack_utm(fix);

    MavlinkDecoder decoder;
    std::vector<TelemetryFrame> frames;
    decoder.feed(bytes.data(), bytes.size(), RECEIVE_TIME_US, frames);
    ASSERT_EQ(frames.size(), 1u);

    const TelemetryFrame& f = frames[0];
    EXPECT_FALSE(f.has_relative_altitude);
    EXPECT_FALSE(f.has_ground_speed);
    EXPECT_FALSE(f.has_heading);
    EXPECT_FALSE(f.has_vertical_speed);
    EXPECT_EQ(f.ground_speed_mps, 0.0);
    EXPECT_EQ(f.timestamp_us, RECEIVE_TIME_US);
}

// GLOBAL_POSITION_INT is ignored unless enabled
TEST_F(MavlinkDecoderTest, GlobalPositionIntFilteredByDefault) {
    auto bytes = mavtrack_test::pack_global_position_int(3, 480000000, 110000000, 50000, 10000, 100, 0, 0, 9000);

    MavlinkDecoder decoder;
    std::vector<TelemetryFrame> frames;
    EXPECT_EQ(decoder.feed(bytes.data(), bytes.size(), RECEIVE_TIME_US, frames), 0u);
    EXPECT_TRUE(frames.empty());
    EXPECT_EQ(decoder.stats().ignored, 1u);
}

// GLOBAL_POSITION_INT carries hdg in cdeg and has no wall clock time
TEST_F(MavlinkDecoderTest, GlobalPositionIntConversion) {
    PositionMessageSet set;
    set.utm_global_position = false;
    set.global_position_int = true;
    MavlinkDecoder decoder(set);

    std::vector<TelemetryFrame> frames;
    auto with_heading = mavtrack_test::pack_global_position_int(3, 480000000, 110000000, 50000, 10000, 300, 400, 200, 9000);
    auto no_heading = mavtrack_test::pack_global_position_int(3, 480000000, 110000000, 50000, 10000, 0, 0, 0, UINT16_MAX);
    decoder.feed(with_heading.data(), with_heading.size(), RECEIVE_TIME_US, frames);
    decoder.feed(no_heading.data(), no_heading.size(), RECEIVE_TIME_US + 1, frames);
    ASSERT_EQ(frames.size(), 2u);

    EXPECT_EQ(frames[0].source, PositionSource::GlobalPositionInt);
    EXPECT_NEAR(frames[0].latitude_deg, 48.0, 1e-9);
    EXPECT_NEAR(frames[0].longitude_deg, 11.0, 1e-9);
    EXPECT_NEAR(frames[0].altitude_m, 50.0, 1e-9);
    EXPECT_NEAR(frames[0].relative_altitude_m, 10.0, 1e-9);
    EXPECT_NEAR(frames[0].ground_speed_mps, 5.0, 1e-9);
    EXPECT_NEAR(frames[0].vertical_speed_mps, -2.0, 1e-9);
    EXPECT_TRUE(frames[0].has_heading);
    EXPECT_NEAR(frames[0].heading_deg, 90.0, 1e-9);
    EXPECT_EQ(frames[0].reported_state, FlightState::Unknown);
    EXPECT_EQ(frames[0].timestamp_us, RECEIVE_TIME_US);

    EXPECT_FALSE(frames[1].has_heading);
    EXPECT_EQ(frames[1].timestamp_us, RECEIVE_TIME_US + 1);
}

// Non-position messages are counted as ignored, never as frames
TEST_F(MavlinkDecoderTest, HeartbeatIgnored) {
    auto bytes = mavtrack_test::pack_vehicle_heartbeat(7);
    MavlinkDecoder decoder;
    std::vector<TelemetryFrame> frames;
    EXPECT_EQ(decoder.feed(bytes.data(), bytes.size(), RECEIVE_TIME_US, frames), 0u);
    EXPECT_EQ(decoder.stats().ignored, 1u);
    EXPECT_EQ(decoder.stats().decode_errors, 0u);
}

// A corrupted frame is dropped and the parser recovers on the next one
TEST_F(MavlinkDecoderTest, CorruptedFrameCountsAsDecodeError) {
    auto bad = mavtrack_test::pack_utm(UtmFix{});
    bad[12] ^= 0xFF;
    auto good = mavtrack_test::pack_utm(UtmFix{});

    MavlinkDecoder decoder;
    std::vector<TelemetryFrame> frames;
    decoder.feed(bad.data(), bad.size(), RECEIVE_TIME_US, frames);
    EXPECT_TRUE(frames.empty());
    EXPECT_EQ(decoder.stats().decode_errors, 1u);

    decoder.feed(good.data(), good.size(), RECEIVE_TIME_US, frames);
    EXPECT_EQ(frames.size(), 1u);
}

// Frames split across reads are reassembled
TEST_F(MavlinkDecoderTest, FrameSplitAcrossReads) {
    UtmFix a;
    UtmFix b;
    b.system_id = 9;
    auto first = mavtrack_test::pack_utm(a);
    auto second = mavtrack_test::pack_utm(b);
    std::vector<uint8_t> stream(first);
    stream.insert(stream.end(), second.begin(), second.end());

    MavlinkDecoder decoder;
    std::vector<TelemetryFrame> frames;
    const size_t split = first.size() + 5;
    decoder.feed(stream.data(), split, RECEIVE_TIME_US, frames);
    EXPECT_EQ(frames.size(), 1u);
    decoder.feed(stream.data() + split, stream.size() - split, RECEIVE_TIME_US, frames);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].system_id, 7);
    EXPECT_EQ(frames[1].system_id, 9);
}

// Two decoders keep independent parser state
TEST_F(MavlinkDecoderTest, DecodersAreIndependent) {
    auto bytes = mavtrack_test::pack_utm(UtmFix{});
    MavlinkDecoder a;
    MavlinkDecoder b;
    std::vector<TelemetryFrame> frames_a;
    std::vector<TelemetryFrame> frames_b;

    const size_t half = bytes.size() / 2;
    a.feed(bytes.data(), half, RECEIVE_TIME_US, frames_a);
    b.feed(bytes.data(), bytes.size(), RECEIVE_TIME_US, frames_b);
    a.feed(bytes.data() + half, bytes.size() - half, RECEIVE_TIME_US, frames_a);

    EXPECT_EQ(frames_a.size(), 1u);
    EXPECT_EQ(frames_b.size(), 1u);
}

// Position message names map to the enabled set
TEST_F(MavlinkDecoderTest, ParsePositionMessages) {
    auto both = parse_position_messages({"UTM_GLOBAL_POSITION", "GLOBAL_POSITION_INT"});
    EXPECT_TRUE(both.utm_global_position);
    EXPECT_TRUE(both.global_position_int);

    auto gpi = parse_position_messages({"GLOBAL_POSITION_INT"});
    EXPECT_FALSE(gpi.utm_global_position);
    EXPECT_TRUE(gpi.accepts(MAVLINK_MSG_ID_GLOBAL_POSITION_INT));
    EXPECT_FALSE(gpi.accepts(MAVLINK_MSG_ID_UTM_GLOBAL_POSITION));

    EXPECT_THROW(parse_position_messages({"ATTITUDE"}), std::invalid_argument);
    EXPECT_THROW(parse_position_messages({}), std::invalid_argument);

    PositionMessageSet none;
    none.utm_global_position = false;
    EXPECT_THROW(MavlinkDecoder decoder(none), std::invalid_argument);
}

class ConnectionStringTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Network endpoints
TEST_F(ConnectionStringTest, NetworkEndpoints) {
    auto in = parse_connection_string("udpin:0.0.0.0:14550");
    EXPECT_EQ(in.kind, LinkKind::UdpIn);
    EXPECT_EQ(in.host, "0.0.0.0");
    EXPECT_EQ(in.port, 14550);
    EXPECT_EQ(in.text, "udpin:0.0.0.0:14550");

    auto out = parse_connection_string("udpout:192.168.1.10:14555");
    EXPECT_EQ(out.kind, LinkKind::UdpOut);
    EXPECT_EQ(out.host, "192.168.1.10");
    EXPECT_EQ(out.port, 14555);

    auto tcp = parse_connection_string("tcp:localhost:5760");
    EXPECT_EQ(tcp.kind, LinkKind::Tcp);
    EXPECT_EQ(tcp.host, "localhost");
    EXPECT_EQ(tcp.port, 5760);

    auto udp = parse_connection_string("udp::14550");
    EXPECT_EQ(udp.kind, LinkKind::UdpIn);
    EXPECT_TRUE(udp.host.empty());
}

// Serial devices with and without a baud rate
TEST_F(ConnectionStringTest, SerialDevices) {
    auto plain = parse_connection_string("/dev/ttyUSB0");
    EXPECT_EQ(plain.kind, LinkKind::Serial);
    EXPECT_EQ(plain.device, "/dev/ttyUSB0");
    EXPECT_EQ(plain.baud, DEFAULT_SERIAL_BAUD);

    auto fast = parse_connection_string("/dev/ttyACM0,115200");
    EXPECT_EQ(fast.device, "/dev/ttyACM0");
    EXPECT_EQ(fast.baud, 115200);

    auto configured = parse_connection_string("/dev/ttyS1", 921600);
    EXPECT_EQ(configured.baud, 921600);
}

// Malformed strings are rejected before anything is opened
TEST_F(ConnectionStringTest, MalformedStringsThrow) {
    EXPECT_THROW(parse_connection_string(""), std::invalid_argument);
    EXPECT_THROW(parse_connection_string("udpin:0.0.0.0"), std::invalid_argument);
    EXPECT_THROW(parse_connection_string("udpin:0.0.0.0:0"), std::invalid_argument);
    EXPECT_THROW(parse_connection_string("udpin:0.0.0.0:70000"), std::invalid_argument);
    EXPECT_THROW(parse_connection_string("tcp:host:port"), std::invalid_argument);
    EXPECT_THROW(parse_connection_string("tcp::5760"), std::invalid_argument);
    EXPECT_THROW(parse_connection_string("serial:/dev/ttyUSB0"), std::invalid_argument);
    EXPECT_THROW(parse_connection_string("/dev/ttyUSB0,12345"), std::invalid_argument);
    EXPECT_THROW(parse_connection_string("/dev/ttyUSB0,fast"), std::invalid_argument);
}

#include "source_mavlink.hpp"
#include "zf_log.h"
#include <common/mavlink.h>

namespace mavtrack {

namespace {

constexpr uint8_t GCS_SYSTEM_ID = 255;
constexpr uint8_t GCS_COMPONENT_ID = 0;

uint64_t unix_time_us() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

size_t pack_ground_station_heartbeat(uint8_t* buffer, size_t len) {
    if (len < MAVLINK_MAX_PACKET_LEN) {
        return 0;
    }
    mavlink_message_t msg;
    mavlink_msg_heartbeat_pack(GCS_SYSTEM_ID, GCS_COMPONENT_ID, &msg,
                               MAV_TYPE_GCS, MAV_AUTOPILOT_INVALID, 0, 0, MAV_STATE_ACTIVE);
    return mavlink_msg_to_send_buffer(buffer, &msg);
}

SourceMavlinkBlock::SourceMavlinkBlock(const char* name,
                                       const ConnectionSpec& spec,
                                       const PositionMessageSet& messages,
                                       const BackoffPolicy& reconnect,
                                       ShutdownSignal& shutdown,
                                       LinkOpener opener,
                                       std::chrono::milliseconds read_timeout,
                                       std::chrono::milliseconds connect_timeout)
    : BlockBase(name),
      _spec(spec),
      _decoder(messages),
      _backoff(reconnect),
      _shutdown(shutdown),
      _opener(std::move(opener)),
      _read_timeout(read_timeout) {
    if (!_opener) {
        throw std::invalid_argument("SourceMavlinkBlock requires a link opener");
    }
    _open_options.shutdown = &_shutdown;
    _open_options.connect_timeout = connect_timeout;
    _open_options.poll_slice = read_timeout;
    _pending.reserve(64);
}

Result<Empty, Error> SourceMavlinkBlock::connect() {
    if (_wait_before_connect) {
        auto delay = _backoff.next_delay();
        ZF_LOGI("%s: reconnecting to %s in %lld ms (attempt %zu)",
                name(), _spec.text.c_str(), static_cast<long long>(delay.count()), _backoff.attempts());
        if (_shutdown.wait_for(delay)) {
            return Error::NoData;
        }
    }

    auto opened = _opener(_spec, _open_options);
    if (opened.is_err() && _shutdown.requested()) {
        return Error::NoData;
    }
    if (opened.is_err()) {
        _wait_before_connect = true;
        _link_failures++;
        ZF_LOGW("%s: cannot open %s: %s (failure %zu)",
                name(), _spec.text.c_str(), to_str(opened.unwrap_err()), _link_failures);
        return Error::LinkDown;
    }

    _link = std::move(opened.unwrap());
    _decoder.reset();
    _backoff.reset();
    _wait_before_connect = false;
    _received_since_connect = false;
    _last_heartbeat = std::chrono::steady_clock::time_point{};
    _connects++;
    ZF_LOGI("%s: MAVLink connection to %s open", name(), _link->describe().c_str());
    return Empty{};
}

void SourceMavlinkBlock::drop_link(const char* reason) {
    _link_failures++;
    ZF_LOGW("%s: lost %s (%s), failure %zu", name(), _spec.text.c_str(), reason, _link_failures);
    _link.reset();
    _wait_before_connect = true;
}

void SourceMavlinkBlock::send_heartbeat_if_due() {
    if (_spec.kind != LinkKind::UdpOut || _received_since_connect || !_link->can_write()) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    if (now - _last_heartbeat < std::chrono::seconds(1)) {
        return;
    }
    _last_heartbeat = now;

    uint8_t buf[MAVLINK_MAX_PACKET_LEN];
    size_t len = pack_ground_station_heartbeat(buf, sizeof(buf));
    auto written = _link->write(buf, len);
    if (written.is_err()) {
        drop_link(to_str(written.unwrap_err()));
        return;
    }
    ZF_LOGD("%s: UDP out: heartbeat sent to %s", name(), _spec.text.c_str());
}

size_t SourceMavlinkBlock::flush_pending(ChannelBase<TelemetryFrame>* out) {
    size_t pushed = 0;
    while (_pending_pos < _pending.size() && out->try_push(_pending[_pending_pos])) {
        _pending_pos++;
        pushed++;
    }
    if (_pending_pos == _pending.size()) {
        _pending.clear();
        _pending_pos = 0;
    }
    return pushed;
}

Result<Empty, Error> SourceMavlinkBlock::procedure(ChannelBase<TelemetryFrame>* out) {
    if (_shutdown.requested()) {
        return Error::NoData;
    }

    if (!_pending.empty()) {
        flush_pending(out);
        if (!_pending.empty()) {
            return Error::NotEnoughSpace;
        }
    }

    if (!_link) {
        auto connected = connect();
        if (connected.is_err()) {
            return connected.unwrap_err();
        }
    }

    send_heartbeat_if_due();
    if (!_link) {
        return Error::LinkDown;
    }

    auto read = _link->read(_read_buffer, READ_BUFFER_SIZE, _read_timeout);
    if (read.is_err()) {
        drop_link(to_str(read.unwrap_err()));
        return Error::LinkDown;
    }

    size_t n = read.unwrap();
    if (n == 0) {
        return Error::NoData;
    }
    if (!_received_since_connect) {
        _received_since_connect = true;
        ZF_LOGI("%s: receiving data from %s", name(), _spec.text.c_str());
    }

    size_t decoded = _decoder.feed(_read_buffer, n, unix_time_us(), _pending);
    if (decoded == 0) {
        return Error::NoData;
    }

    flush_pending(out);
    return Empty{};
}

void SourceMavlinkBlock::close() {
    if (_link) {
        ZF_LOGI("%s: closing %s", name(), _spec.text.c_str());
        _link.reset();
    }
    _pending.clear();
    _pending_pos = 0;
}

} // namespace mavtrack

#include "publisher.hpp"
#include "tracking_payload.hpp"
#include "zf_log.h"

namespace mavtrack {

const char* to_str(PublisherState state) {
    switch (state) {
        case PublisherState::Disconnected: return "DISCONNECTED";
        case PublisherState::Connecting: return "CONNECTING";
        case PublisherState::Connected: return "CONNECTED";
        default: return "INVALID";
    }
}

const char* to_str(SinkKind kind) {
    switch (kind) {
        case SinkKind::Amqp: return "AMQP";
        case SinkKind::Mqtt: return "MQTT";
        default: return "INVALID";
    }
}

const char* to_str(PublishOutcome outcome) {
    switch (outcome) {
        case PublishOutcome::Delivered: return "delivered";
        case PublishOutcome::SkippedNotConnected: return "skipped";
        case PublishOutcome::Failed: return "failed";
        default: return "invalid";
    }
}

Publisher::Publisher(std::string name, SinkKind kind)
    : _name(std::move(name)), _kind(kind) {}

void Publisher::set_state(PublisherState next) {
    PublisherState prev = _state.exchange(next, std::memory_order_acq_rel);
    if (prev == next) {
        return;
    }
    ZF_LOGD("%s: %s -> %s", _name.c_str(), to_str(prev), to_str(next));
    if (_on_state_change) {
        _on_state_change(*this, prev, next, _on_state_change_context);
    }
}

Result<Empty, Error> Publisher::connect() {
    if (state() == PublisherState::Connected) {
        return Empty{};
    }

    set_state(PublisherState::Connecting);
    auto opened = open_connection();
    if (opened.is_err()) {
        _counters.connect_failures++;
        close_connection();
        set_state(PublisherState::Disconnected);
        return opened.unwrap_err();
    }

    _counters.connects++;
    set_state(PublisherState::Connected);
    ZF_LOGI("%s: connected to %s", _name.c_str(), endpoint().c_str());
    return Empty{};
}

PublishOutcome Publisher::publish(const TrackingUpdate& update) {
    if (state() != PublisherState::Connected) {
        _counters.skipped++;
        ZF_LOGD("%s: not connected, update for '%s' skipped (%zu so far)",
                _name.c_str(), update.uav_id.c_str(), _counters.skipped);
        return PublishOutcome::SkippedNotConnected;
    }

    std::string payload;
    try {
        payload = serialize_tracking_update(update);
    } catch (const nlohmann::json::exception& e) {
        _counters.failed++;
        ZF_LOGE("%s: cannot serialize update for '%s': %s", _name.c_str(), update.uav_id.c_str(), e.what());
        return PublishOutcome::Failed;
    }

    auto sent = send(payload, update);
    if (sent.is_err()) {
        _counters.failed++;
        ZF_LOGW("%s: publish to %s failed: %s, dropping connection",
                _name.c_str(), endpoint().c_str(), to_str(sent.unwrap_err()));
        close_connection();
        set_state(PublisherState::Disconnected);
        return PublishOutcome::Failed;
    }

    _counters.delivered++;
    return PublishOutcome::Delivered;
}

void Publisher::close() {
    if (state() != PublisherState::Disconnected) {
        ZF_LOGI("%s: closing connection to %s", _name.c_str(), endpoint().c_str());
    }
    close_connection();
    set_state(PublisherState::Disconnected);
}

} // namespace mavtrack

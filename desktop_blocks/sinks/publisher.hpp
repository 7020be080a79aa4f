#pragma once

#include "mavtrack.hpp"
#include "desktop_blocks/tracking/tracking_types.hpp"
#include <atomic>
#include <chrono>
#include <string>

namespace mavtrack {

// DISCONNECTED -> CONNECTING -> CONNECTED -> (on error) DISCONNECTED
enum class PublisherState : uint8_t {
    Disconnected,
    Connecting,
    Connected,
};

enum class SinkKind : uint8_t {
    Amqp,
    Mqtt,
};

enum class PublishOutcome : uint8_t {
    Delivered,
    SkippedNotConnected,
    Failed,
};

const char* to_str(PublisherState state);
const char* to_str(SinkKind kind);
const char* to_str(PublishOutcome outcome);

struct PublisherCounters {
    size_t delivered = 0;
    size_t skipped = 0;             // publish() while not connected
    size_t failed = 0;
    size_t connects = 0;
    size_t connect_failures = 0;
};

// One broker connection. Not thread safe: a single worker drives
// connect/publish/close, only state() may be read from other threads.
class Publisher {
public:
    typedef void (*OnStateChangeCallback)(const Publisher&, PublisherState from, PublisherState to, void* context);

    Publisher(std::string name, SinkKind kind);
    virtual ~Publisher() = default;

    Publisher(const Publisher&) = delete;
    Publisher& operator=(const Publisher&) = delete;

    // Eager (startup) and lazy (reconnect) connection; no-op when connected
    Result<Empty, Error> connect();

    // Never throws. Not connected: counted no-op. Failure: counted, the
    // connection is dropped and the update is lost.
    PublishOutcome publish(const TrackingUpdate& update);

    void close();

    PublisherState state() const { return _state.load(std::memory_order_acquire); }
    bool connected() const { return state() == PublisherState::Connected; }
    const std::string& name() const { return _name; }
    SinkKind kind() const { return _kind; }
    const PublisherCounters& counters() const { return _counters; }

    // Upper bound for any single blocking broker call
    void set_timeout(std::chrono::milliseconds timeout) { _timeout = timeout; }
    std::chrono::milliseconds timeout() const { return _timeout; }

    void set_on_state_change(OnStateChangeCallback cb, void* context) {
        _on_state_change = cb;
        _on_state_change_context = context;
    }

    // Human readable target for logs, e.g. amqps://broker:5671/tracking
    virtual std::string endpoint() const = 0;

protected:
    virtual Result<Empty, Error> open_connection() = 0;
    virtual Result<Empty, Error> send(const std::string& payload, const TrackingUpdate& update) = 0;
    virtual void close_connection() = 0;

private:
    void set_state(PublisherState next);

    std::string _name;
    SinkKind _kind;
    std::atomic<PublisherState> _state{PublisherState::Disconnected};
    std::chrono::milliseconds _timeout{2000};
    PublisherCounters _counters;
    OnStateChangeCallback _on_state_change = nullptr;
    void* _on_state_change_context = nullptr;
};

} // namespace mavtrack

#pragma once

#include "mavtrack.hpp"
#include "mavtrack_utils.hpp"
#include "mavlink_decoder.hpp"
#include "mavlink_link.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace mavtrack {

// Reads a MAVLink endpoint and emits position frames. Owns the link and
// reconnects it with backoff; link loss is never fatal to the flowgraph.
struct SourceMavlinkBlock : public BlockBase {
    using LinkOpener = std::function<Result<std::unique_ptr<MavlinkLink>, Error>(const ConnectionSpec&, const LinkOpenOptions&)>;

    SourceMavlinkBlock(const char* name,
                       const ConnectionSpec& spec,
                       const PositionMessageSet& messages,
                       const BackoffPolicy& reconnect,
                       ShutdownSignal& shutdown,
                       LinkOpener opener = open_link,
                       std::chrono::milliseconds read_timeout = std::chrono::milliseconds(100),
                       std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(5000));

    Result<Empty, Error> procedure(ChannelBase<TelemetryFrame>* out);

    // Only call once the flowgraph has stopped
    void close();

    bool connected() const { return static_cast<bool>(_link); }
    size_t connects() const { return _connects; }
    size_t link_failures() const { return _link_failures; }
    const DecoderStats& decoder_stats() const { return _decoder.stats(); }
    const ConnectionSpec& spec() const { return _spec; }

private:
    static constexpr size_t READ_BUFFER_SIZE = 2048;

    Result<Empty, Error> connect();
    void drop_link(const char* reason);
    void send_heartbeat_if_due();
    size_t flush_pending(ChannelBase<TelemetryFrame>* out);

    ConnectionSpec _spec;
    MavlinkDecoder _decoder;
    Backoff _backoff;
    ShutdownSignal& _shutdown;
    LinkOpener _opener;
    std::chrono::milliseconds _read_timeout;
    LinkOpenOptions _open_options;

    std::unique_ptr<MavlinkLink> _link;
    bool _wait_before_connect = false;
    bool _received_since_connect = false;
    std::chrono::steady_clock::time_point _last_heartbeat{};
    size_t _connects = 0;
    size_t _link_failures = 0;

    uint8_t _read_buffer[READ_BUFFER_SIZE];
    std::vector<TelemetryFrame> _pending;
    size_t _pending_pos = 0;
};

// System 255 / component 0 heartbeat as sent by a ground station
size_t pack_ground_station_heartbeat(uint8_t* buffer, size_t len);

} // namespace mavtrack

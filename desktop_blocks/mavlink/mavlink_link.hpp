#pragma once

#include "mavtrack.hpp"
#include "mavtrack_utils.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <netinet/in.h>

namespace mavtrack {

enum class LinkKind {
    UdpIn,      // bind locally and wait for the vehicle
    UdpOut,     // send to the vehicle, receive replies on the same socket
    Tcp,
    Serial,
};

const char* to_str(LinkKind kind);

struct ConnectionSpec {
    LinkKind kind = LinkKind::UdpIn;
    std::string host;
    uint16_t port = 0;
    std::string device;             // serial only
    int baud = 57600;               // serial only
    std::string text;               // the string this was parsed from
};

constexpr int DEFAULT_SERIAL_BAUD = 57600;

// udpin:<host>:<port> | udpout:<host>:<port> | tcp:<host>:<port> | <device>[,<baud>]
// Throws std::invalid_argument on malformed input.
ConnectionSpec parse_connection_string(const std::string& text, int default_baud = DEFAULT_SERIAL_BAUD);

// Byte pipe to a MAVLink endpoint. read() returns Ok(0) when the timeout
// elapsed without data; a dead link is reported as Error::LinkDown.
class MavlinkLink {
public:
    virtual ~MavlinkLink() = default;

    virtual Result<size_t, Error> read(uint8_t* buffer, size_t len, std::chrono::milliseconds timeout) = 0;
    virtual Result<size_t, Error> write(const uint8_t* data, size_t len) = 0;

    // true when write() has somewhere to send to
    virtual bool can_write() const { return true; }
    virtual const std::string& describe() const = 0;
};

class FdLink : public MavlinkLink {
public:
    FdLink(int fd, std::string description);
    ~FdLink() override;

    FdLink(const FdLink&) = delete;
    FdLink& operator=(const FdLink&) = delete;

    const std::string& describe() const override { return _description; }

protected:
    // Ok(true) when readable, Ok(false) on timeout
    Result<bool, Error> wait_readable(std::chrono::milliseconds timeout);

    int _fd;
    std::string _description;
};

class UdpLink : public FdLink {
public:
    // listen == true binds to host:port, otherwise host:port is the fixed peer
    UdpLink(int fd, std::string description, bool listen, const sockaddr_in& peer);

    Result<size_t, Error> read(uint8_t* buffer, size_t len, std::chrono::milliseconds timeout) override;
    Result<size_t, Error> write(const uint8_t* data, size_t len) override;
    bool can_write() const override { return _has_peer; }

private:
    bool _listen;
    bool _has_peer;
    sockaddr_in _peer;
};

class TcpLink : public FdLink {
public:
    using FdLink::FdLink;

    Result<size_t, Error> read(uint8_t* buffer, size_t len, std::chrono::milliseconds timeout) override;
    Result<size_t, Error> write(const uint8_t* data, size_t len) override;
};

class SerialLink : public FdLink {
public:
    using FdLink::FdLink;

    Result<size_t, Error> read(uint8_t* buffer, size_t len, std::chrono::milliseconds timeout) override;
    Result<size_t, Error> write(const uint8_t* data, size_t len) override;
};

// Bounds on opening a network link. Name lookup and TCP connect wait in
// poll_slice steps, end on `shutdown` and give up after connect_timeout.
struct LinkOpenOptions {
    const ShutdownSignal* shutdown = nullptr;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds poll_slice{100};
};

// Failures are logged with errno text and returned as Error::LinkDown,
// an expired connect_timeout as Error::Timeout
Result<std::unique_ptr<MavlinkLink>, Error> open_link(const ConnectionSpec& spec,
                                                      const LinkOpenOptions& options = LinkOpenOptions{});

} // namespace mavtrack

#include "mavlink_link.hpp"
#include "zf_log.h"

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace mavtrack {

const char* to_str(LinkKind kind) {
    switch (kind) {
        case LinkKind::UdpIn: return "udpin";
        case LinkKind::UdpOut: return "udpout";
        case LinkKind::Tcp: return "tcp";
        case LinkKind::Serial: return "serial";
        default: return "invalid";
    }
}

namespace {

uint16_t parse_port(const std::string& port_str, const std::string& text) {
    if (port_str.empty()) {
        throw std::invalid_argument("Missing port in connection string: " + text);
    }
    int port = 0;
    try {
        size_t used = 0;
        port = std::stoi(port_str, &used);
        if (used != port_str.size()) {
            throw std::invalid_argument("Invalid port number in: " + text);
        }
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Port number out of range in: " + text);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("Invalid port number in: " + text);
    }
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("Port number out of range (1-65535) in: " + text);
    }
    return static_cast<uint16_t>(port);
}

speed_t to_speed(int baud) {
    switch (baud) {
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        case 460800: return B460800;
        case 500000: return B500000;
        case 921600: return B921600;
        case 1500000: return B1500000;
        default: return B0;
    }
}

// getaddrinfo cannot be cancelled, so it runs on its own thread and the
// caller stops waiting for it on shutdown or timeout
struct PendingLookup {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    int rc = 0;
    in_addr addr{};
};

bool stop_requested(const LinkOpenOptions& options) {
    return options.shutdown && options.shutdown->requested();
}

std::chrono::milliseconds next_slice(const LinkOpenOptions& options,
                                     std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto slice = std::min(options.poll_slice, remaining);
    return std::max(slice, std::chrono::milliseconds(1));
}

Result<Empty, Error> resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& out,
                                  const LinkOpenOptions& options) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    if (host.empty()) {
        out.sin_addr.s_addr = htonl(INADDR_ANY);
        return Empty{};
    }
    if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
        return Empty{};
    }

    auto lookup = std::make_shared<PendingLookup>();
    std::thread([lookup, host] {
        addrinfo hints{};
        hints.ai_family = AF_INET;
        addrinfo* res = nullptr;
        int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
        std::lock_guard<std::mutex> lock(lookup->mutex);
        lookup->rc = rc;
        if (rc == 0 && res) {
            lookup->addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
        } else if (rc == 0) {
            lookup->rc = EAI_NONAME;
        }
        if (res) {
            freeaddrinfo(res);
        }
        lookup->done = true;
        lookup->cv.notify_all();
    }).detach();

    const auto deadline = std::chrono::steady_clock::now() + options.connect_timeout;
    std::unique_lock<std::mutex> lock(lookup->mutex);
    while (!lookup->done) {
        if (stop_requested(options)) {
            ZF_LOGI("Lookup of '%s' abandoned, shutting down", host.c_str());
            return Error::LinkDown;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ZF_LOGW("Lookup of '%s' timed out after %lld ms", host.c_str(),
                    static_cast<long long>(options.connect_timeout.count()));
            return Error::Timeout;
        }
        lookup->cv.wait_for(lock, next_slice(options, deadline));
    }
    if (lookup->rc != 0) {
        ZF_LOGW("Cannot resolve '%s': %s", host.c_str(), gai_strerror(lookup->rc));
        return Error::LinkDown;
    }
    out.sin_addr = lookup->addr;
    return Empty{};
}

// Non-blocking connect, polled for writability in slices
Result<Empty, Error> connect_bounded(int fd, const sockaddr_in& addr, const ConnectionSpec& spec,
                                     const LinkOpenOptions& options) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        ZF_LOGW("%s: cannot make socket non-blocking: %s", spec.text.c_str(), strerror(errno));
        return Error::LinkDown;
    }

    if (connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0 && errno != EINPROGRESS) {
        ZF_LOGW("%s: connect failed: %s", spec.text.c_str(), strerror(errno));
        return Error::LinkDown;
    }

    const auto deadline = std::chrono::steady_clock::now() + options.connect_timeout;
    while (true) {
        if (stop_requested(options)) {
            ZF_LOGI("%s: connect abandoned, shutting down", spec.text.c_str());
            return Error::LinkDown;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ZF_LOGW("%s: connect timed out after %lld ms", spec.text.c_str(),
                    static_cast<long long>(options.connect_timeout.count()));
            return Error::Timeout;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int rc = poll(&pfd, 1, static_cast<int>(next_slice(options, deadline).count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            ZF_LOGW("%s: poll failed: %s", spec.text.c_str(), strerror(errno));
            return Error::LinkDown;
        }
        if (rc > 0) {
            break;
        }
    }

    int err = 0;
    socklen_t err_len = sizeof(err);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &err_len) < 0) {
        err = errno;
    }
    if (err != 0) {
        ZF_LOGW("%s: connect failed: %s", spec.text.c_str(), strerror(err));
        return Error::LinkDown;
    }

    // TcpLink::write expects a blocking socket
    if (fcntl(fd, F_SETFL, flags) < 0) {
        ZF_LOGW("%s: cannot restore socket flags: %s", spec.text.c_str(), strerror(errno));
        return Error::LinkDown;
    }
    return Empty{};
}

Result<std::unique_ptr<MavlinkLink>, Error> open_udp(const ConnectionSpec& spec, const LinkOpenOptions& options) {
    sockaddr_in addr{};
    auto resolved = resolve_ipv4(spec.host, spec.port, addr, options);
    if (resolved.is_err()) {
        return resolved.unwrap_err();
    }

    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        ZF_LOGW("%s: socket() failed: %s", spec.text.c_str(), strerror(errno));
        return Error::LinkDown;
    }

    const bool listen = spec.kind == LinkKind::UdpIn;
    if (listen) {
        int reuse = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            ZF_LOGW("%s: SO_REUSEADDR failed: %s", spec.text.c_str(), strerror(errno));
        }
        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            ZF_LOGW("%s: bind failed: %s", spec.text.c_str(), strerror(errno));
            close(fd);
            return Error::LinkDown;
        }
    }

    return std::unique_ptr<MavlinkLink>(std::make_unique<UdpLink>(fd, spec.text, listen, addr));
}

Result<std::unique_ptr<MavlinkLink>, Error> open_tcp(const ConnectionSpec& spec, const LinkOpenOptions& options) {
    sockaddr_in addr{};
    auto resolved = resolve_ipv4(spec.host, spec.port, addr, options);
    if (resolved.is_err()) {
        return resolved.unwrap_err();
    }

    int fd = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        ZF_LOGW("%s: socket() failed: %s", spec.text.c_str(), strerror(errno));
        return Error::LinkDown;
    }
    auto connected = connect_bounded(fd, addr, spec, options);
    if (connected.is_err()) {
        close(fd);
        return connected.unwrap_err();
    }

    return std::unique_ptr<MavlinkLink>(std::make_unique<TcpLink>(fd, spec.text));
}

Result<std::unique_ptr<MavlinkLink>, Error> open_serial(const ConnectionSpec& spec) {
    int fd = open(spec.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        ZF_LOGW("%s: open failed: %s", spec.device.c_str(), strerror(errno));
        return Error::LinkDown;
    }

    termios tio{};
    if (tcgetattr(fd, &tio) != 0) {
        ZF_LOGW("%s: tcgetattr failed: %s", spec.device.c_str(), strerror(errno));
        close(fd);
        return Error::LinkDown;
    }
    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    const speed_t speed = to_speed(spec.baud);
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        ZF_LOGW("%s: tcsetattr failed: %s", spec.device.c_str(), strerror(errno));
        close(fd);
        return Error::LinkDown;
    }

    return std::unique_ptr<MavlinkLink>(std::make_unique<SerialLink>(fd, spec.text));
}

} // namespace

ConnectionSpec parse_connection_string(const std::string& text, int default_baud) {
    if (text.empty()) {
        throw std::invalid_argument("Empty MAVLink connection string");
    }

    ConnectionSpec spec;
    spec.text = text;

    struct Prefix { const char* name; LinkKind kind; };
    static const Prefix prefixes[] = {
        {"udpin:", LinkKind::UdpIn},
        {"udpout:", LinkKind::UdpOut},
        {"udp:", LinkKind::UdpIn},
        {"tcp:", LinkKind::Tcp},
    };

    for (const auto& prefix : prefixes) {
        const size_t plen = std::strlen(prefix.name);
        if (text.compare(0, plen, prefix.name) != 0) {
            continue;
        }
        std::string rest = text.substr(plen);
        size_t colon = rest.find_last_of(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument("Expected '<host>:<port>' in connection string: " + text);
        }
        spec.kind = prefix.kind;
        spec.host = rest.substr(0, colon);
        spec.port = parse_port(rest.substr(colon + 1), text);
        if (spec.host.empty() && spec.kind != LinkKind::UdpIn) {
            throw std::invalid_argument("Missing host in connection string: " + text);
        }
        return spec;
    }

    if (text.find(':') != std::string::npos && text[0] != '/') {
        throw std::invalid_argument("Unknown connection type in: " + text);
    }

    spec.kind = LinkKind::Serial;
    spec.baud = default_baud;
    size_t comma = text.find(',');
    spec.device = text.substr(0, comma);
    if (comma != std::string::npos) {
        std::string baud_str = text.substr(comma + 1);
        try {
            size_t used = 0;
            spec.baud = std::stoi(baud_str, &used);
            if (used != baud_str.size()) {
                throw std::invalid_argument("Invalid baud rate in: " + text);
            }
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Baud rate out of range in: " + text);
        } catch (const std::invalid_argument&) {
            throw std::invalid_argument("Invalid baud rate in: " + text);
        }
    }
    if (spec.device.empty()) {
        throw std::invalid_argument("Missing serial device in: " + text);
    }
    if (to_speed(spec.baud) == B0) {
        throw std::invalid_argument("Unsupported baud rate " + std::to_string(spec.baud) + " in: " + text);
    }
    return spec;
}

Result<std::unique_ptr<MavlinkLink>, Error> open_link(const ConnectionSpec& spec, const LinkOpenOptions& options) {
    switch (spec.kind) {
        case LinkKind::UdpIn:
        case LinkKind::UdpOut:
            return open_udp(spec, options);
        case LinkKind::Tcp:
            return open_tcp(spec, options);
        case LinkKind::Serial:
            return open_serial(spec);
        default:
            return Error::TERM_ProcedureError;
    }
}

FdLink::FdLink(int fd, std::string description)
    : _fd(fd), _description(std::move(description)) {
    if (_fd < 0) {
        throw std::invalid_argument("FdLink: invalid file descriptor");
    }
}

FdLink::~FdLink() {
    if (_fd >= 0) {
        close(_fd);
    }
}

Result<bool, Error> FdLink::wait_readable(std::chrono::milliseconds timeout) {
    pollfd pfd{};
    pfd.fd = _fd;
    pfd.events = POLLIN;
    int rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno == EINTR) {
            return false;
        }
        ZF_LOGW("%s: poll failed: %s", _description.c_str(), strerror(errno));
        return Error::LinkDown;
    }
    if (rc == 0) {
        return false;
    }
    if (pfd.revents & (POLLERR | POLLNVAL)) {
        ZF_LOGW("%s: descriptor error", _description.c_str());
        return Error::LinkDown;
    }
    // POLLHUP with pending data still reads; the 0-byte read reports the hangup
    return true;
}

UdpLink::UdpLink(int fd, std::string description, bool listen, const sockaddr_in& peer)
    : FdLink(fd, std::move(description)), _listen(listen), _has_peer(!listen), _peer(peer) {}

Result<size_t, Error> UdpLink::read(uint8_t* buffer, size_t len, std::chrono::milliseconds timeout) {
    auto ready = wait_readable(timeout);
    if (ready.is_err()) {
        return ready.unwrap_err();
    }
    if (!ready.unwrap()) {
        return size_t{0};
    }

    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    ssize_t n = recvfrom(_fd, buffer, len, 0, reinterpret_cast<sockaddr*>(&from), &from_len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return size_t{0};
        }
        // udpout before the vehicle is up: ICMP port unreachable surfaces here
        if (errno == ECONNREFUSED && !_listen) {
            return size_t{0};
        }
        ZF_LOGW("%s: recvfrom failed: %s", _description.c_str(), strerror(errno));
        return Error::LinkDown;
    }

    if (_listen && (!_has_peer || from.sin_addr.s_addr != _peer.sin_addr.s_addr || from.sin_port != _peer.sin_port)) {
        char addr[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &from.sin_addr, addr, sizeof(addr));
        ZF_LOGI("%s: receiving from %s:%u", _description.c_str(), addr, ntohs(from.sin_port));
        _peer = from;
        _has_peer = true;
    }
    return static_cast<size_t>(n);
}

Result<size_t, Error> UdpLink::write(const uint8_t* data, size_t len) {
    if (!_has_peer) {
        return size_t{0};
    }
    ssize_t n = sendto(_fd, data, len, 0, reinterpret_cast<const sockaddr*>(&_peer), sizeof(_peer));
    if (n < 0) {
        if (errno == ECONNREFUSED || errno == EAGAIN || errno == EWOULDBLOCK) {
            return size_t{0};
        }
        ZF_LOGW("%s: sendto failed: %s", _description.c_str(), strerror(errno));
        return Error::LinkDown;
    }
    return static_cast<size_t>(n);
}

Result<size_t, Error> TcpLink::read(uint8_t* buffer, size_t len, std::chrono::milliseconds timeout) {
    auto ready = wait_readable(timeout);
    if (ready.is_err()) {
        return ready.unwrap_err();
    }
    if (!ready.unwrap()) {
        return size_t{0};
    }

    ssize_t n = recv(_fd, buffer, len, 0);
    if (n == 0) {
        ZF_LOGW("%s: connection closed by peer", _description.c_str());
        return Error::LinkDown;
    }
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return size_t{0};
        }
        ZF_LOGW("%s: recv failed: %s", _description.c_str(), strerror(errno));
        return Error::LinkDown;
    }
    return static_cast<size_t>(n);
}

Result<size_t, Error> TcpLink::write(const uint8_t* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = send(_fd, data + total, len - total, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            ZF_LOGW("%s: send failed: %s", _description.c_str(), strerror(errno));
            return Error::LinkDown;
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

Result<size_t, Error> SerialLink::read(uint8_t* buffer, size_t len, std::chrono::milliseconds timeout) {
    auto ready = wait_readable(timeout);
    if (ready.is_err()) {
        return ready.unwrap_err();
    }
    if (!ready.unwrap()) {
        return size_t{0};
    }

    ssize_t n = ::read(_fd, buffer, len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return size_t{0};
        }
        ZF_LOGW("%s: read failed: %s", _description.c_str(), strerror(errno));
        return Error::LinkDown;
    }
    if (n == 0) {
        // Readable but empty: the device went away (USB unplug)
        ZF_LOGW("%s: device disconnected", _description.c_str());
        return Error::LinkDown;
    }
    return static_cast<size_t>(n);
}

Result<size_t, Error> SerialLink::write(const uint8_t* data, size_t len) {
    ssize_t n = ::write(_fd, data, len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return size_t{0};
        }
        ZF_LOGW("%s: write failed: %s", _description.c_str(), strerror(errno));
        return Error::LinkDown;
    }
    return static_cast<size_t>(n);
}

} // namespace mavtrack

#include "amqp_publisher.hpp"
#include "zf_log.h"
#include <rabbitmq-c/ssl_socket.h>
#include <rabbitmq-c/tcp_socket.h>
#include <stdexcept>
#include <sys/time.h>

namespace mavtrack {

namespace {

constexpr amqp_channel_t AMQP_CHANNEL = 1;
constexpr int AMQP_FRAME_MAX = 131072;

timeval to_timeval(std::chrono::milliseconds ms) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

} // namespace

AmqpPublisher::AmqpPublisher(std::string name, const AmqpSettings& settings)
    : Publisher(std::move(name), SinkKind::Amqp), _settings(settings) {
    if (_settings.host.empty() || _settings.queue.empty()) {
        throw std::invalid_argument("AmqpPublisher requires host and queue");
    }
}

AmqpPublisher::~AmqpPublisher() {
    close_connection();
}

std::string AmqpPublisher::endpoint() const {
    return std::string(_settings.tls ? "amqps://" : "amqp://") + _settings.host + ":" +
           std::to_string(_settings.effective_port()) + "/" + _settings.queue;
}

bool AmqpPublisher::check_rpc_reply(const char* context) {
    amqp_rpc_reply_t reply = amqp_get_rpc_reply(_conn);
    if (reply.reply_type == AMQP_RESPONSE_NORMAL) {
        return true;
    }
    if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION) {
        ZF_LOGW("%s: %s failed: %s", name().c_str(), context, amqp_error_string2(reply.library_error));
    } else {
        ZF_LOGW("%s: %s rejected by broker", name().c_str(), context);
    }
    return false;
}

Result<Empty, Error> AmqpPublisher::open_connection() {
    close_connection();

    _conn = amqp_new_connection();
    if (!_conn) {
        ZF_LOGE("%s: amqp_new_connection failed", name().c_str());
        return Error::BrokerUnavailable;
    }

    timeval tv = to_timeval(timeout());
    amqp_set_handshake_timeout(_conn, &tv);
    amqp_set_rpc_timeout(_conn, &tv);

    amqp_socket_t* socket = nullptr;
    if (_settings.tls) {
        socket = amqp_ssl_socket_new(_conn);
        if (socket) {
            amqp_ssl_socket_set_verify_peer(socket, _settings.verify_peer ? 1 : 0);
            amqp_ssl_socket_set_verify_hostname(socket, _settings.verify_peer ? 1 : 0);
        }
    } else {
        socket = amqp_tcp_socket_new(_conn);
    }
    if (!socket) {
        ZF_LOGE("%s: cannot create %s socket", name().c_str(), _settings.tls ? "TLS" : "TCP");
        close_connection();
        return Error::BrokerUnavailable;
    }

    int status = amqp_socket_open_noblock(socket, _settings.host.c_str(), _settings.effective_port(), &tv);
    if (status != AMQP_STATUS_OK) {
        ZF_LOGW("%s: cannot reach %s: %s", name().c_str(), endpoint().c_str(), amqp_error_string2(status));
        close_connection();
        return Error::BrokerUnavailable;
    }

    amqp_rpc_reply_t login = amqp_login(_conn, _settings.vhost.c_str(), 0, AMQP_FRAME_MAX, 0,
                                        AMQP_SASL_METHOD_PLAIN,
                                        _settings.username.c_str(), _settings.password.c_str());
    if (login.reply_type != AMQP_RESPONSE_NORMAL) {
        if (login.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION) {
            ZF_LOGW("%s: login to %s failed: %s", name().c_str(), endpoint().c_str(),
                    amqp_error_string2(login.library_error));
        } else {
            ZF_LOGW("%s: login to %s rejected by broker", name().c_str(), endpoint().c_str());
        }
        close_connection();
        return Error::BrokerUnavailable;
    }

    amqp_channel_open(_conn, AMQP_CHANNEL);
    if (!check_rpc_reply("channel.open")) {
        close_connection();
        return Error::BrokerUnavailable;
    }
    _channel_open = true;
    return Empty{};
}

Result<Empty, Error> AmqpPublisher::send(const std::string& payload, const TrackingUpdate& update) {
    if (!_conn || !_channel_open) {
        return Error::BrokerUnavailable;
    }

    amqp_basic_properties_t props;
    props._flags = AMQP_BASIC_CONTENT_TYPE_FLAG | AMQP_BASIC_DELIVERY_MODE_FLAG;
    props.content_type = amqp_cstring_bytes("application/json");
    props.delivery_mode = 1;  // transient

    amqp_bytes_t body;
    body.len = payload.size();
    body.bytes = const_cast<char*>(payload.data());

    int rc = amqp_basic_publish(_conn, AMQP_CHANNEL,
                                amqp_cstring_bytes(_settings.exchange.c_str()),
                                amqp_cstring_bytes(_settings.queue.c_str()),
                                0, 0, &props, body);
    if (rc != AMQP_STATUS_OK) {
        ZF_LOGW("%s: basic.publish for '%s' failed: %s", name().c_str(), update.uav_id.c_str(),
                amqp_error_string2(rc));
        return rc == AMQP_STATUS_TIMEOUT ? Error::Timeout : Error::BrokerUnavailable;
    }
    return Empty{};
}

void AmqpPublisher::close_connection() {
    if (!_conn) {
        return;
    }
    if (_channel_open) {
        amqp_channel_close(_conn, AMQP_CHANNEL, AMQP_REPLY_SUCCESS);
        amqp_connection_close(_conn, AMQP_REPLY_SUCCESS);
        _channel_open = false;
    }
    int rc = amqp_destroy_connection(_conn);
    if (rc != AMQP_STATUS_OK) {
        ZF_LOGD("%s: amqp_destroy_connection: %s", name().c_str(), amqp_error_string2(rc));
    }
    _conn = nullptr;
}

} // namespace mavtrack

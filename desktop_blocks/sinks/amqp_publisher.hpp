#pragma once

#include "publisher.hpp"
#include <rabbitmq-c/amqp.h>
#include <string>

namespace mavtrack {

struct AmqpSettings {
    std::string host;
    std::string username;
    std::string password;
    std::string queue;              // routing key
    int port = 0;                   // 0: 5671 with TLS, 5672 without
    std::string vhost = "/";
    std::string exchange;           // "" is the default exchange
    bool tls = true;
    bool verify_peer = true;

    int effective_port() const { return port > 0 ? port : (tls ? 5671 : 5672); }
};

// rabbitmq-c connection on channel 1, one basic.publish per update
class AmqpPublisher : public Publisher {
public:
    AmqpPublisher(std::string name, const AmqpSettings& settings);
    ~AmqpPublisher() override;

    std::string endpoint() const override;
    const AmqpSettings& settings() const { return _settings; }

protected:
    Result<Empty, Error> open_connection() override;
    Result<Empty, Error> send(const std::string& payload, const TrackingUpdate& update) override;
    void close_connection() override;

private:
    bool check_rpc_reply(const char* context);

    AmqpSettings _settings;
    amqp_connection_state_t _conn = nullptr;
    bool _channel_open = false;
};

} // namespace mavtrack

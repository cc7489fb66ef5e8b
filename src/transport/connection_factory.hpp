#pragma once

#include <memory>
#include <core/config.hpp>
#include "transport.hpp"

// Picks TcpTransport or SshTunnelTransport from the client's `server` entry.
class ConnectionFactory : public TransportFactory {
public:
    ConnectionFactory(ServerEndpoint endpoint, SendConfig sending)
        : endpoint_(std::move(endpoint)), sending_(std::move(sending)) {}

    std::unique_ptr<Transport> create() override;

private:
    ServerEndpoint endpoint_;
    SendConfig sending_;
};

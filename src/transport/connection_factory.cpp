#include "connection_factory.hpp"
#include "tcp_transport.hpp"
#include "ssh_tunnel_transport.hpp"

std::unique_ptr<Transport> ConnectionFactory::create() {
    if (endpoint_.is_tunnel()) {
        return std::make_unique<SshTunnelTransport>(*endpoint_.tunnel,
                                                    sending_.connect_timeout_secs,
                                                    sending_.io_timeout_secs);
    }
    return std::make_unique<TcpTransport>(endpoint_.host, endpoint_.port,
                                          sending_.connect_timeout_secs,
                                          sending_.io_timeout_secs);
}

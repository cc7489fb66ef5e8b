#include "listener.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <transport/tcp_transport.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

Listener::Listener(Intake& intake, std::string host, int port, int io_timeout_secs)
    : intake_(intake), host_(std::move(host)), port_(port), io_timeout_secs_(io_timeout_secs) {}

Listener::~Listener() {
    stop();
}

Result<void> Listener::start() {
    auto sock = platform::listen_tcp(host_, port_);
    if (sock.is_err()) return Result<void>::Err(sock);
    listen_sock_ = sock.value;
    bound_port_ = platform::local_port(listen_sock_);

    stopping_ = false;
    accept_thread_ = std::thread(&Listener::accept_loop, this);
    log_info("listening on {}:{}", host_, bound_port_);
    return Result<void>::Ok();
}

void Listener::stop() {
    if (!accept_thread_.joinable()) return;

    stopping_ = true;
    accept_thread_.join();
    platform::close_socket(listen_sock_);
    listen_sock_ = PIPELINE_INVALID_SOCKET;

    reap_finished(true);
    log_info("listener stopped");
}

void Listener::reap_finished(bool all) {
    std::list<Connection> done;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        for (auto it = conns_.begin(); it != conns_.end();) {
            if (all || it->finished->load()) {
                done.splice(done.end(), conns_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& c : done) {
        if (c.thread.joinable()) c.thread.join();
    }
}

void Listener::accept_loop() {
    set_log_thread_name("accept");

    while (!stopping_) {
        int revents = platform::poll_socket(listen_sock_, POLLIN, ACCEPT_POLL_MS);
        reap_finished(false);
        if (revents <= 0) continue;

        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        socket_t client = ::accept4(listen_sock_, reinterpret_cast<sockaddr*>(&addr), &len,
                                    SOCK_CLOEXEC);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                log_warn("accept failed: {}", std::strerror(errno));
            }
            continue;
        }
        platform::enable_keepalive(client);

        char host[INET6_ADDRSTRLEN] = "?";
        int port = 0;
        if (addr.ss_family == AF_INET) {
            auto* in = reinterpret_cast<sockaddr_in*>(&addr);
            inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
            port = ntohs(in->sin_port);
        } else if (addr.ss_family == AF_INET6) {
            auto* in6 = reinterpret_cast<sockaddr_in6*>(&addr);
            inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
            port = ntohs(in6->sin6_port);
        }
        std::string peer = fmt::format("{}:{}", host, port);

        auto finished = std::make_shared<std::atomic<bool>>(false);
        unsigned id = next_conn_id_++;
        std::thread t([this, client, peer, finished, id]() {
            set_log_thread_name(fmt::format("intake-{}", id));
            TcpTransport conn(client, peer, io_timeout_secs_);
            intake_.serve(conn, stopping_);
            finished->store(true);
        });

        std::lock_guard<std::mutex> lock(conns_mutex_);
        conns_.push_back(Connection{std::move(t), finished});
    }
}

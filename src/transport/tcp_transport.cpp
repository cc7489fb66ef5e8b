#include "tcp_transport.hpp"
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

TcpTransport::TcpTransport(std::string host, int port, int connect_timeout_secs,
                           int io_timeout_secs)
    : host_(std::move(host)), port_(port),
      connect_timeout_secs_(connect_timeout_secs), io_timeout_secs_(io_timeout_secs) {}

TcpTransport::TcpTransport(socket_t sock, std::string peer, int io_timeout_secs)
    : host_(std::move(peer)), connect_timeout_secs_(0),
      io_timeout_secs_(io_timeout_secs), sock_(sock) {}

TcpTransport::~TcpTransport() {
    close();
}

Result<void> TcpTransport::connect() {
    close();
    auto r = platform::connect_tcp(host_, port_, connect_timeout_secs_);
    if (r.is_err()) return Result<void>::Err(r);
    sock_ = r.value;
    return Result<void>::Ok();
}

void TcpTransport::close() {
    if (sock_ != PIPELINE_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = PIPELINE_INVALID_SOCKET;
    }
}

Result<void> TcpTransport::write_all(const void* data, std::size_t len) {
    if (!is_open()) return transport_error("write on closed connection");

    const char* p = static_cast<const char*>(data);
    std::size_t sent = 0;
    while (sent < len) {
        int revents = platform::poll_socket(sock_, POLLOUT, io_timeout_secs_ * 1000);
        if (revents == 0) {
            return transport_error(fmt::format("write timed out after {}s", io_timeout_secs_));
        }
        if (revents < 0 || (revents & (POLLERR | POLLNVAL))) {
            return transport_error("connection error while writing");
        }
        ssize_t w = ::send(sock_, p + sent, len - sent, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return transport_error(std::string("write failed: ") + std::strerror(errno));
        }
        sent += static_cast<std::size_t>(w);
    }
    return Result<void>::Ok();
}

Result<void> TcpTransport::read_exact(void* data, std::size_t len, bool* clean_eof) {
    if (clean_eof) *clean_eof = false;
    if (!is_open()) return transport_error("read on closed connection");

    char* p = static_cast<char*>(data);
    std::size_t got = 0;
    while (got < len) {
        int revents = platform::poll_socket(sock_, POLLIN, io_timeout_secs_ * 1000);
        if (revents == 0) {
            return transport_error(fmt::format("read timed out after {}s", io_timeout_secs_));
        }
        if (revents < 0 || (revents & POLLNVAL)) {
            return transport_error("connection error while reading");
        }
        ssize_t n = ::recv(sock_, p + got, len - got, 0);
        if (n == 0) {
            if (got == 0 && clean_eof) *clean_eof = true;
            return transport_error("connection closed by peer");
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return transport_error(std::string("read failed: ") + std::strerror(errno));
        }
        got += static_cast<std::size_t>(n);
    }
    return Result<void>::Ok();
}

int TcpTransport::wait_readable(int timeout_ms) {
    if (!is_open()) return -1;
    int revents = platform::poll_socket(sock_, POLLIN, timeout_ms);
    if (revents < 0 || (revents & POLLNVAL)) return -1;
    return revents == 0 ? 0 : 1;
}

std::string TcpTransport::describe() const {
    if (port_ > 0) return fmt::format("tcp {}:{}", host_, port_);
    return fmt::format("tcp {}", host_);
}

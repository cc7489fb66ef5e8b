#pragma once

#include <string>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// Direct TCP stream. Client side connects to host:port; server side wraps an
// accepted socket.
class TcpTransport : public Transport {
public:
    TcpTransport(std::string host, int port, int connect_timeout_secs, int io_timeout_secs);

    // Adopt an already connected socket (takes ownership).
    TcpTransport(socket_t sock, std::string peer, int io_timeout_secs);

    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    Result<void> connect() override;
    void close() override;
    bool is_open() const override { return sock_ != PIPELINE_INVALID_SOCKET; }

    Result<void> write_all(const void* data, std::size_t len) override;
    Result<void> read_exact(void* data, std::size_t len, bool* clean_eof = nullptr) override;
    int wait_readable(int timeout_ms) override;

    std::string describe() const override;

    socket_t native_socket() const { return sock_; }

private:
    std::string host_;
    int port_ = 0;
    int connect_timeout_secs_;
    int io_timeout_secs_;
    socket_t sock_ = PIPELINE_INVALID_SOCKET;
};

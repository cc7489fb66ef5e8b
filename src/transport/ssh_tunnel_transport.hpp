#pragma once

#include <string>
#include <core/config.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_AGENT LIBSSH2_AGENT;

// Byte stream carried by a libssh2 direct-tcpip channel:
//   local process -> ssh_host:ssh_port -> server_addr_from_host:server_port_from_host
//
// The SSH host key must match one of accepted_ssh_keys, otherwise connect()
// fails without retry.
class SshTunnelTransport : public Transport {
public:
    SshTunnelTransport(SshTunnelConfig config, int connect_timeout_secs, int io_timeout_secs);
    ~SshTunnelTransport() override;

    SshTunnelTransport(const SshTunnelTransport&) = delete;
    SshTunnelTransport& operator=(const SshTunnelTransport&) = delete;

    Result<void> connect() override;
    void close() override;
    bool is_open() const override { return channel_ != nullptr; }

    Result<void> write_all(const void* data, std::size_t len) override;
    Result<void> read_exact(void* data, std::size_t len, bool* clean_eof = nullptr) override;
    int wait_readable(int timeout_ms) override;

    std::string describe() const override;

    // Does the raw host key (as returned by libssh2) match an OpenSSH line
    // such as "ssh-ed25519 AAAA... comment"?
    static bool host_key_matches(const std::string& raw_key,
                                 const std::vector<std::string>& accepted);

private:
    SshTunnelConfig config_;
    int connect_timeout_secs_;
    int io_timeout_secs_;

    socket_t sock_ = PIPELINE_INVALID_SOCKET;
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_CHANNEL* channel_ = nullptr;

    Result<void> verify_host_key();
    Result<void> authenticate();
    Result<void> authenticate_with_agent();
    Result<void> fail(const std::string& msg, bool retryable);
    std::string last_ssh_error() const;
};

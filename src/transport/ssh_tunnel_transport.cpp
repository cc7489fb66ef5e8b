#include "ssh_tunnel_transport.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <sstream>

static Result<void> init_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) return transport_error("failed to initialize libssh2", false);
    return Result<void>::Ok();
}

// Split an OpenSSH public key line into its fields.
static std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string f;
    while (ss >> f) fields.push_back(f);
    return fields;
}

SshTunnelTransport::SshTunnelTransport(SshTunnelConfig config, int connect_timeout_secs,
                                       int io_timeout_secs)
    : config_(std::move(config)), connect_timeout_secs_(connect_timeout_secs),
      io_timeout_secs_(io_timeout_secs) {}

SshTunnelTransport::~SshTunnelTransport() {
    close();
}

bool SshTunnelTransport::host_key_matches(const std::string& raw_key,
                                          const std::vector<std::string>& accepted) {
    if (raw_key.empty()) return false;
    for (const auto& line : accepted) {
        auto fields = split_fields(line);
        if (fields.size() < 2) continue;
        if (base64_decode(fields[1]) == raw_key) return true;
    }
    return false;
}

std::string SshTunnelTransport::last_ssh_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return msg ? std::string(msg, static_cast<size_t>(len)) : "unknown error";
}

Result<void> SshTunnelTransport::fail(const std::string& msg, bool retryable) {
    std::string full = msg;
    if (session_) full += ": " + last_ssh_error();
    close();
    return transport_error(full, retryable);
}

Result<void> SshTunnelTransport::connect() {
    close();
    auto init = init_libssh2();
    if (init.is_err()) return init;

    auto sock = platform::connect_tcp(config_.ssh_host, config_.ssh_port, connect_timeout_secs_);
    if (sock.is_err()) return Result<void>::Err(sock);
    sock_ = sock.value;

    session_ = libssh2_session_init();
    if (!session_) return fail("failed to create SSH session", true);

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(io_timeout_secs_) * 1000);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        return fail("SSH handshake with " + config_.ssh_host + " failed", true);
    }

    auto hk = verify_host_key();
    if (hk.is_err()) return hk;

    auto auth = authenticate();
    if (auth.is_err()) return auth;

    libssh2_keepalive_config(session_, 1, static_cast<unsigned>(config_.keepalive_every_secs));

    channel_ = libssh2_channel_direct_tcpip_ex(session_,
                                               config_.server_addr_from_host.c_str(),
                                               config_.server_port_from_host,
                                               "127.0.0.1", 0);
    if (!channel_) {
        return fail(fmt::format("cannot open forwarding channel to {}:{}",
                                config_.server_addr_from_host,
                                config_.server_port_from_host), true);
    }

    log_debug("ssh tunnel up: {}", describe());
    return Result<void>::Ok();
}

Result<void> SshTunnelTransport::verify_host_key() {
    size_t len = 0;
    int type = 0;
    const char* key = libssh2_session_hostkey(session_, &len, &type);
    if (!key) return fail("server sent no host key", false);

    std::string raw(key, len);
    if (!host_key_matches(raw, config_.accepted_ssh_keys)) {
        log_warn("unknown SSH host key for {}, refusing connection: {}",
                 config_.ssh_host, base64_encode(raw));
        close();
        return transport_error("SSH host key of " + config_.ssh_host + " is not accepted", false);
    }
    log_info("accepted SSH host key of {}", config_.ssh_host);
    return Result<void>::Ok();
}

Result<void> SshTunnelTransport::authenticate() {
    const auto& auth = config_.ssh_auth;
    const std::string& user = auth.user;

    switch (auth.strategy) {
    case SshAuthStrategy::None: {
        log_info("authenticating as {} with `none` auth", user);
        libssh2_userauth_list(session_, user.c_str(), static_cast<unsigned>(user.size()));
        if (libssh2_userauth_authenticated(session_)) return Result<void>::Ok();
        return fail("`none` authentication denied for " + user, false);
    }
    case SshAuthStrategy::Password: {
        log_info("authenticating as {} with password", user);
        std::string password;
        if (auth.password) {
            password = *auth.password;
        } else if (const char* env = std::getenv("PIPELINE_SSH_PASSWORD")) {
            password = env;
        } else {
            return fail("no password for " + user + " (set PIPELINE_SSH_PASSWORD)", false);
        }
        int rc = libssh2_userauth_password(session_, user.c_str(), password.c_str());
        std::fill(password.begin(), password.end(), '\0');
        if (rc == 0) return Result<void>::Ok();
        return fail("password authentication denied for " + user, false);
    }
    case SshAuthStrategy::Key:
        log_info("authenticating as {} with key", user);
        return authenticate_with_agent();
    }
    return fail("unsupported authentication strategy", false);
}

Result<void> SshTunnelTransport::authenticate_with_agent() {
    const auto& auth = config_.ssh_auth;

    std::string wanted_blob;
    if (auth.public_key) {
        fs::path key_path = platform::expand_user(*auth.public_key);
        std::ifstream in(key_path);
        std::string line;
        if (!in || !std::getline(in, line)) {
            return fail("cannot read public key " + key_path.string(), false);
        }
        auto fields = split_fields(line);
        if (fields.size() < 2) return fail("malformed public key " + key_path.string(), false);
        wanted_blob = base64_decode(fields[1]);
    }

    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return fail("failed to initialize ssh-agent client", false);

    auto release = [agent]() {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    };

    if (libssh2_agent_connect(agent) != 0) {
        release();
        return fail("cannot connect to ssh-agent (SSH_AUTH_SOCK)", false);
    }
    if (libssh2_agent_list_identities(agent) != 0) {
        release();
        return fail("cannot list ssh-agent identities", false);
    }

    struct libssh2_agent_publickey* identity = nullptr;
    struct libssh2_agent_publickey* prev = nullptr;
    bool authenticated = false;
    while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
        std::string blob(reinterpret_cast<const char*>(identity->blob), identity->blob_len);
        if (wanted_blob.empty() || blob == wanted_blob) {
            if (libssh2_agent_userauth(agent, auth.user.c_str(), identity) == 0) {
                authenticated = true;
                break;
            }
        }
        prev = identity;
    }
    release();

    if (!authenticated) return fail("key authentication denied for " + auth.user, false);
    return Result<void>::Ok();
}

void SshTunnelTransport::close() {
    if (channel_) {
        libssh2_channel_close(channel_);
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "closing");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != PIPELINE_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = PIPELINE_INVALID_SOCKET;
    }
}

Result<void> SshTunnelTransport::write_all(const void* data, std::size_t len) {
    if (!channel_) return transport_error("write on closed tunnel");

    int next_keepalive = 0;
    libssh2_keepalive_send(session_, &next_keepalive);

    const char* p = static_cast<const char*>(data);
    std::size_t sent = 0;
    while (sent < len) {
        ssize_t w = libssh2_channel_write(channel_, p + sent, len - sent);
        if (w == LIBSSH2_ERROR_TIMEOUT) {
            return transport_error(fmt::format("tunnel write timed out after {}s",
                                               io_timeout_secs_));
        }
        if (w < 0) {
            return transport_error("tunnel write failed: " + last_ssh_error());
        }
        sent += static_cast<std::size_t>(w);
    }
    return Result<void>::Ok();
}

Result<void> SshTunnelTransport::read_exact(void* data, std::size_t len, bool* clean_eof) {
    if (clean_eof) *clean_eof = false;
    if (!channel_) return transport_error("read on closed tunnel");

    char* p = static_cast<char*>(data);
    std::size_t got = 0;
    while (got < len) {
        ssize_t n = libssh2_channel_read(channel_, p + got, len - got);
        if (n > 0) {
            got += static_cast<std::size_t>(n);
            continue;
        }
        if (n == LIBSSH2_ERROR_TIMEOUT) {
            return transport_error(fmt::format("tunnel read timed out after {}s",
                                               io_timeout_secs_));
        }
        if (n < 0) {
            return transport_error("tunnel read failed: " + last_ssh_error());
        }
        if (libssh2_channel_eof(channel_)) {
            if (got == 0 && clean_eof) *clean_eof = true;
            return transport_error("tunnel closed by peer");
        }
    }
    return Result<void>::Ok();
}

int SshTunnelTransport::wait_readable(int timeout_ms) {
    if (!channel_) return -1;
    int revents = platform::poll_socket(sock_, POLLIN, timeout_ms);
    if (revents < 0) return -1;
    if (revents > 0) return 1;
    // Data may already sit decrypted in libssh2's buffer
    return libssh2_poll_channel_read(channel_, 0) ? 1 : 0;
}

std::string SshTunnelTransport::describe() const {
    return fmt::format("ssh {}@{}:{} -> {}:{}", config_.ssh_auth.user, config_.ssh_host,
                       config_.ssh_port, config_.server_addr_from_host,
                       config_.server_port_from_host);
}

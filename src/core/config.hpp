#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// ── Client ─────────────────────────────────────────────────

enum class SshAuthStrategy { None, Password, Key };

struct SshAuthConfig {
    SshAuthStrategy strategy = SshAuthStrategy::None;
    std::string user;
    std::optional<std::string> password;     // falls back to PIPELINE_SSH_PASSWORD
    std::optional<fs::path> public_key;      // key strategy: identity offered by ssh-agent
};

struct SshTunnelConfig {
    std::string ssh_host;
    int ssh_port = 22;
    SshAuthConfig ssh_auth;
    std::string server_addr_from_host;
    int server_port_from_host = 0;
    std::vector<std::string> accepted_ssh_keys;  // OpenSSH public key lines
    int keepalive_every_secs = SSH_KEEPALIVE_SECS;
};

// Either a direct "host:port" or an SSH tunnel.
struct ServerEndpoint {
    std::string host;
    int port = 0;
    std::optional<SshTunnelConfig> tunnel;

    bool is_tunnel() const { return tunnel.has_value(); }
};

struct WatchConfig {
    fs::path directory;
    std::string extension;                    // "" = every file
    int stability_window_secs = WATCH_STABILITY_SECS;
    int stable_polls = WATCH_STABLE_POLLS;
    int refresh_every_secs = WATCH_REFRESH_SECS;
};

struct SendConfig {
    int max_in_flight = 2;
    int max_attempts = SEND_MAX_ATTEMPTS;
    int retry_initial_ms = SEND_RETRY_INITIAL_MS;
    int retry_max_ms = SEND_RETRY_MAX_MS;
    int max_retry_rounds = SEND_MAX_RETRY_ROUNDS;
    int connect_timeout_secs = CONNECT_TIMEOUT_SECS;
    int io_timeout_secs = IO_TIMEOUT_SECS;
    bool remove_after_send = false;
};

struct ClientConfig {
    std::string name;                         // reported to the server as client_name
    ServerEndpoint server;
    WatchConfig watching;
    SendConfig sending;
};

// ── Server ─────────────────────────────────────────────────

struct ServerConfig {
    std::string address = "127.0.0.1:12345";
    fs::path incoming_directory;
    fs::path state_directory = DEFAULT_STATE_DIR;
    std::vector<std::string> processing;      // argv template
    bool auto_status_update = true;
    int concurrency = DEFAULT_CONCURRENCY;
    std::uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE;
    int max_attempts = PROCESS_MAX_ATTEMPTS;
    bool readmit_failed = false;
    int io_timeout_secs = IO_TIMEOUT_SECS;
    int poll_interval_ms = DISPATCH_POLL_MS;
};

// Load and validate. Relative paths are resolved against the config file's directory.
Result<ClientConfig> load_client_config(const fs::path& path);
Result<ServerConfig> load_server_config(const fs::path& path);

// Parse from an in-memory YAML document (base_dir resolves relative paths).
Result<ClientConfig> parse_client_config(const std::string& yaml, const fs::path& base_dir);
Result<ServerConfig> parse_server_config(const std::string& yaml, const fs::path& base_dir);

// Split "host:port". Returns false on a missing or invalid port.
bool parse_host_port(const std::string& addr, std::string& host, int& port);

// Commented default documents for `print-config`.
const char* default_client_config();
const char* default_tunnel_client_config();
const char* default_server_config();

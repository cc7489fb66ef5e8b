#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path resolve(const fs::path& base_dir, const fs::path& p) {
    if (p.empty() || p.is_absolute() || base_dir.empty()) return p;
    return base_dir / p;
}

static std::string default_client_name() {
    char buf[256];
    if (gethostname(buf, sizeof(buf)) == 0) {
        buf[sizeof(buf) - 1] = '\0';
        return buf;
    }
    return "client";
}

bool parse_host_port(const std::string& addr, std::string& host, int& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= addr.size()) {
        return false;
    }
    host = addr.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    try {
        size_t used = 0;
        port = std::stoi(addr.substr(colon + 1), &used);
        if (used != addr.size() - colon - 1) return false;
    } catch (const std::exception&) {
        return false;
    }
    return port > 0 && port < 65536;
}

// ── Client ─────────────────────────────────────────────────

static Result<SshAuthConfig> parse_ssh_auth(const YAML::Node& node) {
    SshAuthConfig auth;
    if (!node || !node.IsMap()) {
        return Result<SshAuthConfig>::Err("server.ssh_auth must be a map", ErrorKind::Config);
    }
    std::string strategy = node["strategy"].as<std::string>("none");
    auth.user = node["user"].as<std::string>("");
    if (auth.user.empty()) {
        return Result<SshAuthConfig>::Err("server.ssh_auth.user is required", ErrorKind::Config);
    }

    if (strategy == "none") {
        auth.strategy = SshAuthStrategy::None;
    } else if (strategy == "password") {
        auth.strategy = SshAuthStrategy::Password;
        if (node["password"]) auth.password = node["password"].as<std::string>();
    } else if (strategy == "key") {
        auth.strategy = SshAuthStrategy::Key;
        if (!node["public_key"]) {
            return Result<SshAuthConfig>::Err(
                "server.ssh_auth.public_key is required for the key strategy", ErrorKind::Config);
        }
        auth.public_key = fs::path(node["public_key"].as<std::string>());
    } else {
        return Result<SshAuthConfig>::Err(
            "unknown server.ssh_auth.strategy '" + strategy + "' (none, password, key)",
            ErrorKind::Config);
    }
    return Result<SshAuthConfig>::Ok(auth);
}

static Result<ServerEndpoint> parse_endpoint(const YAML::Node& node) {
    ServerEndpoint ep;
    if (!node) {
        return Result<ServerEndpoint>::Err("missing required key 'server'", ErrorKind::Config);
    }

    if (node.IsScalar()) {
        std::string addr = node.as<std::string>();
        if (!parse_host_port(addr, ep.host, ep.port)) {
            return Result<ServerEndpoint>::Err("invalid server address '" + addr + "'",
                                               ErrorKind::Config);
        }
        return Result<ServerEndpoint>::Ok(ep);
    }

    if (!node.IsMap()) {
        return Result<ServerEndpoint>::Err("'server' must be \"host:port\" or a tunnel map",
                                           ErrorKind::Config);
    }

    SshTunnelConfig t;
    t.ssh_host = node["ssh_host"].as<std::string>("");
    t.ssh_port = node["ssh_port"].as<int>(22);
    t.server_addr_from_host = node["server_addr_from_host"].as<std::string>("127.0.0.1");
    t.server_port_from_host = node["server_port_from_host"].as<int>(0);
    t.keepalive_every_secs = node["keepalive_every_secs"].as<int>(SSH_KEEPALIVE_SECS);
    if (t.ssh_host.empty()) {
        return Result<ServerEndpoint>::Err("server.ssh_host is required", ErrorKind::Config);
    }
    if (t.server_port_from_host <= 0 || t.server_port_from_host >= 65536) {
        return Result<ServerEndpoint>::Err("server.server_port_from_host is required",
                                           ErrorKind::Config);
    }

    auto auth = parse_ssh_auth(node["ssh_auth"]);
    if (auth.is_err()) return Result<ServerEndpoint>::Err(auth);
    t.ssh_auth = auth.value;

    if (node["accepted_ssh_keys"] && node["accepted_ssh_keys"].IsSequence()) {
        for (const auto& k : node["accepted_ssh_keys"]) {
            t.accepted_ssh_keys.push_back(k.as<std::string>());
        }
    }
    if (t.accepted_ssh_keys.empty()) {
        return Result<ServerEndpoint>::Err(
            "server.accepted_ssh_keys must list at least one host key", ErrorKind::Config);
    }

    ep.host = t.server_addr_from_host;
    ep.port = t.server_port_from_host;
    ep.tunnel = t;
    return Result<ServerEndpoint>::Ok(ep);
}

static WatchConfig parse_watching(const YAML::Node& node, const fs::path& base_dir) {
    WatchConfig w;
    w.directory = resolve(base_dir, node["directory"].as<std::string>(""));
    w.extension = node["extension"].as<std::string>("");
    if (!w.extension.empty() && w.extension[0] == '.') w.extension.erase(0, 1);
    w.stability_window_secs = node["stability_window_secs"].as<int>(
        node["last_modif_secs"].as<int>(WATCH_STABILITY_SECS));
    w.stable_polls = node["stable_polls"].as<int>(WATCH_STABLE_POLLS);
    w.refresh_every_secs = node["refresh_every_secs"].as<int>(WATCH_REFRESH_SECS);
    return w;
}

static SendConfig parse_sending(const YAML::Node& node) {
    SendConfig s;
    if (!node) return s;
    s.max_in_flight = node["max_in_flight"].as<int>(2);
    s.max_attempts = node["max_attempts"].as<int>(SEND_MAX_ATTEMPTS);
    s.retry_initial_ms = node["retry_initial_ms"].as<int>(SEND_RETRY_INITIAL_MS);
    s.retry_max_ms = node["retry_max_ms"].as<int>(SEND_RETRY_MAX_MS);
    s.max_retry_rounds = node["max_retry_rounds"].as<int>(SEND_MAX_RETRY_ROUNDS);
    s.connect_timeout_secs = node["connect_timeout_secs"].as<int>(CONNECT_TIMEOUT_SECS);
    s.io_timeout_secs = node["io_timeout_secs"].as<int>(IO_TIMEOUT_SECS);
    s.remove_after_send = node["remove_after_send"].as<bool>(false);
    return s;
}

Result<ClientConfig> parse_client_config(const std::string& yaml, const fs::path& base_dir) {
    try {
        YAML::Node root = YAML::Load(yaml);
        ClientConfig cfg;
        cfg.name = root["name"].as<std::string>(default_client_name());

        auto ep = parse_endpoint(root["server"]);
        if (ep.is_err()) return Result<ClientConfig>::Err(ep);
        cfg.server = ep.value;

        if (!root["watching"] || !root["watching"].IsMap()) {
            return Result<ClientConfig>::Err("missing required key 'watching'", ErrorKind::Config);
        }
        cfg.watching = parse_watching(root["watching"], base_dir);
        if (cfg.watching.directory.empty()) {
            return Result<ClientConfig>::Err("missing required key 'watching.directory'",
                                             ErrorKind::Config);
        }
        if (cfg.watching.stable_polls < 1 || cfg.watching.refresh_every_secs < 1) {
            return Result<ClientConfig>::Err(
                "watching.stable_polls and watching.refresh_every_secs must be >= 1",
                ErrorKind::Config);
        }

        cfg.sending = parse_sending(root["sending"]);
        if (cfg.sending.max_in_flight < 1 || cfg.sending.max_attempts < 1 ||
            cfg.sending.max_retry_rounds < 1) {
            return Result<ClientConfig>::Err(
                "sending.max_in_flight, sending.max_attempts and sending.max_retry_rounds "
                "must be >= 1", ErrorKind::Config);
        }
        return Result<ClientConfig>::Ok(cfg);
    } catch (const YAML::Exception& e) {
        return Result<ClientConfig>::Err(std::string("invalid client config: ") + e.what(),
                                         ErrorKind::Config);
    }
}

// ── Server ─────────────────────────────────────────────────

Result<ServerConfig> parse_server_config(const std::string& yaml, const fs::path& base_dir) {
    try {
        YAML::Node root = YAML::Load(yaml);
        ServerConfig cfg;
        cfg.address = root["address"].as<std::string>(cfg.address);
        std::string host;
        int port = 0;
        if (!parse_host_port(cfg.address, host, port)) {
            return Result<ServerConfig>::Err("invalid address '" + cfg.address + "'",
                                             ErrorKind::Config);
        }

        if (!root["incoming_directory"]) {
            return Result<ServerConfig>::Err("missing required key 'incoming_directory'",
                                             ErrorKind::Config);
        }
        cfg.incoming_directory = resolve(base_dir, root["incoming_directory"].as<std::string>());
        cfg.state_directory = resolve(
            base_dir, root["state_directory"].as<std::string>(DEFAULT_STATE_DIR));

        const auto& proc = root["processing"];
        if (proc && proc.IsSequence()) {
            for (const auto& a : proc) cfg.processing.push_back(a.as<std::string>());
        } else if (proc && proc.IsScalar()) {
            cfg.processing.push_back(proc.as<std::string>());
        }
        if (cfg.processing.empty() || cfg.processing[0].empty()) {
            return Result<ServerConfig>::Err("missing required key 'processing'",
                                             ErrorKind::Config);
        }

        cfg.auto_status_update = root["auto_status_update"].as<bool>(true);
        cfg.concurrency = root["concurrency"].as<int>(DEFAULT_CONCURRENCY);
        cfg.max_file_size = root["max_file_size"].as<std::uint64_t>(DEFAULT_MAX_FILE_SIZE);
        cfg.max_attempts = root["max_attempts"].as<int>(PROCESS_MAX_ATTEMPTS);
        cfg.readmit_failed = root["readmit_failed"].as<bool>(false);
        cfg.io_timeout_secs = root["io_timeout_secs"].as<int>(IO_TIMEOUT_SECS);
        cfg.poll_interval_ms = root["poll_interval_ms"].as<int>(DISPATCH_POLL_MS);

        if (cfg.concurrency < 1) {
            return Result<ServerConfig>::Err("concurrency must be >= 1", ErrorKind::Config);
        }
        if (cfg.max_attempts < 1) {
            return Result<ServerConfig>::Err("max_attempts must be >= 1", ErrorKind::Config);
        }
        return Result<ServerConfig>::Ok(cfg);
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig>::Err(std::string("invalid server config: ") + e.what(),
                                         ErrorKind::Config);
    }
}

static Result<std::string> read_config_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::string>::Err("cannot read config file " + path.string(),
                                        ErrorKind::Config);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

Result<ClientConfig> load_client_config(const fs::path& path) {
    auto text = read_config_file(path);
    if (text.is_err()) return Result<ClientConfig>::Err(text);
    return parse_client_config(text.value, path.parent_path());
}

Result<ServerConfig> load_server_config(const fs::path& path) {
    auto text = read_config_file(path);
    if (text.is_err()) return Result<ServerConfig>::Err(text);
    return parse_server_config(text.value, path.parent_path());
}

// ── Defaults ───────────────────────────────────────────────

const char* default_client_config() {
    return R"(# Pipeline client configuration

# Name reported to the server, available as {client_name} in processing commands
name: "client-1"

# Server address (direct TCP)
server: "127.0.0.1:12345"

watching:
  directory: "watched"
  extension: "mrc"               # only files with this extension; "" for all
  stability_window_secs: 10      # mtime must be at least this old
  stable_polls: 2                # size/mtime unchanged across this many polls
  refresh_every_secs: 5

sending:
  max_in_flight: 2
  max_attempts: 8                # connection attempts per round
  max_retry_rounds: 10           # rounds before the file is given up until it changes
  retry_initial_ms: 500
  retry_max_ms: 60000
  connect_timeout_secs: 10
  io_timeout_secs: 60
  remove_after_send: false       # delete the local file once the server acknowledged it
)";
}

const char* default_tunnel_client_config() {
    return R"(# Pipeline client configuration (SSH tunnel)

name: "client-1"

server:
  ssh_host: "gateway.example.org"
  ssh_port: 22
  ssh_auth:
    strategy: "key"              # none, password (PIPELINE_SSH_PASSWORD), key (ssh-agent)
    user: "pipeline"
    public_key: "~/.ssh/id_ed25519.pub"
  server_addr_from_host: "127.0.0.1"
  server_port_from_host: 12345
  accepted_ssh_keys:
    - "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIDummyHostKeyReplaceMeWithTheRealOne0000"
  keepalive_every_secs: 30

watching:
  directory: "watched"
  extension: "mrc"
  stability_window_secs: 10
  stable_polls: 2
  refresh_every_secs: 5

sending:
  max_in_flight: 2
  max_attempts: 8
)";
}

const char* default_server_config() {
    return R"(# Pipeline server configuration

address: "127.0.0.1:12345"

# Admitted files land in <incoming_directory>/<h0h1>/<h2h3>/<hash>.<ext>
incoming_directory: "incoming"

# Job records, per-job processing logs
state_directory: ".pipeline_state"

# Placeholders: {hash} {server_path} {origin_name} {client_name}
#               {client_relative_directory} {client_file_stem}
processing:
  - "sh"
  - "-c"
  - "echo processing {server_path}"

# true: exit code decides Done/Failed
# false: launch and forget; resolve later with `pipeline mark <hash> done|failed`
auto_status_update: true

concurrency: 2
max_file_size: 17179869184       # bytes
max_attempts: 3                  # re-queues of a job interrupted by a restart
readmit_failed: false            # accept a re-upload of a Failed hash as a new admission
io_timeout_secs: 60
)";
}

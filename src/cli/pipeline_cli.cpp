#include "pipeline_cli.hpp"
#include "theme.hpp"
#include <client/client_daemon.hpp>
#include <core/log.hpp>
#include <server/admin.hpp>
#include <server/mark.hpp>
#include <server/server_daemon.hpp>
#include <fmt/format.h>
#include <atomic>
#include <csignal>
#include <iostream>

// ── Signals ─────────────────────────────────────────────────

static std::atomic<bool> g_stop{false};

static void on_signal(int) {
    g_stop = true;
}

static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

PipelineCLI::PipelineCLI() {
    // Broken connections are reported by write errors instead
    std::signal(SIGPIPE, SIG_IGN);
}

// ── Daemons ─────────────────────────────────────────────────

int PipelineCLI::run_client(const std::string& config_path) {
    auto config = load_client_config(config_path);
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return 1;
    }

    set_log_thread_name("watch");
    install_signal_handlers();
    ClientDaemon daemon(config.value);
    auto r = daemon.run(g_stop);
    if (r.is_err()) {
        log_error("{}", r.error);
        return 1;
    }
    return 0;
}

int PipelineCLI::run_server(const std::string& config_path) {
    ServerConfig config;
    if (!load_server(config_path, config)) return 1;

    set_log_thread_name("main");
    install_signal_handlers();
    ServerDaemon daemon(config);
    auto r = daemon.run(g_stop);
    if (r.is_err()) {
        log_error("server cannot start ({}): {}", error_kind_name(r.kind), r.error);
        return 1;
    }
    return 0;
}

// ── Admin ───────────────────────────────────────────────────

bool PipelineCLI::load_server(const std::string& config_path, ServerConfig& out) const {
    std::string path = config_path.empty() ? DEFAULT_SERVER_CONFIG : config_path;
    auto config = load_server_config(path);
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return false;
    }
    out = config.value;
    return true;
}

int PipelineCLI::run_mark(const std::string& hash, const std::string& outcome,
                          const std::string& config_path) {
    auto parsed = parse_mark_outcome(outcome);
    if (!parsed) {
        std::cerr << theme::fail("Outcome must be `done` or `failed`, got: " + outcome);
        return 1;
    }

    ServerConfig config;
    if (!load_server(config_path, config)) return 1;

    auto store = JobStore::open(store_options(config, false));
    if (store.is_err()) {
        std::cerr << theme::fail(store.error);
        return 1;
    }

    auto r = mark_job(*store.value, hash, *parsed);
    if (r.is_err()) {
        std::cerr << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("{} is now {}", hash, job_state_name(r.value.state)));
    return 0;
}

static std::string state_colored(JobState state) {
    std::string name = fmt::format("{:<11}", job_state_name(state));
    switch (state) {
    case JobState::Done:       return theme::green(name);
    case JobState::Failed:     return theme::red(name);
    case JobState::Processing: return theme::yellow(name);
    default:                   return name;
    }
}

int PipelineCLI::run_status(const std::string& config_path) {
    ServerConfig config;
    if (!load_server(config_path, config)) return 1;

    auto store = JobStore::open(store_options(config, false));
    if (store.is_err()) {
        std::cerr << theme::fail(store.error);
        return 1;
    }

    auto status = collect_status(*store.value);
    if (status.is_err()) {
        std::cerr << theme::fail(status.error);
        return 1;
    }

    std::cout << theme::section("Jobs");
    if (status.value.jobs.empty()) {
        std::cout << theme::info("No jobs yet.");
    }
    for (const auto& job : status.value.jobs) {
        std::string line = fmt::format("    {}  {} {:>2}  {}  {}", job.content_hash.substr(0, 12),
                                       state_colored(job.state), job.attempt_count,
                                       theme::dim(job.received_at), job.origin_name);
        if (job.last_error) line += "  " + theme::red(*job.last_error);
        std::cout << line << "\n";
    }

    std::cout << theme::section("Summary");
    for (JobState s : {JobState::Admitted, JobState::Processing, JobState::Done,
                       JobState::Failed}) {
        auto it = status.value.counts.find(s);
        std::size_t n = it == status.value.counts.end() ? 0 : it->second;
        std::cout << theme::kv(job_state_name(s), std::to_string(n));
    }
    std::cout << "\n";
    return 0;
}

int PipelineCLI::run_clean(bool force, const std::string& config_path) {
    ServerConfig config;
    if (!load_server(config_path, config)) return 1;

    auto store = JobStore::open(store_options(config, false));
    if (store.is_err()) {
        std::cerr << theme::fail(store.error);
        return 1;
    }

    if (!force) {
        std::cout << theme::info("Dry run, use `-f` to actually remove files.");
    }
    auto report = clean_done_jobs(*store.value, force);
    if (report.is_err()) {
        std::cerr << theme::fail(report.error);
        return 1;
    }

    for (const auto& job : report.value.removed) {
        std::string what = fmt::format("{} ({})", job.stored_path, job.origin_name);
        std::cout << (force ? theme::ok("removed " + what) : theme::step("would remove " + what));
    }
    for (const auto& err : report.value.errors) {
        std::cout << theme::fail(err.first.content_hash + ": " + err.second);
    }
    return report.value.errors.empty() ? 0 : 1;
}

int PipelineCLI::run_print_config(const std::string& kind) {
    if (kind == "client") {
        std::cout << default_client_config();
    } else if (kind == "tunnel") {
        std::cout << default_tunnel_client_config();
    } else if (kind == "server") {
        std::cout << default_server_config();
    } else {
        std::cerr << theme::fail("Unknown config kind: " + kind);
        std::cerr << theme::step("Usage: pipeline print-config client|tunnel|server");
        return 1;
    }
    return 0;
}

// ── Help ────────────────────────────────────────────────────

void PipelineCLI::print_usage() const {
    std::cout << theme::banner(PIPELINE_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::usage("pipeline client", "<config.yaml>", "Watch and send files");
    std::cout << theme::usage("pipeline server", "<config.yaml>", "Receive and process files");
    std::cout << theme::usage("pipeline mark", "<hash> done|failed [cfg]",
                              "Resolve a processing job");
    std::cout << theme::usage("pipeline status", "[config.yaml]", "List jobs");
    std::cout << theme::usage("pipeline clean", "[-f] [config.yaml]",
                              "Remove done jobs and their files");
    std::cout << theme::usage("pipeline print-config", "client|tunnel|server",
                              "Print a default config");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    pipeline --version     Show version\n"
              << "    pipeline --help        Show this help\n"
              << "    PIPELINE_LOG=debug|info|warn|off sets log verbosity"
              << theme::color::RESET << "\n\n";
}

void PipelineCLI::print_version() const {
    std::cout << theme::color::BROWN << theme::color::BOLD << "pipeline"
              << theme::color::RESET << theme::color::DIM
              << " version " << PIPELINE_VERSION << theme::color::RESET << "\n";
}

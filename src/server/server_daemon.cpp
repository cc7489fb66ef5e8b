#include "server_daemon.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>

StoreOptions store_options(const ServerConfig& config, bool recover) {
    StoreOptions opts;
    opts.state_dir = config.state_directory;
    opts.incoming_dir = config.incoming_directory;
    opts.policy = config.auto_status_update ? ResolvePolicy::AutoResolve
                                            : ResolvePolicy::ExternalResolve;
    opts.max_attempts = config.max_attempts;
    opts.recover = recover;
    return opts;
}

ServerDaemon::ServerDaemon(ServerConfig config) : config_(std::move(config)) {}

ServerDaemon::~ServerDaemon() {
    stop();
}

Result<void> ServerDaemon::start() {
    std::string host;
    int port = 0;
    if (!parse_host_port(config_.address, host, port)) {
        return Result<void>::Err("invalid address " + config_.address, ErrorKind::Config);
    }

    RecoveryReport report;
    auto store = JobStore::open(store_options(config_, true), &report);
    if (store.is_err()) return Result<void>::Err(store);
    store_ = std::move(store.value);
    log_info("job store: {} job(s), {} requeued, {} failed, {} awaiting mark, "
             "{} partial upload(s) and {} orphan file(s) removed",
             report.jobs, report.requeued, report.failed, report.kept_processing,
             report.orphan_temps, report.orphan_files);

    DispatchOptions dopts;
    dopts.command = config_.processing;
    dopts.policy = store_options(config_, true).policy;
    dopts.concurrency = config_.concurrency;
    dopts.poll_interval_ms = config_.poll_interval_ms;
    dispatcher_ = std::make_unique<Dispatcher>(*store_, dopts);

    IntakeOptions iopts;
    iopts.max_file_size = config_.max_file_size;
    iopts.readmit_failed = config_.readmit_failed;
    Dispatcher* dispatcher = dispatcher_.get();
    intake_ = std::make_unique<Intake>(*store_, iopts,
                                       [dispatcher](const Job&) { dispatcher->notify(); });

    listener_ = std::make_unique<Listener>(*intake_, host, port, config_.io_timeout_secs);
    auto listening = listener_->start();
    if (listening.is_err()) {
        listener_.reset();
        return listening;
    }

    dispatcher_->start();
    return Result<void>::Ok();
}

void ServerDaemon::stop() {
    if (listener_) {
        listener_->stop();
        listener_.reset();
    }
    if (dispatcher_) {
        dispatcher_->stop();
        dispatcher_.reset();
    }
    intake_.reset();
}

Result<void> ServerDaemon::run(const std::atomic<bool>& stop_flag) {
    auto started = start();
    if (started.is_err()) return started;

    while (!stop_flag) platform::sleep_ms(200);

    log_info("server stopping");
    stop();
    return Result<void>::Ok();
}

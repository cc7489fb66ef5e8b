#include "client_daemon.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <transport/connection_factory.hpp>
#include <algorithm>

// Watch below the canonical root so relative directories are computed
// against the same spelling the scan produces.
static WatchConfig canonical_watch(WatchConfig wc) {
    std::error_code ec;
    fs::path root = fs::canonical(wc.directory, ec);
    if (!ec) wc.directory = root;
    return wc;
}

ClientDaemon::ClientDaemon(ClientConfig config)
    : ClientDaemon(config, std::make_unique<ConnectionFactory>(config.server, config.sending)) {}

ClientDaemon::ClientDaemon(ClientConfig config, std::unique_ptr<TransportFactory> factory)
    : config_(std::move(config)), factory_(std::move(factory)),
      watcher_(canonical_watch(config_.watching), config_.sending.retry_initial_ms,
               config_.sending.retry_max_ms, config_.sending.max_retry_rounds) {}

ClientDaemon::~ClientDaemon() {
    if (queue_) queue_->stop();
}

Result<void> ClientDaemon::run(const std::atomic<bool>& stop) {
    std::error_code ec;
    if (!fs::is_directory(config_.watching.directory, ec)) {
        return Result<void>::Err("watch directory " + config_.watching.directory.string() +
                                 " does not exist", ErrorKind::Config);
    }

    const fs::path& root = watcher_.config().directory;

    const std::string ext = config_.watching.extension.empty()
        ? std::string("all") : config_.watching.extension;
    log_info("client {} watching {} for {} files, server {}", config_.name, root.string(), ext,
             factory_->create()->describe());

    queue_ = std::make_unique<SendQueue>(
        *factory_, config_.sending, config_.name, root,
        [this](const fs::path& path, const SendReport& report) { on_report(path, report); });
    queue_->start();

    const int refresh_ms = std::max(1, config_.watching.refresh_every_secs) * 1000;
    while (!stop) {
        for (const auto& path : watcher_.tick(wall_clock_ms())) {
            log_info("{} is stable, queueing", path.string());
            queue_->push(path);
        }
        for (int waited = 0; waited < refresh_ms && !stop; waited += 100) {
            platform::sleep_ms(100);
        }
    }

    log_info("client stopping");
    queue_->stop();
    queue_.reset();
    return Result<void>::Ok();
}

void ClientDaemon::on_report(const fs::path& path, const SendReport& report) {
    switch (report.outcome) {
    case SendOutcome::Sent:
        if (config_.sending.remove_after_send) {
            std::error_code ec;
            if (fs::remove(path, ec)) {
                log_info("removed {}", path.string());
                watcher_.forget(path);
                return;
            }
            if (ec) log_warn("cannot remove {}: {}", path.string(), ec.message());
        }
        watcher_.mark_sent(path);
        break;
    case SendOutcome::Rejected:
        watcher_.mark_abandoned(path);
        break;
    case SendOutcome::Retry:
    case SendOutcome::Aborted:
        watcher_.mark_retry(path, wall_clock_ms());
        break;
    }
}

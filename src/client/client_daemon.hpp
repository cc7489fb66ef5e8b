#pragma once

#include <atomic>
#include <memory>
#include <core/config.hpp>
#include <transport/transport.hpp>
#include "send_queue.hpp"
#include "watcher.hpp"

// Client process: one watch loop feeding the send queue.
class ClientDaemon {
public:
    explicit ClientDaemon(ClientConfig config);

    // Use a custom transport factory (tests).
    ClientDaemon(ClientConfig config, std::unique_ptr<TransportFactory> factory);

    ~ClientDaemon();

    // Watch until `stop` becomes true. Fails only if the watch directory is
    // unusable at startup.
    Result<void> run(const std::atomic<bool>& stop);

    Watcher& watcher() { return watcher_; }

private:
    void on_report(const fs::path& path, const SendReport& report);

    ClientConfig config_;
    std::unique_ptr<TransportFactory> factory_;
    Watcher watcher_;
    std::unique_ptr<SendQueue> queue_;
};

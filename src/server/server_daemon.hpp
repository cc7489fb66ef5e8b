#pragma once

#include <atomic>
#include <memory>
#include <core/config.hpp>
#include "dispatcher.hpp"
#include "intake.hpp"
#include "job_store.hpp"
#include "listener.hpp"

StoreOptions store_options(const ServerConfig& config, bool recover);

// Server process: recovery, listener, dispatcher.
class ServerDaemon {
public:
    explicit ServerDaemon(ServerConfig config);
    ~ServerDaemon();

    // Open the store (running recovery) and start listening and dispatching.
    // A storage error here is fatal for the process.
    Result<void> start();

    // Stop accepting, finish transfers in progress, stop dispatching.
    void stop();

    // start(), wait for `stop`, then stop().
    Result<void> run(const std::atomic<bool>& stop);

    int port() const { return listener_ ? listener_->port() : 0; }
    JobStore* store() { return store_.get(); }

private:
    ServerConfig config_;
    std::unique_ptr<JobStore> store_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<Intake> intake_;
    std::unique_ptr<Listener> listener_;
};

#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <platform/socket_util.hpp>
#include "intake.hpp"

// Accepts transfer connections and serves each on its own thread.
class Listener {
public:
    Listener(Intake& intake, std::string host, int port, int io_timeout_secs);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Bind and start the accept thread.
    Result<void> start();

    // Stop accepting, close idle connections, wait for transfers in progress.
    void stop();

    // Bound port (useful with port 0).
    int port() const { return bound_port_; }

private:
    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void accept_loop();
    void reap_finished(bool all);

    Intake& intake_;
    std::string host_;
    int port_;
    int io_timeout_secs_;
    int bound_port_ = 0;

    socket_t listen_sock_ = PIPELINE_INVALID_SOCKET;
    std::atomic<bool> stopping_{false};
    std::thread accept_thread_;

    std::mutex conns_mutex_;
    std::list<Connection> conns_;
    unsigned next_conn_id_ = 0;
};

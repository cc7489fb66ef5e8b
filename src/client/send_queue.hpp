#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "sender.hpp"

// Fixed pool of sender threads fed from one FIFO. Each thread owns its own
// SendProtocol, hence its own connection; at most `max_in_flight` files are
// on the wire at once.
class SendQueue {
public:
    using ReportCallback = std::function<void(const fs::path&, const SendReport&)>;

    SendQueue(TransportFactory& factory, SendConfig sending, std::string client_name,
              fs::path watch_root, ReportCallback on_report);
    ~SendQueue();

    void start();

    // Abort backoffs, finish or drop what is on the wire, join the threads.
    // Paths still queued are reported as Aborted.
    void stop();

    void push(const fs::path& path);
    std::size_t pending() const;

private:
    void worker_loop(int index);

    TransportFactory& factory_;
    SendConfig sending_;
    std::string client_name_;
    fs::path watch_root_;
    ReportCallback on_report_;

    std::atomic<bool> stop_{false};
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<fs::path> queue_;
};

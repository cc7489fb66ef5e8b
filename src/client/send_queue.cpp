#include "send_queue.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

SendQueue::SendQueue(TransportFactory& factory, SendConfig sending, std::string client_name,
                     fs::path watch_root, ReportCallback on_report)
    : factory_(factory), sending_(std::move(sending)), client_name_(std::move(client_name)),
      watch_root_(std::move(watch_root)), on_report_(std::move(on_report)) {}

SendQueue::~SendQueue() {
    stop();
}

void SendQueue::start() {
    if (!workers_.empty()) return;
    stop_ = false;
    int n = sending_.max_in_flight > 0 ? sending_.max_in_flight : 1;
    for (int i = 0; i < n; ++i) {
        workers_.emplace_back(&SendQueue::worker_loop, this, i);
    }
    log_debug("send queue started with {} sender(s)", n);
}

void SendQueue::stop() {
    if (workers_.empty()) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    std::deque<fs::path> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftover.swap(queue_);
    }
    for (const auto& path : leftover) {
        SendReport report;
        report.outcome = SendOutcome::Aborted;
        if (on_report_) on_report_(path, report);
    }
}

void SendQueue::push(const fs::path& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(path);
    }
    cv_.notify_one();
}

std::size_t SendQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void SendQueue::worker_loop(int index) {
    set_log_thread_name(fmt::format("send-{}", index));
    SendProtocol protocol(factory_, sending_, client_name_, watch_root_, &stop_);

    while (true) {
        fs::path path;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (stop_) break;
            path = queue_.front();
            queue_.pop_front();
        }

        SendReport report = protocol.send(path);
        if (on_report_) on_report_(path, report);
    }
    protocol.close();
}

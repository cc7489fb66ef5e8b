#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "job_store.hpp"

struct DispatchOptions {
    std::vector<std::string> command;    // argv template, command[0] is the program
    ResolvePolicy policy = ResolvePolicy::AutoResolve;
    int concurrency = 2;
    int poll_interval_ms = 1000;
};

// Fixed pool of workers pulling Admitted jobs from the store.
//
// AutoResolve: run the command and wait; exit 0 -> Done, anything else -> Failed.
// ExternalResolve: launch detached and move on; the job stays Processing until
// `mark` resolves it.
//
// The store is the queue. With AutoResolve at most `concurrency` jobs are
// Processing at once.
class Dispatcher {
public:
    Dispatcher(JobStore& store, DispatchOptions options);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void start();

    // Stop claiming. Commands still running are terminated and their jobs
    // left Processing for recovery.
    void stop();

    // New work was admitted.
    void notify();

    // Run one claimed (Processing) job to its resolution.
    void process(const Job& job);

    // Expand placeholders for one job.
    static std::vector<std::string> build_command(const std::vector<std::string>& tmpl,
                                                  const Job& job);

    int busy() const { return busy_.load(); }
    int peak_busy() const { return peak_busy_.load(); }

private:
    void worker_loop(int index);
    void run_and_wait(const Job& job, const std::vector<std::string>& argv);
    void run_detached(const Job& job, const std::vector<std::string>& argv);
    void resolve(const Job& job, JobState outcome, const std::string& error);

    JobStore& store_;
    DispatchOptions options_;

    std::atomic<bool> stop_{false};
    std::vector<std::thread> workers_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool signaled_ = false;

    std::atomic<int> busy_{0};
    std::atomic<int> peak_busy_{0};
};

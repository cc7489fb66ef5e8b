#include "dispatcher.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <sstream>

// Last STDERR_EXCERPT_BYTES of a job's stderr log, for last_error.
static std::string stderr_tail(const fs::path& log) {
    std::ifstream in(log, std::ios::binary);
    if (!in) return "";
    std::stringstream ss;
    ss << in.rdbuf();
    std::string tail = tail_excerpt(ss.str(), STDERR_EXCERPT_BYTES);
    trim(tail);
    return tail;
}

Dispatcher::Dispatcher(JobStore& store, DispatchOptions options)
    : store_(store), options_(std::move(options)) {}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::start() {
    if (!workers_.empty()) return;
    stop_ = false;
    int n = options_.concurrency > 0 ? options_.concurrency : 1;
    for (int i = 0; i < n; ++i) {
        workers_.emplace_back(&Dispatcher::worker_loop, this, i);
    }
    log_info("dispatcher started: {} worker(s), {}", n,
             options_.policy == ResolvePolicy::AutoResolve ? "auto status update"
                                                           : "external status update");
}

void Dispatcher::stop() {
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
    log_info("dispatcher stopped");
}

void Dispatcher::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        signaled_ = true;
    }
    cv_.notify_all();
}

std::vector<std::string> Dispatcher::build_command(const std::vector<std::string>& tmpl,
                                                   const Job& job) {
    const std::vector<std::pair<std::string, std::string>> values = {
        {"hash", job.content_hash},
        {"server_path", job.stored_path},
        {"origin_name", job.origin_name},
        {"client_name", job.client_name},
        {"client_relative_directory", job.relative_dir},
        {"client_file_stem", fs::path(job.origin_name).stem().string()},
    };
    std::vector<std::string> argv;
    argv.reserve(tmpl.size());
    for (const auto& arg : tmpl) argv.push_back(substitute_placeholders(arg, values));
    return argv;
}

void Dispatcher::worker_loop(int index) {
    set_log_thread_name(fmt::format("worker-{}", index));

    while (!stop_) {
        auto claimed = store_.claim_next();
        if (claimed.is_err()) {
            log_error("cannot claim work: {}", claimed.error);
        } else if (claimed.value) {
            process(*claimed.value);
            continue;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(options_.poll_interval_ms),
                     [this] { return stop_.load() || signaled_; });
        signaled_ = false;
    }
}

void Dispatcher::process(const Job& job) {
    auto argv = build_command(options_.command, job);
    if (argv.empty()) {
        resolve(job, JobState::Failed, "no processing command configured");
        return;
    }
    log_info("processing {} ({}) attempt {}", job.content_hash, job.origin_name,
             job.attempt_count);

    if (options_.policy == ResolvePolicy::AutoResolve) {
        run_and_wait(job, argv);
    } else {
        run_detached(job, argv);
    }
}

void Dispatcher::run_and_wait(const Job& job, const std::vector<std::string>& argv) {
    int now_busy = ++busy_;
    int peak = peak_busy_.load();
    while (now_busy > peak && !peak_busy_.compare_exchange_weak(peak, now_busy)) {}

    fs::path log = store_.stderr_log_path(job.content_hash);
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    platform::ProcessHandle proc = platform::spawn(argv[0], args, log.string());

    if (!proc.valid()) {
        --busy_;
        log_warn("cannot launch processing for {}: {}", job.content_hash, proc.launch_error());
        resolve(job, JobState::Failed, proc.launch_error());
        return;
    }

    int code = -1;
    while (true) {
        code = proc.wait(200);
        if (code >= 0 || !proc.running()) break;
        if (stop_) {
            log_warn("terminating processing of {} for shutdown", job.content_hash);
            proc.terminate();
            --busy_;
            return;
        }
    }
    if (code < 0) code = proc.wait(0);
    --busy_;

    if (code == 0) {
        resolve(job, JobState::Done, "");
        return;
    }
    std::string error = fmt::format("exit code {}", code);
    std::string tail = stderr_tail(log);
    if (!tail.empty()) error += ": " + tail;
    resolve(job, JobState::Failed, error);
}

void Dispatcher::run_detached(const Job& job, const std::vector<std::string>& argv) {
    fs::path log = store_.stderr_log_path(job.content_hash);
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    auto launched = platform::spawn_detached(argv[0], args, log.string());
    if (launched.is_err()) {
        // The external side owns the outcome; the job stays Processing
        log_error("cannot launch processing for {}: {}", job.content_hash, launched.error);
        return;
    }
    log_info("launched {} for {}, waiting for mark", argv[0], job.content_hash);
}

void Dispatcher::resolve(const Job& job, JobState outcome, const std::string& error) {
    auto t = store_.transition(job.content_hash, JobState::Processing, outcome,
                               [&](Job& j) {
                                   if (outcome == JobState::Failed) j.last_error = error;
                                   else j.last_error.reset();
                               });
    if (t.is_err()) {
        if (t.kind == ErrorKind::Precondition) {
            log_warn("job {} already resolved elsewhere: {}", job.content_hash, t.error);
        } else {
            log_error("cannot record outcome of {}: {}", job.content_hash, t.error);
        }
        return;
    }
    if (outcome == JobState::Done) {
        log_info("job {} done", job.content_hash);
    } else {
        log_warn("job {} failed: {}", job.content_hash, error);
    }
}

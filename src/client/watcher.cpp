#include "watcher.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <sys/stat.h>
#include <cerrno>
#include <chrono>
#include <cstring>

WatchTime wall_clock_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

const char* watch_phase_name(WatchPhase phase) {
    switch (phase) {
    case WatchPhase::Observing: return "observing";
    case WatchPhase::Stable:    return "stable";
    case WatchPhase::InFlight:  return "in-flight";
    case WatchPhase::Sent:      return "sent";
    case WatchPhase::Abandoned: return "abandoned";
    case WatchPhase::RetryWait: return "retry-wait";
    }
    return "unknown";
}

Watcher::Watcher(WatchConfig config, int retry_initial_ms, int retry_max_ms,
                 int max_retry_rounds)
    : config_(std::move(config)), retry_initial_ms_(retry_initial_ms),
      retry_max_ms_(retry_max_ms), max_retry_rounds_(max_retry_rounds) {}

bool Watcher::matches_extension(const fs::path& path) const {
    if (config_.extension.empty()) return true;
    std::string want = config_.extension;
    if (want[0] != '.') want.insert(want.begin(), '.');
    return path.extension().string() == want;
}

std::vector<FileObservation> Watcher::scan() const {
    std::vector<FileObservation> out;
    std::error_code ec;
    auto opts = fs::directory_options::skip_permission_denied;
    fs::recursive_directory_iterator it(config_.directory, opts, ec), end;
    if (ec) {
        log_warn("cannot read watch directory {}: {}", config_.directory.string(), ec.message());
        return out;
    }

    for (; it != end; it.increment(ec)) {
        if (ec) {
            log_warn("scan error under {}: {}", config_.directory.string(), ec.message());
            ec.clear();
            continue;
        }
        const fs::path& p = it->path();
        struct stat st;
        if (::lstat(p.c_str(), &st) != 0) {
            // Vanished between listing and stat
            log_debug("skipping {}: {}", p.string(), std::strerror(errno));
            continue;
        }
        if (!S_ISREG(st.st_mode) || !matches_extension(p)) continue;

        FileObservation obs;
        obs.path = p;
        obs.size = static_cast<std::uint64_t>(st.st_size);
        obs.mtime = static_cast<WatchTime>(st.st_mtim.tv_sec) * 1000 +
                    st.st_mtim.tv_nsec / 1000000;
        out.push_back(std::move(obs));
    }
    return out;
}

bool Watcher::is_stable(const WatchEntry& e, WatchTime now) const {
    return e.stable_count >= config_.stable_polls &&
           now - e.mtime >= static_cast<WatchTime>(config_.stability_window_secs) * 1000;
}

void Watcher::observe(const std::vector<FileObservation>& files) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<fs::path, const FileObservation*> seen;
    for (const auto& f : files) seen[f.path] = &f;

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!seen.count(it->first) && it->second.phase != WatchPhase::InFlight) {
            log_debug("{} is gone", it->first.string());
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& kv : seen) {
        const FileObservation& f = *kv.second;
        auto it = entries_.find(f.path);
        if (it == entries_.end()) {
            WatchEntry e;
            e.path = f.path;
            e.size = f.size;
            e.mtime = f.mtime;
            e.stable_count = 1;
            entries_.emplace(f.path, e);
            log_debug("discovered {} ({} bytes)", f.path.string(), f.size);
            continue;
        }

        WatchEntry& e = it->second;
        if (e.phase == WatchPhase::InFlight) continue;

        bool changed = e.size != f.size || e.mtime != f.mtime;
        if (!changed) {
            if (e.phase == WatchPhase::Observing) ++e.stable_count;
            continue;
        }

        if (e.phase != WatchPhase::Observing) {
            log_info("{} changed while {}, watching it again", f.path.string(),
                     watch_phase_name(e.phase));
        }
        e.size = f.size;
        e.mtime = f.mtime;
        e.stable_count = 1;
        e.phase = WatchPhase::Observing;
        e.attempts = 0;
        e.next_retry = 0;
    }
}

std::vector<fs::path> Watcher::poll(WatchTime now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<fs::path> ready;
    for (auto& kv : entries_) {
        WatchEntry& e = kv.second;
        if (e.phase == WatchPhase::Observing && is_stable(e, now)) {
            e.phase = WatchPhase::Stable;
        }
        if (e.phase == WatchPhase::RetryWait && now >= e.next_retry) {
            e.phase = WatchPhase::Stable;
        }
        if (e.phase == WatchPhase::Stable) {
            e.phase = WatchPhase::InFlight;
            ready.push_back(e.path);
        }
    }
    return ready;
}

std::vector<fs::path> Watcher::tick(WatchTime now) {
    observe(scan());
    return poll(now);
}

void Watcher::mark_sent(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end()) return;
    it->second.phase = WatchPhase::Sent;
    it->second.attempts = 0;
}

void Watcher::mark_abandoned(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end()) return;
    it->second.phase = WatchPhase::Abandoned;
}

void Watcher::mark_retry(const fs::path& path, WatchTime now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end()) return;

    WatchEntry& e = it->second;
    ++e.attempts;
    if (max_retry_rounds_ > 0 && e.attempts >= max_retry_rounds_) {
        e.phase = WatchPhase::Abandoned;
        log_error("giving up on {} after {} failed send rounds; modify the file or restart "
                  "the client to send it again", path.string(), e.attempts);
        return;
    }
    std::int64_t delay = backoff_delay_ms(e.attempts, retry_initial_ms_, retry_max_ms_);

    e.phase = WatchPhase::RetryWait;
    e.next_retry = now + delay;
    log_debug("{} retry #{} in {}ms", path.string(), e.attempts, delay);
}

void Watcher::forget(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(path);
}

std::optional<WatchEntry> Watcher::entry(const fs::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::size_t Watcher::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

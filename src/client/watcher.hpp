#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>

// Milliseconds since the Unix epoch. Watch decisions compare file mtimes
// against it, so it is wall-clock time.
using WatchTime = std::int64_t;

WatchTime wall_clock_ms();

enum class WatchPhase {
    Observing,   // seen, not yet stable
    Stable,      // ready to be handed out by poll()
    InFlight,    // owned by a sender
    Sent,        // Accepted or Duplicate; kept until the file changes
    Abandoned,   // rejected, or out of retry rounds; kept until the file changes
    RetryWait,   // send failed, re-yielded at next_retry
};

const char* watch_phase_name(WatchPhase phase);

// One file as seen by a directory scan.
struct FileObservation {
    fs::path path;
    std::uint64_t size = 0;
    WatchTime mtime = 0;
};

struct WatchEntry {
    fs::path path;
    std::uint64_t size = 0;
    WatchTime mtime = 0;
    int stable_count = 0;        // consecutive observations with unchanged size+mtime
    WatchPhase phase = WatchPhase::Observing;
    int attempts = 0;            // failed send rounds since the last change
    WatchTime next_retry = 0;
};

// Per-path stability state machine.
//
// observe() feeds the result of a scan; poll() is the timed step that returns
// the paths that became ready at `now`. Neither blocks nor reads file
// content. Senders report back through mark_*(); all methods are thread-safe.
class Watcher {
public:
    explicit Watcher(WatchConfig config, int retry_initial_ms = SEND_RETRY_INITIAL_MS,
                     int retry_max_ms = SEND_RETRY_MAX_MS,
                     int max_retry_rounds = SEND_MAX_RETRY_ROUNDS);

    // Walk the watch directory recursively. Unreadable entries are logged and
    // skipped; they will be seen again on a later scan.
    std::vector<FileObservation> scan() const;

    // Reconcile entries with a complete scan. Paths missing from `files`
    // are forgotten unless a sender owns them.
    void observe(const std::vector<FileObservation>& files);

    // Paths ready to send at `now`; each returned path moves to InFlight.
    std::vector<fs::path> poll(WatchTime now);

    // scan() + observe() + poll()
    std::vector<fs::path> tick(WatchTime now);

    void mark_sent(const fs::path& path);
    void mark_abandoned(const fs::path& path);
    // Schedule another round, or abandon the path once max_retry_rounds
    // rounds have failed. Only a change to the file clears the count.
    void mark_retry(const fs::path& path, WatchTime now);
    void forget(const fs::path& path);

    std::optional<WatchEntry> entry(const fs::path& path) const;
    std::size_t size() const;

    const WatchConfig& config() const { return config_; }

private:
    bool is_stable(const WatchEntry& e, WatchTime now) const;
    bool matches_extension(const fs::path& path) const;

    WatchConfig config_;
    int retry_initial_ms_;
    int retry_max_ms_;
    int max_retry_rounds_;

    mutable std::mutex mutex_;
    std::map<fs::path, WatchEntry> entries_;
};

#include "job_store.hpp"
#include <core/constants.hpp>
#include <core/hashing.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

// ── Per-key lock ────────────────────────────────────────────

class JobStore::KeyLock {
public:
    explicit KeyLock(const fs::path& path) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        for (;;) {
            fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
            if (fd_ < 0) {
                error_ = "cannot open lock " + path.string() + ": " + std::strerror(errno);
                return;
            }
            while (::flock(fd_, LOCK_EX) != 0) {
                if (errno == EINTR) continue;
                error_ = "cannot lock " + path.string() + ": " + std::strerror(errno);
                ::close(fd_);
                fd_ = -1;
                return;
            }
            // remove() unlinks the lock file while holding it; a waiter that
            // got the old inode must start over on the current one
            struct stat held, current;
            if (::fstat(fd_, &held) != 0) {
                error_ = "cannot stat lock " + path.string() + ": " + std::strerror(errno);
                ::close(fd_);
                fd_ = -1;
                return;
            }
            if (::stat(path.c_str(), &current) == 0 && current.st_ino == held.st_ino &&
                current.st_dev == held.st_dev) {
                return;
            }
            ::close(fd_);
            fd_ = -1;
        }
    }

    ~KeyLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    KeyLock(const KeyLock&) = delete;
    KeyLock& operator=(const KeyLock&) = delete;

    bool ok() const { return fd_ >= 0; }
    const std::string& error() const { return error_; }

private:
    int fd_ = -1;
    std::string error_;
};

static Result<void> storage_error(const std::string& msg) {
    return Result<void>::Err(msg, ErrorKind::Storage);
}

static Result<void> precondition_error(const std::string& msg) {
    return Result<void>::Err(msg, ErrorKind::Precondition);
}

static bool names_are_text(const Job& job) {
    return is_valid_utf8(job.origin_name) && is_valid_utf8(job.client_name) &&
           is_valid_utf8(job.relative_dir);
}

// ── Construction / recovery ─────────────────────────────────

JobStore::JobStore(StoreOptions options) : options_(std::move(options)) {}

Result<std::unique_ptr<JobStore>> JobStore::open(StoreOptions options, RecoveryReport* report) {
    using R = Result<std::unique_ptr<JobStore>>;

    std::unique_ptr<JobStore> store(new JobStore(std::move(options)));
    const StoreOptions& opts = store->options_;

    for (const auto& dir : {opts.state_dir / "jobs", store->queue_dir(), store->logs_dir(),
                            store->temp_dir()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) return R::Err("cannot create " + dir.string() + ": " + ec.message(),
                              ErrorKind::Storage);
    }
    if (::access(opts.state_dir.c_str(), W_OK) != 0) {
        return R::Err("state directory " + opts.state_dir.string() + " is not writable",
                      ErrorKind::Storage);
    }

    RecoveryReport local;
    RecoveryReport& rep = report ? *report : local;

    std::vector<std::string> processing;
    auto loaded = store->load_all(rep, processing);
    if (loaded.is_err()) return R::Err(loaded);

    if (opts.recover) {
        auto recovered = store->recover(rep, processing);
        if (recovered.is_err()) return R::Err(recovered);
    }
    return R::Ok(std::move(store));
}

Result<void> JobStore::for_each_record(const std::function<Result<void>(const Job&)>& visit,
                                       RecoveryReport* report) {
    fs::path jobs_dir = options_.state_dir / "jobs";
    std::error_code ec;
    fs::recursive_directory_iterator it(jobs_dir, ec), end;
    if (ec) return storage_error("cannot read " + jobs_dir.string() + ": " + ec.message());

    for (; it != end; it.increment(ec)) {
        if (ec) return storage_error("cannot read " + jobs_dir.string() + ": " + ec.message());
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        const fs::path& p = it->path();
        std::string name = p.filename().string();
        if (name.find(".yaml.tmp.") != std::string::npos) {
            // Interrupted record write; the previous version (if any) is intact
            if (report) {
                std::error_code rm;
                if (fs::remove(p, rm)) ++report->orphan_temps;
            }
            continue;
        }
        if (p.extension() != ".yaml") continue;

        std::string hash = p.stem().string();
        if (!is_valid_content_hash(hash)) continue;
        auto rec = read_record(hash);
        if (rec.is_err()) return Result<void>::Err(rec);
        if (!rec.value) continue;
        if (rec.value->content_hash != hash) {
            return storage_error("record " + p.string() + " belongs to " +
                                 rec.value->content_hash);
        }
        auto v = visit(*rec.value);
        if (v.is_err()) return v;
    }
    return Result<void>::Ok();
}

Result<void> JobStore::load_all(RecoveryReport& report, std::vector<std::string>& processing) {
    return for_each_record([&](const Job& job) -> Result<void> {
        ++report.jobs;
        if (!options_.recover) return Result<void>::Ok();
        if (job.state != JobState::Admitted && job.state != JobState::Processing) {
            return Result<void>::Ok();
        }

        std::error_code ec;
        if (!fs::exists(job.stored_path, ec)) {
            log_error("job {} ({}) lost its stored file {}", job.content_hash,
                      job_state_name(job.state), job.stored_path);
        }

        if (job.state == JobState::Admitted) {
            // The marker may not have made it to disk before a crash
            KeyLock lock(lock_path(job.content_hash));
            if (!lock.ok()) return storage_error(lock.error());
            auto rec = read_record(job.content_hash);
            if (rec.is_err()) return Result<void>::Err(rec);
            if (rec.value) sync_queue_marker(*rec.value);
        } else if (options_.policy == ResolvePolicy::ExternalResolve) {
            log_info("job {} still processing externally, waiting for mark", job.content_hash);
            ++report.kept_processing;
        } else {
            processing.push_back(job.content_hash);
        }
        return Result<void>::Ok();
    }, options_.recover ? &report : nullptr);
}

Result<void> JobStore::recover(RecoveryReport& report,
                               const std::vector<std::string>& processing) {
    for (const auto& hash : processing) {
        auto rec = get(hash);
        if (rec.is_err()) return Result<void>::Err(rec);
        if (!rec.value || rec.value->state != JobState::Processing) continue;
        const Job& job = *rec.value;

        bool requeue = job.attempt_count < options_.max_attempts;
        if (requeue) {
            log_info("requeueing interrupted job {} (attempt {}/{})", hash, job.attempt_count,
                     options_.max_attempts);
            ++report.requeued;
        } else {
            log_warn("job {} interrupted {} times, giving up", hash, job.attempt_count);
            ++report.failed;
        }
        Result<Job> t = requeue
            ? transition(hash, JobState::Processing, JobState::Admitted)
            : transition(hash, JobState::Processing, JobState::Failed,
                         [](Job& j) { j.last_error = "retry bound exceeded"; });
        if (t.is_err() && t.kind == ErrorKind::Storage) return Result<void>::Err(t);
    }

    prune_queue();
    remove_orphans(report);
    return Result<void>::Ok();
}

void JobStore::prune_queue() {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(queue_dir(), ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    for (const auto& name : names) {
        if (!drop_stale_marker(name)) log_warn("cannot remove stale queue entry {}", name);
    }
}

void JobStore::remove_orphans(RecoveryReport& report) {
    std::error_code ec;
    for (fs::directory_iterator it(temp_dir(), ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code rm;
        if (fs::remove(it->path(), rm)) {
            log_debug("removed partial upload {}", it->path().string());
            ++report.orphan_temps;
        }
    }

    fs::recursive_directory_iterator it(options_.incoming_dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec) && it->path().filename() == TMP_SUBDIR) {
            it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(type_ec)) continue;

        std::string name = it->path().filename().string();
        if (name.size() < HASH_HEX_LEN) continue;
        std::string hash = name.substr(0, HASH_HEX_LEN);
        if (!is_valid_content_hash(hash)) continue;

        std::error_code exists_ec;
        if (fs::exists(record_path(hash), exists_ec) || exists_ec) continue;

        std::error_code rm;
        if (fs::remove(it->path(), rm)) {
            log_warn("removed stored file without a job record: {}", it->path().string());
            ++report.orphan_files;
        }
    }
}

// ── Paths / records ─────────────────────────────────────────

fs::path JobStore::temp_dir() const {
    return options_.incoming_dir / TMP_SUBDIR;
}

fs::path JobStore::logs_dir() const {
    return options_.state_dir / "logs";
}

fs::path JobStore::stderr_log_path(const std::string& hash) const {
    return logs_dir() / (hash + ".stderr");
}

fs::path JobStore::queue_dir() const {
    return options_.state_dir / "queue";
}

fs::path JobStore::queue_marker(const Job& job) const {
    return queue_dir() / (job.received_at + "_" + job.content_hash);
}

fs::path JobStore::record_path(const std::string& hash) const {
    return options_.state_dir / "jobs" / hash.substr(0, 2) / (hash + ".yaml");
}

fs::path JobStore::lock_path(const std::string& hash) const {
    return options_.state_dir / "jobs" / hash.substr(0, 2) / (hash + ".lock");
}

Result<std::optional<Job>> JobStore::read_record(const std::string& hash) const {
    using R = Result<std::optional<Job>>;
    if (hash.size() < 2) return R::Err("invalid hash " + hash, ErrorKind::Precondition);

    fs::path path = record_path(hash);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) return R::Err("cannot stat " + path.string() + ": " + ec.message(),
                              ErrorKind::Storage);
        return R::Ok(std::nullopt);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) return R::Err("cannot read " + path.string(), ErrorKind::Storage);
    std::stringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return R::Err("cannot read " + path.string(), ErrorKind::Storage);

    auto job = job_from_yaml(ss.str());
    if (job.is_err()) return R::Err(path.string() + ": " + job.error, ErrorKind::Storage);
    return R::Ok(std::move(job.value));
}

Result<void> JobStore::write_record(const Job& job) const {
    fs::path path = record_path(job.content_hash);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) return storage_error("cannot create " + path.parent_path().string());

    std::string err;
    if (!platform::write_file_atomic(path, job_to_yaml(job), &err)) {
        return storage_error("cannot write job record: " + err);
    }
    return Result<void>::Ok();
}

void JobStore::sync_queue_marker(const Job& job) const {
    fs::path marker = queue_marker(job);
    if (job.state == JobState::Admitted) {
        int fd = ::open(marker.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            // Rebuilt by the next recovery
            log_error("cannot queue job {}: {}", job.content_hash, std::strerror(errno));
            return;
        }
        ::close(fd);
    } else if (::unlink(marker.c_str()) != 0 && errno != ENOENT) {
        log_warn("cannot dequeue job {}: {}", job.content_hash, std::strerror(errno));
    }
}

bool JobStore::drop_stale_marker(const std::string& marker_name) {
    fs::path marker = queue_dir() / marker_name;
    std::string hash = marker_name.size() > HASH_HEX_LEN
        ? marker_name.substr(marker_name.size() - HASH_HEX_LEN) : std::string();

    if (is_valid_content_hash(hash)) {
        std::error_code ec;
        if (!fs::exists(record_path(hash), ec) && !ec) {
            return ::unlink(marker.c_str()) == 0 || errno == ENOENT;
        }
        KeyLock lock(lock_path(hash));
        if (!lock.ok()) return false;
        auto rec = read_record(hash);
        if (rec.is_err()) return false;
        if (rec.value && rec.value->state == JobState::Admitted &&
            queue_marker(*rec.value) == marker) {
            return true;
        }
    }
    return ::unlink(marker.c_str()) == 0 || errno == ENOENT;
}

// ── Operations ──────────────────────────────────────────────

Result<InsertResult> JobStore::insert_if_absent(const Job& job) {
    using R = Result<InsertResult>;
    if (!is_valid_content_hash(job.content_hash)) {
        return R::Err("invalid content hash " + job.content_hash, ErrorKind::Precondition);
    }
    if (!names_are_text(job)) {
        return R::Err("job names must be valid UTF-8", ErrorKind::Precondition);
    }

    KeyLock lock(lock_path(job.content_hash));
    if (!lock.ok()) return R::Err(lock.error(), ErrorKind::Storage);

    auto existing = read_record(job.content_hash);
    if (existing.is_err()) return R::Err(existing);
    if (existing.value) {
        return R::Ok(InsertResult{InsertOutcome::Exists, *existing.value});
    }

    Job stored = job;
    if (stored.received_at.empty()) stored.received_at = now_iso();
    if (stored.state_changed_at.empty()) stored.state_changed_at = stored.received_at;

    auto w = write_record(stored);
    if (w.is_err()) return R::Err(w);
    sync_queue_marker(stored);
    return R::Ok(InsertResult{InsertOutcome::Inserted, stored});
}

Result<Job> JobStore::transition(const std::string& hash, JobState expected, JobState next,
                                 const std::function<void(Job&)>& update) {
    using R = Result<Job>;
    KeyLock lock(lock_path(hash));
    if (!lock.ok()) return R::Err(lock.error(), ErrorKind::Storage);

    auto rec = read_record(hash);
    if (rec.is_err()) return R::Err(rec);
    if (!rec.value) return R::Err("no job " + hash, ErrorKind::Precondition);

    Job job = *rec.value;
    if (job.state != expected) {
        return R::Err(fmt::format("job {} is {}, not {}", hash, job_state_name(job.state),
                                  job_state_name(expected)), ErrorKind::Precondition);
    }
    if (!is_legal_transition(expected, next)) {
        return R::Err(fmt::format("illegal transition {} -> {}", job_state_name(expected),
                                  job_state_name(next)), ErrorKind::Precondition);
    }

    job.state = next;
    job.state_changed_at = now_iso();
    if (update) update(job);
    job.state = next;

    auto w = write_record(job);
    if (w.is_err()) return R::Err(w);
    sync_queue_marker(job);
    return R::Ok(std::move(job));
}

Result<std::optional<Job>> JobStore::get(const std::string& hash) {
    return read_record(hash);
}

Result<std::vector<Job>> JobStore::list(std::optional<JobState> state) {
    using R = Result<std::vector<Job>>;
    std::vector<Job> jobs;
    auto scanned = for_each_record([&](const Job& job) -> Result<void> {
        if (!state || job.state == *state) jobs.push_back(job);
        return Result<void>::Ok();
    }, nullptr);
    if (scanned.is_err()) return R::Err(scanned);
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        if (a.received_at != b.received_at) return a.received_at < b.received_at;
        return a.content_hash < b.content_hash;
    });
    return R::Ok(std::move(jobs));
}

Result<AdmitResult> JobStore::admit(const Job& job, const fs::path& temp_path,
                                    bool readmit_failed) {
    using R = Result<AdmitResult>;
    const std::string& hash = job.content_hash;
    if (!is_valid_content_hash(hash)) {
        return R::Err("invalid content hash " + hash, ErrorKind::Precondition);
    }
    if (!names_are_text(job)) {
        return R::Err("job names must be valid UTF-8", ErrorKind::Precondition);
    }

    KeyLock lock(lock_path(hash));
    if (!lock.ok()) return R::Err(lock.error(), ErrorKind::Storage);

    auto existing = read_record(hash);
    if (existing.is_err()) return R::Err(existing);

    std::error_code ec;
    if (existing.value) {
        Job current = *existing.value;
        if (current.state != JobState::Failed || !readmit_failed) {
            fs::remove(temp_path, ec);
            return R::Ok(AdmitResult{AdmitOutcome::Duplicate, current});
        }

        // Failed jobs keep their bytes; only restore them if they went missing
        if (!fs::exists(current.stored_path, ec)) {
            fs::path final_path = current.stored_path;
            fs::create_directories(final_path.parent_path(), ec);
            if (::rename(temp_path.c_str(), final_path.c_str()) != 0) {
                return R::Err("cannot move upload into " + final_path.string() + ": " +
                              std::strerror(errno), ErrorKind::Storage);
            }
            platform::fsync_dir(final_path.parent_path());
        } else {
            fs::remove(temp_path, ec);
        }

        current.state = JobState::Admitted;
        current.state_changed_at = now_iso();
        current.attempt_count = 0;
        current.last_error.reset();
        auto w = write_record(current);
        if (w.is_err()) return R::Err(w);
        sync_queue_marker(current);
        return R::Ok(AdmitResult{AdmitOutcome::Readmitted, current});
    }

    fs::path final_path = stored_file_path(options_.incoming_dir, hash, job.origin_name);
    if (!platform::fsync_path(temp_path)) {
        return R::Err("cannot flush " + temp_path.string() + ": " + std::strerror(errno),
                      ErrorKind::Storage);
    }
    fs::create_directories(final_path.parent_path(), ec);
    if (ec) return R::Err("cannot create " + final_path.parent_path().string() + ": " +
                          ec.message(), ErrorKind::Storage);
    if (::rename(temp_path.c_str(), final_path.c_str()) != 0) {
        return R::Err("cannot move upload into " + final_path.string() + ": " +
                      std::strerror(errno), ErrorKind::Storage);
    }
    if (!platform::fsync_dir(final_path.parent_path())) {
        log_warn("cannot flush directory {}: {}", final_path.parent_path().string(),
                 std::strerror(errno));
    }

    Job stored = job;
    stored.state = JobState::Admitted;
    stored.received_at = now_iso();
    stored.state_changed_at = stored.received_at;
    stored.attempt_count = 0;
    stored.last_error.reset();
    stored.stored_path = final_path.string();

    auto w = write_record(stored);
    if (w.is_err()) {
        // No record, no bytes
        fs::remove(final_path, ec);
        return R::Err(w);
    }
    sync_queue_marker(stored);
    return R::Ok(AdmitResult{AdmitOutcome::Admitted, stored});
}

Result<std::optional<Job>> JobStore::claim_next() {
    using R = Result<std::optional<Job>>;

    for (;;) {
        // Marker names sort by received_at, so the smallest is the oldest job
        std::string oldest;
        std::error_code ec;
        fs::directory_iterator it(queue_dir(), ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (oldest.empty() || name < oldest) oldest = name;
        }
        if (ec) return R::Err("cannot read " + queue_dir().string() + ": " + ec.message(),
                              ErrorKind::Storage);
        if (oldest.empty()) return R::Ok(std::nullopt);

        std::string hash = oldest.size() > HASH_HEX_LEN
            ? oldest.substr(oldest.size() - HASH_HEX_LEN) : std::string();
        if (is_valid_content_hash(hash)) {
            auto t = transition(hash, JobState::Admitted, JobState::Processing,
                                [](Job& j) { ++j.attempt_count; });
            if (t.is_ok()) return R::Ok(std::move(t.value));
            if (t.kind != ErrorKind::Precondition) return R::Err(t);
        }
        // Another worker (or process) got there first, or the marker is stale
        if (!drop_stale_marker(oldest)) {
            return R::Err("cannot remove stale queue entry " + oldest, ErrorKind::Storage);
        }
    }
}

Result<void> JobStore::remove(const std::string& hash) {
    KeyLock lock(lock_path(hash));
    if (!lock.ok()) return storage_error(lock.error());

    auto rec = read_record(hash);
    if (rec.is_err()) return Result<void>::Err(rec);
    if (!rec.value) return precondition_error("no job " + hash);
    if (!is_terminal(rec.value->state)) {
        return precondition_error(fmt::format("job {} is {}", hash,
                                              job_state_name(rec.value->state)));
    }

    std::error_code ec;
    if (!rec.value->stored_path.empty()) fs::remove(rec.value->stored_path, ec);
    if (ec) return storage_error("cannot remove " + rec.value->stored_path + ": " + ec.message());

    fs::path record = record_path(hash);
    if (::unlink(record.c_str()) != 0 && errno != ENOENT) {
        return storage_error("cannot remove " + record.string() + ": " + std::strerror(errno));
    }
    platform::fsync_dir(record.parent_path());
    fs::remove(stderr_log_path(hash), ec);
    fs::remove(queue_marker(*rec.value), ec);

    // Waiters holding the old inode notice the unlink and reopen
    fs::path lock_file = lock_path(hash);
    if (::unlink(lock_file.c_str()) != 0 && errno != ENOENT) {
        log_warn("cannot remove {}: {}", lock_file.string(), std::strerror(errno));
    }
    return Result<void>::Ok();
}

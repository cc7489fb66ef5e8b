#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "job.hpp"

// Who resolves a job once its processing command has been launched.
enum class ResolvePolicy {
    AutoResolve,       // the dispatcher waits for the exit status
    ExternalResolve,   // an external actor calls `mark`
};

struct StoreOptions {
    fs::path state_dir;
    fs::path incoming_dir;
    ResolvePolicy policy = ResolvePolicy::AutoResolve;
    int max_attempts = 3;      // recovery re-queues of a Processing job
    bool recover = true;       // false: read-only style open (mark, status)
};

struct RecoveryReport {
    std::size_t jobs = 0;
    std::size_t requeued = 0;
    std::size_t failed = 0;
    std::size_t kept_processing = 0;
    std::size_t orphan_temps = 0;
    std::size_t orphan_files = 0;
};

enum class InsertOutcome { Inserted, Exists };

struct InsertResult {
    InsertOutcome outcome = InsertOutcome::Inserted;
    Job job;                   // the stored job (the existing one for Exists)
};

enum class AdmitOutcome { Admitted, Readmitted, Duplicate };

struct AdmitResult {
    AdmitOutcome outcome = AdmitOutcome::Admitted;
    Job job;
};

// Durable job ledger.
//
// Layout under state_dir:
//   jobs/<h0h1>/<hash>.yaml     one record per job (temp + fsync + rename)
//   jobs/<h0h1>/<hash>.lock     flock'd around every operation on <hash>
//   queue/<received_at>_<hash>  empty marker, present while the job is Admitted
//   logs/<hash>.stderr          processing stderr
//
// The lock file serializes threads of this process as well as other
// processes (`pipeline mark`). Every mutation re-reads the record under the
// lock. Nothing is cached in memory: the queue directory is the work queue,
// so a backlog costs disk entries, not server memory.
class JobStore {
public:
    // Create directories, check every record and, when options.recover is
    // set, run startup recovery (which also rebuilds the queue markers). Any
    // unreadable record is an error: the caller must not run with a partial
    // ledger.
    static Result<std::unique_ptr<JobStore>> open(StoreOptions options,
                                                  RecoveryReport* report = nullptr);

    Result<InsertResult> insert_if_absent(const Job& job);

    // Move hash from `expected` to `next`. Fails with ErrorKind::Precondition
    // if the stored state differs or the edge is not in the lifecycle graph.
    // `update` may adjust other fields before the record is written.
    Result<Job> transition(const std::string& hash, JobState expected, JobState next,
                           const std::function<void(Job&)>& update = {});

    Result<std::optional<Job>> get(const std::string& hash);
    Result<std::vector<Job>> list(std::optional<JobState> state = std::nullopt);
    Result<std::vector<Job>> all() { return list(); }

    // Move a fully received temp file into its final place and record the
    // job as Admitted, atomically with respect to other operations on the
    // same hash. An existing record yields Duplicate (temp removed) unless it
    // is Failed and readmit_failed is set. Names that are not valid UTF-8
    // are refused with ErrorKind::Precondition.
    Result<AdmitResult> admit(const Job& job, const fs::path& temp_path, bool readmit_failed);

    // Atomically move the oldest Admitted job to Processing, counting the
    // attempt. nullopt when there is nothing to do.
    Result<std::optional<Job>> claim_next();

    // Delete record, stored file and lock file of a terminal job (retention).
    Result<void> remove(const std::string& hash);

    const fs::path& incoming_dir() const { return options_.incoming_dir; }
    fs::path temp_dir() const;
    fs::path logs_dir() const;
    fs::path stderr_log_path(const std::string& hash) const;
    fs::path queue_dir() const;

private:
    explicit JobStore(StoreOptions options);

    class KeyLock;

    fs::path record_path(const std::string& hash) const;
    fs::path lock_path(const std::string& hash) const;
    fs::path queue_marker(const Job& job) const;

    Result<std::optional<Job>> read_record(const std::string& hash) const;
    Result<void> write_record(const Job& job) const;

    // Present iff job is Admitted. Called under the job's lock after every
    // record write.
    void sync_queue_marker(const Job& job) const;

    // Visit every record under jobs/, one at a time.
    Result<void> for_each_record(const std::function<Result<void>(const Job&)>& visit,
                                 RecoveryReport* report);

    Result<void> load_all(RecoveryReport& report, std::vector<std::string>& processing);
    Result<void> recover(RecoveryReport& report, const std::vector<std::string>& processing);
    void prune_queue();
    void remove_orphans(RecoveryReport& report);

    // Drop a marker whose job is no longer Admitted. Returns false only if the
    // marker could not be removed.
    bool drop_stale_marker(const std::string& marker_name);

    StoreOptions options_;
};

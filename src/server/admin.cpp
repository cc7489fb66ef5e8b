#include "admin.hpp"
#include <core/log.hpp>

Result<StatusSummary> collect_status(JobStore& store) {
    auto jobs = store.all();
    if (jobs.is_err()) return Result<StatusSummary>::Err(jobs);

    StatusSummary summary;
    for (const auto& job : jobs.value) ++summary.counts[job.state];
    summary.jobs = std::move(jobs.value);
    return Result<StatusSummary>::Ok(std::move(summary));
}

Result<CleanReport> clean_done_jobs(JobStore& store, bool force) {
    auto done = store.list(JobState::Done);
    if (done.is_err()) return Result<CleanReport>::Err(done);

    CleanReport report;
    for (const auto& job : done.value) {
        if (!force) {
            report.removed.push_back(job);
            continue;
        }
        auto r = store.remove(job.content_hash);
        if (r.is_err()) {
            log_warn("cannot remove {}: {}", job.content_hash, r.error);
            report.errors.emplace_back(job, r.error);
            continue;
        }
        log_debug("removed job {} ({})", job.content_hash, job.stored_path);
        report.removed.push_back(job);
    }
    return Result<CleanReport>::Ok(std::move(report));
}

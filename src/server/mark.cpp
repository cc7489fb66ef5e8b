#include "mark.hpp"
#include <core/hashing.hpp>
#include <core/log.hpp>

std::optional<MarkOutcome> parse_mark_outcome(const std::string& s) {
    if (s == "done") return MarkOutcome::Done;
    if (s == "failed") return MarkOutcome::Failed;
    return std::nullopt;
}

Result<Job> mark_job(JobStore& store, const std::string& hash, MarkOutcome outcome) {
    if (!is_valid_content_hash(hash)) {
        return Result<Job>::Err("not a content hash: " + hash, ErrorKind::Precondition);
    }

    JobState next = outcome == MarkOutcome::Done ? JobState::Done : JobState::Failed;
    auto t = store.transition(hash, JobState::Processing, next, [&](Job& j) {
        if (next == JobState::Failed) j.last_error = "marked failed";
        else j.last_error.reset();
    });
    if (t.is_ok()) {
        log_info("marked {} {}", hash, job_state_name(next));
    }
    return t;
}

#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "job_store.hpp"

struct StatusSummary {
    std::map<JobState, std::size_t> counts;
    std::vector<Job> jobs;          // oldest first
};

Result<StatusSummary> collect_status(JobStore& store);

struct CleanReport {
    std::vector<Job> removed;       // or "would remove" on a dry run
    std::vector<std::pair<Job, std::string>> errors;
};

// Retention: drop Done jobs with their stored files. Without `force`
// nothing is touched and the report lists what would go.
Result<CleanReport> clean_done_jobs(JobStore& store, bool force);

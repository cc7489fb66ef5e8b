#pragma once

#include <optional>
#include <string>
#include "job_store.hpp"

// Out-of-band resolution of a Processing job, used by external schedulers
// when auto_status_update is off.
enum class MarkOutcome { Done, Failed };

std::optional<MarkOutcome> parse_mark_outcome(const std::string& s);

// Processing -> Done | Failed. Any other current state is a Precondition error.
Result<Job> mark_job(JobStore& store, const std::string& hash, MarkOutcome outcome);

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Lifecycle of one content hash. Discovered and Transferring exist only on the
// client and are never persisted; the server starts at Admitted.
enum class JobState {
    Discovered,
    Transferring,
    Admitted,
    Processing,
    Done,
    Failed,
};

const char* job_state_name(JobState state);
std::optional<JobState> parse_job_state(const std::string& s);

bool is_terminal(JobState state);

// Edges of the lifecycle graph:
//   Discovered -> Transferring -> Admitted -> Processing -> Done | Failed
// plus Failed -> Admitted (re-admission) and Processing -> Admitted (recovery).
bool is_legal_transition(JobState from, JobState to);

struct Job {
    std::string content_hash;
    std::string origin_name;
    std::string client_name;
    std::string relative_dir;
    std::uint64_t size = 0;
    JobState state = JobState::Admitted;
    std::string received_at;          // ISO 8601 UTC
    std::string state_changed_at;
    int attempt_count = 0;            // times claimed for processing
    std::optional<std::string> last_error;
    std::string stored_path;          // absolute path under the incoming directory
};

// One YAML document per job.
std::string job_to_yaml(const Job& job);
Result<Job> job_from_yaml(const std::string& text);

// <incoming>/<h0h1>/<h2h3>/<hash><ext>. ext is origin_name's extension when it
// is short plain ASCII, otherwise empty.
fs::path stored_file_path(const fs::path& incoming, const std::string& hash,
                          const std::string& origin_name);

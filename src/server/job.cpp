#include "job.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>

const char* job_state_name(JobState state) {
    switch (state) {
    case JobState::Discovered:   return "discovered";
    case JobState::Transferring: return "transferring";
    case JobState::Admitted:     return "admitted";
    case JobState::Processing:   return "processing";
    case JobState::Done:         return "done";
    case JobState::Failed:       return "failed";
    }
    return "unknown";
}

std::optional<JobState> parse_job_state(const std::string& s) {
    if (s == "discovered") return JobState::Discovered;
    if (s == "transferring") return JobState::Transferring;
    if (s == "admitted") return JobState::Admitted;
    if (s == "processing") return JobState::Processing;
    if (s == "done") return JobState::Done;
    if (s == "failed") return JobState::Failed;
    return std::nullopt;
}

bool is_terminal(JobState state) {
    return state == JobState::Done || state == JobState::Failed;
}

bool is_legal_transition(JobState from, JobState to) {
    switch (from) {
    case JobState::Discovered:   return to == JobState::Transferring;
    case JobState::Transferring: return to == JobState::Admitted;
    case JobState::Admitted:     return to == JobState::Processing;
    case JobState::Processing:
        return to == JobState::Done || to == JobState::Failed || to == JobState::Admitted;
    case JobState::Failed:       return to == JobState::Admitted;
    case JobState::Done:         return false;
    }
    return false;
}

std::string job_to_yaml(const Job& job) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "content_hash" << YAML::Value << job.content_hash;
    out << YAML::Key << "origin_name" << YAML::Value << YAML::DoubleQuoted << job.origin_name;
    out << YAML::Key << "client_name" << YAML::Value << YAML::DoubleQuoted << job.client_name;
    out << YAML::Key << "relative_dir" << YAML::Value << YAML::DoubleQuoted << job.relative_dir;
    out << YAML::Key << "size" << YAML::Value << job.size;
    out << YAML::Key << "state" << YAML::Value << job_state_name(job.state);
    out << YAML::Key << "received_at" << YAML::Value << job.received_at;
    out << YAML::Key << "state_changed_at" << YAML::Value << job.state_changed_at;
    out << YAML::Key << "attempt_count" << YAML::Value << job.attempt_count;
    if (job.last_error) {
        out << YAML::Key << "last_error" << YAML::Value << YAML::DoubleQuoted << *job.last_error;
    }
    out << YAML::Key << "stored_path" << YAML::Value << YAML::DoubleQuoted << job.stored_path;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<Job> job_from_yaml(const std::string& text) {
    Job job;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) return Result<Job>::Err("job record is not a map", ErrorKind::Storage);

        job.content_hash = root["content_hash"].as<std::string>("");
        job.origin_name = root["origin_name"].as<std::string>("");
        job.client_name = root["client_name"].as<std::string>("");
        job.relative_dir = root["relative_dir"].as<std::string>("");
        job.size = root["size"].as<std::uint64_t>(0);
        job.received_at = root["received_at"].as<std::string>("");
        job.state_changed_at = root["state_changed_at"].as<std::string>("");
        job.attempt_count = root["attempt_count"].as<int>(0);
        if (root["last_error"]) job.last_error = root["last_error"].as<std::string>();
        job.stored_path = root["stored_path"].as<std::string>("");

        auto state = parse_job_state(root["state"].as<std::string>(""));
        if (!state) return Result<Job>::Err("job record has no valid state", ErrorKind::Storage);
        job.state = *state;
    } catch (const YAML::Exception& e) {
        return Result<Job>::Err(std::string("invalid job record: ") + e.what(), ErrorKind::Storage);
    }
    if (job.content_hash.empty()) {
        return Result<Job>::Err("job record has no content_hash", ErrorKind::Storage);
    }
    return Result<Job>::Ok(std::move(job));
}

fs::path stored_file_path(const fs::path& incoming, const std::string& hash,
                          const std::string& origin_name) {
    std::string ext = fs::path(origin_name).extension().string();
    bool plain = ext.size() <= 16;
    for (std::size_t i = 1; plain && i < ext.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(ext[i]);
        plain = std::isalnum(c) || c == '_' || c == '-';
    }
    if (!plain) ext.clear();
    return incoming / hash.substr(0, 2) / hash.substr(2, 2) / (hash + ext);
}

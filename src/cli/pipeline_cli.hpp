#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

constexpr const char* PIPELINE_VERSION = "0.4.0";

// Command entry points behind `pipeline <command>`. Each returns the process
// exit code.
class PipelineCLI {
public:
    PipelineCLI();

    int run_client(const std::string& config_path);
    int run_server(const std::string& config_path);
    int run_mark(const std::string& hash, const std::string& outcome,
                 const std::string& config_path);
    int run_status(const std::string& config_path);
    int run_clean(bool force, const std::string& config_path);
    int run_print_config(const std::string& kind);

    void print_usage() const;
    void print_version() const;

private:
    // Load the server config, defaulting to ./server.yaml.
    bool load_server(const std::string& config_path, ServerConfig& out) const;
};

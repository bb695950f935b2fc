#pragma once
#include "log.hpp"
#include <chrono>
#include <filesystem>
#include <string>

struct ServiceConfig {
    int port{8000};
    std::filesystem::path base_dir{"/"};
    std::filesystem::path workspace_dir{"/workspace"};
    std::filesystem::path output_dir{"/workspace/ComfyUI/output"};
    std::chrono::seconds job_ttl{3600};
    std::chrono::seconds default_timeout{1200};
    std::chrono::milliseconds stream_poll{300};
    LogLevel log_level{LogLevel::Info};
};

std::string getenv_or(const char* key, const std::string& def);

// Defaults overlaid with EXECUTOR_* environment variables.
// Throws std::invalid_argument on malformed values.
ServiceConfig load_config_from_env();

// Applies --flag value pairs on top of `cfg`. Returns false if --help was
// given. Throws std::invalid_argument on unknown flags or malformed values.
bool apply_cli_args(ServiceConfig& cfg, int argc, char** argv);

std::string config_usage();

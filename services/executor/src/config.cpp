#include "config.hpp"
#include <cstdlib>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

static long parse_long(const std::string& key, const std::string& value, long min_value) {
    std::size_t used = 0;
    long n = 0;
    try {
        n = std::stol(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": expected an integer, got '" + value + "'");
    }
    if (used != value.size()) throw std::invalid_argument(key + ": expected an integer, got '" + value + "'");
    if (n < min_value) throw std::invalid_argument(key + ": must be >= " + std::to_string(min_value));
    return n;
}

static LogLevel parse_level(const std::string& key, const std::string& value) {
    auto level = parse_log_level(value);
    if (!level) throw std::invalid_argument(key + ": unknown log level '" + value + "'");
    return *level;
}

static void set_option(ServiceConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "port") {
        long p = parse_long(key, value, 1);
        if (p > 65535) throw std::invalid_argument("port: must be <= 65535");
        cfg.port = (int)p;
    } else if (key == "base-dir") {
        cfg.base_dir = value;
    } else if (key == "workspace") {
        cfg.workspace_dir = value;
    } else if (key == "output-dir") {
        cfg.output_dir = value;
    } else if (key == "job-ttl") {
        cfg.job_ttl = std::chrono::seconds(parse_long(key, value, 0));
    } else if (key == "timeout") {
        cfg.default_timeout = std::chrono::seconds(parse_long(key, value, 1));
    } else if (key == "stream-poll-ms") {
        cfg.stream_poll = std::chrono::milliseconds(parse_long(key, value, 1));
    } else if (key == "log-level") {
        cfg.log_level = parse_level(key, value);
    } else {
        throw std::invalid_argument("unknown option --" + key);
    }
}

ServiceConfig load_config_from_env() {
    static const std::pair<const char*, const char*> env_keys[] = {
        {"EXECUTOR_PORT", "port"},
        {"EXECUTOR_BASE_DIR", "base-dir"},
        {"EXECUTOR_WORKSPACE", "workspace"},
        {"EXECUTOR_OUTPUT_DIR", "output-dir"},
        {"EXECUTOR_JOB_TTL", "job-ttl"},
        {"EXECUTOR_DEFAULT_TIMEOUT", "timeout"},
        {"EXECUTOR_STREAM_POLL_MS", "stream-poll-ms"},
        {"EXECUTOR_LOG_LEVEL", "log-level"},
    };
    ServiceConfig cfg;
    for (const auto& kv : env_keys) {
        if (const char* v = std::getenv(kv.first)) {
            try {
                set_option(cfg, kv.second, v);
            } catch (const std::invalid_argument& e) {
                throw std::invalid_argument(std::string(kv.first) + " (" + e.what() + ")");
            }
        }
    }
    return cfg;
}

bool apply_cli_args(ServiceConfig& cfg, int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") return false;
        if (a.rfind("--", 0) != 0) throw std::invalid_argument("unexpected argument '" + a + "'");
        std::string key = a.substr(2);
        std::string value;
        auto eq = key.find('=');
        if (eq != std::string::npos) {
            value = key.substr(eq + 1);
            key.resize(eq);
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            throw std::invalid_argument("missing value for --" + key);
        }
        set_option(cfg, key, value);
    }
    return true;
}

std::string config_usage() {
    return "executor_service usage:\n"
           "  executor_service [--port N] [--base-dir DIR] [--workspace DIR] [--output-dir DIR]\n"
           "                   [--job-ttl SECONDS] [--timeout SECONDS] [--stream-poll-ms MS]\n"
           "                   [--log-level error|warn|info|debug]\n"
           "Every option can also be set through EXECUTOR_<NAME> (e.g. EXECUTOR_PORT).\n";
}

#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

static std::atomic<LogLevel> g_level{LogLevel::Info};
static std::mutex g_log_mtx;

void set_log_level(LogLevel level) { g_level.store(level); }

LogLevel log_level() { return g_level.load(); }

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (s == "error") return LogLevel::Error;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "info") return LogLevel::Info;
    if (s == "debug") return LogLevel::Debug;
    return std::nullopt;
}

static const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN ";
        case LogLevel::Info: return "INFO ";
        case LogLevel::Debug: return "DEBUG";
    }
    return "?    ";
}

void log_message(LogLevel level, const std::string& msg) noexcept {
    if ((int)level > (int)g_level.load()) return;
    try {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);

        std::ostringstream line;
        line << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
             << "[" << level_tag(level) << "] [executor] " << msg;

        std::lock_guard<std::mutex> lock(g_log_mtx);
        std::cerr << line.str() << std::endl;
    } catch (const std::exception& e) {
        std::fputs("[executor] log formatting failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

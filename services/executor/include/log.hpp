#pragma once
#include <cstdint>
#include <optional>
#include <string>

enum class LogLevel : std::uint8_t { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();
std::optional<LogLevel> parse_log_level(const std::string& name);

// Writes one line to stderr. Safe to call from any thread; never throws.
void log_message(LogLevel level, const std::string& msg) noexcept;

inline void log_error(const std::string& msg) noexcept { log_message(LogLevel::Error, msg); }
inline void log_warn(const std::string& msg) noexcept { log_message(LogLevel::Warn, msg); }
inline void log_info(const std::string& msg) noexcept { log_message(LogLevel::Info, msg); }
inline void log_debug(const std::string& msg) noexcept { log_message(LogLevel::Debug, msg); }

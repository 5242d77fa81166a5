#pragma once
#include <string>
#include <optional>

namespace toolmux {

// Diagnostics go to stderr as "[component] message" lines; stdout is
// reserved for JSON-RPC traffic.
enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// Parse "error" / "warn" / "info" / "debug" (case-insensitive)
std::optional<LogLevel> parse_log_level(const std::string& name);

void log_error(const std::string& component, const std::string& message);
void log_warn(const std::string& component, const std::string& message);
void log_info(const std::string& component, const std::string& message);
void log_debug(const std::string& component, const std::string& message);

} // namespace toolmux

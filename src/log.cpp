#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>

namespace toolmux {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= g_level.load();
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "error") return LogLevel::Error;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    return std::nullopt;
}

static void write_line(LogLevel level, const std::string& component,
                       const std::string& message) {
    if (!log_enabled(level)) return;
    std::cerr << "[" << component << "] " << message << "\n";
}

void log_error(const std::string& component, const std::string& message) {
    write_line(LogLevel::Error, component, message);
}

void log_warn(const std::string& component, const std::string& message) {
    write_line(LogLevel::Warn, component, message);
}

void log_info(const std::string& component, const std::string& message) {
    write_line(LogLevel::Info, component, message);
}

void log_debug(const std::string& component, const std::string& message) {
    write_line(LogLevel::Debug, component, message);
}

} // namespace toolmux

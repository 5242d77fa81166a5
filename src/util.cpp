#include "util.hpp"

#include <chrono>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <sstream>

namespace toolmux {

uint64_t epoch_millis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

size_t count_lines(const std::string& text) {
    size_t lines = 1;
    for (char c : text) {
        if (c == '\n') lines++;
    }
    return lines;
}

std::string prefix(const std::string& s, size_t n) {
    return s.size() <= n ? s : s.substr(0, n);
}

std::string generate_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;
    uint64_t val = dist(gen);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(val));
    return buf;
}

uint32_t estimate_tokens(const std::string& text) {
    return static_cast<uint32_t>((text.size() + 3) / 4);
}

std::string format_duration(uint64_t elapsed_ms) {
    char buf[32];
    if (elapsed_ms > 60000) {
        std::snprintf(buf, sizeof(buf), "%.2fmin", static_cast<double>(elapsed_ms) / 60000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2fs", static_cast<double>(elapsed_ms) / 1000.0);
    }
    return buf;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

} // namespace toolmux

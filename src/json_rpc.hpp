#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace toolmux {

constexpr const char* kProtocolVersion = "2024-11-05";

namespace rpc_error {
    constexpr int MethodNotFound = -32601;
    constexpr int InternalError  = -32603;
} // namespace rpc_error

// Receives the result member of a successful response.
using ResultCallback = std::function<void(const nlohmann::json& result)>;

// Splits a byte stream into newline-delimited lines. Blank lines are
// dropped and a trailing '\r' is stripped. A line longer than max_line
// bytes is discarded whole, up to and including its newline.
class LineBuffer {
public:
    static constexpr size_t kDefaultMaxLine = 16 * 1024 * 1024;

    explicit LineBuffer(size_t max_line = kDefaultMaxLine) : max_line_(max_line) {}

    std::vector<std::string> feed(const char* data, size_t len);
    std::vector<std::string> feed(const std::string& data) {
        return feed(data.data(), data.size());
    }

    // Bytes received after the last newline.
    const std::string& pending() const { return buffer_; }
    void clear() {
        buffer_.clear();
        discarding_ = false;
    }

    // Bytes thrown away from overlong lines so far.
    size_t dropped_bytes() const { return dropped_; }

private:
    std::string buffer_;
    size_t max_line_;
    size_t dropped_ = 0;
    bool discarding_ = false;
};

nlohmann::json make_request(uint64_t id, const std::string& method,
                            const nlohmann::json& params);
nlohmann::json make_notification(const std::string& method,
                                 const nlohmann::json& params);
nlohmann::json make_result(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

// Tool-level payloads: a single text content block, optionally flagged.
nlohmann::json text_content(const std::string& text, bool is_error = false);

// Serialize as one line, newline-terminated.
std::string frame(const nlohmann::json& message);

// Has an id and either result or error, and no method.
bool is_response(const nlohmann::json& message);

} // namespace toolmux

#include "json_rpc.hpp"
#include "log.hpp"
#include "util.hpp"
#include <cstring>

namespace toolmux {

std::vector<std::string> LineBuffer::feed(const char* data, size_t len) {
    std::vector<std::string> lines;

    // Still inside an overlong line: skip to its end.
    if (discarding_) {
        const char* nl = static_cast<const char*>(std::memchr(data, '\n', len));
        if (!nl) {
            dropped_ += len;
            return lines;
        }
        size_t skipped = static_cast<size_t>(nl - data) + 1;
        dropped_ += skipped;
        data += skipped;
        len -= skipped;
        discarding_ = false;
    }

    buffer_.append(data, len);

    size_t start = 0;
    size_t nl;
    while ((nl = buffer_.find('\n', start)) != std::string::npos) {
        std::string line = buffer_.substr(start, nl - start);
        start = nl + 1;
        if (line.size() > max_line_) {
            dropped_ += line.size() + 1;
            log_warn("json_rpc", "Dropped a " + std::to_string(line.size()) +
                     "-byte line over the " + std::to_string(max_line_) + "-byte limit");
            continue;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;
        lines.push_back(std::move(line));
    }
    buffer_.erase(0, start);

    if (buffer_.size() > max_line_) {
        log_warn("json_rpc", "Dropping a line over the " + std::to_string(max_line_) +
                 "-byte limit");
        dropped_ += buffer_.size();
        buffer_.clear();
        discarding_ = true;
    }
    return lines;
}

nlohmann::json make_request(uint64_t id, const std::string& method,
                            const nlohmann::json& params) {
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) req["params"] = params;
    return req;
}

nlohmann::json make_notification(const std::string& method,
                                 const nlohmann::json& params) {
    nlohmann::json note = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) note["params"] = params;
    return note;
}

nlohmann::json make_result(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

nlohmann::json text_content(const std::string& text, bool is_error) {
    nlohmann::json payload = {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}
    };
    if (is_error) payload["isError"] = true;
    return payload;
}

std::string frame(const nlohmann::json& message) {
    // Replace invalid UTF-8 instead of throwing; child output is arbitrary bytes.
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

bool is_response(const nlohmann::json& message) {
    return message.is_object() && message.contains("id") && !message.contains("method") &&
           (message.contains("result") || message.contains("error"));
}

} // namespace toolmux

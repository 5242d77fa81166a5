#pragma once
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>

namespace toolmux {

// Base for every error the runtime raises on purpose.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No usable provider configuration. Fatal at startup.
class ConfigError : public Error {
public:
    using Error::Error;
};

// One provider failed its handshake; it is skipped.
class ProviderStartError : public Error {
public:
    using Error::Error;
};

// A pending provider call exceeded its timeout.
class RpcTimeoutError : public Error {
public:
    using Error::Error;
};

// Provider answered with a JSON-RPC error, or the request could not be sent.
class RpcError : public Error {
public:
    RpcError(const std::string& message, int code = 0)
        : Error(message), code_(code) {}
    int code() const { return code_; }

private:
    int code_;
};

// Malformed or empty tool input.
class ValidationError : public Error {
public:
    using Error::Error;
};

// Nonzero exit, compile failure, kill or spawn failure.
class ExecutionError : public Error {
public:
    ExecutionError(const std::string& message, int exit_code = -1)
        : Error(message), exit_code_(exit_code) {}
    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

// Failure callback shared by the asynchronous APIs.
using ErrorHandler = std::function<void(std::exception_ptr)>;

// Message of an exception_ptr, for logging and tool-level error text.
inline std::string error_message(const std::exception_ptr& err) {
    try {
        if (err) std::rethrow_exception(err);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
    return {};
}

} // namespace toolmux

#pragma once

#include <string>
#include <cstdint>

// Error taxonomy shared by client and server
enum class ErrorKind {
    None,
    Transport,      // connect/timeout/disconnect, usually retryable
    Protocol,       // malformed frame, oversized declared size
    Integrity,      // hash mismatch
    Precondition,   // illegal state transition
    Processing,     // external command failed or could not be launched
    Storage,        // job store unreadable/unwritable
    Config,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    bool retryable = false;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None, false};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::None,
                         bool retryable = false) {
        return {false, T{}, err, kind, retryable};
    }

    // Re-wrap the error of another result (value type differs)
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind, other.retryable};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    bool retryable = false;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None, false};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::None,
                            bool retryable = false) {
        return {false, err, kind, retryable};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind, other.retryable};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Shorthand constructors for the transport layer
inline Result<void> transport_error(const std::string& msg, bool retryable = true) {
    return Result<void>::Err(msg, ErrorKind::Transport, retryable);
}

inline Result<void> protocol_error(const std::string& msg) {
    return Result<void>::Err(msg, ErrorKind::Protocol, false);
}


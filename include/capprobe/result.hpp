#pragma once

#include <optional>
#include <string>
#include <utility>

namespace capprobe {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for capprobe operations
 */
enum class ErrorCode {
    // Probe queries
    NOT_PRESENT,
    NOT_A_FILE,
    PROBE_UNKNOWN,

    // System / IO
    FILE_NOT_FOUND,
    IO_ERROR,

    // Configuration
    CONFIG_PARSE_ERROR,
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::NOT_PRESENT: return "NOT_PRESENT";
        case ErrorCode::NOT_A_FILE: return "NOT_A_FILE";
        case ErrorCode::PROBE_UNKNOWN: return "PROBE_UNKNOWN";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace capprobe

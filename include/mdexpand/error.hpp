#pragma once

/**
 * @file error.hpp
 * @brief Error taxonomy and Result type for import resolution
 *
 * Every resolution strategy reports failure through Result<T>. A failed action
 * aborts the expansion call that contains it; the Error carries enough context
 * (paths, command text, sizes, cycle chain) to diagnose without re-running.
 */

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace mdexpand {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // File imports
    IMPORT_NOT_FOUND,
    FILE_TOO_LARGE,
    BINARY_IMPORT_REJECTED,
    CIRCULAR_IMPORT,
    SYMBOL_NOT_FOUND,

    // Glob imports
    CONTEXT_BUDGET_EXCEEDED,

    // URL imports
    UNSUPPORTED_CONTENT_TYPE,
    URL_FETCH_FAILED,

    // Commands and code fences
    COMMAND_TIMED_OUT,
    BINARY_COMMAND_OUTPUT,
    COMMAND_FAILED,
    CODE_FENCE_FAILED,

    // System
    IO_ERROR,
    CONFIG_INVALID,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::IMPORT_NOT_FOUND: return "import_not_found";
        case ErrorCode::FILE_TOO_LARGE: return "file_too_large";
        case ErrorCode::BINARY_IMPORT_REJECTED: return "binary_import_rejected";
        case ErrorCode::CIRCULAR_IMPORT: return "circular_import";
        case ErrorCode::SYMBOL_NOT_FOUND: return "symbol_not_found";
        case ErrorCode::CONTEXT_BUDGET_EXCEEDED: return "context_budget_exceeded";
        case ErrorCode::UNSUPPORTED_CONTENT_TYPE: return "unsupported_content_type";
        case ErrorCode::URL_FETCH_FAILED: return "url_fetch_failed";
        case ErrorCode::COMMAND_TIMED_OUT: return "command_timed_out";
        case ErrorCode::BINARY_COMMAND_OUTPUT: return "binary_command_output";
        case ErrorCode::COMMAND_FAILED: return "command_failed";
        case ErrorCode::CODE_FENCE_FAILED: return "code_fence_failed";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::CONFIG_INVALID: return "config_invalid";
        default: return "unknown";
    }
}

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error type with code, message and diagnostic fields
 */
class Error {
public:
    using Fields = std::unordered_map<std::string, std::string>;

    Error(ErrorCode code, std::string message, Fields fields = {})
        : code_(code), message_(std::move(message)), fields_(std::move(fields)) {}

    Error& withField(const std::string& key, std::string value) {
        fields_[key] = std::move(value);
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const Fields& fields() const { return fields_; }

    std::string field(const std::string& key) const {
        auto it = fields_.find(key);
        return it != fields_.end() ? it->second : std::string();
    }

private:
    ErrorCode code_;
    std::string message_;
    Fields fields_;
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

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
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

} // namespace mdexpand

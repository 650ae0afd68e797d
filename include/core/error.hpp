#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace orabridge {

/**
 * @brief Error categories surfaced by the bridge
 *
 * Native failures are split by the layer that raised them; worker dispatch
 * failures are kept apart from anything the database reported.
 */
enum class ErrorCategory {
    NONE,
    CONNECTION_ERROR,   // connect / ping / close
    STATEMENT_ERROR,    // prepare / bind / execute / fetch / commit / rollback
    CONVERSION_ERROR,   // encode / decode
    CONCURRENCY_ERROR,  // blocking worker dispatch or join
    CONFIG_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:              return "None";
        case ErrorCategory::CONNECTION_ERROR:  return "ConnectionError";
        case ErrorCategory::STATEMENT_ERROR:   return "StatementError";
        case ErrorCategory::CONVERSION_ERROR:  return "ConversionError";
        case ErrorCategory::CONCURRENCY_ERROR: return "ConcurrencyError";
        case ErrorCategory::CONFIG_ERROR:      return "ConfigError";
        default:                               return "Unknown";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    /**
     * @brief Re-type an error from another Result (value side is dropped)
     */
    template<typename U>
    static Result from_error(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Result for operations with no value (bind, commit, ping, close)
 */
template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    template<typename U>
    static Result from_error(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

using Status = Result<void>;

} // namespace orabridge

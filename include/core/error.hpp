#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace webcapture {

/**
 * @brief Error categories for capture and archive operations
 *
 * STEP_ERROR never leaves the controller (recorded as a log entry).
 * Budget breaches are not errors at all.
 */
enum class ErrorCategory {
    NONE,
    CONFIGURATION_ERROR,
    SETUP_ERROR,
    STEP_ERROR,
    ENCODE_ERROR,
    DECODE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::CONFIGURATION_ERROR: return "configuration_error";
        case ErrorCategory::SETUP_ERROR:         return "setup_error";
        case ErrorCategory::STEP_ERROR:          return "step_error";
        case ErrorCategory::ENCODE_ERROR:        return "encode_error";
        case ErrorCategory::DECODE_ERROR:        return "decode_error";
        case ErrorCategory::INTERNAL_ERROR:      return "internal_error";
    }
    return "unknown";
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

} // namespace webcapture

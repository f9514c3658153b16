/**
 * @file types.h
 * @brief Core type definitions for custody_upload
 */

#ifndef CUSTODY_UPLOAD_CORE_TYPES_H
#define CUSTODY_UPLOAD_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace custody::upload {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Session errors (-100 to -119)
    not_initiated = -100,
    invalid_capture_id = -101,
    session_start_failed = -102,
    no_parts_uploaded = -103,
    incomplete_parts = -104,
    invalid_state = -105,
    completion_failure = -106,
    cancel_failure = -107,

    // Part errors (-120 to -139)
    invalid_part_number = -120,
    negotiation_failure = -121,
    invalid_authorization_url = -122,
    transfer_failure = -123,
    confirmation_missing = -124,
    retries_exhausted = -125,

    // Network errors (-140 to -159)
    network_error = -140,
    transfer_timeout = -141,

    // State errors (-160 to -179)
    state_store_failure = -160,
    state_corrupted = -161,

    // Configuration errors (-180 to -199)
    config_invalid = -180,

    // Integrity errors (-200 to -219)
    chain_sequence_error = -200,
    invalid_hash = -201,
    empty_chain = -202,

    // Internal errors (-220 to -239)
    internal_error = -220,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::not_initiated:
            return "upload not initiated";
        case error_code::invalid_capture_id:
            return "invalid capture id";
        case error_code::session_start_failed:
            return "session start failed";
        case error_code::no_parts_uploaded:
            return "no parts uploaded";
        case error_code::incomplete_parts:
            return "incomplete parts";
        case error_code::invalid_state:
            return "invalid session state";
        case error_code::completion_failure:
            return "completion failure";
        case error_code::cancel_failure:
            return "cancel failure";
        case error_code::invalid_part_number:
            return "invalid part number";
        case error_code::negotiation_failure:
            return "negotiation failure";
        case error_code::invalid_authorization_url:
            return "invalid authorization url";
        case error_code::transfer_failure:
            return "transfer failure";
        case error_code::confirmation_missing:
            return "confirmation token missing";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::network_error:
            return "network error";
        case error_code::transfer_timeout:
            return "transfer timeout";
        case error_code::state_store_failure:
            return "state store failure";
        case error_code::state_corrupted:
            return "state corrupted";
        case error_code::config_invalid:
            return "invalid configuration";
        case error_code::chain_sequence_error:
            return "chain sequence error";
        case error_code::invalid_hash:
            return "invalid hash";
        case error_code::empty_chain:
            return "empty chain";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code belongs to the part upload range
 */
[[nodiscard]] constexpr auto is_part_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -120 && value >= -139;
}

/**
 * @brief Check if error code belongs to the network range
 */
[[nodiscard]] constexpr auto is_network_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -140 && value >= -159;
}

/**
 * @brief Error type with code and diagnostic details
 *
 * Besides the code and message, an error records how many attempts were
 * performed, whether a later retry could succeed, and the HTTP status of
 * the response that caused it (if any).
 */
struct error {
    error_code code;
    std::string message;
    std::size_t attempts = 0;
    bool recoverable = false;
    std::optional<int> http_status;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, std::optional<int> status)
        : code(c), message(std::move(msg)), http_status(status) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief Mark this error as recoverable or not
     */
    auto with_recoverable(bool value) -> error& {
        recoverable = value;
        return *this;
    }

    /**
     * @brief Record the number of attempts performed
     */
    auto with_attempts(std::size_t value) -> error& {
        attempts = value;
        return *this;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_CORE_TYPES_H

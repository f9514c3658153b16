/**
 * @file retry_executor.h
 * @brief Exponential backoff retry with error classification
 */

#ifndef CUSTODY_UPLOAD_CORE_RETRY_EXECUTOR_H
#define CUSTODY_UPLOAD_CORE_RETRY_EXECUTOR_H

#include <custody/upload/core/logging.h>
#include <custody/upload/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace custody::upload {

/**
 * @brief Retry policy for part transfers
 */
struct retry_policy {
    /// Total attempts including the first one
    std::size_t max_attempts = 3;

    /// Delay before the second attempt
    std::chrono::milliseconds base_delay{1000};

    /// Upper bound of a single delay before jitter
    std::chrono::milliseconds max_delay{30000};

    double backoff_multiplier = 2.0;

    /// Relative jitter applied to each delay (0.1 means +/-10%)
    double jitter_ratio = 0.1;

    /**
     * @brief Policy that never retries
     */
    [[nodiscard]] static auto no_retry() -> retry_policy {
        retry_policy policy;
        policy.max_attempts = 1;
        return policy;
    }

    /**
     * @brief Check whether the policy values are usable
     */
    [[nodiscard]] auto is_valid() const -> bool {
        return max_attempts >= 1 && base_delay.count() >= 0 &&
               max_delay >= base_delay && backoff_multiplier >= 1.0 &&
               jitter_ratio >= 0.0 && jitter_ratio < 1.0;
    }
};

/**
 * @brief Runs an operation until it succeeds, fails permanently, or the
 *        attempts run out
 *
 * Failures are classified by is_recoverable(). A non-recoverable failure is
 * returned at once with its attempt count. When every attempt fails with a
 * recoverable error the result is error_code::retries_exhausted, carrying the
 * last error's message and HTTP status.
 *
 * @code
 * retry_executor executor(retry_policy{});
 * auto result = executor.execute(
 *     [&](std::size_t attempt) -> result<std::string> { return transfer(attempt); },
 *     "part 3");
 * @endcode
 */
class retry_executor {
public:
    using sleep_function = std::function<void(std::chrono::milliseconds)>;

    /**
     * @brief Construct an executor
     * @param policy Retry policy
     * @param sleeper Called between attempts; defaults to std::this_thread::sleep_for
     */
    explicit retry_executor(retry_policy policy, sleep_function sleeper = nullptr);

    /**
     * @brief Execute an operation with retries
     * @param operation Callable taking the 1-based attempt number and
     *        returning result<T>
     * @param label Short description used in log messages and errors
     */
    template <typename Operation>
    [[nodiscard]] auto execute(Operation&& operation, std::string_view label) const
        -> decltype(operation(std::size_t{1})) {
        const auto max_attempts = policy_.max_attempts == 0 ? 1 : policy_.max_attempts;
        struct error last_error;

        for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
            auto outcome = operation(attempt);
            if (outcome.has_value()) {
                if (attempt > 1) {
                    CU_LOG_INFO(log_category::retry,
                                std::string(label) + " succeeded on attempt " +
                                    std::to_string(attempt));
                }
                return outcome;
            }

            last_error = outcome.error();
            if (!is_recoverable(last_error)) {
                upload_log_context ctx;
                ctx.attempt = static_cast<uint32_t>(attempt);
                ctx.http_status = last_error.http_status;
                ctx.error_message = last_error.message;
                CU_LOG_WARN_CTX(log_category::retry,
                                std::string(label) + " failed with non-recoverable error", ctx);
                last_error.attempts = attempt;
                last_error.recoverable = false;
                return unexpected{std::move(last_error)};
            }

            if (attempt < max_attempts) {
                auto delay = calculate_delay(attempt);
                upload_log_context ctx;
                ctx.attempt = static_cast<uint32_t>(attempt);
                ctx.delay_ms = static_cast<uint64_t>(delay.count());
                ctx.http_status = last_error.http_status;
                ctx.error_message = last_error.message;
                CU_LOG_WARN_CTX(log_category::retry,
                                std::string(label) + " failed, retrying", ctx);
                sleep_(delay);
            }
        }

        error exhausted(error_code::retries_exhausted,
                        std::string(label) + " failed after " +
                            std::to_string(max_attempts) + " attempts: " + last_error.message,
                        last_error.http_status);
        exhausted.with_attempts(max_attempts).with_recoverable(true);
        CU_LOG_ERROR(log_category::retry, exhausted.message);
        return unexpected{std::move(exhausted)};
    }

    /**
     * @brief Delay before the attempt following @p attempt
     *
     * min(base_delay * multiplier^(attempt-1), max_delay), scaled by a random
     * factor in [1 - jitter_ratio, 1 + jitter_ratio].
     */
    [[nodiscard]] auto calculate_delay(std::size_t attempt) const -> std::chrono::milliseconds;

    /**
     * @brief Delay before jitter for the attempt following @p attempt
     */
    [[nodiscard]] auto base_delay_for(std::size_t attempt) const -> std::chrono::milliseconds;

    /**
     * @brief Classify an error
     *
     * 429 and 5xx responses, network errors, and timeouts are recoverable;
     * other 4xx responses are not. Errors for which a retry cannot change
     * the outcome (bad arguments, negotiation failures) are not recoverable.
     * Anything else is treated as recoverable.
     */
    [[nodiscard]] static auto is_recoverable(const struct error& err) -> bool;

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

private:
    retry_policy policy_;
    sleep_function sleep_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_CORE_RETRY_EXECUTOR_H

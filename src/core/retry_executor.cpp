/**
 * @file retry_executor.cpp
 * @brief Implementation of retry delay calculation and error classification
 */

#include <custody/upload/core/retry_executor.h>

#include <algorithm>
#include <random>
#include <thread>

namespace custody::upload {

retry_executor::retry_executor(retry_policy policy, sleep_function sleeper)
    : policy_(std::move(policy)), sleep_(std::move(sleeper)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

auto retry_executor::base_delay_for(std::size_t attempt) const -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy_.base_delay.count());
    const auto max_delay = static_cast<double>(policy_.max_delay.count());

    for (std::size_t i = 1; i < attempt && delay < max_delay; ++i) {
        delay *= policy_.backoff_multiplier;
    }

    delay = std::min(delay, max_delay);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto retry_executor::calculate_delay(std::size_t attempt) const -> std::chrono::milliseconds {
    auto delay = static_cast<double>(base_delay_for(attempt).count());

    if (policy_.jitter_ratio > 0.0) {
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_real_distribution<> dis(1.0 - policy_.jitter_ratio,
                                             1.0 + policy_.jitter_ratio);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto retry_executor::is_recoverable(const struct error& err) -> bool {
    if (err.http_status) {
        const int status = *err.http_status;
        if (status == 429) {
            return true;
        }
        if (status >= 400 && status < 500) {
            return false;
        }
        if (status >= 500) {
            return true;
        }
    }

    switch (err.code) {
        case error_code::network_error:
        case error_code::transfer_timeout:
            return true;
        case error_code::not_initiated:
        case error_code::invalid_part_number:
        case error_code::negotiation_failure:
        case error_code::invalid_authorization_url:
        case error_code::config_invalid:
            return false;
        default:
            return true;
    }
}

}  // namespace custody::upload

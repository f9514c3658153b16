/**
 * @file logging.h
 * @brief Structured logging for custody_upload
 *
 * Messages go through get_logger() and the CU_LOG_* macros. Output is text
 * or JSON, written to stderr or forwarded to logger_system when the library
 * is built with it.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include <custody/upload/config/feature_flags.h>

#if CUSTODY_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace custody::upload {

/**
 * @brief Log categories for the upload coordinator
 */
struct log_category {
    static constexpr std::string_view session = "custody_upload.session";
    static constexpr std::string_view accumulator = "custody_upload.accumulator";
    static constexpr std::string_view serializer = "custody_upload.serializer";
    static constexpr std::string_view uploader = "custody_upload.uploader";
    static constexpr std::string_view retry = "custody_upload.retry";
    static constexpr std::string_view state = "custody_upload.state";
    static constexpr std::string_view api = "custody_upload.api";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_log_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 *
 * Authorization URLs carry signed query strings that grant write access to
 * the storage backend; capture ids identify evidence owners.
 */
struct masking_config {
    bool mask_url_queries = true;
    bool mask_capture_ids = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks sensitive values in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    /**
     * @brief Mask URL query strings embedded in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_url_queries) {
            return input;
        }

        static const std::regex url_pattern(R"(https?://[^\s"?]+\?[^\s"]*)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), url_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_url(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);
        return result;
    }

    /**
     * @brief Replace the query part of a URL, keeping scheme, host and path
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_url_queries) {
            return url;
        }
        auto query = url.find('?');
        if (query == std::string::npos) {
            return url;
        }
        return url.substr(0, query + 1) + std::string(8, config_.mask_char[0]);
    }

    /**
     * @brief Keep the first visible_chars of a capture id
     */
    [[nodiscard]] auto mask_capture_id(const std::string& id) const -> std::string {
        if (!config_.mask_capture_ids || id.size() <= config_.visible_chars) {
            return id;
        }
        return id.substr(0, config_.visible_chars) +
               std::string(id.size() - config_.visible_chars, config_.mask_char[0]);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string capture_id;
    std::string session_id;
    std::optional<uint32_t> part_number;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> buffered_bytes;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> delay_ms;
    std::optional<int> http_status;
    std::optional<std::string> status;
    std::optional<std::string> url;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_log_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, long long value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!capture_id.empty()) {
            add_field("capture_id", masker ? masker->mask_capture_id(capture_id) : capture_id);
        }
        if (!session_id.empty()) add_field("session_id", session_id);
        if (part_number) add_int("part_number", *part_number);
        if (bytes) add_int("bytes", static_cast<long long>(*bytes));
        if (buffered_bytes) add_int("buffered_bytes", static_cast<long long>(*buffered_bytes));
        if (attempt) add_int("attempt", *attempt);
        if (delay_ms) add_int("delay_ms", static_cast<long long>(*delay_ms));
        if (http_status) add_int("http_status", *http_status);
        if (status) add_field("status", *status);
        if (url) add_field("url", masker ? masker->mask_url(*url) : *url);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_log_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_log_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::uploader)
 *     .with_message("Part uploaded")
 *     .with_capture_id("cap-1")
 *     .with_part_number(2)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_capture_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->capture_id = std::string(id);
        return *this;
    }

    auto with_session_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->session_id = std::string(id);
        return *this;
    }

    auto with_part_number(uint32_t part_number) -> log_entry_builder& {
        ensure_context();
        entry_.context->part_number = part_number;
        return *this;
    }

    auto with_bytes(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes = bytes;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const upload_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = upload_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

class upload_logger;

upload_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Logger used by every upload component
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const upload_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called when an upload session is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CUSTODY_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if CUSTODY_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CUSTODY_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Install a callback receiving every enabled message
     *
     * While a callback or JSON callback is installed, nothing is written to
     * stderr.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        bool intercepted = false;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
                intercepted = true;
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            emit(builder.build(), current_masker, intercepted);
        } else if (!intercepted) {
            log_text(level, category, message, context, file, line, function, current_masker);
        }
    }

    /**
     * @brief Log a structured entry directly
     */
    void log(const structured_log_entry& entry) {
        if (!is_enabled(entry.level)) return;

        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            current_masker = masker_;
        }
        emit(entry, current_masker, false);
    }

    void flush() {
#if CUSTODY_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(const structured_log_entry& entry,
              const sensitive_info_masker& masker,
              bool intercepted) {
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
                intercepted = true;
            }
        }
        if (intercepted) return;

#if CUSTODY_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (entry.source_file && entry.source_line && entry.function_name) {
                logger_->log(to_logger_level(entry.level), json_str,
                             entry.source_file->c_str(), *entry.source_line,
                             entry.function_name->c_str());
            } else {
                logger_->log(to_logger_level(entry.level), json_str);
            }
            return;
        }
#endif
        output_to_stderr(json_str);
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const upload_log_context* context,
                  [[maybe_unused]] const char* file,
                  [[maybe_unused]] int line,
                  [[maybe_unused]] const char* function,
                  const sensitive_info_masker& masker) {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

#if CUSTODY_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), oss.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), oss.str());
            }
            return;
        }
#endif
        output_to_stderr(get_timestamp() + " [" + std::string(log_level_to_string(level)) +
                         "] " + oss.str());
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if CUSTODY_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define CU_LOG(level, category, message) \
    custody::upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_CTX(level, category, message, context) \
    custody::upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_TRACE(category, message) \
    CU_LOG(custody::upload::log_level::trace, category, message)

#define CU_LOG_DEBUG(category, message) \
    CU_LOG(custody::upload::log_level::debug, category, message)

#define CU_LOG_INFO(category, message) \
    CU_LOG(custody::upload::log_level::info, category, message)

#define CU_LOG_WARN(category, message) \
    CU_LOG(custody::upload::log_level::warn, category, message)

#define CU_LOG_ERROR(category, message) \
    CU_LOG(custody::upload::log_level::error, category, message)

#define CU_LOG_FATAL(category, message) \
    CU_LOG(custody::upload::log_level::fatal, category, message)

#define CU_LOG_DEBUG_CTX(category, message, ctx) \
    CU_LOG_CTX(custody::upload::log_level::debug, category, message, ctx)

#define CU_LOG_INFO_CTX(category, message, ctx) \
    CU_LOG_CTX(custody::upload::log_level::info, category, message, ctx)

#define CU_LOG_WARN_CTX(category, message, ctx) \
    CU_LOG_CTX(custody::upload::log_level::warn, category, message, ctx)

#define CU_LOG_ERROR_CTX(category, message, ctx) \
    CU_LOG_CTX(custody::upload::log_level::error, category, message, ctx)

}  // namespace custody::upload

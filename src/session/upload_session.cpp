/**
 * @file upload_session.cpp
 * @brief Upload session orchestrator implementation
 */

#include <custody/upload/session/upload_session.h>

#include <custody/upload/core/logging.h>
#include <custody/upload/session/chunk_accumulator.h>
#include <custody/upload/session/flush_serializer.h>
#include <custody/upload/session/part_uploader.h>
#include <custody/upload/session/session_state_store.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <utility>

namespace custody::upload {

namespace {

/**
 * @brief A flushed block whose transfer failed, kept for retry by complete()
 */
struct failed_block {
    uint32_t part_number = 0;
    assembled_block block;
};

/**
 * @brief Check whether units may be buffered in the given status
 */
[[nodiscard]] auto accepts_units(upload_status status) noexcept -> bool {
    switch (status) {
        case upload_status::uploading:
        case upload_status::failed:
            return true;
        case upload_status::idle:
        case upload_status::completing:
        case upload_status::completed:
        default:
            return false;
    }
}

/**
 * @brief Part numbers missing from 1..max of a list sorted by part number
 */
[[nodiscard]] auto missing_part_numbers(const std::vector<upload_part>& sorted)
    -> std::vector<uint32_t> {
    std::vector<uint32_t> missing;
    uint32_t expected = 1;
    for (const auto& part : sorted) {
        while (expected < part.part_number) {
            missing.push_back(expected++);
        }
        if (part.part_number == expected) {
            ++expected;
        }
    }
    return missing;
}

[[nodiscard]] auto join_numbers(const std::vector<uint32_t>& numbers) -> std::string {
    std::string joined;
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += std::to_string(numbers[i]);
    }
    return joined;
}

[[nodiscard]] auto not_initiated_error() -> unexpected {
    return unexpected{error{error_code::not_initiated,
                            "Upload session has not been initiated"}};
}

}  // namespace

// ============================================================================
// upload_session::impl
// ============================================================================

class upload_session::impl {
public:
    impl(upload_config cfg,
         std::shared_ptr<upload_api> api,
         std::shared_ptr<part_transport> transport,
         std::shared_ptr<key_value_store> store,
         std::optional<std::string> capture,
         retry_executor::sleep_function sleeper)
        : config(std::move(cfg)),
          api_(api),
          uploader_(std::move(api), std::move(transport),
                    retry_executor(config.retry, std::move(sleeper)), config.transfer),
          state_store_(std::move(store), config.state_key_prefix),
          accumulator_(config.part_size_threshold),
          capture_id_(std::move(capture)) {}

    upload_config config;

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    auto initiate(const std::string& capture_id, const std::string& storage_class)
        -> result<session_identity> {
        if (capture_id.empty()) {
            return unexpected{error{error_code::invalid_capture_id,
                                    "Capture id must not be empty"}};
        }

        {
            std::lock_guard lock(state_mutex_);
            if (identity_ && status_ != upload_status::completed) {
                auto ctx = context_locked();
                CU_LOG_WARN_CTX(log_category::session,
                                "Replacing an active session; its parts are abandoned", ctx);
            }
        }

        upload_log_context ctx;
        ctx.capture_id = capture_id;
        CU_LOG_INFO_CTX(log_category::session,
                        "Starting upload session (storage class " + storage_class + ")", ctx);

        auto started = api_->start(capture_id, storage_class);
        if (!started || started.value().session_id.empty()) {
            error err;
            if (started) {
                err = error{error_code::session_start_failed,
                            "Backend returned no session identifier"};
                err.with_recoverable(false);
            } else {
                err = started.error();
                if (err.code != error_code::session_start_failed) {
                    err = error{error_code::session_start_failed,
                                "Failed to start session: " + err.message, err.http_status};
                }
                err.with_recoverable(retry_executor::is_recoverable(err));
            }

            {
                std::lock_guard lock(state_mutex_);
                status_ = upload_status::failed;
            }
            ctx.http_status = err.http_status;
            ctx.error_message = err.message;
            CU_LOG_ERROR_CTX(log_category::session, "Failed to start upload session", ctx);
            notify_progress();
            return unexpected{std::move(err)};
        }

        session_identity identity{started.value().session_id, capture_id,
                                  started.value().object_key};
        {
            std::lock_guard lock(state_mutex_);
            ++generation_;
            reset_locked();
            identity_ = identity;
            capture_id_ = capture_id;
            status_ = upload_status::uploading;
        }

        persist();

        ctx.session_id = identity.session_id;
        CU_LOG_INFO_CTX(log_category::session, "Upload session started", ctx);
        notify_progress();
        return identity;
    }

    auto add_unit(std::span<const std::byte> data,
                  std::string content_hash,
                  std::optional<std::string> previous_unit_hash) -> result<void> {
        bool threshold_reached = false;
        {
            std::lock_guard lock(state_mutex_);
            if (auto loaded = ensure_loaded_locked(); !loaded) {
                return unexpected{loaded.error()};
            }
            if (!identity_) {
                return not_initiated_error();
            }
            if (!accepts_units(status_)) {
                return unexpected{error{error_code::invalid_state,
                                        std::string("Cannot add units while session is ") +
                                            to_string(status_)}};
            }

            bytes_received_ += data.size();
            accumulator_.add(pending_unit{std::vector<std::byte>(data.begin(), data.end()),
                                          std::move(content_hash),
                                          std::move(previous_unit_hash)});
            threshold_reached = accumulator_.threshold_reached();

            CU_LOG_TRACE(log_category::accumulator,
                         "Buffered unit, " + std::to_string(accumulator_.buffered_bytes()) +
                             " bytes pending");
        }
        notify_progress();

        if (!threshold_reached) {
            return {};
        }

        auto ticket = serializer_.try_acquire();
        if (!ticket) {
            CU_LOG_DEBUG(log_category::serializer,
                         "Flush already running; threshold flush deferred");
            return {};
        }
        return flush_block(std::move(*ticket), false);
    }

    auto flush() -> result<void> {
        {
            std::lock_guard lock(state_mutex_);
            if (auto loaded = ensure_loaded_locked(); !loaded) {
                return unexpected{loaded.error()};
            }
            if (!identity_) {
                return not_initiated_error();
            }
            if (status_ == upload_status::completed) {
                return unexpected{error{error_code::invalid_state,
                                        "Session is already completed"}};
            }
        }
        return flush_block(serializer_.acquire(), true);
    }

    auto upload_part(std::span<const std::byte> data,
                     uint32_t part_number,
                     const std::string& content_hash,
                     const std::optional<std::string>& previous_unit_hash)
        -> result<upload_part_result> {
        std::optional<session_identity> identity;
        uint64_t generation = 0;
        {
            std::lock_guard lock(state_mutex_);
            if (auto loaded = ensure_loaded_locked(); !loaded) {
                return unexpected{loaded.error()};
            }
            if (identity_ && status_ == upload_status::completed) {
                return unexpected{error{error_code::invalid_state,
                                        "Session is already completed"}};
            }
            if (identity_ && part_claimed_locked(part_number)) {
                return unexpected{error{error_code::invalid_part_number,
                                        "Part " + std::to_string(part_number) +
                                            " already recorded"}
                                      .with_recoverable(false)};
            }
            identity = identity_;
            generation = generation_;
        }

        auto uploaded = uploader_.upload(identity, part_number, data, content_hash,
                                         previous_unit_hash);
        if (!uploaded) {
            return unexpected{uploaded.error()};
        }

        bool current = false;
        {
            std::lock_guard lock(state_mutex_);
            current = identity_.has_value() && generation == generation_;
            if (current) {
                record_part_locked(custody::upload::upload_part{
                    part_number, uploaded.value().confirmation_token});
                bytes_uploaded_ += data.size();
            }
        }

        if (current) {
            persist();
            notify_progress();
        }
        return uploaded;
    }

    auto complete(std::optional<preview_metadata> preview) -> result<completion_result> {
        {
            std::lock_guard lock(state_mutex_);
            if (auto loaded = ensure_loaded_locked(); !loaded) {
                return unexpected{loaded.error()};
            }
            if (!identity_) {
                return not_initiated_error();
            }
            if (status_ == upload_status::completing || status_ == upload_status::completed) {
                return unexpected{error{error_code::invalid_state,
                                        std::string("Session is already ") + to_string(status_)}};
            }
            status_ = upload_status::completing;
            auto ctx = context_locked();
            CU_LOG_INFO_CTX(log_category::session, "Completing upload session", ctx);
        }
        notify_progress();

        if (auto flushed = flush_block(serializer_.acquire(), true); !flushed) {
            CU_LOG_WARN(log_category::session,
                        "Final flush failed, retrying before completion: " +
                            flushed.error().message);
        }

        session_identity identity;
        uint64_t generation = 0;
        std::vector<failed_block> retry_blocks;
        {
            std::unique_lock lock(state_mutex_);
            inflight_cv_.wait(lock, [this] { return inflight_ == 0; });
            if (!identity_) {
                return unexpected{error{error_code::invalid_state,
                                        "Session was aborted during completion"}};
            }
            identity = *identity_;
            generation = generation_;
            retry_blocks.swap(failed_blocks_);
        }

        if (auto retried = retry_failed_blocks(identity, generation, std::move(retry_blocks));
            !retried) {
            return fail_completion(generation, retried.error());
        }

        std::vector<custody::upload::upload_part> sorted;
        {
            std::lock_guard lock(state_mutex_);
            if (generation != generation_) {
                return unexpected{error{error_code::invalid_state,
                                        "Session was aborted during completion"}};
            }
            sorted = parts_;
        }

        if (sorted.empty()) {
            return fail_completion(generation, error{error_code::no_parts_uploaded,
                                                     "No parts have been uploaded"});
        }

        std::sort(sorted.begin(), sorted.end(),
                  [](const custody::upload::upload_part& a,
                     const custody::upload::upload_part& b) {
                      return a.part_number < b.part_number;
                  });

        if (auto missing = missing_part_numbers(sorted); !missing.empty()) {
            return fail_completion(generation,
                                   error{error_code::incomplete_parts,
                                         "Missing parts: " + join_numbers(missing)});
        }

        complete_request request;
        request.capture_id = identity.capture_id;
        request.session_id = identity.session_id;
        request.parts = sorted;
        request.preview = std::move(preview);

        auto completed = api_->complete(request);
        if (!completed) {
            error err = completed.error();
            if (err.code != error_code::completion_failure) {
                err = error{error_code::completion_failure,
                            "Failed to complete session: " + err.message, err.http_status};
            }
            err.with_recoverable(retry_executor::is_recoverable(err));
            return fail_completion(generation, std::move(err));
        }

        {
            std::lock_guard lock(state_mutex_);
            if (generation != generation_) {
                return unexpected{error{error_code::invalid_state,
                                        "Session was aborted during completion"}};
            }
            status_ = upload_status::completed;
        }

        {
            std::lock_guard persist_lock(persist_mutex_);
            if (auto cleared = state_store_.clear(identity.capture_id); !cleared) {
                CU_LOG_WARN(log_category::state,
                            "Failed to clear persisted state: " + cleared.error().message);
            }
        }

        completion_result done;
        done.url = completed.value().url;
        done.object_key = completed.value().object_key.empty() ? identity.object_key
                                                               : completed.value().object_key;
        done.total_parts = sorted.size();

        upload_log_context ctx;
        ctx.capture_id = identity.capture_id;
        ctx.session_id = identity.session_id;
        ctx.url = done.url;
        CU_LOG_INFO_CTX(log_category::session,
                        "Upload completed with " + std::to_string(done.total_parts) + " parts",
                        ctx);
        notify_progress();
        return done;
    }

    void abort() {
        std::optional<session_identity> identity;
        std::optional<std::string> capture;
        upload_status previous = upload_status::idle;
        {
            std::lock_guard lock(state_mutex_);
            if (auto loaded = ensure_loaded_locked(); !loaded) {
                CU_LOG_WARN(log_category::state,
                            "Ignoring unreadable state during abort: " + loaded.error().message);
            }
            identity = identity_;
            capture = identity_ ? std::optional<std::string>(identity_->capture_id) : capture_id_;
            previous = status_;

            ++generation_;
            reset_locked();
            capture_id_.reset();
        }
        inflight_cv_.notify_all();

        if (identity && previous != upload_status::completed) {
            upload_log_context ctx;
            ctx.capture_id = identity->capture_id;
            ctx.session_id = identity->session_id;
            CU_LOG_INFO_CTX(log_category::session, "Aborting upload session", ctx);

            if (auto cancelled = api_->cancel(identity->capture_id, identity->session_id);
                !cancelled) {
                ctx.http_status = cancelled.error().http_status;
                ctx.error_message = cancelled.error().message;
                CU_LOG_WARN_CTX(log_category::session,
                                "Backend cancel failed; local state cleared anyway", ctx);
            }
        }

        if (capture) {
            std::lock_guard persist_lock(persist_mutex_);
            if (auto cleared = state_store_.clear(*capture); !cleared) {
                CU_LOG_WARN(log_category::state,
                            "Failed to clear persisted state: " + cleared.error().message);
            }
        }

        notify_progress();
    }

    auto resume() -> result<bool> {
        {
            std::lock_guard lock(state_mutex_);
            if (identity_) {
                return status_ != upload_status::completed;
            }
            if (!capture_id_) {
                return unexpected{error{error_code::invalid_capture_id,
                                        "No capture is bound to the session"}};
            }

            load_attempted_ = false;
            if (auto loaded = ensure_loaded_locked(); !loaded) {
                return unexpected{loaded.error()};
            }
            if (!identity_) {
                return false;
            }
        }

        notify_progress();
        return true;
    }

    // ------------------------------------------------------------------------
    // Observation
    // ------------------------------------------------------------------------

    void set_progress_callback(progress_callback callback) {
        std::lock_guard lock(callback_mutex_);
        progress_callback_ = std::move(callback);
    }

    auto progress() const -> upload_progress {
        std::lock_guard lock(state_mutex_);
        upload_progress current;
        current.units_uploaded = parts_.size();
        current.units_total_estimate = parts_.size() + (accumulator_.empty() ? 0 : 1);
        current.bytes_uploaded = bytes_uploaded_;
        current.bytes_total_received = bytes_received_;
        current.status = status_;
        return current;
    }

    auto status() const -> upload_status {
        std::lock_guard lock(state_mutex_);
        return status_;
    }

    auto parts() const -> std::vector<custody::upload::upload_part> {
        std::lock_guard lock(state_mutex_);
        return parts_;
    }

    auto identity() const -> std::optional<session_identity> {
        std::lock_guard lock(state_mutex_);
        return identity_;
    }

    auto capture_id() const -> std::optional<std::string> {
        std::lock_guard lock(state_mutex_);
        return identity_ ? std::optional<std::string>(identity_->capture_id) : capture_id_;
    }

    auto next_part_number() const -> uint32_t {
        std::lock_guard lock(state_mutex_);
        return next_part_number_;
    }

    auto buffered_bytes() const -> std::size_t {
        std::lock_guard lock(state_mutex_);
        return accumulator_.buffered_bytes();
    }

    auto buffered_units() const -> std::size_t {
        std::lock_guard lock(state_mutex_);
        return accumulator_.unit_count();
    }

    auto is_in_progress() const -> bool {
        std::lock_guard lock(state_mutex_);
        return identity_.has_value() && status_ != upload_status::completed;
    }

private:
    // ------------------------------------------------------------------------
    // Flushing
    // ------------------------------------------------------------------------

    /**
     * Drains the buffer and claims a part number while holding the ticket,
     * then transfers after releasing it so the next flush can proceed.
     */
    auto flush_block(flush_serializer::ticket ticket, bool forced) -> result<void> {
        std::vector<pending_unit> units;
        session_identity identity;
        uint32_t part_number = 0;
        uint64_t generation = 0;
        {
            std::lock_guard lock(state_mutex_);
            if (!identity_) {
                return not_initiated_error();
            }
            if (accumulator_.empty() || (!forced && !accumulator_.threshold_reached())) {
                return {};
            }
            units = accumulator_.drain();
            part_number = next_part_number_++;
            identity = *identity_;
            generation = generation_;
            ++inflight_;
        }

        auto block = chunk_accumulator::assemble(std::move(units));
        ticket.release();

        if (!block) {
            {
                std::lock_guard lock(state_mutex_);
                --inflight_;
            }
            inflight_cv_.notify_all();
            CU_LOG_ERROR(log_category::serializer,
                         "Failed to assemble part " + std::to_string(part_number) + ": " +
                             block.error().message);
            return unexpected{block.error()};
        }

        upload_log_context ctx;
        ctx.capture_id = identity.capture_id;
        ctx.session_id = identity.session_id;
        ctx.part_number = part_number;
        ctx.bytes = block.value().data.size();
        CU_LOG_INFO_CTX(log_category::serializer,
                        "Flushing " + std::to_string(block.value().unit_count) +
                            " buffered units",
                        ctx);

        auto uploaded = uploader_.upload(identity, part_number, block.value().data,
                                         block.value().content_hash,
                                         block.value().previous_unit_hash);
        return settle_transfer(generation, part_number, std::move(block.value()), uploaded);
    }

    auto settle_transfer(uint64_t generation,
                         uint32_t part_number,
                         assembled_block block,
                         const result<upload_part_result>& uploaded) -> result<void> {
        bool current = false;
        {
            std::lock_guard lock(state_mutex_);
            --inflight_;
            current = generation == generation_;
            if (current) {
                if (uploaded) {
                    record_part_locked(
                        custody::upload::upload_part{part_number,
                                                     uploaded.value().confirmation_token});
                    bytes_uploaded_ += block.data.size();
                } else {
                    failed_blocks_.push_back(failed_block{part_number, std::move(block)});
                }
            }
        }
        inflight_cv_.notify_all();

        if (!current) {
            CU_LOG_INFO(log_category::session,
                        "Discarding part " + std::to_string(part_number) +
                            " finished after the session was reset");
            return {};
        }

        if (uploaded) {
            persist();
        }
        notify_progress();

        if (!uploaded) {
            return unexpected{uploaded.error()};
        }
        return {};
    }

    auto retry_failed_blocks(const session_identity& identity,
                             uint64_t generation,
                             std::vector<failed_block> blocks) -> result<void> {
        if (blocks.empty()) {
            return {};
        }

        std::optional<error> first_error;
        bool recorded = false;
        for (auto& pending : blocks) {
            CU_LOG_INFO(log_category::session,
                        "Retrying failed part " + std::to_string(pending.part_number));

            auto uploaded = uploader_.upload(identity, pending.part_number, pending.block.data,
                                             pending.block.content_hash,
                                             pending.block.previous_unit_hash);

            std::lock_guard lock(state_mutex_);
            if (generation != generation_) {
                return unexpected{error{error_code::invalid_state,
                                        "Session was aborted during completion"}};
            }
            if (uploaded) {
                record_part_locked(
                    custody::upload::upload_part{pending.part_number,
                                                 uploaded.value().confirmation_token});
                bytes_uploaded_ += pending.block.data.size();
                recorded = true;
            } else {
                if (!first_error) {
                    first_error = uploaded.error();
                }
                failed_blocks_.push_back(std::move(pending));
            }
        }

        if (recorded) {
            persist();
        }
        if (first_error) {
            return unexpected{std::move(*first_error)};
        }
        return {};
    }

    auto fail_completion(uint64_t generation, error err) -> unexpected {
        {
            std::lock_guard lock(state_mutex_);
            if (generation == generation_) {
                status_ = upload_status::failed;
            }
        }
        upload_log_context ctx;
        ctx.http_status = err.http_status;
        ctx.error_message = err.message;
        ctx.status = to_string(upload_status::failed);
        CU_LOG_ERROR_CTX(log_category::session, "Upload completion failed", ctx);
        notify_progress();
        return unexpected{std::move(err)};
    }

    // ------------------------------------------------------------------------
    // State helpers (state_mutex_ held)
    // ------------------------------------------------------------------------

    void record_part_locked(const custody::upload::upload_part& part) {
        auto existing = std::find_if(parts_.begin(), parts_.end(),
                                     [&](const custody::upload::upload_part& recorded) {
                                         return recorded.part_number == part.part_number;
                                     });
        if (existing != parts_.end()) {
            CU_LOG_WARN(log_category::session,
                        "Part " + std::to_string(part.part_number) +
                            " already recorded; keeping the first confirmation");
            return;
        }
        parts_.push_back(part);
        next_part_number_ = std::max(next_part_number_, part.part_number + 1);
    }

    auto part_claimed_locked(uint32_t part_number) const -> bool {
        auto recorded = std::any_of(parts_.begin(), parts_.end(),
                                    [&](const custody::upload::upload_part& part) {
                                        return part.part_number == part_number;
                                    });
        auto pending = std::any_of(failed_blocks_.begin(), failed_blocks_.end(),
                                   [&](const failed_block& failed) {
                                       return failed.part_number == part_number;
                                   });
        return recorded || pending;
    }

    void reset_locked() {
        identity_.reset();
        parts_.clear();
        failed_blocks_.clear();
        accumulator_.clear();
        next_part_number_ = 1;
        bytes_uploaded_ = 0;
        bytes_received_ = 0;
        status_ = upload_status::idle;
        load_attempted_ = true;
    }

    /**
     * Loads the persisted snapshot of the bound capture once, when no
     * session is resident in memory.
     */
    auto ensure_loaded_locked() -> result<void> {
        if (identity_ || load_attempted_ || !capture_id_) {
            return {};
        }

        auto loaded = state_store_.load(*capture_id_);
        if (!loaded) {
            return unexpected{loaded.error()};
        }
        load_attempted_ = true;
        if (!loaded.value()) {
            return {};
        }

        const auto& snapshot = *loaded.value();
        identity_ = session_identity{snapshot.session_id, snapshot.capture_id,
                                     snapshot.object_key};
        parts_ = snapshot.parts;
        next_part_number_ = snapshot.next_part_number;
        for (const auto& part : parts_) {
            next_part_number_ = std::max(next_part_number_, part.part_number + 1);
        }
        status_ = upload_status::uploading;

        auto ctx = context_locked();
        ctx.part_number = next_part_number_;
        CU_LOG_INFO_CTX(log_category::state,
                        "Resumed session with " + std::to_string(parts_.size()) + " parts",
                        ctx);
        return {};
    }

    auto snapshot_locked() const -> session_snapshot {
        session_snapshot snapshot;
        snapshot.session_id = identity_->session_id;
        snapshot.object_key = identity_->object_key;
        snapshot.capture_id = identity_->capture_id;
        snapshot.parts = parts_;
        snapshot.next_part_number = next_part_number_;
        return snapshot;
    }

    auto context_locked() const -> upload_log_context {
        upload_log_context ctx;
        if (identity_) {
            ctx.capture_id = identity_->capture_id;
            ctx.session_id = identity_->session_id;
        } else if (capture_id_) {
            ctx.capture_id = *capture_id_;
        }
        ctx.status = to_string(status_);
        return ctx;
    }

    // ------------------------------------------------------------------------
    // Persistence and notification (no lock held)
    // ------------------------------------------------------------------------

    /**
     * The snapshot is taken under persist_mutex_ so a later save never
     * carries older state than an earlier one.
     */
    void persist() {
        std::lock_guard persist_lock(persist_mutex_);
        std::optional<session_snapshot> snapshot;
        {
            std::lock_guard lock(state_mutex_);
            if (identity_ && status_ != upload_status::completed) {
                snapshot = snapshot_locked();
            }
        }
        if (!snapshot) {
            return;
        }
        if (auto saved = state_store_.save(*snapshot); !saved) {
            CU_LOG_WARN(log_category::state,
                        "Failed to persist session state: " + saved.error().message);
        }
    }

    void notify_progress() {
        progress_callback callback;
        {
            std::lock_guard lock(callback_mutex_);
            callback = progress_callback_;
        }
        if (callback) {
            callback(progress());
        }
    }

    std::shared_ptr<upload_api> api_;
    part_uploader uploader_;
    session_state_store state_store_;
    flush_serializer serializer_;

    // Lock order: persist_mutex_ before state_mutex_
    mutable std::mutex state_mutex_;
    std::mutex persist_mutex_;
    std::condition_variable inflight_cv_;

    chunk_accumulator accumulator_;
    std::optional<std::string> capture_id_;
    std::optional<session_identity> identity_;
    std::vector<custody::upload::upload_part> parts_;
    std::vector<failed_block> failed_blocks_;
    uint32_t next_part_number_ = 1;
    uint64_t bytes_uploaded_ = 0;
    uint64_t bytes_received_ = 0;
    upload_status status_ = upload_status::idle;
    uint64_t generation_ = 0;
    std::size_t inflight_ = 0;
    bool load_attempted_ = false;

    std::mutex callback_mutex_;
    progress_callback progress_callback_;
};

// ============================================================================
// upload_session::builder
// ============================================================================

upload_session::builder::builder() = default;

auto upload_session::builder::with_api(std::shared_ptr<upload_api> api) -> builder& {
    api_ = std::move(api);
    return *this;
}

auto upload_session::builder::with_transport(std::shared_ptr<part_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto upload_session::builder::with_key_value_store(std::shared_ptr<key_value_store> store)
    -> builder& {
    store_ = std::move(store);
    return *this;
}

auto upload_session::builder::with_config(upload_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto upload_session::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto upload_session::builder::with_part_size_threshold(std::size_t bytes) -> builder& {
    config_.part_size_threshold = bytes;
    return *this;
}

auto upload_session::builder::with_content_type(std::string content_type) -> builder& {
    config_.transfer.content_type = std::move(content_type);
    return *this;
}

auto upload_session::builder::with_state_key_prefix(std::string prefix) -> builder& {
    config_.state_key_prefix = std::move(prefix);
    return *this;
}

auto upload_session::builder::for_capture(std::string capture_id) -> builder& {
    capture_id_ = std::move(capture_id);
    return *this;
}

auto upload_session::builder::with_sleep_function(retry_executor::sleep_function sleeper)
    -> builder& {
    sleeper_ = std::move(sleeper);
    return *this;
}

auto upload_session::builder::build() -> result<upload_session> {
    if (!api_) {
        return unexpected{error{error_code::config_invalid, "An upload api is required"}};
    }
    if (!transport_) {
        return unexpected{error{error_code::config_invalid, "A part transport is required"}};
    }
    if (config_.part_size_threshold < min_part_size ||
        config_.part_size_threshold > max_part_size) {
        return unexpected{error{error_code::config_invalid,
                                "Part size threshold must be between 5MB and 5GB"}};
    }
    if (!config_.retry.is_valid()) {
        return unexpected{error{error_code::config_invalid, "Retry policy is invalid"}};
    }
    if (config_.transfer.content_type.empty() || config_.transfer.checksum_header.empty() ||
        config_.transfer.confirmation_header.empty()) {
        return unexpected{error{error_code::config_invalid,
                                "Part transfer headers must not be empty"}};
    }
    if (capture_id_ && capture_id_->empty()) {
        return unexpected{error{error_code::invalid_capture_id,
                                "Capture id must not be empty"}};
    }
    if (!store_) {
        store_ = std::make_shared<memory_key_value_store>();
    }

    return upload_session{std::make_unique<impl>(std::move(config_), std::move(api_),
                                                 std::move(transport_), std::move(store_),
                                                 std::move(capture_id_), std::move(sleeper_))};
}

// ============================================================================
// upload_session
// ============================================================================

upload_session::upload_session(std::unique_ptr<impl> state) : impl_(std::move(state)) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

upload_session::upload_session(upload_session&&) noexcept = default;
auto upload_session::operator=(upload_session&&) noexcept -> upload_session& = default;
upload_session::~upload_session() = default;

auto upload_session::initiate(const std::string& capture_id, const std::string& storage_class)
    -> result<session_identity> {
    return impl_->initiate(capture_id, storage_class);
}

auto upload_session::initiate(const std::string& capture_id) -> result<session_identity> {
    return impl_->initiate(capture_id, impl_->config.default_storage_class);
}

auto upload_session::add_unit(std::span<const std::byte> data,
                              std::string content_hash,
                              std::optional<std::string> previous_unit_hash) -> result<void> {
    return impl_->add_unit(data, std::move(content_hash), std::move(previous_unit_hash));
}

auto upload_session::flush() -> result<void> {
    return impl_->flush();
}

auto upload_session::upload_part(std::span<const std::byte> data,
                                 uint32_t part_number,
                                 const std::string& content_hash,
                                 const std::optional<std::string>& previous_unit_hash)
    -> result<upload_part_result> {
    return impl_->upload_part(data, part_number, content_hash, previous_unit_hash);
}

auto upload_session::complete(std::optional<preview_metadata> preview)
    -> result<completion_result> {
    return impl_->complete(std::move(preview));
}

void upload_session::abort() {
    impl_->abort();
}

auto upload_session::resume() -> result<bool> {
    return impl_->resume();
}

void upload_session::on_progress(progress_callback callback) {
    impl_->set_progress_callback(std::move(callback));
}

auto upload_session::progress() const -> upload_progress {
    return impl_->progress();
}

auto upload_session::status() const -> upload_status {
    return impl_->status();
}

auto upload_session::parts() const -> std::vector<custody::upload::upload_part> {
    return impl_->parts();
}

auto upload_session::identity() const -> std::optional<session_identity> {
    return impl_->identity();
}

auto upload_session::session_id() const -> std::optional<std::string> {
    auto current = impl_->identity();
    if (!current) return std::nullopt;
    return current->session_id;
}

auto upload_session::object_key() const -> std::optional<std::string> {
    auto current = impl_->identity();
    if (!current) return std::nullopt;
    return current->object_key;
}

auto upload_session::capture_id() const -> std::optional<std::string> {
    return impl_->capture_id();
}

auto upload_session::next_part_number() const -> uint32_t {
    return impl_->next_part_number();
}

auto upload_session::buffered_bytes() const -> std::size_t {
    return impl_->buffered_bytes();
}

auto upload_session::buffered_units() const -> std::size_t {
    return impl_->buffered_units();
}

auto upload_session::is_in_progress() const -> bool {
    return impl_->is_in_progress();
}

auto upload_session::config() const -> const upload_config& {
    return impl_->config;
}

}  // namespace custody::upload

/**
 * @file flush_serializer.h
 * @brief FIFO mutual exclusion for buffer flushes
 */

#ifndef CUSTODY_UPLOAD_SESSION_FLUSH_SERIALIZER_H
#define CUSTODY_UPLOAD_SESSION_FLUSH_SERIALIZER_H

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace custody::upload {

/**
 * @brief Serializes flushes in arrival order
 *
 * Built from a chain of completion signals: each acquirer installs its own
 * signal as the new tail and waits on the previous tail. A ticket fulfils
 * its signal when released or destroyed, so a flush that fails or throws
 * still lets the next one run.
 *
 * @code
 * auto ticket = serializer.acquire();
 * // drain, assemble, claim part number
 * ticket.release();
 * @endcode
 */
class flush_serializer {
public:
    /**
     * @brief Ownership of the serializer; releases on destruction
     */
    class ticket {
    public:
        ticket(ticket&& other) noexcept;
        auto operator=(ticket&& other) noexcept -> ticket&;
        ~ticket();

        ticket(const ticket&) = delete;
        auto operator=(const ticket&) -> ticket& = delete;

        /**
         * @brief Signal completion; later calls are no-ops
         */
        void release();

        [[nodiscard]] auto owns() const -> bool { return owner_ != nullptr; }

    private:
        friend class flush_serializer;

        ticket(flush_serializer* owner, std::shared_ptr<std::promise<void>> done);

        flush_serializer* owner_;
        std::shared_ptr<std::promise<void>> done_;
    };

    flush_serializer() = default;

    flush_serializer(const flush_serializer&) = delete;
    auto operator=(const flush_serializer&) -> flush_serializer& = delete;

    /**
     * @brief Wait for every earlier ticket, then own the serializer
     */
    [[nodiscard]] auto acquire() -> ticket;

    /**
     * @brief Own the serializer only if no ticket is outstanding
     */
    [[nodiscard]] auto try_acquire() -> std::optional<ticket>;

    /**
     * @brief Check whether a ticket is held or queued
     */
    [[nodiscard]] auto busy() const -> bool;

    /**
     * @brief Number of tickets held or queued
     */
    [[nodiscard]] auto pending() const -> std::size_t;

private:
    void on_release();

    mutable std::mutex mutex_;
    std::shared_future<void> tail_;
    std::size_t outstanding_ = 0;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_SESSION_FLUSH_SERIALIZER_H

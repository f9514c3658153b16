/**
 * @file flush_serializer.cpp
 * @brief Implementation of the FIFO flush serializer
 */

#include <custody/upload/session/flush_serializer.h>

#include <custody/upload/core/logging.h>

#include <utility>

namespace custody::upload {

// ============================================================================
// ticket
// ============================================================================

flush_serializer::ticket::ticket(flush_serializer* owner,
                                 std::shared_ptr<std::promise<void>> done)
    : owner_(owner), done_(std::move(done)) {}

flush_serializer::ticket::ticket(ticket&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)), done_(std::move(other.done_)) {}

auto flush_serializer::ticket::operator=(ticket&& other) noexcept -> ticket& {
    if (this != &other) {
        release();
        owner_ = std::exchange(other.owner_, nullptr);
        done_ = std::move(other.done_);
    }
    return *this;
}

flush_serializer::ticket::~ticket() {
    release();
}

void flush_serializer::ticket::release() {
    if (!owner_) {
        return;
    }
    auto* owner = std::exchange(owner_, nullptr);
    owner->on_release();
    done_->set_value();
    done_.reset();
}

// ============================================================================
// flush_serializer
// ============================================================================

auto flush_serializer::acquire() -> ticket {
    auto done = std::make_shared<std::promise<void>>();
    std::shared_future<void> previous;
    std::size_t waiting = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = tail_;
        tail_ = done->get_future().share();
        waiting = outstanding_++;
    }

    if (previous.valid()) {
        if (waiting > 0) {
            CU_LOG_TRACE(log_category::serializer,
                         "Flush queued behind " + std::to_string(waiting) + " request(s)");
        }
        previous.wait();
    }
    return ticket(this, std::move(done));
}

auto flush_serializer::try_acquire() -> std::optional<ticket> {
    auto done = std::make_shared<std::promise<void>>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outstanding_ > 0) {
            return std::nullopt;
        }
        tail_ = done->get_future().share();
        ++outstanding_;
    }
    return ticket(this, std::move(done));
}

auto flush_serializer::busy() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_ > 0;
}

auto flush_serializer::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

void flush_serializer::on_release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outstanding_ > 0) {
        --outstanding_;
    }
}

}  // namespace custody::upload

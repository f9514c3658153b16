/**
 * @file test_error_scenarios.cpp
 * @brief Failure handling across the upload session
 */

#include "test_fixtures.h"

namespace custody::upload::test {

using namespace std::chrono_literals;

class ErrorScenariosTest : public UploadSessionFixture {};

// =============================================================================
// Transfer Retry
// =============================================================================

TEST_F(ErrorScenariosTest, TransientFailuresRecovered) {
    transport_->enqueue(503);
    transport_->enqueue(503);
    auto session = make_session();
    ASSERT_TRUE(session.initiate("cap-1").has_value());

    auto bytes = make_bytes(1024);
    auto uploaded = session.upload_part(bytes, 1, checksum::sha256(bytes), std::nullopt);
    ASSERT_TRUE(uploaded.has_value()) << uploaded.error().message;
    EXPECT_EQ(uploaded.value().attempts, 3u);
    EXPECT_EQ(transport_->call_count(), 3u);
    // Negotiation happens once per part, not per attempt
    EXPECT_EQ(api_->negotiate_count(), 1u);
    EXPECT_EQ(sleeps_.size(), 2u);
}

TEST_F(ErrorScenariosTest, ClientErrorNotRetried) {
    transport_->enqueue(404);
    auto session = make_session();
    ASSERT_TRUE(session.initiate("cap-1").has_value());

    auto bytes = make_bytes(1024);
    auto uploaded = session.upload_part(bytes, 1, checksum::sha256(bytes), std::nullopt);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().attempts, 1u);
    EXPECT_EQ(uploaded.error().http_status, 404);
    EXPECT_FALSE(uploaded.error().recoverable);
    EXPECT_EQ(transport_->call_count(), 1u);
    EXPECT_TRUE(session.parts().empty());
}

TEST_F(ErrorScenariosTest, ConnectionDropsRetried) {
    transport_->enqueue(std::nullopt);
    transport_->enqueue(429);
    auto session = make_session();
    ASSERT_TRUE(session.initiate("cap-1").has_value());
    ASSERT_TRUE(add(session, 512, 1).has_value());

    ASSERT_TRUE(session.flush().has_value());
    EXPECT_EQ(transport_->call_count(), 3u);
    EXPECT_EQ(session.parts().size(), 1u);
}

TEST_F(ErrorScenariosTest, NegotiationRejectionFailsPart) {
    api_->negotiate_errors[1] = error{error_code::negotiation_failure, "expired", 401};
    auto session = make_session();
    ASSERT_TRUE(session.initiate("cap-1").has_value());
    ASSERT_TRUE(add(session, 512, 1).has_value());

    auto flushed = session.flush();
    ASSERT_FALSE(flushed.has_value());
    EXPECT_EQ(flushed.error().code, error_code::negotiation_failure);
    EXPECT_EQ(transport_->call_count(), 0u);
}

// =============================================================================
// Failed Blocks
// =============================================================================

TEST_F(ErrorScenariosTest, FailedBlockRetriedByComplete) {
    for (int i = 0; i < 3; ++i) {
        transport_->enqueue(500);
    }
    auto session = make_session();
    ASSERT_TRUE(session.initiate("cap-1").has_value());
    ASSERT_TRUE(add(session, 512, 1).has_value());

    auto flushed = session.flush();
    ASSERT_FALSE(flushed.has_value());
    EXPECT_EQ(flushed.error().code, error_code::retries_exhausted);
    EXPECT_TRUE(session.parts().empty());

    // The next block takes the next number
    ASSERT_TRUE(add(session, 512, 2).has_value());
    ASSERT_TRUE(session.flush().has_value());
    EXPECT_EQ(session.parts(), (std::vector<upload_part>{{2, "etag-2"}}));

    auto completed = session.complete();
    ASSERT_TRUE(completed.has_value()) << completed.error().message;
    EXPECT_EQ(completed.value().total_parts, 2u);
    EXPECT_EQ(api_->complete_calls[0].parts,
              (std::vector<upload_part>{{1, "etag-1"}, {2, "etag-2"}}));
}

TEST_F(ErrorScenariosTest, FailedBlockStillFailingBlocksCompletion) {
    api_->negotiate_errors[1] = error{error_code::negotiation_failure, "denied", 403};
    auto session = make_session();
    ASSERT_TRUE(session.initiate("cap-1").has_value());
    ASSERT_TRUE(add(session, 512, 1).has_value());
    EXPECT_FALSE(session.flush().has_value());

    auto completed = session.complete();
    ASSERT_FALSE(completed.has_value());
    EXPECT_EQ(completed.error().code, error_code::negotiation_failure);
    EXPECT_EQ(session.status(), upload_status::failed);
    EXPECT_TRUE(api_->complete_calls.empty());

    // Once the backend recovers, completion succeeds
    api_->negotiate_errors.clear();
    auto retried = session.complete();
    ASSERT_TRUE(retried.has_value()) << retried.error().message;
    EXPECT_EQ(retried.value().total_parts, 1u);
}

TEST_F(ErrorScenariosTest, FailedFinalFlushRetriedWithinComplete) {
    auto session = make_session();
    ASSERT_TRUE(session.initiate("cap-1").has_value());
    ASSERT_TRUE(add(session, 512, 1).has_value());
    transport_->enqueue(503);
    transport_->enqueue(503);
    transport_->enqueue(503);

    auto completed = session.complete();
    ASSERT_TRUE(completed.has_value()) << completed.error().message;
    EXPECT_EQ(completed.value().total_parts, 1u);
    EXPECT_EQ(transport_->call_count(), 4u);
}

TEST_F(ErrorScenariosTest, GapInPartsBlocksCompletion) {
    auto session = make_session();
    ASSERT_TRUE(session.initiate("cap-1").has_value());

    auto bytes = make_bytes(64);
    ASSERT_TRUE(session.upload_part(bytes, 1, checksum::sha256(bytes), std::nullopt).has_value());
    ASSERT_TRUE(session.upload_part(bytes, 3, checksum::sha256(bytes), std::nullopt).has_value());

    auto completed = session.complete();
    ASSERT_FALSE(completed.has_value());
    EXPECT_EQ(completed.error().code, error_code::incomplete_parts);
    EXPECT_NE(completed.error().message.find("Missing parts: 2"), std::string::npos);

    // Filling the gap allows completion
    ASSERT_TRUE(session.upload_part(bytes, 2, checksum::sha256(bytes), std::nullopt).has_value());
    ASSERT_TRUE(session.complete().has_value());
}

// =============================================================================
// Abort and State Failures
// =============================================================================

TEST_F(ErrorScenariosTest, AbortClearsStateWhenCancelFails) {
    api_->cancel_error = error{error_code::cancel_failure, "backend down", 500};
    auto session = make_session();
    ASSERT_TRUE(session.initiate("cap-1").has_value());
    ASSERT_TRUE(add(session, 512, 1).has_value());
    ASSERT_TRUE(session.flush().has_value());
    ASSERT_TRUE(persisted("cap-1").has_value());

    session.abort();

    EXPECT_EQ(api_->cancel_calls.size(), 1u);
    EXPECT_FALSE(persisted("cap-1").has_value());
    EXPECT_FALSE(session.identity().has_value());
    EXPECT_EQ(session.status(), upload_status::idle);
}

TEST_F(ErrorScenariosTest, CorruptedSnapshotReported) {
    ASSERT_TRUE(store_->set("upload_state_cap-1", "{\"uploadId\":").has_value());

    auto built = make_builder().for_capture("cap-1").build();
    ASSERT_TRUE(built.has_value());
    auto& session = built.value();

    auto resumed = session.resume();
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, error_code::state_corrupted);

    auto added = add(session, 64, 1);
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, error_code::state_corrupted);

    // Abort discards the unreadable snapshot
    session.abort();
    EXPECT_FALSE(persisted("cap-1").has_value());
    EXPECT_TRUE(api_->cancel_calls.empty());
}

TEST_F(ErrorScenariosTest, StartAfterFailedStartSucceeds) {
    api_->start_error = error{error_code::network_error, "timeout"};
    auto session = make_session();

    auto first = session.initiate("cap-1");
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, error_code::session_start_failed);
    EXPECT_TRUE(first.error().recoverable);

    api_->start_error.reset();
    auto second = session.initiate("cap-1");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(session.status(), upload_status::uploading);
}

TEST_F(ErrorScenariosTest, PersistenceFailureDoesNotFailUpload) {
    class read_only_store : public key_value_store {
    public:
        auto get(const std::string&) -> result<std::optional<std::string>> override {
            return std::optional<std::string>{};
        }
        auto set(const std::string&, const std::string&) -> result<void> override {
            return unexpected{error{error_code::state_store_failure, "read-only"}};
        }
        auto remove(const std::string&) -> result<void> override { return {}; }
    };

    auto built = make_builder().with_key_value_store(std::make_shared<read_only_store>()).build();
    ASSERT_TRUE(built.has_value());
    auto& session = built.value();

    ASSERT_TRUE(session.initiate("cap-1").has_value());
    ASSERT_TRUE(add(session, 512, 1).has_value());
    ASSERT_TRUE(session.flush().has_value());
    ASSERT_TRUE(session.complete().has_value());
}

}  // namespace custody::upload::test

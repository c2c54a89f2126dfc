// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file test_sign_queue.cc
 * @brief Unit tests for SignRequestQueue
 *
 * Covers request lifecycle transitions, completion delivery, timeouts and
 * the retention window for finished requests.
 */

#include <gtest/gtest.h>
#include "../src/core/signing/SignRequestQueue.h"
#include "../src/utils/Clock.h"
#include <chrono>
#include <future>

using namespace CertenVault;
using namespace std::chrono_literals;

// ============================================================================
// Test Fixture
// ============================================================================

class SignRequestQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        queue = std::make_unique<SignRequestQueue>(clock);
    }

    static SignRequestData account_hash(std::string hash = "0xabcd") {
        return AccountHash{std::move(hash), std::nullopt};
    }

    static SignedPayload payload() {
        return SignedPayload{"deadbeef", "0011", "key-1", std::nullopt};
    }

    ManualClock clock;
    std::unique_ptr<SignRequestQueue> queue;
};

// ============================================================================
// Enqueue Tests
// ============================================================================

TEST_F(SignRequestQueueTest, AddAssignsIdAndPendingStatus) {
    const auto id = queue->add(account_hash(), "https://app.example");
    EXPECT_FALSE(id.empty());

    auto request = queue->get(id);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->status, SignRequestStatus::Pending);
    EXPECT_EQ(request->origin, "https://app.example");
    EXPECT_EQ(request->method, RpcMethod::SIGN_HASH);
    EXPECT_EQ(request->timestamp, clock.now_ms());
    EXPECT_FALSE(request->finished_at.has_value());
    EXPECT_EQ(queue->pending_count(), 1u);
}

TEST_F(SignRequestQueueTest, MethodFollowsRequestKind) {
    const auto eth = queue->add(EthereumHash{"0x01", "0xabc"}, "o");
    const auto personal = queue->add(PersonalMessage{"hello", "0xabc"}, "o");
    const auto intent = queue->add(CrossChainIntent{"0a", "acc://a.acme", "transfer", "d", {}, {}, {}}, "o");

    EXPECT_EQ(queue->get(eth)->method, RpcMethod::ETH_SIGN_HASH);
    EXPECT_EQ(queue->get(personal)->method, RpcMethod::PERSONAL_SIGN);
    EXPECT_EQ(queue->get(intent)->method, RpcMethod::SIGN_INTENT);
}

TEST_F(SignRequestQueueTest, IdsAreUnique) {
    const auto a = queue->add(account_hash(), "o");
    const auto b = queue->add(account_hash(), "o");
    EXPECT_NE(a, b);
}

TEST_F(SignRequestQueueTest, RequestAddedSignalCarriesRequest) {
    std::string seen_id;
    queue->signal_request_added().connect([&](const SignRequest& request) {
        seen_id = request.id;
    });

    const auto id = queue->add(account_hash(), "o");
    EXPECT_EQ(seen_id, id);
}

TEST_F(SignRequestQueueTest, GetNextReturnsOldestPending) {
    const auto first = queue->add(account_hash("0x01"), "o");
    clock.advance(10ms);
    const auto second = queue->add(account_hash("0x02"), "o");

    auto next = queue->get_next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->id, first);

    ASSERT_TRUE(queue->reject(first, "no").has_value());
    next = queue->get_next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->id, second);
}

TEST_F(SignRequestQueueTest, CompletingMiddleRequestKeepsOrder) {
    const auto first = queue->add(account_hash("0x01"), "o");
    clock.advance(1ms);
    const auto second = queue->add(account_hash("0x02"), "o");
    clock.advance(1ms);
    const auto third = queue->add(account_hash("0x03"), "o");

    ASSERT_TRUE(queue->complete(second, payload()).has_value());

    auto next = queue->get_next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->id, first);

    const auto pending = queue->get_pending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].id, first);
    EXPECT_EQ(pending[1].id, third);
}

TEST_F(SignRequestQueueTest, GetNextOnEmptyQueue) {
    EXPECT_FALSE(queue->get_next().has_value());
    EXPECT_TRUE(queue->get_pending().empty());
    EXPECT_FALSE(queue->get("missing").has_value());
}

// ============================================================================
// Transition Tests
// ============================================================================

TEST_F(SignRequestQueueTest, CompleteFulfillsSubmission) {
    auto submission = queue->submit(account_hash(), "o");
    EXPECT_EQ(submission.outcome.wait_for(0ms), std::future_status::timeout);

    ASSERT_TRUE(queue->complete(submission.id, payload()).has_value());

    ASSERT_EQ(submission.outcome.wait_for(0ms), std::future_status::ready);
    auto outcome = submission.outcome.get();
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.status, SignRequestStatus::Completed);
    EXPECT_EQ(*outcome.result, payload());

    auto request = queue->get(submission.id);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->status, SignRequestStatus::Completed);
    EXPECT_EQ(request->finished_at, clock.now_ms());
    EXPECT_EQ(queue->pending_count(), 0u);
}

TEST_F(SignRequestQueueTest, RejectDeliversReason) {
    auto submission = queue->submit(account_hash(), "o");
    ASSERT_TRUE(queue->reject(submission.id, "User rejected the request").has_value());

    auto outcome = submission.outcome.get();
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.status, SignRequestStatus::Rejected);
    EXPECT_EQ(outcome.error, VaultError::UserRejected);
    EXPECT_EQ(outcome.message, "User rejected the request");
}

TEST_F(SignRequestQueueTest, ErrorDeliversCode) {
    auto submission = queue->submit(account_hash(), "o");
    ASSERT_TRUE(queue->error(submission.id, "vault locked", VaultError::VaultLocked).has_value());

    auto outcome = submission.outcome.get();
    EXPECT_EQ(outcome.status, SignRequestStatus::Error);
    EXPECT_EQ(outcome.error, VaultError::VaultLocked);
    EXPECT_EQ(outcome.message, "vault locked");
}

TEST_F(SignRequestQueueTest, ErrorDefaultsToSigningFailed) {
    auto submission = queue->submit(account_hash(), "o");
    ASSERT_TRUE(queue->error(submission.id, "boom").has_value());
    EXPECT_EQ(submission.outcome.get().error, VaultError::SigningFailed);
}

TEST_F(SignRequestQueueTest, SecondTransitionIsRefused) {
    auto submission = queue->submit(account_hash(), "o");
    ASSERT_TRUE(queue->complete(submission.id, payload()).has_value());

    auto again = queue->complete(submission.id, payload());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), VaultError::RequestNotPending);

    auto reject = queue->reject(submission.id, "late");
    ASSERT_FALSE(reject.has_value());
    EXPECT_EQ(reject.error(), VaultError::RequestNotPending);

    EXPECT_EQ(queue->get(submission.id)->status, SignRequestStatus::Completed);
}

TEST_F(SignRequestQueueTest, UnknownIdIsNotFound) {
    auto complete = queue->complete("missing", payload());
    ASSERT_FALSE(complete.has_value());
    EXPECT_EQ(complete.error(), VaultError::RequestNotFound);

    auto status = queue->update_status("missing", SignRequestStatus::Approved);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error(), VaultError::RequestNotFound);

    auto callback = queue->on_complete("missing", [](const SignOutcome&) {});
    ASSERT_FALSE(callback.has_value());
    EXPECT_EQ(callback.error(), VaultError::RequestNotFound);
}

TEST_F(SignRequestQueueTest, OnCompleteFiresOnce) {
    const auto id = queue->add(account_hash(), "o");
    int calls = 0;
    SignRequestStatus seen = SignRequestStatus::Pending;
    ASSERT_TRUE(queue->on_complete(id, [&](const SignOutcome& outcome) {
        ++calls;
        seen = outcome.status;
    }).has_value());

    ASSERT_TRUE(queue->reject(id, "no").has_value());
    EXPECT_FALSE(queue->reject(id, "no").has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen, SignRequestStatus::Rejected);
}

TEST_F(SignRequestQueueTest, OnCompleteAfterFinishIsRefused) {
    const auto id = queue->add(account_hash(), "o");
    ASSERT_TRUE(queue->complete(id, payload()).has_value());

    auto result = queue->on_complete(id, [](const SignOutcome&) {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::RequestNotPending);
}

TEST_F(SignRequestQueueTest, UpdateStatusAllowsApprovedOnly) {
    const auto id = queue->add(account_hash(), "o");

    ASSERT_TRUE(queue->update_status(id, SignRequestStatus::Approved).has_value());
    EXPECT_EQ(queue->get(id)->status, SignRequestStatus::Approved);
    EXPECT_EQ(queue->pending_count(), 0u);

    auto terminal = queue->update_status(id, SignRequestStatus::Completed);
    ASSERT_FALSE(terminal.has_value());
    EXPECT_EQ(terminal.error(), VaultError::InvalidData);

    // Approved requests can still be completed
    EXPECT_TRUE(queue->complete(id, payload()).has_value());
}

// ============================================================================
// Sweep Tests
// ============================================================================

TEST_F(SignRequestQueueTest, CleanupTimesOutStaleRequests) {
    auto stale = queue->submit(account_hash("0x01"), "o");
    clock.advance(SignRequestQueue::DEFAULT_TIMEOUT);
    auto fresh = queue->submit(account_hash("0x02"), "o");

    // Exactly at the timeout nothing expires
    EXPECT_EQ(queue->cleanup(SignRequestQueue::DEFAULT_TIMEOUT), 0u);

    clock.advance(1ms);
    EXPECT_EQ(queue->cleanup(SignRequestQueue::DEFAULT_TIMEOUT), 1u);

    auto outcome = stale.outcome.get();
    EXPECT_EQ(outcome.status, SignRequestStatus::Rejected);
    EXPECT_EQ(outcome.error, VaultError::Timeout);
    EXPECT_EQ(outcome.message, SignRequestQueue::TIMEOUT_REASON);

    EXPECT_EQ(fresh.outcome.wait_for(0ms), std::future_status::timeout);
    EXPECT_EQ(queue->pending_count(), 1u);
}

TEST_F(SignRequestQueueTest, FinishedRequestsSurviveGracePeriod) {
    const auto id = queue->add(account_hash(), "o");
    ASSERT_TRUE(queue->complete(id, payload()).has_value());

    clock.advance(4999ms);
    EXPECT_TRUE(queue->get(id).has_value());

    clock.advance(1ms);
    EXPECT_FALSE(queue->get(id).has_value());
}

TEST_F(SignRequestQueueTest, GracePeriodIsConfigurable) {
    queue->set_grace_period(0ms);
    const auto id = queue->add(account_hash(), "o");
    ASSERT_TRUE(queue->reject(id, "no").has_value());
    EXPECT_FALSE(queue->get(id).has_value());
}

TEST_F(SignRequestQueueTest, CleanupDropsOldFinishedRequests) {
    queue->set_grace_period(std::chrono::hours(1));
    const auto id = queue->add(account_hash(), "o");
    ASSERT_TRUE(queue->complete(id, payload()).has_value());

    clock.advance(SignRequestQueue::DEFAULT_TIMEOUT + 1ms);
    EXPECT_EQ(queue->cleanup(SignRequestQueue::DEFAULT_TIMEOUT), 0u);
    EXPECT_FALSE(queue->get(id).has_value());
}

TEST_F(SignRequestQueueTest, ClearRejectsOpenRequests) {
    auto pending = queue->submit(account_hash("0x01"), "o");
    auto approved = queue->submit(account_hash("0x02"), "o");
    ASSERT_TRUE(queue->update_status(approved.id, SignRequestStatus::Approved).has_value());

    queue->clear();

    for (auto* submission : {&pending, &approved}) {
        auto outcome = submission->outcome.get();
        EXPECT_EQ(outcome.status, SignRequestStatus::Rejected);
        EXPECT_EQ(outcome.message, SignRequestQueue::CLEARED_REASON);
    }
    EXPECT_EQ(queue->pending_count(), 0u);
    EXPECT_FALSE(queue->get(pending.id).has_value());
}

TEST_F(SignRequestQueueTest, RemoveRejectsOpenRequest) {
    const auto id = queue->add(account_hash(), "o");
    int calls = 0;
    SignOutcome seen;
    ASSERT_TRUE(queue->on_complete(id, [&](const SignOutcome& outcome) {
        ++calls;
        seen = outcome;
    }).has_value());

    queue->remove(id);
    EXPECT_FALSE(queue->get(id).has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen.status, SignRequestStatus::Rejected);
    EXPECT_EQ(seen.error, VaultError::UserRejected);
    EXPECT_EQ(seen.message, SignRequestQueue::REMOVED_REASON);

    // Removing again is harmless
    queue->remove(id);
    EXPECT_EQ(calls, 1);
}

TEST_F(SignRequestQueueTest, RemoveResolvesSubmitFuture) {
    auto submission = queue->submit(account_hash(), "o");

    queue->remove(submission.id);

    ASSERT_EQ(submission.outcome.wait_for(0s), std::future_status::ready);
    auto outcome = submission.outcome.get();
    EXPECT_EQ(outcome.status, SignRequestStatus::Rejected);
    EXPECT_EQ(outcome.message, SignRequestQueue::REMOVED_REASON);
    EXPECT_EQ(queue->pending_count(), 0u);
}

TEST_F(SignRequestQueueTest, RemoveFinishedRequestDoesNotNotifyAgain) {
    const auto id = queue->add(account_hash(), "o");
    int calls = 0;
    ASSERT_TRUE(queue->on_complete(id, [&](const SignOutcome&) { ++calls; }).has_value());
    ASSERT_TRUE(queue->complete(id, payload()).has_value());
    EXPECT_EQ(calls, 1);

    queue->remove(id);
    EXPECT_FALSE(queue->get(id).has_value());
    EXPECT_EQ(calls, 1);
}

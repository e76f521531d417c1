/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <chrono>
#include <future>

#include "voxa/queue.hpp"

using namespace voxa;
using namespace std::chrono_literals;

TEST(AdmissionQueueTest, RejectsSecondJobFromSameOwner)
{
    AdmissionQueue queue(1, 8, OwnerPolicy::Reject, true);
    EXPECT_EQ(queue.submit("j1", "alice"), AdmitStatus::Accepted);
    EXPECT_EQ(queue.check("alice"), AdmitStatus::DuplicateActiveJob);
    EXPECT_EQ(queue.submit("j2", "alice"), AdmitStatus::DuplicateActiveJob);
    EXPECT_EQ(queue.submit("j3", "bob"), AdmitStatus::Accepted);

    // Still counts while it runs; frees up once finished.
    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);
    EXPECT_EQ(lease->id, "j1");
    EXPECT_EQ(queue.check("alice"), AdmitStatus::DuplicateActiveJob);
    queue.releaseSlot(*lease, Release::Finished);
    EXPECT_EQ(queue.check("alice"), AdmitStatus::Accepted);
}

TEST(AdmissionQueueTest, DepthIsBounded)
{
    AdmissionQueue queue(1, 2, OwnerPolicy::Queue, true);
    EXPECT_EQ(queue.submit("j1", "a"), AdmitStatus::Accepted);
    EXPECT_EQ(queue.submit("j2", "b"), AdmitStatus::Accepted);
    EXPECT_EQ(queue.submit("j3", "c"), AdmitStatus::QueueFull);
    EXPECT_EQ(queue.depth(), 2u);

    // A running job no longer counts against the depth.
    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);
    EXPECT_EQ(queue.submit("j3", "c"), AdmitStatus::Accepted);
    EXPECT_EQ(queue.submit("j3", "c"), AdmitStatus::Duplicate);
}

TEST(AdmissionQueueTest, FifoAcrossOwners)
{
    AdmissionQueue queue(1, 8, OwnerPolicy::Reject, true);
    for (const char* id : {"j1", "j2", "j3"}) {
        ASSERT_EQ(queue.submit(id, std::string("owner-") + id), AdmitStatus::Accepted);
    }
    for (const char* id : {"j1", "j2", "j3"}) {
        auto lease = queue.acquireSlot();
        ASSERT_TRUE(lease);
        EXPECT_EQ(lease->id, id);
        EXPECT_EQ(lease->slot, 0);
        queue.releaseSlot(*lease, Release::Finished);
    }
}

TEST(AdmissionQueueTest, QueuedOwnerJobWaitsBehindItsRunningJob)
{
    AdmissionQueue queue(2, 8, OwnerPolicy::Queue, true);
    ASSERT_EQ(queue.submit("a1", "alice"), AdmitStatus::Accepted);
    ASSERT_EQ(queue.submit("a2", "alice"), AdmitStatus::Accepted);
    ASSERT_EQ(queue.submit("b1", "bob"), AdmitStatus::Accepted);

    auto first = queue.acquireSlot();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->id, "a1");

    // a2 is older but its owner is busy; bob's job runs on the second slot.
    auto second = queue.acquireSlot();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->id, "b1");
    EXPECT_NE(second->slot, first->slot);

    queue.releaseSlot(*second, Release::Finished);
    auto blocked = std::async(std::launch::async, [&] { return queue.acquireSlot(); });
    EXPECT_EQ(blocked.wait_for(100ms), std::future_status::timeout);

    queue.releaseSlot(*first, Release::Finished);
    ASSERT_EQ(blocked.wait_for(5s), std::future_status::ready);
    auto third = blocked.get();
    ASSERT_TRUE(third);
    EXPECT_EQ(third->id, "a2");
}

TEST(AdmissionQueueTest, AcquireBlocksUntilASlotFrees)
{
    AdmissionQueue queue(1, 8, OwnerPolicy::Reject, true);
    ASSERT_EQ(queue.submit("j1", "a"), AdmitStatus::Accepted);
    ASSERT_EQ(queue.submit("j2", "b"), AdmitStatus::Accepted);

    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);
    EXPECT_EQ(queue.activeCount(), 1u);

    auto waiting = std::async(std::launch::async, [&] { return queue.acquireSlot(); });
    EXPECT_EQ(waiting.wait_for(100ms), std::future_status::timeout);

    queue.releaseSlot(*lease, Release::Finished);
    ASSERT_EQ(waiting.wait_for(5s), std::future_status::ready);
    auto next = waiting.get();
    ASSERT_TRUE(next);
    EXPECT_EQ(next->id, "j2");
    EXPECT_EQ(queue.activeCount(), 1u);
}

TEST(AdmissionQueueTest, RequeueKeepsOriginalPosition)
{
    AdmissionQueue queue(1, 8, OwnerPolicy::Reject, true);
    ASSERT_EQ(queue.submit("j1", "a"), AdmitStatus::Accepted);
    ASSERT_EQ(queue.submit("j2", "b"), AdmitStatus::Accepted);

    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);
    EXPECT_TRUE(queue.releaseSlot(*lease, Release::Requeue));
    EXPECT_EQ(queue.depth(), 2u);
    EXPECT_EQ(queue.check("a"), AdmitStatus::DuplicateActiveJob);

    auto again = queue.acquireSlot();
    ASSERT_TRUE(again);
    EXPECT_EQ(again->id, "j1");
}

TEST(AdmissionQueueTest, CancelRemovesWaitingJob)
{
    AdmissionQueue queue(1, 8, OwnerPolicy::Reject, true);
    ASSERT_EQ(queue.submit("j1", "a"), AdmitStatus::Accepted);
    ASSERT_EQ(queue.submit("j2", "b"), AdmitStatus::Accepted);

    EXPECT_EQ(queue.cancel("j1"), CancelOutcome::Removed);
    EXPECT_EQ(queue.depth(), 1u);
    EXPECT_EQ(queue.cancel("j1"), CancelOutcome::NotFound);

    // The owner stays counted until the cancel is recorded.
    EXPECT_EQ(queue.check("a"), AdmitStatus::DuplicateActiveJob);
    EXPECT_EQ(queue.submit("j1", "a"), AdmitStatus::Duplicate);
    queue.forget("j1");
    EXPECT_EQ(queue.check("a"), AdmitStatus::Accepted);

    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);
    EXPECT_EQ(lease->id, "j2");
}

TEST(AdmissionQueueTest, CancelFlagsRunningJobAndRefusesRequeue)
{
    AdmissionQueue queue(1, 8, OwnerPolicy::Reject, true);
    ASSERT_EQ(queue.submit("j1", "a"), AdmitStatus::Accepted);
    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);

    EXPECT_FALSE(queue.isCancelled("j1"));
    EXPECT_EQ(queue.cancel("j1"), CancelOutcome::Flagged);
    EXPECT_TRUE(queue.isCancelled("j1"));

    EXPECT_FALSE(queue.releaseSlot(*lease, Release::Requeue));
    EXPECT_EQ(queue.depth(), 0u);
    EXPECT_EQ(queue.activeCount(), 0u);
    EXPECT_EQ(queue.check("a"), AdmitStatus::DuplicateActiveJob);
    queue.forget("j1");
    EXPECT_EQ(queue.check("a"), AdmitStatus::Accepted);
}

TEST(AdmissionQueueTest, HoldFreesSlotButNotOwner)
{
    AdmissionQueue queue(1, 8, OwnerPolicy::Reject, true);
    ASSERT_EQ(queue.submit("j1", "a"), AdmitStatus::Accepted);
    ASSERT_EQ(queue.submit("j2", "b"), AdmitStatus::Accepted);
    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);

    EXPECT_FALSE(queue.releaseSlot(*lease, Release::Hold));
    EXPECT_EQ(queue.activeCount(), 0u);
    EXPECT_EQ(queue.check("a"), AdmitStatus::DuplicateActiveJob);

    auto next = queue.acquireSlot();
    ASSERT_TRUE(next);
    EXPECT_EQ(next->id, "j2");

    queue.forget("j1");
    queue.forget("j1");
    EXPECT_EQ(queue.check("a"), AdmitStatus::Accepted);
}

TEST(AdmissionQueueTest, RestoreBypassesLimits)
{
    AdmissionQueue queue(1, 1, OwnerPolicy::Reject, true);
    queue.restore("j1", "a");
    queue.restore("j2", "a");
    queue.restore("j2", "a");
    EXPECT_EQ(queue.depth(), 2u);
    EXPECT_EQ(queue.check("b"), AdmitStatus::QueueFull);
}

TEST(AdmissionQueueTest, ShutdownWakesWaiters)
{
    AdmissionQueue queue(1, 8, OwnerPolicy::Reject, true);
    auto waiting = std::async(std::launch::async, [&] { return queue.acquireSlot(); });
    EXPECT_EQ(waiting.wait_for(50ms), std::future_status::timeout);

    queue.shutdown();
    ASSERT_EQ(waiting.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(waiting.get().has_value());
    EXPECT_EQ(queue.submit("j1", "a"), AdmitStatus::Closed);
}

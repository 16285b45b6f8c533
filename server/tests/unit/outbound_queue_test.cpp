#include <string>

#include <gtest/gtest.h>

#include "telemetry/outbound_queue.hpp"

namespace {

using telemetry::EnqueueResult;
using telemetry::MessageKind;
using telemetry::OutboundQueue;
using telemetry::OutboundQueueLimits;

TEST(OutboundQueueTest, BelowSoftLimitEverythingIsKept) {
  OutboundQueue queue(OutboundQueueLimits{4, 8, 1024});
  EXPECT_EQ(queue.Push(MessageKind::kControl, "init"), EnqueueResult::kQueued);
  EXPECT_EQ(queue.Push(MessageKind::kAnalyticsEvent, "e1"), EnqueueResult::kQueued);
  EXPECT_EQ(queue.Size(), 2u);
  EXPECT_EQ(queue.Bytes(), 6u);
  EXPECT_EQ(queue.TakeFront(), "init");
  EXPECT_EQ(queue.TakeFront(), "e1");
  EXPECT_TRUE(queue.Empty());
  EXPECT_EQ(queue.Bytes(), 0u);
}

TEST(OutboundQueueTest, SoftLimitDropsOldestEventsAndNoticesOnce) {
  OutboundQueue queue(OutboundQueueLimits{3, 10, 1024});
  queue.Push(MessageKind::kPresenceSnapshot, "snap");
  queue.Push(MessageKind::kAnalyticsEvent, "e1");
  queue.Push(MessageKind::kAnalyticsEvent, "e2");
  EXPECT_EQ(queue.Push(MessageKind::kAnalyticsEvent, "e3"), EnqueueResult::kQueuedDegraded);

  EXPECT_EQ(queue.Size(), 3u);
  EXPECT_TRUE(queue.Degraded());
  EXPECT_EQ(queue.DroppedSinceDrain(), 1u);
  EXPECT_TRUE(queue.TakeDegradedNotice());
  EXPECT_FALSE(queue.TakeDegradedNotice());

  EXPECT_EQ(queue.TakeFront(), "snap");
  EXPECT_EQ(queue.TakeFront(), "e2");
}

TEST(OutboundQueueTest, NewerSnapshotReplacesQueuedOne) {
  OutboundQueue queue(OutboundQueueLimits{2, 4, 1024});
  queue.Push(MessageKind::kPresenceSnapshot, "snap-1");
  queue.Push(MessageKind::kGlobalSnapshot, "global-1");
  queue.Push(MessageKind::kPresenceSnapshot, "snap-22");
  EXPECT_EQ(queue.Size(), 2u);
  EXPECT_EQ(queue.Bytes(), 7u + 8u);
  EXPECT_EQ(queue.TakeFront(), "snap-22");
  EXPECT_FALSE(queue.Degraded());
}

TEST(OutboundQueueTest, SnapshotsAreNeverDropped) {
  OutboundQueue queue(OutboundQueueLimits{1, 4, 1024});
  queue.Push(MessageKind::kControl, "status");
  queue.Push(MessageKind::kPresenceSnapshot, "snap");
  queue.Push(MessageKind::kAnalyticsEvent, "e1");
  EXPECT_EQ(queue.Size(), 2u);
  EXPECT_EQ(queue.TotalDropped(), 1u);
  EXPECT_EQ(queue.TakeFront(), "status");
  EXPECT_EQ(queue.TakeFront(), "snap");
}

TEST(OutboundQueueTest, ByteLimitAlsoTriggersDrops) {
  OutboundQueue queue(OutboundQueueLimits{100, 200, 10});
  queue.Push(MessageKind::kAnalyticsEvent, std::string(6, 'a'));
  queue.Push(MessageKind::kAnalyticsEvent, std::string(6, 'b'));
  EXPECT_EQ(queue.Size(), 1u);
  EXPECT_EQ(queue.TakeFront(), std::string(6, 'b'));
}

TEST(OutboundQueueTest, DropsPastHardLimitWithoutDrainingMeanSlowConsumer) {
  OutboundQueue queue(OutboundQueueLimits{2, 3, 1024});
  EnqueueResult last = EnqueueResult::kQueued;
  for (int i = 0; i < 6; ++i) {
    last = queue.Push(MessageKind::kAnalyticsEvent, "e" + std::to_string(i));
  }
  EXPECT_EQ(queue.DroppedSinceDrain(), 4u);
  EXPECT_EQ(last, EnqueueResult::kSlowConsumer);
}

TEST(OutboundQueueTest, DrainingResetsDegradedState) {
  OutboundQueue queue(OutboundQueueLimits{1, 5, 1024});
  queue.Push(MessageKind::kAnalyticsEvent, "e1");
  queue.Push(MessageKind::kAnalyticsEvent, "e2");
  ASSERT_TRUE(queue.Degraded());

  queue.TakeFront();
  queue.OnWriteComplete();
  EXPECT_FALSE(queue.Degraded());
  EXPECT_EQ(queue.DroppedSinceDrain(), 0u);
  EXPECT_EQ(queue.TotalDropped(), 1u);
  EXPECT_EQ(queue.Push(MessageKind::kAnalyticsEvent, "e3"), EnqueueResult::kQueued);
}

TEST(OutboundQueueTest, HardLimitIsRaisedToSoftLimit) {
  OutboundQueue queue(OutboundQueueLimits{4, 1, 1024});
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(queue.Push(MessageKind::kControl, "c"), EnqueueResult::kQueued);
  }
}

}  // namespace

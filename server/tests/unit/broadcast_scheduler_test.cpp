#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "telemetry/broadcast_scheduler.hpp"

namespace {

using namespace std::chrono_literals;
using telemetry::BroadcastScheduler;

class RecordingSink : public telemetry::PresenceSink {
 public:
  std::vector<std::string> PresenceOrganizations() const override { return organizations; }
  bool HasGlobalPresenceSubscribers() const override { return global_subscribers; }
  void PushOrganizationSnapshot(const telemetry::PresenceSnapshot& snapshot) override {
    std::lock_guard<std::mutex> lock(mutex);
    org_snapshots.push_back(snapshot);
  }
  void PushGlobalSnapshot(const telemetry::GlobalPresenceSnapshot& snapshot) override {
    std::lock_guard<std::mutex> lock(mutex);
    global_snapshots.push_back(snapshot);
  }

  std::vector<std::string> organizations;
  bool global_subscribers{false};
  std::vector<telemetry::PresenceSnapshot> org_snapshots;
  std::vector<telemetry::GlobalPresenceSnapshot> global_snapshots;
  std::mutex mutex;
};

class BroadcastSchedulerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<telemetry::SharedStore>();
    observability_ = std::make_shared<telemetry::Observability>(telemetry::LogLevel::kError);
    registry_ = std::make_shared<telemetry::ConnectionRegistry>(ioc_, store_, observability_, 30s, 10s);
    sink_ = std::make_shared<RecordingSink>();
    scheduler_ = std::make_shared<BroadcastScheduler>(ioc_, registry_, sink_, observability_, 50ms);
    now_ = std::chrono::system_clock::now();
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<telemetry::SharedStore> store_;
  std::shared_ptr<telemetry::Observability> observability_;
  std::shared_ptr<telemetry::ConnectionRegistry> registry_;
  std::shared_ptr<RecordingSink> sink_;
  std::shared_ptr<BroadcastScheduler> scheduler_;
  std::chrono::system_clock::time_point now_;
};

TEST_F(BroadcastSchedulerTest, TickPushesOneSnapshotPerOrganization) {
  registry_->Register("org-a", "u1", "s1", now_);
  registry_->Register("org-a", "u2", "s2", now_);
  registry_->Register("org-b", "u3", "s3", now_);
  sink_->organizations = {"org-a", "org-b"};

  EXPECT_TRUE(scheduler_->TickOnce(now_));
  ASSERT_EQ(sink_->org_snapshots.size(), 2u);
  EXPECT_EQ(sink_->org_snapshots[0].organization_id, "org-a");
  EXPECT_EQ(sink_->org_snapshots[0].total_users, 2u);
  EXPECT_EQ(sink_->org_snapshots[1].total_users, 1u);
  EXPECT_TRUE(sink_->global_snapshots.empty());

  auto json = sink_->org_snapshots[0].ToJson();
  EXPECT_EQ(json["organizationId"], "org-a");
  EXPECT_EQ(json["totalUsers"], 2);
  EXPECT_TRUE(json["timestamp"].is_string());
}

TEST_F(BroadcastSchedulerTest, SilentSocketDropsOutOfNextTick) {
  registry_->Register("org-x", "u1", "s1", now_);
  registry_->Register("org-x", "u1", "s2", now_);
  registry_->Register("org-x", "u2", "s3", now_);
  sink_->organizations = {"org-x"};

  ASSERT_TRUE(scheduler_->TickOnce(now_));
  ASSERT_EQ(sink_->org_snapshots.size(), 1u);
  EXPECT_EQ(sink_->org_snapshots[0].total_users, 3u);

  // s1만 하트비트를 멈춘다.
  registry_->Heartbeat("org-x", "u1", "s2", now_ + 25s);
  registry_->Heartbeat("org-x", "u2", "s3", now_ + 25s);
  ASSERT_TRUE(scheduler_->TickOnce(now_ + 31s));
  ASSERT_EQ(sink_->org_snapshots.size(), 2u);
  EXPECT_EQ(sink_->org_snapshots[1].total_users, 2u);
}

TEST_F(BroadcastSchedulerTest, GlobalSnapshotOnlyWhenSomeoneListens) {
  registry_->Register("org-a", "u1", "s1", now_);
  registry_->Register("org-b", "u2", "s2", now_);
  registry_->Register("org-b", "u3", "s3", now_);
  sink_->global_subscribers = true;

  EXPECT_TRUE(scheduler_->TickOnce(now_));
  ASSERT_EQ(sink_->global_snapshots.size(), 1u);
  const auto& global = sink_->global_snapshots[0];
  EXPECT_EQ(global.total_users, 3u);
  ASSERT_EQ(global.organizations.size(), 2u);
  EXPECT_EQ(global.organizations[0].organization_id, "org-b");
  EXPECT_EQ(global.ToJson()["organizationCount"], 2);
}

TEST_F(BroadcastSchedulerTest, OutageSkipsWholeTick) {
  registry_->Register("org-a", "u1", "s1", now_);
  sink_->organizations = {"org-a"};
  sink_->global_subscribers = true;
  store_->SetOutageInjector([]() { return true; });

  EXPECT_FALSE(scheduler_->TickOnce(now_));
  EXPECT_TRUE(sink_->org_snapshots.empty());
  EXPECT_TRUE(sink_->global_snapshots.empty());
  EXPECT_EQ(observability_->Snapshot().ticks_skipped, 1u);
  EXPECT_EQ(scheduler_->TickCount(), 1u);

  store_->SetOutageInjector({});
  EXPECT_TRUE(scheduler_->TickOnce(now_ + 1s));
  EXPECT_EQ(sink_->org_snapshots.size(), 1u);
}

TEST_F(BroadcastSchedulerTest, TimestampsNeverGoBackwards) {
  sink_->organizations = {"org-a"};
  scheduler_->TickOnce(now_);
  scheduler_->TickOnce(now_ - 5s);
  scheduler_->TickOnce(now_ + 1s);
  ASSERT_EQ(sink_->org_snapshots.size(), 3u);
  EXPECT_EQ(sink_->org_snapshots[1].timestamp, now_);
  for (std::size_t i = 1; i < sink_->org_snapshots.size(); ++i) {
    EXPECT_GE(sink_->org_snapshots[i].timestamp, sink_->org_snapshots[i - 1].timestamp);
  }
}

TEST_F(BroadcastSchedulerTest, TimerKeepsTickingUntilStopped) {
  sink_->organizations = {"org-a"};
  scheduler_->Start();
  ioc_.run_for(280ms);
  scheduler_->Stop();
  EXPECT_GE(scheduler_->TickCount(), 3u);
  EXPECT_EQ(scheduler_->Interval(), 50ms);
}

TEST(BroadcastSchedulerConfigTest, NonPositiveIntervalFallsBackToDefault) {
  boost::asio::io_context ioc;
  auto observability = std::make_shared<telemetry::Observability>(telemetry::LogLevel::kError);
  auto registry = std::make_shared<telemetry::ConnectionRegistry>(
      ioc, std::make_shared<telemetry::SharedStore>(), observability, 30s, 10s);
  BroadcastScheduler scheduler(ioc, registry, std::make_shared<RecordingSink>(), observability, 0ms);
  EXPECT_EQ(scheduler.Interval(), 5000ms);
}

}  // namespace

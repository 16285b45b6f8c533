#include <chrono>
#include <future>
#include <memory>
#include <sstream>

#include <gtest/gtest.h>

#include "fake_session_geo_store.hpp"
#include "telemetry/session_geo_tracker.hpp"

namespace {

using namespace std::chrono_literals;
using telemetry::TrackOutcome;
using telemetry::TrackRequest;

constexpr char kRanges[] =
    "8.8.8.0,8.8.8.255,US,United States,California,Mountain View,37.386,-122.0838\n"
    "5.9.0.0,5.9.255.255,DE,Germany,Saxony,Falkenstein,50.4779,12.3713\n";

class SessionGeoTrackerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto database = std::make_shared<telemetry::GeoDatabase>();
    std::istringstream input(kRanges);
    database->LoadFromStream(input);
    observability_ = std::make_shared<telemetry::Observability>(telemetry::LogLevel::kError);
    telemetry::GeoResolverConfig config;
    config.worker_threads = 1;
    resolver_ = std::make_shared<telemetry::GeoResolver>(database, std::make_shared<telemetry::SharedStore>(),
                                                         observability_, config);
    store_ = std::make_shared<telemetry::testing::FakeSessionGeoStore>();
    tracker_ = std::make_unique<telemetry::SessionGeoTracker>(resolver_, store_, observability_);
  }

  void TearDown() override { resolver_->Shutdown(); }

  std::shared_ptr<telemetry::Observability> observability_;
  std::shared_ptr<telemetry::GeoResolver> resolver_;
  std::shared_ptr<telemetry::testing::FakeSessionGeoStore> store_;
  std::unique_ptr<telemetry::SessionGeoTracker> tracker_;
};

TEST_F(SessionGeoTrackerTest, RepeatedTrackKeepsOneRecordPerSession) {
  auto first_seen = std::chrono::system_clock::now() - 1h;
  TrackRequest request{"sess-1", "u1", "org-a", "8.8.8.8"};
  EXPECT_EQ(tracker_->Track(request, first_seen), TrackOutcome::kStored);
  request.ip = "5.9.1.2";
  EXPECT_EQ(tracker_->Track(request), TrackOutcome::kStored);

  EXPECT_EQ(store_->Size(), 1u);
  auto record = store_->Find("org-a", "sess-1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->country_code, "DE");
  EXPECT_EQ(record->created_at, first_seen);
  EXPECT_EQ(record->ip_hash.size(), 64u);
  EXPECT_EQ(record->ip_hash.find("5.9"), std::string::npos);
}

TEST_F(SessionGeoTrackerTest, SameSessionIdInAnotherOrganizationLeavesOriginalRecord) {
  auto first_seen = std::chrono::system_clock::now() - 1h;
  EXPECT_EQ(tracker_->Track({"sess-1", "u1", "org-a", "8.8.8.8"}, first_seen), TrackOutcome::kStored);
  EXPECT_EQ(tracker_->Track({"sess-1", "intruder", "org-b", "5.9.1.2"}), TrackOutcome::kStored);

  auto original = store_->Find("org-a", "sess-1");
  ASSERT_TRUE(original.has_value());
  EXPECT_EQ(original->country_code, "US");
  EXPECT_EQ(original->user_id, "u1");
  EXPECT_EQ(original->created_at, first_seen);

  auto other = store_->Find("org-b", "sess-1");
  ASSERT_TRUE(other.has_value());
  EXPECT_EQ(other->country_code, "DE");

  auto org_a = store_->CountByCountry(std::string{"org-a"}, first_seen - 1h);
  ASSERT_EQ(org_a.size(), 1u);
  EXPECT_EQ(org_a[0].code, "US");
}

TEST_F(SessionGeoTrackerTest, UnknownLocationIsNotPersisted) {
  EXPECT_EQ(tracker_->Track({"sess-2", "u1", "org-a", "192.168.1.20"}), TrackOutcome::kSkippedUnknown);
  EXPECT_EQ(tracker_->Track({"sess-3", "u1", "org-a", "1.0.0.1"}), TrackOutcome::kSkippedUnknown);
  EXPECT_EQ(store_->UpsertCalls(), 0u);
}

TEST_F(SessionGeoTrackerTest, StoreFailureIsReportedNotThrown) {
  store_->SetFailing(true);
  TrackOutcome outcome = TrackOutcome::kStored;
  EXPECT_NO_THROW(outcome = tracker_->Track({"sess-4", "u1", "org-a", "8.8.8.8"}));
  EXPECT_EQ(outcome, TrackOutcome::kFailed);
  EXPECT_EQ(store_->Size(), 0u);
  EXPECT_EQ(telemetry::ToString(outcome), "failed");
}

TEST_F(SessionGeoTrackerTest, TrackAsyncCompletesOnWorker) {
  std::promise<TrackOutcome> done;
  tracker_->TrackAsync({"sess-5", "u2", "org-b", "8.8.8.9"},
                       [&done](TrackOutcome outcome) { done.set_value(outcome); });
  auto future = done.get_future();
  ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(future.get(), TrackOutcome::kStored);
  auto record = store_->Find("org-b", "sess-5");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->organization_id, "org-b");
}

}  // namespace

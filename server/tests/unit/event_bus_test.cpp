#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "telemetry/event_bus.hpp"
#include "telemetry/event_types.hpp"

namespace {

using telemetry::AnalyticsEvent;
using telemetry::AnalyticsEventBus;
using telemetry::EventType;

TEST(EventTypesTest, ParsesKnownNamesOnly) {
  auto parsed = telemetry::ParseEventType("meeting:started");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, EventType::kMeetingStarted);
  EXPECT_EQ(telemetry::ToString(EventType::kSystemHealthChange), "system:health_change");
  EXPECT_FALSE(telemetry::ParseEventType("meeting:unknown").has_value());
  EXPECT_FALSE(telemetry::ParseEventType("").has_value());
}

TEST(EventTypesTest, EmptyFilterMatchesEverything) {
  telemetry::EventTypeFilter all;
  EXPECT_TRUE(all.MatchesAll());
  EXPECT_TRUE(all.Matches(EventType::kApiError));

  telemetry::EventTypeFilter meetings({EventType::kMeetingStarted, EventType::kMeetingEnded});
  EXPECT_TRUE(meetings.Matches(EventType::kMeetingEnded));
  EXPECT_FALSE(meetings.Matches(EventType::kUserLogin));
  EXPECT_EQ(meetings.Types().size(), 2u);
}

TEST(EventBusTest, InterleavedPublishesNeverCrossTenants) {
  AnalyticsEventBus bus(nullptr, 100);
  std::mutex mutex;
  std::vector<std::string> org_a_seen;
  std::vector<std::string> org_b_seen;
  std::atomic<int> global_seen{0};
  bus.SubscribeOrganization("org-a", [&](const AnalyticsEvent& event) {
    std::lock_guard<std::mutex> lock(mutex);
    org_a_seen.push_back(event.organization_id);
  });
  bus.SubscribeOrganization("org-b", [&](const AnalyticsEvent& event) {
    std::lock_guard<std::mutex> lock(mutex);
    org_b_seen.push_back(event.organization_id);
  });
  bus.SubscribeGlobal([&](const AnalyticsEvent&) { global_seen.fetch_add(1); });

  std::vector<std::thread> publishers;
  for (int t = 0; t < 4; ++t) {
    publishers.emplace_back([&bus, t]() {
      for (int i = 0; i < 250; ++i) {
        const char* org = (i + t) % 2 == 0 ? "org-a" : "org-b";
        bus.Publish(org, EventType::kUserActivity, {{"i", i}});
      }
    });
  }
  for (auto& publisher : publishers) {
    publisher.join();
  }

  EXPECT_EQ(org_a_seen.size() + org_b_seen.size(), 1000u);
  EXPECT_EQ(org_a_seen.size(), 500u);
  for (const auto& org : org_a_seen) {
    EXPECT_EQ(org, "org-a");
  }
  for (const auto& org : org_b_seen) {
    EXPECT_EQ(org, "org-b");
  }
  EXPECT_EQ(global_seen.load(), 1000);
}

TEST(EventBusTest, TypeFilterSelectsMatchingSubscriberOnly) {
  AnalyticsEventBus bus(nullptr, 100);
  telemetry::EventTypeFilter meetings({EventType::kMeetingStarted});
  telemetry::EventTypeFilter billing({EventType::kBillingPaymentReceived});
  std::vector<std::string> meeting_seen;
  std::vector<std::string> billing_seen;
  bus.SubscribeOrganization("X", [&](const AnalyticsEvent& event) {
    if (meetings.Matches(event.type)) {
      meeting_seen.push_back(event.payload.value("meetingId", ""));
    }
  });
  bus.SubscribeOrganization("X", [&](const AnalyticsEvent& event) {
    if (billing.Matches(event.type)) {
      billing_seen.push_back(event.id);
    }
  });

  bus.Publish("X", EventType::kMeetingStarted, {{"meetingId", "m1"}});
  ASSERT_EQ(meeting_seen.size(), 1u);
  EXPECT_EQ(meeting_seen[0], "m1");
  EXPECT_TRUE(billing_seen.empty());
}

TEST(EventBusTest, RecentRingKeepsNewestInPublishOrder) {
  AnalyticsEventBus bus(nullptr, 3);
  for (int i = 0; i < 5; ++i) {
    bus.Publish("org-a", EventType::kApiRequest, {{"i", i}});
  }
  bus.Publish("org-b", EventType::kApiRequest, {{"i", 99}});

  auto recent = bus.GetRecent("org-a", 10);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent[0].payload["i"], 2);
  EXPECT_EQ(recent[1].payload["i"], 3);
  EXPECT_EQ(recent[2].payload["i"], 4);

  auto last_two = bus.GetRecent("org-a", 2);
  ASSERT_EQ(last_two.size(), 2u);
  EXPECT_EQ(last_two[0].payload["i"], 3);

  EXPECT_TRUE(bus.GetRecent("org-c", 5).empty());
  auto global = bus.GetRecentGlobal(10);
  ASSERT_EQ(global.size(), 3u);
  EXPECT_EQ(global.back().organization_id, "org-b");
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
  AnalyticsEventBus bus(nullptr, 10);
  int delivered = 0;
  auto id = bus.SubscribeOrganization("org-a", [&delivered](const AnalyticsEvent&) { ++delivered; });
  EXPECT_EQ(bus.SubscriberCount(), 1u);
  bus.Publish("org-a", EventType::kUserLogin, nlohmann::json::object());
  bus.Unsubscribe(id);
  bus.Publish("org-a", EventType::kUserLogin, nlohmann::json::object());
  EXPECT_EQ(delivered, 1);
  EXPECT_EQ(bus.SubscriberCount(), 0u);
}

TEST(EventBusTest, OutageSkipsPublishWithoutThrowing) {
  AnalyticsEventBus bus(nullptr, 10);
  int delivered = 0;
  bus.SubscribeOrganization("org-a", [&delivered](const AnalyticsEvent&) { ++delivered; });
  bus.SetOutageInjector([]() { return true; });
  EXPECT_FALSE(bus.Publish("org-a", EventType::kAlertTriggered, nlohmann::json::object()).has_value());
  EXPECT_EQ(delivered, 0);
  EXPECT_TRUE(bus.GetRecent("org-a", 10).empty());

  bus.SetOutageInjector({});
  auto event = bus.Publish("org-a", EventType::kAlertTriggered, {{"severity", "high"}},
                           telemetry::EventMetadata{std::string("u1"), std::nullopt, std::string("api")});
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(delivered, 1);
  auto json = event->ToJson();
  EXPECT_EQ(json["type"], "alert:triggered");
  EXPECT_EQ(json["metadata"]["userId"], "u1");
  EXPECT_FALSE(json["metadata"].contains("sessionId"));
}

TEST(EventBusTest, EventIdsAreUnique) {
  AnalyticsEventBus bus(nullptr, 10);
  auto first = bus.Publish("org-a", EventType::kUserLogout, nlohmann::json::object());
  auto second = bus.Publish("org-a", EventType::kUserLogout, nlohmann::json::object());
  ASSERT_TRUE(first && second);
  EXPECT_NE(first->id, second->id);
}

}  // namespace

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "telemetry/observability.hpp"

namespace {

std::vector<nlohmann::json> ParseLines(const std::string& text) {
  std::vector<nlohmann::json> lines;
  std::istringstream input(text);
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(nlohmann::json::parse(line));
    }
  }
  return lines;
}

TEST(ObservabilityTest, LevelFilterDropsLowerLevels) {
  telemetry::Observability obs(telemetry::ParseLogLevel("warn"));
  std::ostringstream sink;
  obs.SetSink(&sink);
  obs.Log(telemetry::LogLevel::kInfo, "presence.register", {{"organizationId", "org-a"}});
  obs.Log(telemetry::LogLevel::kError, "http.db_error", {{"code", 2013}});

  auto lines = ParseLines(sink.str());
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0]["level"], "error");
  EXPECT_EQ(lines[0]["eventName"], "http.db_error");
  EXPECT_EQ(lines[0]["code"], 2013);
  EXPECT_TRUE(lines[0].contains("ts"));
  obs.SetSink(nullptr);
}

TEST(ObservabilityTest, SecurityEventIsAlwaysWrittenAndCounted) {
  telemetry::Observability obs(telemetry::LogLevel::kError);
  std::ostringstream sink;
  obs.SetSink(&sink);
  obs.SecurityEvent("tenant_isolation_violation", {{"userId", "u1"}, {"requestedOrganizationId", "org-b"}});

  auto lines = ParseLines(sink.str());
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0]["category"], "security");
  EXPECT_EQ(lines[0]["level"], "warn");
  EXPECT_EQ(lines[0]["requestedOrganizationId"], "org-b");
  EXPECT_EQ(obs.Snapshot().isolation_violations, 1u);
  obs.SetSink(nullptr);
}

TEST(ObservabilityTest, CountersAccumulate) {
  telemetry::Observability obs;
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.AddEventsDropped(5);
  obs.IncrementSnapshotsSent(3);
  obs.IncrementTicksSkipped();
  obs.SetWebsocketActive(4);

  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.events_dropped, 5u);
  EXPECT_EQ(snapshot.snapshots_sent, 3u);
  EXPECT_EQ(snapshot.ticks_skipped, 1u);
  EXPECT_EQ(snapshot.websocket_active, 4u);
}

}  // namespace

/*
 * 설명: 연결 목록 관리와 프레즌스 스냅샷 라우팅을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#include "telemetry/realtime.hpp"

#include <set>
#include <sstream>

#include "telemetry/websocket_session.hpp"

namespace telemetry {

std::string_view ToString(Channel channel) {
  switch (channel) {
    case Channel::kPresence:
      return "presence";
    case Channel::kAnalytics:
      return "analytics";
  }
  return "presence";
}

std::string RealtimeCoordinator::NextConnectionId() {
  std::ostringstream oss;
  oss << "conn-" << next_connection_id_.fetch_add(1);
  return oss.str();
}

void RealtimeCoordinator::Register(const ConnectionInfo& info, const std::shared_ptr<WebSocketSession>& session) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_[info.connection_id] = Entry{info, session, session.get()};
  }
  UpdateActiveGauge();
}

void RealtimeCoordinator::Unregister(const std::string& connection_id, const WebSocketSession* session) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end() || it->second.raw != session) {
      return;
    }
    connections_.erase(it);
  }
  UpdateActiveGauge();
}

std::vector<std::string> RealtimeCoordinator::PresenceOrganizations() const {
  std::set<std::string> orgs;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, entry] : connections_) {
    if (entry.info.channel == Channel::kPresence) {
      orgs.insert(entry.info.identity.organization_id);
    }
  }
  return {orgs.begin(), orgs.end()};
}

bool RealtimeCoordinator::HasGlobalPresenceSubscribers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, entry] : connections_) {
    if (entry.info.channel == Channel::kPresence && entry.info.identity.IsSuperAdmin()) {
      return true;
    }
  }
  return false;
}

void RealtimeCoordinator::PushOrganizationSnapshot(const PresenceSnapshot& snapshot) {
  auto targets = Collect([&](const ConnectionInfo& info) {
    return info.channel == Channel::kPresence && info.identity.organization_id == snapshot.organization_id;
  });
  for (const auto& session : targets) {
    session->DeliverPresenceSnapshot(snapshot);
  }
  if (observability_ && !targets.empty()) {
    observability_->IncrementSnapshotsSent(targets.size());
  }
}

void RealtimeCoordinator::PushGlobalSnapshot(const GlobalPresenceSnapshot& snapshot) {
  auto targets = Collect([](const ConnectionInfo& info) {
    return info.channel == Channel::kPresence && info.identity.IsSuperAdmin();
  });
  for (const auto& session : targets) {
    session->DeliverGlobalSnapshot(snapshot);
  }
  if (observability_ && !targets.empty()) {
    observability_->IncrementSnapshotsSent(targets.size());
  }
}

std::size_t RealtimeCoordinator::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t RealtimeCoordinator::ActiveConnections(Channel channel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& [id, entry] : connections_) {
    if (entry.info.channel == channel) {
      ++count;
    }
  }
  return count;
}

void RealtimeCoordinator::CloseAll(const std::string& reason) {
  for (const auto& session : Collect([](const ConnectionInfo&) { return true; })) {
    session->Shutdown(reason);
  }
}

std::vector<std::shared_ptr<WebSocketSession>> RealtimeCoordinator::Collect(
    const std::function<bool(const ConnectionInfo&)>& pred) const {
  std::vector<std::shared_ptr<WebSocketSession>> sessions;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, entry] : connections_) {
    if (!pred(entry.info)) {
      continue;
    }
    if (auto session = entry.session.lock()) {
      sessions.push_back(std::move(session));
    }
  }
  return sessions;
}

void RealtimeCoordinator::UpdateActiveGauge() {
  if (observability_) {
    observability_->SetWebsocketActive(ActiveConnections());
  }
}

}  // namespace telemetry

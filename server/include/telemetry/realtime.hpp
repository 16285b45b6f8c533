/*
 * 설명: 게이트웨이에 붙은 WebSocket 연결을 채널/조직별로 관리하고 프레즌스 스냅샷을 해당 연결로 중계한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "telemetry/auth.hpp"
#include "telemetry/broadcast_scheduler.hpp"
#include "telemetry/observability.hpp"

namespace telemetry {

class WebSocketSession;

enum class Channel { kPresence, kAnalytics };

std::string_view ToString(Channel channel);

struct ConnectionInfo {
  std::string connection_id;
  Channel channel;
  Identity identity;
};

class RealtimeCoordinator : public PresenceSink {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  std::string NextConnectionId();
  void Register(const ConnectionInfo& info, const std::shared_ptr<WebSocketSession>& session);
  void Unregister(const std::string& connection_id, const WebSocketSession* session);

  std::vector<std::string> PresenceOrganizations() const override;
  bool HasGlobalPresenceSubscribers() const override;
  void PushOrganizationSnapshot(const PresenceSnapshot& snapshot) override;
  void PushGlobalSnapshot(const GlobalPresenceSnapshot& snapshot) override;

  std::size_t ActiveConnections() const;
  std::size_t ActiveConnections(Channel channel) const;
  void CloseAll(const std::string& reason);

 private:
  struct Entry {
    ConnectionInfo info;
    std::weak_ptr<WebSocketSession> session;
    const WebSocketSession* raw{nullptr};
  };

  std::vector<std::shared_ptr<WebSocketSession>> Collect(const std::function<bool(const ConnectionInfo&)>& pred) const;
  void UpdateActiveGauge();

  std::unordered_map<std::string, Entry> connections_;
  mutable std::mutex mutex_;
  std::atomic<std::uint64_t> next_connection_id_{1};
  std::shared_ptr<Observability> observability_;
};

}  // namespace telemetry

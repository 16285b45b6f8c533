/*
 * 설명: 프레즌스/분석 채널 WebSocket 연결 하나의 상태 머신, 구독 필터, 백프레셔, 재등록을 관리한다.
 *       외부 스레드에서 오는 전달 요청은 모두 연결 스트랜드로 post된다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "telemetry/auth.hpp"
#include "telemetry/broadcast_scheduler.hpp"
#include "telemetry/connection_registry.hpp"
#include "telemetry/connection_state.hpp"
#include "telemetry/event_bus.hpp"
#include "telemetry/event_types.hpp"
#include "telemetry/observability.hpp"
#include "telemetry/outbound_queue.hpp"
#include "telemetry/realtime.hpp"

namespace telemetry {

// 연결들이 공유하는 서비스 핸들.
struct GatewayServices {
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<AnalyticsEventBus> event_bus;
  std::shared_ptr<BroadcastScheduler> scheduler;
  std::shared_ptr<RealtimeCoordinator> coordinator;
  std::shared_ptr<Observability> observability;
};

struct WebSocketSessionOptions {
  OutboundQueueLimits queue_limits;
  std::chrono::milliseconds reconnect_base_delay{500};
  std::chrono::milliseconds reconnect_max_delay{8000};
  std::size_t default_recent_limit{50};
};

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
 public:
  static constexpr char kGlobalScope[] = "*";

  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, ConnectionInfo info,
                   GatewayServices services, const WebSocketSessionOptions& options);
  ~WebSocketSession();

  // 업그레이드 직후 연결 스트랜드에서 호출한다.
  void Run();

  // 아래는 어느 스레드에서 호출해도 된다.
  void DeliverPresenceSnapshot(const PresenceSnapshot& snapshot);
  void DeliverGlobalSnapshot(const GlobalPresenceSnapshot& snapshot);
  void DeliverAnalyticsEvent(const AnalyticsEvent& event);
  void Shutdown(const std::string& reason);

 private:
  void StartPresence();
  bool RegisterPresence();
  bool SendPresenceInit(std::uint64_t seq);
  void EnterReconnecting(const std::string& reason);
  void ScheduleReconnect();
  void OnReconnectTimer(const boost::system::error_code& ec);
  void RecordHeartbeat();

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleMessage(const std::string& event, const nlohmann::json& payload, std::uint64_t seq);
  void HandlePresenceGet(const nlohmann::json& payload, std::uint64_t seq);
  void HandleSubscribe(const nlohmann::json& payload, std::uint64_t seq);
  void HandleGetRecent(const nlohmann::json& payload, std::uint64_t seq);
  void HandleHeartbeat(std::uint64_t seq);

  void OnPresenceSnapshot(const PresenceSnapshot& snapshot);
  void OnGlobalSnapshot(const GlobalPresenceSnapshot& snapshot);
  void OnAnalyticsEvent(const AnalyticsEvent& event);
  std::vector<AnalyticsEvent> RecentForScope(std::size_t limit) const;
  nlohmann::json EventsToJson(const std::vector<AnalyticsEvent>& events) const;

  void SendEvent(std::string_view event, const nlohmann::json& payload, std::uint64_t seq,
                 MessageKind kind = MessageKind::kControl);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void SendStatus(const nlohmann::json& payload);
  void Enqueue(MessageKind kind, std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);

  void RejectCrossTenant(const std::string& requested_org, std::string_view action);
  void CloseWithReason(boost::beast::websocket::close_code code, std::string_view reason);
  void Cleanup();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  ConnectionInfo info_;
  GatewayServices services_;
  WebSocketSessionOptions options_;
  ConnectionStateMachine state_;
  OutboundQueue queue_;
  std::string in_flight_;
  boost::asio::steady_timer reconnect_timer_;
  std::size_t reconnect_attempt_{0};
  bool writing_{false};
  bool closing_{false};
  bool cleaned_up_{false};
  bool presence_registered_{false};
  std::optional<SubscriptionId> subscription_;
  EventTypeFilter filter_;
  std::string analytics_scope_;
};

}  // namespace telemetry

/*
 * 설명: 프레즌스/분석 채널 메시지 처리, 스냅샷·이벤트 전달, 백프레셔와 재등록 백오프를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#include "telemetry/websocket_session.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "telemetry/api_response.hpp"
#include "telemetry/errors.hpp"

namespace telemetry {
namespace websocket = boost::beast::websocket;

WebSocketSession::WebSocketSession(websocket::stream<boost::beast::tcp_stream> ws, ConnectionInfo info,
                                   GatewayServices services, const WebSocketSessionOptions& options)
    : ws_(std::move(ws)), info_(std::move(info)), services_(std::move(services)), options_(options),
      queue_(options.queue_limits), reconnect_timer_(ws_.get_executor()) {}

WebSocketSession::~WebSocketSession() { Cleanup(); }

void WebSocketSession::Run() {
  state_.Transition(ConnectionState::kAuthenticated);
  // 프로토콜 ping/pong도 하트비트로 취급한다. 콜백은 읽기 작업 안에서만 호출된다.
  ws_.control_callback([this](websocket::frame_type kind, boost::beast::string_view) {
    if (kind != websocket::frame_type::close) {
      RecordHeartbeat();
    }
  });
  services_.coordinator->Register(info_, shared_from_this());
  services_.observability->Log(LogLevel::kInfo, "ws.connected",
                               {{"connectionId", info_.connection_id},
                                {"channel", ToString(info_.channel)},
                                {"userId", info_.identity.user_id},
                                {"organizationId", info_.identity.organization_id}});
  if (info_.channel == Channel::kPresence) {
    StartPresence();
  }
  DoRead();
}

void WebSocketSession::StartPresence() {
  if (!state_.Transition(ConnectionState::kSubscribed)) {
    return;
  }
  if (!RegisterPresence() || !SendPresenceInit(0)) {
    EnterReconnecting("registry_unavailable");
    return;
  }
  state_.Transition(ConnectionState::kActive);
}

bool WebSocketSession::RegisterPresence() {
  try {
    services_.registry->Register(info_.identity.organization_id, info_.identity.user_id, info_.connection_id);
    presence_registered_ = true;
    return true;
  } catch (const TransientStoreError& ex) {
    services_.observability->Log(LogLevel::kWarn, "ws.register_failed",
                                 {{"connectionId", info_.connection_id}, {"reason", ex.what()}});
    return false;
  }
}

bool WebSocketSession::SendPresenceInit(std::uint64_t seq) {
  try {
    auto payload = services_.scheduler->BuildOrganizationSnapshot(info_.identity.organization_id).ToJson();
    if (info_.identity.IsSuperAdmin()) {
      payload["global"] = services_.scheduler->BuildGlobalSnapshot().ToJson();
    }
    SendEvent("init", payload, seq);
    return true;
  } catch (const TransientStoreError& ex) {
    services_.observability->Log(LogLevel::kWarn, "ws.init_failed",
                                 {{"connectionId", info_.connection_id}, {"reason", ex.what()}});
    return false;
  }
}

void WebSocketSession::EnterReconnecting(const std::string& reason) {
  if (closing_ || !state_.Transition(ConnectionState::kReconnecting)) {
    return;
  }
  services_.observability->Log(LogLevel::kWarn, "ws.reconnecting",
                               {{"connectionId", info_.connection_id}, {"reason", reason}});
  SendStatus({{"state", "reconnecting"}, {"reason", reason}});
  ScheduleReconnect();
}

void WebSocketSession::ScheduleReconnect() {
  auto delay = options_.reconnect_base_delay * (1 << std::min<std::size_t>(reconnect_attempt_, 10));
  delay = std::min(delay, options_.reconnect_max_delay);
  ++reconnect_attempt_;
  reconnect_timer_.expires_after(delay);
  auto self = shared_from_this();
  reconnect_timer_.async_wait([self](const boost::system::error_code& ec) { self->OnReconnectTimer(ec); });
}

void WebSocketSession::OnReconnectTimer(const boost::system::error_code& ec) {
  if (ec || closing_ || !state_.Transition(ConnectionState::kSubscribed)) {
    return;
  }
  if (!RegisterPresence() || !SendPresenceInit(0)) {
    state_.Transition(ConnectionState::kReconnecting);
    ScheduleReconnect();
    return;
  }
  state_.Transition(ConnectionState::kActive);
  services_.observability->Log(LogLevel::kInfo, "ws.reconnected",
                               {{"connectionId", info_.connection_id}, {"attempts", reconnect_attempt_}});
  reconnect_attempt_ = 0;
  SendStatus({{"state", "active"}});
}

void WebSocketSession::RecordHeartbeat() {
  if (info_.channel != Channel::kPresence || state_.State() != ConnectionState::kActive) {
    return;
  }
  try {
    services_.registry->Heartbeat(info_.identity.organization_id, info_.identity.user_id, info_.connection_id);
  } catch (const TransientStoreError&) {
    EnterReconnecting("registry_unavailable");
  }
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (!closing_ && ec != websocket::error::closed) {
      services_.observability->Log(LogLevel::kDebug, "ws.read_failed",
                                   {{"connectionId", info_.connection_id}, {"reason", ec.message()}});
    }
    closing_ = true;
    reconnect_timer_.cancel();
    state_.Transition(ConnectionState::kClosed);
    Cleanup();
    return;
  }
  if (closing_) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  auto message = nlohmann::json::parse(data, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    SendError(error_code::kBadRequest, "JSON 파싱 오류", 0);
    return DoRead();
  }
  std::uint64_t seq = 0;
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  auto event_it = message.find("event");
  if (type_it == message.end() || *type_it != "event" || event_it == message.end() || !event_it->is_string()) {
    SendError(error_code::kBadRequest, "잘못된 메시지 형식", seq);
    return DoRead();
  }
  auto payload_it = message.find("p");
  nlohmann::json payload = payload_it != message.end() ? *payload_it : nlohmann::json::object();
  if (!payload.is_object()) {
    SendError(error_code::kBadRequest, "payload는 객체여야 합니다", seq);
    return DoRead();
  }

  HandleMessage(event_it->get<std::string>(), payload, seq);
  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::HandleMessage(const std::string& event, const nlohmann::json& payload, std::uint64_t seq) {
  if (event == "heartbeat") {
    return HandleHeartbeat(seq);
  }
  if (info_.channel == Channel::kPresence) {
    if (event == "get") {
      return HandlePresenceGet(payload, seq);
    }
  } else {
    if (event == "subscribe") {
      return HandleSubscribe(payload, seq);
    }
    if (event == "getRecent") {
      return HandleGetRecent(payload, seq);
    }
  }
  SendError(error_code::kBadRequest, "알 수 없는 이벤트", seq);
}

void WebSocketSession::HandleHeartbeat(std::uint64_t /*seq*/) { RecordHeartbeat(); }

void WebSocketSession::HandlePresenceGet(const nlohmann::json& payload, std::uint64_t seq) {
  const auto& own_org = info_.identity.organization_id;
  std::string org_id = own_org;
  auto org_it = payload.find("organizationId");
  if (org_it != payload.end()) {
    if (!org_it->is_string()) {
      return SendError(error_code::kBadRequest, "organizationId는 문자열이어야 합니다", seq);
    }
    org_id = org_it->get<std::string>();
  }
  if (!info_.identity.CanAccessOrganization(org_id)) {
    return RejectCrossTenant(org_id, "presence.get");
  }
  if (state_.State() != ConnectionState::kActive) {
    return SendStatus({{"state", ToString(state_.State())}});
  }
  try {
    auto snapshot = services_.scheduler->BuildOrganizationSnapshot(org_id).ToJson();
    if (info_.identity.IsSuperAdmin()) {
      snapshot["global"] = services_.scheduler->BuildGlobalSnapshot().ToJson();
    }
    SendEvent("update", snapshot, seq);
  } catch (const TransientStoreError&) {
    EnterReconnecting("registry_unavailable");
  }
}

void WebSocketSession::HandleSubscribe(const nlohmann::json& payload, std::uint64_t seq) {
  EventTypeFilter filter;
  auto types_it = payload.find("eventTypes");
  if (types_it != payload.end()) {
    if (!types_it->is_array()) {
      return SendError(error_code::kBadRequest, "eventTypes는 배열이어야 합니다", seq);
    }
    for (const auto& entry : *types_it) {
      auto type = entry.is_string() ? ParseEventType(entry.get<std::string>()) : std::nullopt;
      if (!type) {
        return SendError(error_code::kBadRequest, "알 수 없는 이벤트 유형: " + entry.dump(), seq);
      }
      filter.Add(*type);
    }
  }

  std::string scope = info_.identity.organization_id;
  auto org_it = payload.find("organizationId");
  if (org_it != payload.end()) {
    if (!org_it->is_string()) {
      return SendError(error_code::kBadRequest, "organizationId는 문자열이어야 합니다", seq);
    }
    scope = org_it->get<std::string>();
  }
  bool allowed = scope == kGlobalScope ? info_.identity.IsSuperAdmin() : info_.identity.CanAccessOrganization(scope);
  if (!allowed) {
    return RejectCrossTenant(scope, "analytics.subscribe");
  }

  std::size_t recent_limit = 0;
  auto recent_it = payload.find("recent");
  if (recent_it != payload.end()) {
    if (recent_it->is_boolean()) {
      recent_limit = recent_it->get<bool>() ? options_.default_recent_limit : 0;
    } else if (recent_it->is_number_unsigned()) {
      recent_limit = recent_it->get<std::size_t>();
    } else {
      return SendError(error_code::kBadRequest, "recent는 불리언 또는 양의 정수여야 합니다", seq);
    }
  }

  if (!subscription_ || scope != analytics_scope_) {
    if (subscription_) {
      services_.event_bus->Unsubscribe(*subscription_);
    }
    std::weak_ptr<WebSocketSession> weak = shared_from_this();
    EventHandler handler = [weak](const AnalyticsEvent& event) {
      if (auto self = weak.lock()) {
        self->DeliverAnalyticsEvent(event);
      }
    };
    subscription_ = scope == kGlobalScope ? services_.event_bus->SubscribeGlobal(std::move(handler))
                                          : services_.event_bus->SubscribeOrganization(scope, std::move(handler));
  }
  analytics_scope_ = scope;
  filter_ = filter;

  if (state_.State() == ConnectionState::kAuthenticated) {
    state_.Transition(ConnectionState::kSubscribed);
  }
  nlohmann::json types = nlohmann::json::array();
  for (auto type : filter_.Types()) {
    types.push_back(ToString(type));
  }
  SendEvent("subscribed", {{"eventTypes", types}, {"organizationId", analytics_scope_}}, seq);
  if (recent_limit > 0) {
    SendEvent("recent", {{"events", EventsToJson(RecentForScope(recent_limit))}}, seq);
  }
  if (state_.State() == ConnectionState::kSubscribed) {
    state_.Transition(ConnectionState::kActive);
  }
  services_.observability->Log(LogLevel::kInfo, "ws.subscribed",
                               {{"connectionId", info_.connection_id},
                                {"organizationId", analytics_scope_},
                                {"eventTypes", types}});
}

void WebSocketSession::HandleGetRecent(const nlohmann::json& payload, std::uint64_t seq) {
  if (state_.State() != ConnectionState::kActive) {
    return SendError(error_code::kBadRequest, "subscribe 이후에만 조회할 수 있습니다", seq);
  }
  std::size_t limit = options_.default_recent_limit;
  auto limit_it = payload.find("limit");
  if (limit_it != payload.end()) {
    if (!limit_it->is_number_unsigned() || limit_it->get<std::size_t>() == 0) {
      return SendError(error_code::kBadRequest, "limit은 양의 정수여야 합니다", seq);
    }
    limit = limit_it->get<std::size_t>();
  }
  SendEvent("recent", {{"events", EventsToJson(RecentForScope(limit))}}, seq);
}

std::vector<AnalyticsEvent> WebSocketSession::RecentForScope(std::size_t limit) const {
  // 필터를 먼저 적용한 뒤 가장 최근 limit개를 남긴다.
  auto capacity = services_.event_bus->BufferCapacity();
  auto events = analytics_scope_ == kGlobalScope ? services_.event_bus->GetRecentGlobal(capacity)
                                                 : services_.event_bus->GetRecent(analytics_scope_, capacity);
  events.erase(std::remove_if(events.begin(), events.end(),
                              [this](const AnalyticsEvent& event) { return !filter_.Matches(event.type); }),
               events.end());
  if (events.size() > limit) {
    events.erase(events.begin(), events.end() - static_cast<std::ptrdiff_t>(limit));
  }
  return events;
}

nlohmann::json WebSocketSession::EventsToJson(const std::vector<AnalyticsEvent>& events) const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& event : events) {
    list.push_back(event.ToJson());
  }
  return list;
}

void WebSocketSession::DeliverPresenceSnapshot(const PresenceSnapshot& snapshot) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), snapshot]() { self->OnPresenceSnapshot(snapshot); });
}

void WebSocketSession::DeliverGlobalSnapshot(const GlobalPresenceSnapshot& snapshot) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), snapshot]() { self->OnGlobalSnapshot(snapshot); });
}

void WebSocketSession::DeliverAnalyticsEvent(const AnalyticsEvent& event) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), event]() { self->OnAnalyticsEvent(event); });
}

void WebSocketSession::Shutdown(const std::string& reason) {
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), reason]() { self->CloseWithReason(websocket::close_code::going_away, reason); });
}

void WebSocketSession::OnPresenceSnapshot(const PresenceSnapshot& snapshot) {
  if (closing_ || state_.State() != ConnectionState::kActive) {
    return;
  }
  if (snapshot.organization_id != info_.identity.organization_id) {
    services_.observability->SecurityEvent("cross_tenant_delivery_blocked",
                                           {{"connectionId", info_.connection_id},
                                            {"organizationId", info_.identity.organization_id},
                                            {"snapshotOrganizationId", snapshot.organization_id}});
    return;
  }
  SendEvent("update", snapshot.ToJson(), 0, MessageKind::kPresenceSnapshot);
}

void WebSocketSession::OnGlobalSnapshot(const GlobalPresenceSnapshot& snapshot) {
  if (closing_ || state_.State() != ConnectionState::kActive || !info_.identity.IsSuperAdmin()) {
    return;
  }
  SendEvent("global", snapshot.ToJson(), 0, MessageKind::kGlobalSnapshot);
}

void WebSocketSession::OnAnalyticsEvent(const AnalyticsEvent& event) {
  if (closing_ || state_.State() != ConnectionState::kActive) {
    return;
  }
  if (analytics_scope_ != kGlobalScope && event.organization_id != analytics_scope_) {
    services_.observability->SecurityEvent("cross_tenant_delivery_blocked",
                                           {{"connectionId", info_.connection_id},
                                            {"organizationId", analytics_scope_},
                                            {"eventOrganizationId", event.organization_id}});
    return;
  }
  if (!filter_.Matches(event.type)) {
    return;
  }
  SendEvent("event", event.ToJson(), 0, MessageKind::kAnalyticsEvent);
}

void WebSocketSession::SendEvent(std::string_view event, const nlohmann::json& payload, std::uint64_t seq,
                                 MessageKind kind) {
  WsEnvelope env{.type = "event", .event = std::string(event), .seq = seq, .payload = payload};
  Enqueue(kind, ToWsJson(env).dump());
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  Enqueue(MessageKind::kControl, ToWsJson(env).dump());
}

void WebSocketSession::SendStatus(const nlohmann::json& payload) { SendEvent("status", payload, 0); }

void WebSocketSession::Enqueue(MessageKind kind, std::string message) {
  if (closing_) {
    return;
  }
  auto dropped_before = queue_.TotalDropped();
  auto result = queue_.Push(kind, std::move(message));
  auto dropped = queue_.TotalDropped() - dropped_before;
  if (dropped > 0) {
    services_.observability->AddEventsDropped(dropped);
  }
  if (result == EnqueueResult::kSlowConsumer) {
    services_.observability->IncrementSlowConsumerCloses();
    services_.observability->Log(LogLevel::kWarn, "ws.slow_consumer",
                                 {{"connectionId", info_.connection_id},
                                  {"queued", queue_.Size()},
                                  {"dropped", queue_.DroppedSinceDrain()}});
    return CloseWithReason(websocket::close_code::policy_error, error_code::kSlowConsumer);
  }
  if (result == EnqueueResult::kQueuedDegraded && queue_.TakeDegradedNotice()) {
    services_.observability->Log(LogLevel::kWarn, "ws.degraded",
                                 {{"connectionId", info_.connection_id}, {"queued", queue_.Size()}});
    SendStatus({{"degraded", true}});
  }
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (queue_.Empty() || closing_) {
    return;
  }
  writing_ = true;
  in_flight_ = queue_.TakeFront();
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(in_flight_),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  writing_ = false;
  in_flight_.clear();
  if (ec) {
    closing_ = true;
    Cleanup();
    return;
  }
  queue_.OnWriteComplete();
  if (!queue_.Empty()) {
    WriteNext();
  }
}

void WebSocketSession::RejectCrossTenant(const std::string& requested_org, std::string_view action) {
  services_.observability->SecurityEvent(error_code::kTenantIsolationViolation,
                                         {{"connectionId", info_.connection_id},
                                          {"userId", info_.identity.user_id},
                                          {"organizationId", info_.identity.organization_id},
                                          {"requestedOrganizationId", requested_org},
                                          {"action", action}});
  CloseWithReason(websocket::close_code::policy_error, error_code::kTenantIsolationViolation);
}

void WebSocketSession::CloseWithReason(websocket::close_code code, std::string_view reason) {
  if (closing_) {
    return;
  }
  closing_ = true;
  reconnect_timer_.cancel();
  queue_.Clear();
  state_.Transition(ConnectionState::kClosed);
  services_.observability->Log(LogLevel::kInfo, "ws.closing",
                               {{"connectionId", info_.connection_id}, {"reason", reason}});
  websocket::close_reason close_reason{code};
  close_reason.reason = std::string(reason);
  auto self = shared_from_this();
  ws_.async_close(close_reason, [self](boost::beast::error_code) { self->Cleanup(); });
}

void WebSocketSession::Cleanup() {
  if (cleaned_up_) {
    return;
  }
  cleaned_up_ = true;
  if (subscription_) {
    services_.event_bus->Unsubscribe(*subscription_);
    subscription_.reset();
  }
  if (presence_registered_) {
    try {
      services_.registry->Unregister(info_.identity.organization_id, info_.identity.user_id, info_.connection_id);
    } catch (const TransientStoreError& ex) {
      // 스윕이 하트비트 타임아웃 후 정리한다.
      services_.observability->Log(LogLevel::kWarn, "ws.unregister_failed",
                                   {{"connectionId", info_.connection_id}, {"reason", ex.what()}});
    }
    presence_registered_ = false;
  }
  services_.coordinator->Unregister(info_.connection_id, this);
  services_.observability->Log(LogLevel::kInfo, "ws.disconnected", {{"connectionId", info_.connection_id}});
}

}  // namespace telemetry

/*
 * 설명: HTTP 요청을 처리하고 실시간/지오 관리자 REST 경로와 WS 업그레이드를 분기한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp, server/tests/e2e/admin_api_test.cpp
 */
#include "telemetry/http_session.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string_view>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "telemetry/errors.hpp"
#include "telemetry/event_types.hpp"

namespace telemetry {

namespace http = boost::beast::http;

namespace {
constexpr char kServerName[] = "telemetry-core";
constexpr std::string_view kRealtimePrefix = "/api/admin/analytics/realtime";
constexpr std::string_view kGeoPrefix = "/api/admin/analytics/geo";
constexpr std::string_view kAdminPrefix = "/api/admin/analytics/";
constexpr std::string_view kOrgUsersPrefix = "/api/admin/analytics/realtime/concurrent-users/organization/";
constexpr std::string_view kUserOnlinePrefix = "/api/admin/analytics/realtime/concurrent-users/user/";
constexpr std::size_t kGlobalBreakdownLimit = 50;
constexpr long kStaleGeoDatabaseDays = 7;

HttpSession::QueryParams ParseQueryParams(const std::string& query) {
  HttpSession::QueryParams params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  if (value.empty() || value.size() > 9) {
    return std::nullopt;
  }
  std::size_t parsed = 0;
  for (char c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    parsed = parsed * 10 + static_cast<std::size_t>(c - '0');
  }
  return parsed;
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

nlohmann::json SharesToJson(const std::vector<GeoShare>& shares) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& share : shares) {
    list.push_back(share.ToJson());
  }
  return list;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, HttpServices services)
    : stream_(std::move(socket)), config_(config), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  // 업그레이드 요청과 인증은 이 시간 안에 끝나야 한다. 초과하면 tcp_stream이 소켓을 닫는다.
  stream_.expires_after(std::chrono::seconds(config_.handshake_timeout_seconds));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec == boost::beast::error::timeout) {
    auto obs = services_.gateway.observability;
    obs->IncrementAuthFailures();
    obs->Log(LogLevel::kWarn, "auth.handshake_timeout",
             {{"category", "security"},
              {"code", error_code::kAuthError},
              {"timeoutSeconds", config_.handshake_timeout_seconds}});
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  auto obs = services_.gateway.observability;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = obs->NextTraceId();
  obs->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }
  auto params = ParseQueryParams(query);
  auto method = req_.method();

  if (method == http::verb::get && path == "/api/health") {
    return Reply(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  if (method == http::verb::get && path == "/metrics") {
    auto snapshot = obs->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"events", {{"published", snapshot.events_published}, {"dropped", snapshot.events_dropped}}},
                        {"broadcast",
                         {{"snapshotsSent", snapshot.snapshots_sent}, {"ticksSkipped", snapshot.ticks_skipped}}},
                        {"security",
                         {{"isolationViolations", snapshot.isolation_violations},
                          {"authFailures", snapshot.auth_failures}}},
                        {"slowConsumerCloses", snapshot.slow_consumer_closes}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (method == http::verb::get && path == "/ops/status") {
    auto header_it = req_.base().find("X-Ops-Token");
    std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
    if (config_.ops_token.empty() || header_token != config_.ops_token) {
      return ReplyError(res, http::status::unauthorized, error_code::kAuthError, "운영 토큰이 올바르지 않습니다");
    }
    auto snapshot = obs->Snapshot();
    auto health = services_.gateway.registry->Health();
    nlohmann::json data{{"activeWebsocket", snapshot.websocket_active},
                        {"storeReachable", health.store_reachable},
                        {"presenceConnections", health.total_connections},
                        {"errorCount", snapshot.request_errors}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (!StartsWith(path, kAdminPrefix)) {
    return ReplyError(res, http::status::not_found, error_code::kNotFound, "지원되지 않는 경로입니다");
  }

  std::string auth_error;
  auto identity = Authenticate(auth_error);
  if (!identity) {
    obs->IncrementAuthFailures();
    obs->Log(LogLevel::kWarn, "auth.rejected", {{"category", "security"}, {"path", path}, {"reason", auth_error}});
    return ReplyError(res, http::status::unauthorized, error_code::kAuthError, auth_error);
  }
  identity_ = identity;

  try {
    if (method == http::verb::get && path == std::string(kRealtimePrefix) + "/concurrent-users") {
      return HandleConcurrentUsers(*identity, res);
    }
    if (method == http::verb::get && StartsWith(path, kOrgUsersPrefix) && path.size() > kOrgUsersPrefix.size()) {
      return HandleOrganizationUsers(*identity, path.substr(kOrgUsersPrefix.size()), res);
    }
    if (method == http::verb::get && StartsWith(path, kUserOnlinePrefix) && path.size() > kUserOnlinePrefix.size()) {
      return HandleUserOnline(*identity, path.substr(kUserOnlinePrefix.size()), params, res);
    }
    if (method == http::verb::get && path == std::string(kRealtimePrefix) + "/health") {
      return HandleRealtimeHealth(*identity, res);
    }
    if (method == http::verb::post && path == std::string(kRealtimePrefix) + "/events/publish") {
      return HandlePublish(*identity, res);
    }
    if (method == http::verb::get && path == std::string(kRealtimePrefix) + "/events/recent") {
      return HandleRecentEvents(*identity, params, res);
    }
    if (method == http::verb::get && path == std::string(kRealtimePrefix) + "/websocket-info") {
      return HandleConnectionInfo(*identity, res);
    }
    if (method == http::verb::get && path == std::string(kGeoPrefix) + "/distribution") {
      return HandleGeoDistribution(*identity, params, res);
    }
    if (method == http::verb::get && path == std::string(kGeoPrefix) + "/heatmap") {
      return HandleGeoHeatmap(*identity, params, res);
    }
    if (method == http::verb::get && path == std::string(kGeoPrefix) + "/global") {
      return HandleGeoGlobal(*identity, params, res);
    }
    if (method == http::verb::get && path == std::string(kGeoPrefix) + "/sessions") {
      return HandleGeoSessions(*identity, params, res);
    }
    if (method == http::verb::get && path == std::string(kGeoPrefix) + "/status") {
      return HandleGeoStatus(*identity, res);
    }
    if (method == http::verb::post && path == std::string(kGeoPrefix) + "/track") {
      return HandleGeoTrack(*identity, res);
    }
  } catch (const TransientStoreError& ex) {
    obs->Log(LogLevel::kWarn, "http.store_unavailable", {{"path", path}, {"reason", ex.what()}});
    return ReplyError(res, http::status::service_unavailable, error_code::kStoreUnavailable,
                      "저장소가 일시적으로 응답하지 않습니다");
  } catch (const DbException& ex) {
    obs->Log(LogLevel::kError, "http.db_error", {{"path", path}, {"reason", ex.what()}, {"code", ex.code}});
    return ReplyError(res, http::status::internal_server_error, error_code::kInternalError,
                      "요청을 처리하지 못했습니다");
  } catch (const std::exception& ex) {
    obs->Log(LogLevel::kError, "http.unhandled", {{"path", path}, {"reason", ex.what()}});
    return ReplyError(res, http::status::internal_server_error, error_code::kInternalError,
                      "요청을 처리하지 못했습니다");
  }

  ReplyError(res, http::status::not_found, error_code::kNotFound, "지원되지 않는 경로입니다");
}

void HttpSession::HandleConcurrentUsers(const Identity& identity, const std::shared_ptr<Response>& res) {
  const auto& registry = services_.gateway.registry;
  auto now = std::chrono::system_clock::now();
  if (identity.IsSuperAdmin()) {
    auto breakdown = registry->GlobalBreakdown(now);
    std::size_t total = 0;
    nlohmann::json by_org = nlohmann::json::array();
    for (const auto& entry : breakdown) {
      total += entry.total_users;
      if (by_org.size() < kGlobalBreakdownLimit) {
        by_org.push_back({{"organizationId", entry.organization_id}, {"count", entry.total_users}});
      }
    }
    nlohmann::json data{{"type", "global"},
                        {"stats",
                         {{"totalUsers", total}, {"organizationCount", breakdown.size()}, {"byOrganization", by_org}}},
                        {"timestamp", FormatIsoTimestamp(now)}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }
  auto count = registry->CountActive(identity.organization_id, now);
  nlohmann::json data{{"type", "organization"},
                      {"stats", {{"organizationId", identity.organization_id}, {"count", count}}},
                      {"timestamp", FormatIsoTimestamp(now)}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleOrganizationUsers(const Identity& identity, const std::string& org_id,
                                          const std::shared_ptr<Response>& res) {
  if (!CheckOrganizationAccess(identity, org_id, "concurrent-users.organization", res)) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  const auto& registry = services_.gateway.registry;
  nlohmann::json data{{"organizationId", org_id},
                      {"count", registry->CountActive(org_id, now)},
                      {"distinctUsers", registry->OrganizationUsers(org_id, now).size()},
                      {"timestamp", FormatIsoTimestamp(now)}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleUserOnline(const Identity& identity, const std::string& user_id, const QueryParams& params,
                                   const std::shared_ptr<Response>& res) {
  if (!identity.IsSuperAdmin() && identity.user_id != user_id) {
    return ReplyError(res, http::status::forbidden, error_code::kForbidden, "접근 권한이 없습니다");
  }
  // 슈퍼 관리자는 organizationId로 다른 조직의 사용자를 조회할 수 있다.
  std::string org_id = identity.organization_id;
  auto org_it = params.find("organizationId");
  if (org_it != params.end() && !org_it->second.empty()) {
    org_id = org_it->second;
  }
  if (!CheckOrganizationAccess(identity, org_id, "concurrent-users.user", res)) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  nlohmann::json data{{"userId", user_id},
                      {"organizationId", org_id},
                      {"isOnline", services_.gateway.registry->IsUserOnline(org_id, user_id, now)},
                      {"timestamp", FormatIsoTimestamp(now)}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleRealtimeHealth(const Identity& identity, const std::shared_ptr<Response>& res) {
  if (!identity.IsOperator()) {
    return ReplyError(res, http::status::forbidden, error_code::kForbidden, "관리자 권한이 필요합니다");
  }
  const auto& gateway = services_.gateway;
  auto registry_health = gateway.registry->Health();
  auto geo_stats = services_.geo_resolver->Stats();
  bool geo_ready = services_.geo_resolver->DatabaseLoaded();
  bool healthy = registry_health.store_reachable;
  nlohmann::json data{
      {"status", healthy ? "healthy" : "degraded"},
      {"services",
       {{"concurrentUsers",
         {{"status", registry_health.store_reachable ? "healthy" : "unhealthy"},
          {"details",
           {{"totalConnections", registry_health.total_connections},
            {"organizationCount", registry_health.organization_count}}}}},
        {"store", {{"status", services_.store->Ping() ? "healthy" : "unhealthy"}}},
        {"analyticsPublisher",
         {{"status", "healthy"},
          {"subscribers", gateway.event_bus->SubscriberCount()},
          {"bufferCapacity", gateway.event_bus->BufferCapacity()}}},
        {"broadcastScheduler",
         {{"intervalMs", gateway.scheduler->Interval().count()}, {"ticks", gateway.scheduler->TickCount()}}},
        {"geoResolver",
         {{"status", geo_ready ? "healthy" : "degraded"},
          {"databaseEntries", services_.geo_resolver->DatabaseSize()},
          {"cacheHits", geo_stats.cache_hits},
          {"databaseLookups", geo_stats.database_lookups}}},
        {"gateway",
         {{"presenceConnections", gateway.coordinator->ActiveConnections(Channel::kPresence)},
          {"analyticsConnections", gateway.coordinator->ActiveConnections(Channel::kAnalytics)}}}}},
      {"timestamp", FormatIsoTimestamp(std::chrono::system_clock::now())}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandlePublish(const Identity& identity, const std::shared_ptr<Response>& res) {
  auto body = nlohmann::json::parse(req_.body(), nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("type") || !body["type"].is_string()) {
    return ReplyError(res, http::status::bad_request, error_code::kBadRequest, "type 필드가 필요합니다");
  }
  auto type = ParseEventType(body["type"].get<std::string>());
  if (!type) {
    return ReplyError(res, http::status::bad_request, error_code::kBadRequest, "알 수 없는 이벤트 유형입니다");
  }
  nlohmann::json data = body.value("data", nlohmann::json::object());
  if (!data.is_object()) {
    return ReplyError(res, http::status::bad_request, error_code::kBadRequest, "data는 객체여야 합니다");
  }
  EventMetadata metadata;
  metadata.user_id = identity.user_id;
  auto meta_it = body.find("metadata");
  if (meta_it != body.end()) {
    if (!meta_it->is_object()) {
      return ReplyError(res, http::status::bad_request, error_code::kBadRequest, "metadata는 객체여야 합니다");
    }
    if (meta_it->contains("userId") && (*meta_it)["userId"].is_string()) {
      metadata.user_id = (*meta_it)["userId"].get<std::string>();
    }
    if (meta_it->contains("sessionId") && (*meta_it)["sessionId"].is_string()) {
      metadata.session_id = (*meta_it)["sessionId"].get<std::string>();
    }
    if (meta_it->contains("source") && (*meta_it)["source"].is_string()) {
      metadata.source = (*meta_it)["source"].get<std::string>();
    }
  }

  auto event = services_.gateway.event_bus->Publish(identity.organization_id, *type, data, metadata);
  if (!event) {
    return ReplyError(res, http::status::service_unavailable, error_code::kStoreUnavailable,
                      "이벤트 브로커가 일시적으로 응답하지 않습니다");
  }
  nlohmann::json payload{{"published", true},
                         {"id", event->id},
                         {"type", ToString(event->type)},
                         {"timestamp", FormatIsoTimestamp(event->timestamp)}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(payload));
}

void HttpSession::HandleRecentEvents(const Identity& identity, const QueryParams& params,
                                     const std::shared_ptr<Response>& res) {
  const auto& bus = services_.gateway.event_bus;
  std::size_t limit = bus->BufferCapacity();
  auto limit_it = params.find("limit");
  if (limit_it != params.end()) {
    auto parsed = ParsePositiveInt(limit_it->second);
    if (!parsed || *parsed == 0) {
      return ReplyError(res, http::status::bad_request, error_code::kBadRequest, "limit은 양의 정수여야 합니다");
    }
    limit = std::min(*parsed, bus->BufferCapacity());
  }
  std::string org_id = identity.organization_id;
  auto org_it = params.find("organizationId");
  if (org_it != params.end()) {
    org_id = org_it->second;
  }
  std::vector<AnalyticsEvent> events;
  if (org_id == WebSocketSession::kGlobalScope) {
    if (!identity.IsSuperAdmin()) {
      return ReplyError(res, http::status::forbidden, error_code::kForbidden, "전역 조회 권한이 없습니다");
    }
    events = bus->GetRecentGlobal(limit);
  } else {
    if (!CheckOrganizationAccess(identity, org_id, "events.recent", res)) {
      return;
    }
    events = bus->GetRecent(org_id, limit);
  }
  nlohmann::json list = nlohmann::json::array();
  for (const auto& event : events) {
    list.push_back(event.ToJson());
  }
  Reply(res, http::status::ok, MakeSuccessEnvelope({{"organizationId", org_id}, {"events", list}}));
}

void HttpSession::HandleConnectionInfo(const Identity& identity, const std::shared_ptr<Response>& res) {
  nlohmann::json channels = nlohmann::json::array();
  channels.push_back({{"path", "/ws/presence"},
                      {"outgoing", {"init", "update", "global", "status", "error"}},
                      {"incoming", {"get", "heartbeat"}}});
  channels.push_back({{"path", "/ws/analytics"},
                      {"outgoing", {"subscribed", "event", "recent", "status", "error"}},
                      {"incoming", {"subscribe", "getRecent", "heartbeat"}}});
  nlohmann::json event_types = nlohmann::json::array();
  for (std::size_t i = 0; i < kEventTypeCount; ++i) {
    event_types.push_back(ToString(static_cast<EventType>(i)));
  }
  nlohmann::json data{{"channels", channels},
                      {"authentication", {{"header", "Authorization: Bearer <token>"}, {"query", "token"}}},
                      {"scope", identity.IsSuperAdmin() ? "global" : "organization"},
                      {"eventTypes", event_types},
                      {"heartbeatTimeoutSeconds", config_.heartbeat_timeout_seconds},
                      {"broadcastIntervalMs", config_.broadcast_interval_ms}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleGeoDistribution(const Identity& identity, const QueryParams& params,
                                        const std::shared_ptr<Response>& res) {
  auto days = ParseWindowDays(params, res);
  if (!days) {
    return;
  }
  std::string type = "country";
  auto type_it = params.find("type");
  if (type_it != params.end()) {
    type = type_it->second;
  }
  std::string org_id = identity.organization_id;
  auto org_it = params.find("organizationId");
  if (org_it != params.end()) {
    org_id = org_it->second;
  }
  if (!CheckOrganizationAccess(identity, org_id, "geo.distribution", res)) {
    return;
  }

  std::vector<GeoShare> shares;
  nlohmann::json data{{"organizationId", org_id}, {"days", *days}, {"type", type}};
  if (type == "country") {
    shares = services_.geo_aggregator->AggregateByCountry(org_id, *days);
  } else if (type == "region") {
    auto country_it = params.find("countryCode");
    if (country_it == params.end() || country_it->second.size() != 2) {
      return ReplyError(res, http::status::bad_request, error_code::kBadRequest,
                        "region 분포에는 2자리 countryCode가 필요합니다");
    }
    shares = services_.geo_aggregator->AggregateByRegion(org_id, country_it->second, *days);
    data["countryCode"] = country_it->second;
  } else {
    return ReplyError(res, http::status::bad_request, error_code::kBadRequest, "type은 country 또는 region이어야 합니다");
  }
  std::size_t total = 0;
  for (const auto& share : shares) {
    total += share.count;
  }
  data["total"] = total;
  data["distribution"] = SharesToJson(shares);
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleGeoHeatmap(const Identity& identity, const QueryParams& params,
                                   const std::shared_ptr<Response>& res) {
  auto days = ParseWindowDays(params, res);
  if (!days) {
    return;
  }
  auto points = services_.geo_aggregator->HeatmapPoints(identity.organization_id, *days);
  nlohmann::json list = nlohmann::json::array();
  for (const auto& point : points) {
    list.push_back(point.ToJson());
  }
  nlohmann::json data{{"organizationId", identity.organization_id},
                      {"days", *days},
                      {"maxPoints", services_.geo_aggregator->HeatmapCap()},
                      {"points", list}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleGeoGlobal(const Identity& identity, const QueryParams& params,
                                  const std::shared_ptr<Response>& res) {
  if (!identity.IsSuperAdmin()) {
    return ReplyError(res, http::status::forbidden, error_code::kForbidden, "전역 분포는 슈퍼 관리자만 볼 수 있습니다");
  }
  auto days = ParseWindowDays(params, res);
  if (!days) {
    return;
  }
  auto shares = services_.geo_aggregator->GlobalDistribution(*days);
  std::size_t total = 0;
  for (const auto& share : shares) {
    total += share.count;
  }
  nlohmann::json data{{"days", *days}, {"total", total}, {"distribution", SharesToJson(shares)}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleGeoSessions(const Identity& identity, const QueryParams& params,
                                    const std::shared_ptr<Response>& res) {
  std::size_t limit = GeoAggregator::kDefaultSessionLimit;
  auto limit_it = params.find("limit");
  if (limit_it != params.end()) {
    auto parsed = ParsePositiveInt(limit_it->second);
    if (!parsed || *parsed < 1 || *parsed > GeoAggregator::kMaxSessionLimit) {
      return ReplyError(res, http::status::bad_request, error_code::kBadRequest, "limit은 1에서 1000 사이여야 합니다");
    }
    limit = *parsed;
  }
  std::string org_id = identity.organization_id;
  auto org_it = params.find("organizationId");
  if (org_it != params.end()) {
    org_id = org_it->second;
  }
  if (!CheckOrganizationAccess(identity, org_id, "geo.sessions", res)) {
    return;
  }

  auto page = services_.geo_aggregator->SessionLocations(org_id, limit);
  nlohmann::json list = nlohmann::json::array();
  for (const auto& session : page.sessions) {
    list.push_back(session.ToJson());
  }
  services_.gateway.observability->Log(LogLevel::kInfo, "geo.sessions_listed",
                                       {{"organizationId", org_id}, {"returned", page.sessions.size()}});
  nlohmann::json data{{"organizationId", org_id},
                      {"sessions", list},
                      {"meta", {{"total", page.total}, {"returned", page.sessions.size()}, {"limit", limit}}}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleGeoStatus(const Identity& identity, const std::shared_ptr<Response>& res) {
  if (!identity.IsOperator()) {
    return ReplyError(res, http::status::forbidden, error_code::kForbidden, "관리자 권한이 필요합니다");
  }
  const auto& resolver = services_.geo_resolver;
  bool initialized = resolver->DatabaseLoaded();
  auto file = GeoDatabase::InspectFile(config_.geoip_db_path);
  auto loaded_at = resolver->DatabaseLoadedAt();
  auto stats = resolver->Stats();
  bool stale = file.age_days && *file.age_days > kStaleGeoDatabaseDays;
  nlohmann::json details{
      {"initialized", initialized},
      {"databaseExists", file.exists},
      {"databaseAgeDays", file.age_days ? nlohmann::json(*file.age_days) : nlohmann::json(nullptr)},
      {"databaseLoadedAt", loaded_at ? nlohmann::json(FormatIsoTimestamp(*loaded_at)) : nlohmann::json(nullptr)},
      {"databaseEntries", resolver->DatabaseSize()},
      {"recommendation", stale ? "지오 데이터베이스가 7일 이상 지났습니다. 갱신을 권장합니다"
                               : "지오 데이터베이스가 최신입니다"},
      {"cache",
       {{"hits", stats.cache_hits}, {"databaseLookups", stats.database_lookups}, {"unknown", stats.unknown_results}}},
      {"storeReachable", services_.geo_aggregator->StoreReachable()}};
  services_.gateway.observability->Log(LogLevel::kInfo, "geo.status_checked",
                                       {{"userId", identity.user_id}, {"initialized", initialized}});
  nlohmann::json data{{"service", "geoip"}, {"status", initialized ? "healthy" : "degraded"}, {"details", details}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleGeoTrack(const Identity& identity, const std::shared_ptr<Response>& res) {
  auto body = nlohmann::json::parse(req_.body(), nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("sessionId") || !body["sessionId"].is_string() ||
      body["sessionId"].get<std::string>().empty()) {
    return ReplyError(res, http::status::bad_request, error_code::kBadRequest, "sessionId가 필요합니다");
  }
  TrackRequest request;
  request.session_id = body["sessionId"].get<std::string>();
  request.user_id = body.contains("userId") && body["userId"].is_string() ? body["userId"].get<std::string>()
                                                                           : identity.user_id;
  request.organization_id = identity.organization_id;
  request.ip = body.contains("ip") && body["ip"].is_string() ? body["ip"].get<std::string>() : RemoteIp();
  services_.geo_tracker->TrackAsync(std::move(request));
  Reply(res, http::status::accepted, MakeSuccessEnvelope({{"accepted", true}}));
}

std::optional<Identity> HttpSession::Authenticate(std::string& error_message) {
  std::string token;
  auto auth_it = req_.find(http::field::authorization);
  if (auth_it != req_.end()) {
    token = ParseBearer(std::string(auth_it->value()));
  }
  if (token.empty()) {
    std::string target = std::string(req_.target());
    auto qpos = target.find('?');
    if (qpos != std::string::npos) {
      auto params = ParseQueryParams(target.substr(qpos + 1));
      auto it = params.find("token");
      if (it != params.end()) {
        token = it->second;
      }
    }
  }
  if (token.empty()) {
    error_message = "인증이 필요합니다";
    return std::nullopt;
  }
  return services_.auth->Verify(token, error_message);
}

bool HttpSession::CheckOrganizationAccess(const Identity& identity, const std::string& org_id,
                                          std::string_view action, const std::shared_ptr<Response>& res) {
  if (identity.CanAccessOrganization(org_id)) {
    return true;
  }
  services_.gateway.observability->SecurityEvent(error_code::kTenantIsolationViolation,
                                                 {{"userId", identity.user_id},
                                                  {"organizationId", identity.organization_id},
                                                  {"requestedOrganizationId", org_id},
                                                  {"action", std::string(action)},
                                                  {"traceId", trace_id_}});
  ReplyError(res, http::status::forbidden, error_code::kTenantIsolationViolation,
             "다른 조직의 데이터에 접근할 수 없습니다");
  return false;
}

std::optional<int> HttpSession::ParseWindowDays(const QueryParams& params, const std::shared_ptr<Response>& res) {
  auto it = params.find("days");
  if (it == params.end()) {
    return GeoAggregator::kDefaultWindowDays;
  }
  auto parsed = ParsePositiveInt(it->second);
  if (!parsed || *parsed < 1 || *parsed > static_cast<std::size_t>(GeoAggregator::kMaxWindowDays)) {
    ReplyError(res, http::status::bad_request, error_code::kBadRequest, "days는 1에서 365 사이여야 합니다");
    return std::nullopt;
  }
  return static_cast<int>(*parsed);
}

void HttpSession::Reply(const std::shared_ptr<Response>& res, http::status status, const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::ReplyError(const std::shared_ptr<Response>& res, http::status status, std::string_view code,
                             std::string_view message) {
  Reply(res, status, MakeErrorEnvelope(code, message));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  auto obs = services_.gateway.observability;
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    obs->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  LogContext ctx{trace_id_, std::nullopt, std::nullopt, std::nullopt, std::string(req_.target()), static_cast<long>(latency)};
  if (identity_) {
    ctx.user_id = identity_->user_id;
    ctx.organization_id = identity_->organization_id;
  }
  obs->Log(ctx);
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  auto obs = services_.gateway.observability;
  request_start_ = std::chrono::steady_clock::now();
  std::string target = std::string(req_.target());
  std::string path = target.substr(0, target.find('?'));

  std::optional<Channel> channel;
  if (path == "/ws/presence") {
    channel = Channel::kPresence;
  } else if (path == "/ws/analytics") {
    channel = Channel::kAnalytics;
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");
  if (!channel) {
    return ReplyError(res, http::status::not_found, error_code::kNotFound, "지원되지 않는 WS 경로입니다");
  }

  std::string auth_error;
  auto identity = Authenticate(auth_error);
  if (!identity) {
    obs->IncrementAuthFailures();
    obs->Log(LogLevel::kWarn, "auth.rejected", {{"category", "security"}, {"path", path}, {"reason", auth_error}});
    return ReplyError(res, http::status::unauthorized, error_code::kAuthError, auth_error);
  }

  ConnectionInfo info{services_.gateway.coordinator->NextConnectionId(), *channel, *identity};
  WebSocketSessionOptions options;
  options.queue_limits = OutboundQueueLimits{config_.ws_queue_soft_limit, config_.ws_queue_hard_limit,
                                             config_.ws_queue_limit_bytes};

  // 이후 타임아웃은 websocket 스트림이 관리한다.
  stream_.expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  boost::beast::websocket::stream_base::timeout timeouts{};
  timeouts.handshake_timeout = std::chrono::seconds(config_.handshake_timeout_seconds);
  timeouts.idle_timeout = std::chrono::seconds(config_.heartbeat_timeout_seconds);
  timeouts.keep_alive_pings = true;
  ws.set_option(timeouts);
  ws.set_option(boost::beast::websocket::stream_base::decorator(
      [](boost::beast::websocket::response_type& response) { response.set(http::field::server, kServerName); }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    obs->Log(LogLevel::kDebug, "ws.accept_failed", {{"reason", ec.message()}});
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), std::move(info), services_.gateway, options)->Run();
}

std::string HttpSession::RemoteIp() {
  auto forwarded_it = req_.find("X-Forwarded-For");
  if (forwarded_it != req_.end()) {
    std::string forwarded = std::string(forwarded_it->value());
    auto comma = forwarded.find(',');
    auto first = forwarded.substr(0, comma);
    auto begin = first.find_first_not_of(' ');
    auto end = first.find_last_not_of(' ');
    if (begin != std::string::npos) {
      return first.substr(begin, end - begin + 1);
    }
  }
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

std::string HttpSession::ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace telemetry

/*
 * 설명: HTTP 연결 하나를 처리한다. 실시간/지오 관리자 REST 경로와 WS 업그레이드(인증 포함)를 분기한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp, server/tests/e2e/admin_api_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "telemetry/api_response.hpp"
#include "telemetry/auth.hpp"
#include "telemetry/config.hpp"
#include "telemetry/geo_aggregator.hpp"
#include "telemetry/geo_resolver.hpp"
#include "telemetry/session_geo_tracker.hpp"
#include "telemetry/shared_store.hpp"
#include "telemetry/websocket_session.hpp"

namespace telemetry {

struct HttpServices {
  std::shared_ptr<AuthService> auth;
  GatewayServices gateway;
  std::shared_ptr<SharedStore> store;
  std::shared_ptr<GeoResolver> geo_resolver;
  std::shared_ptr<SessionGeoTracker> geo_tracker;
  std::shared_ptr<GeoAggregator> geo_aggregator;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;
  using QueryParams = std::unordered_map<std::string, std::string>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, HttpServices services);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleWebSocket();

  void HandleConcurrentUsers(const Identity& identity, const std::shared_ptr<Response>& res);
  void HandleOrganizationUsers(const Identity& identity, const std::string& org_id,
                               const std::shared_ptr<Response>& res);
  void HandleUserOnline(const Identity& identity, const std::string& user_id, const QueryParams& params,
                        const std::shared_ptr<Response>& res);
  void HandleRealtimeHealth(const Identity& identity, const std::shared_ptr<Response>& res);
  void HandlePublish(const Identity& identity, const std::shared_ptr<Response>& res);
  void HandleRecentEvents(const Identity& identity, const QueryParams& params, const std::shared_ptr<Response>& res);
  void HandleConnectionInfo(const Identity& identity, const std::shared_ptr<Response>& res);
  void HandleGeoDistribution(const Identity& identity, const QueryParams& params,
                             const std::shared_ptr<Response>& res);
  void HandleGeoHeatmap(const Identity& identity, const QueryParams& params, const std::shared_ptr<Response>& res);
  void HandleGeoGlobal(const Identity& identity, const QueryParams& params, const std::shared_ptr<Response>& res);
  void HandleGeoSessions(const Identity& identity, const QueryParams& params, const std::shared_ptr<Response>& res);
  void HandleGeoStatus(const Identity& identity, const std::shared_ptr<Response>& res);
  void HandleGeoTrack(const Identity& identity, const std::shared_ptr<Response>& res);

  std::optional<Identity> Authenticate(std::string& error_message);
  // 다른 조직을 요청했는데 권한이 없으면 보안 로그를 남기고 403을 채운 뒤 false.
  bool CheckOrganizationAccess(const Identity& identity, const std::string& org_id, std::string_view action,
                               const std::shared_ptr<Response>& res);
  std::optional<int> ParseWindowDays(const QueryParams& params, const std::shared_ptr<Response>& res);
  std::string RemoteIp();
  std::string ParseBearer(const std::string& header_value);

  void Reply(const std::shared_ptr<Response>& res, boost::beast::http::status status, const nlohmann::json& body);
  void ReplyError(const std::shared_ptr<Response>& res, boost::beast::http::status status, std::string_view code,
                  std::string_view message);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  HttpServices services_;
  std::optional<Identity> identity_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace telemetry

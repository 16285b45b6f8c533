#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "telemetry/app.hpp"
#include "telemetry/auth.hpp"

namespace {

namespace http = boost::beast::http;

telemetry::AppConfig TestConfig(unsigned short port) {
  telemetry::AppConfig cfg{};
  cfg.port = port;
  cfg.db_host = "127.0.0.1";
  cfg.db_port = 3306;
  cfg.db_user = "app";
  cfg.db_password = "app_pass";
  cfg.db_name = "app_db";
  cfg.log_level = "warn";
  cfg.auth_token_secret = "e2e-admin-secret";
  cfg.handshake_timeout_seconds = 5;
  cfg.heartbeat_timeout_seconds = 30;
  cfg.presence_sweep_interval_seconds = 10;
  cfg.broadcast_interval_ms = 1000;
  cfg.ws_queue_soft_limit = 64;
  cfg.ws_queue_hard_limit = 256;
  cfg.ws_queue_limit_bytes = 1 << 20;
  cfg.event_buffer_capacity = 100;
  cfg.geoip_db_path = TELEMETRY_GEO_DB_PATH;
  cfg.geo_cache_ttl_seconds = 3600;
  cfg.geo_truncate_ip = true;
  cfg.ip_hash_salt = "e2e-salt";
  cfg.heatmap_max_points = 500;
  cfg.geo_worker_threads = 1;
  cfg.ops_token = "ops-secret";
  return cfg;
}

struct SimpleHttpResponse {
  http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
  EXPECT_TRUE(body["meta"].is_object());
}

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
}

class AdminApiFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestConfig(18092);
    app_ = std::make_unique<telemetry::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    host_ = "127.0.0.1";
    port_ = config_.port;
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  std::string TokenFor(const std::string& user_id, const std::string& org_id, const std::string& role = "member") {
    return app_->GetAuthService()->Sign({user_id, org_id, role},
                                        std::chrono::system_clock::now() + std::chrono::hours(1));
  }

  SimpleHttpResponse Send(http::verb method, const std::string& target, const std::string& token,
                          const std::string& body = {}, const std::string& ops_token = {}) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    stream.connect(results);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, host_);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!token.empty()) {
      req.set(http::field::authorization, "Bearer " + token);
    }
    if (!ops_token.empty()) {
      req.set("X-Ops-Token", ops_token);
    }
    if (!body.empty()) {
      req.set(http::field::content_type, "application/json");
      req.body() = body;
      req.prepare_payload();
    }
    http::write(stream, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse Get(const std::string& target, const std::string& token = {}) {
    return Send(http::verb::get, target, token);
  }

  SimpleHttpResponse PostJson(const std::string& target, const nlohmann::json& body, const std::string& token) {
    return Send(http::verb::post, target, token, body.dump());
  }

  telemetry::AppConfig config_{};
  std::unique_ptr<telemetry::ServerApp> app_{};
  std::thread server_thread_{};
  std::string host_{};
  unsigned short port_{0};
};

}  // namespace

TEST_F(AdminApiFixture, HealthAndMetricsAreOpen) {
  auto health = Get("/api/health");
  EXPECT_EQ(health.status, http::status::ok);
  ExpectSuccessEnvelope(health.body);
  EXPECT_EQ(health.body["data"]["status"], "ok");

  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.status, http::status::ok);
  ExpectSuccessEnvelope(metrics.body);
  EXPECT_GE(metrics.body["data"]["requests"]["total"].get<std::uint64_t>(), 1u);
  EXPECT_TRUE(metrics.body["data"]["security"].contains("isolationViolations"));
}

TEST_F(AdminApiFixture, OpsStatusRequiresOpsToken) {
  auto denied = Send(http::verb::get, "/ops/status", {});
  EXPECT_EQ(denied.status, http::status::unauthorized);
  ExpectErrorEnvelope(denied.body, "auth_error");

  auto wrong = Send(http::verb::get, "/ops/status", {}, {}, "nope");
  EXPECT_EQ(wrong.status, http::status::unauthorized);

  auto ok = Send(http::verb::get, "/ops/status", {}, {}, "ops-secret");
  EXPECT_EQ(ok.status, http::status::ok);
  ExpectSuccessEnvelope(ok.body);
  EXPECT_TRUE(ok.body["data"]["storeReachable"].get<bool>());
}

TEST_F(AdminApiFixture, AdminRoutesRequireToken) {
  auto missing = Get("/api/admin/analytics/realtime/concurrent-users");
  EXPECT_EQ(missing.status, http::status::unauthorized);
  ExpectErrorEnvelope(missing.body, "auth_error");

  auto bad = Get("/api/admin/analytics/realtime/concurrent-users", "abc.def.ghi");
  EXPECT_EQ(bad.status, http::status::unauthorized);
  EXPECT_GE(app_->GetObservability()->Snapshot().auth_failures, 2u);

  auto unknown = Get("/api/unknown");
  EXPECT_EQ(unknown.status, http::status::not_found);
  ExpectErrorEnvelope(unknown.body, "not_found");
}

TEST_F(AdminApiFixture, ConcurrentUsersScopedByRole) {
  auto registry = app_->GetRegistry();
  registry->Register("org-a", "u1", "s1");
  registry->Register("org-a", "u2", "s2");
  registry->Register("org-b", "u3", "s3");

  auto member = Get("/api/admin/analytics/realtime/concurrent-users", TokenFor("u1", "org-a"));
  EXPECT_EQ(member.status, http::status::ok);
  ExpectSuccessEnvelope(member.body);
  EXPECT_EQ(member.body["data"]["type"], "organization");
  EXPECT_EQ(member.body["data"]["stats"]["organizationId"], "org-a");
  EXPECT_EQ(member.body["data"]["stats"]["count"], 2);

  auto admin = Get("/api/admin/analytics/realtime/concurrent-users", TokenFor("root", "org-a", "super_admin"));
  EXPECT_EQ(admin.status, http::status::ok);
  EXPECT_EQ(admin.body["data"]["type"], "global");
  EXPECT_EQ(admin.body["data"]["stats"]["totalUsers"], 3);
  EXPECT_EQ(admin.body["data"]["stats"]["organizationCount"], 2);
  EXPECT_EQ(admin.body["data"]["stats"]["byOrganization"][0]["organizationId"], "org-a");

  auto online = Get("/api/admin/analytics/realtime/concurrent-users/user/u1", TokenFor("u1", "org-a"));
  EXPECT_EQ(online.status, http::status::ok);
  EXPECT_TRUE(online.body["data"]["isOnline"].get<bool>());

  auto other_user = Get("/api/admin/analytics/realtime/concurrent-users/user/u2", TokenFor("u1", "org-a"));
  EXPECT_EQ(other_user.status, http::status::forbidden);
}

TEST_F(AdminApiFixture, CrossOrganizationReadIsForbidden) {
  auto before = app_->GetObservability()->Snapshot().isolation_violations;
  auto res = Get("/api/admin/analytics/realtime/concurrent-users/organization/org-b", TokenFor("u1", "org-a"));
  EXPECT_EQ(res.status, http::status::forbidden);
  ExpectErrorEnvelope(res.body, "tenant_isolation_violation");
  EXPECT_EQ(app_->GetObservability()->Snapshot().isolation_violations, before + 1);

  auto own = Get("/api/admin/analytics/realtime/concurrent-users/organization/org-a", TokenFor("u1", "org-a"));
  EXPECT_EQ(own.status, http::status::ok);
  EXPECT_EQ(own.body["data"]["organizationId"], "org-a");

  auto admin = Get("/api/admin/analytics/realtime/concurrent-users/organization/org-b",
                   TokenFor("root", "org-a", "super_admin"));
  EXPECT_EQ(admin.status, http::status::ok);
}

TEST_F(AdminApiFixture, RealtimeHealthIsOperatorOnly) {
  auto member = Get("/api/admin/analytics/realtime/health", TokenFor("u1", "org-a"));
  EXPECT_EQ(member.status, http::status::forbidden);
  ExpectErrorEnvelope(member.body, "forbidden");

  auto support = Get("/api/admin/analytics/realtime/health", TokenFor("s1", "org-a", "support_admin"));
  EXPECT_EQ(support.status, http::status::ok);
  ExpectSuccessEnvelope(support.body);
  EXPECT_EQ(support.body["data"]["status"], "healthy");
  EXPECT_GT(support.body["data"]["services"]["geoResolver"]["databaseEntries"].get<std::size_t>(), 0u);
}

TEST_F(AdminApiFixture, PublishedEventAppearsInRecentEvents) {
  std::string token = TokenFor("u1", "org-a");
  auto published = PostJson("/api/admin/analytics/realtime/events/publish",
                            {{"type", "meeting:started"}, {"data", {{"meetingId", "m-42"}}}}, token);
  EXPECT_EQ(published.status, http::status::ok);
  ExpectSuccessEnvelope(published.body);
  EXPECT_TRUE(published.body["data"]["published"].get<bool>());
  EXPECT_EQ(published.body["data"]["type"], "meeting:started");

  auto recent = Get("/api/admin/analytics/realtime/events/recent?limit=10", token);
  EXPECT_EQ(recent.status, http::status::ok);
  ASSERT_EQ(recent.body["data"]["events"].size(), 1u);
  EXPECT_EQ(recent.body["data"]["events"][0]["id"], published.body["data"]["id"]);
  EXPECT_EQ(recent.body["data"]["events"][0]["data"]["meetingId"], "m-42");
  EXPECT_EQ(recent.body["data"]["events"][0]["metadata"]["userId"], "u1");

  auto other_org = Get("/api/admin/analytics/realtime/events/recent", TokenFor("u9", "org-b"));
  EXPECT_EQ(other_org.status, http::status::ok);
  EXPECT_TRUE(other_org.body["data"]["events"].empty());
}

TEST_F(AdminApiFixture, PublishRejectsUnknownType) {
  auto res = PostJson("/api/admin/analytics/realtime/events/publish", {{"type", "meeting:exploded"}},
                      TokenFor("u1", "org-a"));
  EXPECT_EQ(res.status, http::status::bad_request);
  ExpectErrorEnvelope(res.body, "bad_request");

  auto bad_limit = Get("/api/admin/analytics/realtime/events/recent?limit=0", TokenFor("u1", "org-a"));
  EXPECT_EQ(bad_limit.status, http::status::bad_request);
}

TEST_F(AdminApiFixture, WebsocketInfoDescribesChannels) {
  auto res = Get("/api/admin/analytics/realtime/websocket-info", TokenFor("u1", "org-a"));
  EXPECT_EQ(res.status, http::status::ok);
  ASSERT_EQ(res.body["data"]["channels"].size(), 2u);
  EXPECT_EQ(res.body["data"]["channels"][0]["path"], "/ws/presence");
  EXPECT_EQ(res.body["data"]["scope"], "organization");
  EXPECT_EQ(res.body["data"]["broadcastIntervalMs"], 1000);
}

TEST_F(AdminApiFixture, GeoQueriesValidateBeforeTouchingStorage) {
  std::string token = TokenFor("u1", "org-a");

  auto zero_days = Get("/api/admin/analytics/geo/distribution?days=0", token);
  EXPECT_EQ(zero_days.status, http::status::bad_request);
  ExpectErrorEnvelope(zero_days.body, "bad_request");

  auto too_many = Get("/api/admin/analytics/geo/heatmap?days=366", token);
  EXPECT_EQ(too_many.status, http::status::bad_request);

  auto not_number = Get("/api/admin/analytics/geo/distribution?days=abc", token);
  EXPECT_EQ(not_number.status, http::status::bad_request);

  auto cross = Get("/api/admin/analytics/geo/distribution?organizationId=org-b", token);
  EXPECT_EQ(cross.status, http::status::forbidden);
  ExpectErrorEnvelope(cross.body, "tenant_isolation_violation");

  auto region = Get("/api/admin/analytics/geo/distribution?type=region", token);
  EXPECT_EQ(region.status, http::status::bad_request);

  auto global = Get("/api/admin/analytics/geo/global", token);
  EXPECT_EQ(global.status, http::status::forbidden);
  ExpectErrorEnvelope(global.body, "forbidden");
}

TEST_F(AdminApiFixture, GeoTrackIsAcceptedAsynchronously) {
  std::string token = TokenFor("u1", "org-a");
  auto accepted = PostJson("/api/admin/analytics/geo/track", {{"sessionId", "sess-1"}, {"ip", "8.8.8.8"}}, token);
  EXPECT_EQ(accepted.status, http::status::accepted);
  ExpectSuccessEnvelope(accepted.body);
  EXPECT_TRUE(accepted.body["data"]["accepted"].get<bool>());

  auto missing = PostJson("/api/admin/analytics/geo/track", {{"ip", "8.8.8.8"}}, token);
  EXPECT_EQ(missing.status, http::status::bad_request);
  ExpectErrorEnvelope(missing.body, "bad_request");
}

TEST_F(AdminApiFixture, SuperAdminChecksUserOnlineInAnotherOrganization) {
  app_->GetRegistry()->Register("org-b", "u5", "s5");
  std::string root = TokenFor("root", "org-a", "super_admin");

  auto scoped = Get("/api/admin/analytics/realtime/concurrent-users/user/u5?organizationId=org-b", root);
  EXPECT_EQ(scoped.status, http::status::ok);
  EXPECT_EQ(scoped.body["data"]["organizationId"], "org-b");
  EXPECT_TRUE(scoped.body["data"]["isOnline"].get<bool>());

  auto own_org = Get("/api/admin/analytics/realtime/concurrent-users/user/u5", root);
  EXPECT_EQ(own_org.status, http::status::ok);
  EXPECT_FALSE(own_org.body["data"]["isOnline"].get<bool>());

  auto member = Get("/api/admin/analytics/realtime/concurrent-users/user/u1?organizationId=org-b",
                    TokenFor("u1", "org-a"));
  EXPECT_EQ(member.status, http::status::forbidden);
  ExpectErrorEnvelope(member.body, "tenant_isolation_violation");
}

TEST_F(AdminApiFixture, GeoSessionsValidateLimitAndOrganization) {
  std::string token = TokenFor("u1", "org-a");

  auto zero = Get("/api/admin/analytics/geo/sessions?limit=0", token);
  EXPECT_EQ(zero.status, http::status::bad_request);
  ExpectErrorEnvelope(zero.body, "bad_request");

  auto too_many = Get("/api/admin/analytics/geo/sessions?limit=1001", token);
  EXPECT_EQ(too_many.status, http::status::bad_request);

  auto not_number = Get("/api/admin/analytics/geo/sessions?limit=ten", token);
  EXPECT_EQ(not_number.status, http::status::bad_request);

  auto other_org = Get("/api/admin/analytics/geo/sessions?organizationId=org-b", token);
  EXPECT_EQ(other_org.status, http::status::forbidden);
  ExpectErrorEnvelope(other_org.body, "tenant_isolation_violation");

  auto anonymous = Get("/api/admin/analytics/geo/sessions");
  EXPECT_EQ(anonymous.status, http::status::unauthorized);
}

TEST_F(AdminApiFixture, GeoStatusIsOperatorOnly) {
  auto member = Get("/api/admin/analytics/geo/status", TokenFor("u1", "org-a"));
  EXPECT_EQ(member.status, http::status::forbidden);
  ExpectErrorEnvelope(member.body, "forbidden");

  auto support = Get("/api/admin/analytics/geo/status", TokenFor("ops", "org-a", "support_admin"));
  EXPECT_EQ(support.status, http::status::ok);
  ExpectSuccessEnvelope(support.body);
  const auto& data = support.body["data"];
  EXPECT_EQ(data["service"], "geoip");
  EXPECT_EQ(data["status"], "healthy");
  EXPECT_TRUE(data["details"]["initialized"].get<bool>());
  EXPECT_TRUE(data["details"]["databaseExists"].get<bool>());
  EXPECT_TRUE(data["details"]["databaseAgeDays"].is_number());
  EXPECT_TRUE(data["details"]["databaseLoadedAt"].is_string());
  EXPECT_GT(data["details"]["databaseEntries"].get<std::size_t>(), 0u);
  EXPECT_TRUE(data["details"]["storeReachable"].is_boolean());
  EXPECT_TRUE(data["details"]["cache"].is_object());
}

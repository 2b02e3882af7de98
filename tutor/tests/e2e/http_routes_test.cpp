#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "tutor/app.hpp"

#ifndef TUTOR_SCENARIO_DIR
#define TUTOR_SCENARIO_DIR "scenarios"
#endif

namespace {

tutor::AppConfig TestConfig(unsigned short port) {
  tutor::AppConfig cfg{};
  cfg.port = port;
  cfg.openai_api_key = "sk-test";
  // 이 테스트는 업스트림에 연결하지 않는다.
  cfg.realtime_url = "ws://127.0.0.1:1/v1/realtime";
  cfg.allowed_origins = "http://localhost:5173";
  cfg.scenario_dir = TUTOR_SCENARIO_DIR;
  cfg.log_level = "warn";
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  boost::beast::http::fields headers;
  nlohmann::json body;
};

class HttpRoutesFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestConfig(18787);
    std::string error;
    auto catalog = tutor::ScenarioCatalog::LoadFromDirectory(config_.scenario_dir, error);
    ASSERT_TRUE(catalog) << error;
    app_ = std::make_unique<tutor::ServerApp>(config_, catalog);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Request(boost::beast::http::verb verb, const std::string& target,
                             const std::optional<std::string>& origin = std::nullopt) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (origin) {
      req.set(boost::beast::http::field::origin, *origin);
    }

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), res.base(),
                              res.body().empty() ? nlohmann::json() : nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse Get(const std::string& target, const std::optional<std::string>& origin = std::nullopt) {
    return Request(boost::beast::http::verb::get, target, origin);
  }

  boost::beast::http::status UpgradeStatus(const std::string& target,
                                           const std::optional<std::string>& origin = std::nullopt) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    ws.next_layer().connect(results);
    if (origin) {
      ws.set_option(boost::beast::websocket::stream_base::decorator(
          [origin](boost::beast::websocket::request_type& req) { req.set(boost::beast::http::field::origin, *origin); }));
    }
    boost::beast::websocket::response_type res;
    boost::beast::error_code ec;
    ws.handshake(res, "localhost", target, ec);
    EXPECT_EQ(ec, boost::beast::websocket::error::upgrade_declined) << ec.message();
    return res.result();
  }

  tutor::AppConfig config_;
  std::unique_ptr<tutor::ServerApp> app_;
  std::thread server_thread_;
};

}  // namespace

TEST_F(HttpRoutesFixture, HealthAndScenarioRoutes) {
  auto health = Get("/api/health");
  EXPECT_EQ(health.status, boost::beast::http::status::ok);
  EXPECT_EQ(health.body, (nlohmann::json{{"ok", true}}));

  auto index = Get("/api/scenarios");
  EXPECT_EQ(index.status, boost::beast::http::status::ok);
  ASSERT_TRUE(index.body.is_array());
  ASSERT_EQ(index.body.size(), 1u);
  EXPECT_EQ(index.body[0]["id"], "a1_taxi_bogota");
  EXPECT_EQ(index.body[0]["level"], "A1");
  EXPECT_TRUE(index.body[0].contains("title"));

  auto scenario = Get("/api/scenarios/a1_taxi_bogota");
  EXPECT_EQ(scenario.status, boost::beast::http::status::ok);
  EXPECT_EQ(scenario.body["id"], "a1_taxi_bogota");
  EXPECT_TRUE(scenario.body["opening_line"].is_string());
  EXPECT_TRUE(scenario.body["tools"].is_array());

  auto missing = Get("/api/scenarios/b2_museum");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  EXPECT_EQ(missing.body["error"], "Scenario not found");

  auto unknown = Get("/api/unknown");
  EXPECT_EQ(unknown.status, boost::beast::http::status::not_found);
  EXPECT_EQ(unknown.body["error"], "Not found");
}

TEST_F(HttpRoutesFixture, CorsPreflightAndHeaders) {
  auto preflight = Request(boost::beast::http::verb::options, "/api/scenarios", std::string("http://localhost:5173"));
  EXPECT_EQ(preflight.status, boost::beast::http::status::no_content);
  EXPECT_EQ(preflight.headers[boost::beast::http::field::access_control_allow_origin], "http://localhost:5173");
  EXPECT_EQ(preflight.headers[boost::beast::http::field::access_control_allow_methods], "GET, OPTIONS");
  EXPECT_EQ(preflight.headers[boost::beast::http::field::access_control_allow_headers], "Content-Type");

  auto allowed = Get("/api/health", std::string("http://localhost:5173"));
  EXPECT_EQ(allowed.status, boost::beast::http::status::ok);
  EXPECT_EQ(allowed.headers[boost::beast::http::field::access_control_allow_origin], "http://localhost:5173");
}

TEST_F(HttpRoutesFixture, OriginGuardBlocksDisallowedOrigins) {
  auto blocked = Get("/api/scenarios", std::string("https://evil.example"));
  EXPECT_EQ(blocked.status, boost::beast::http::status::forbidden);
  EXPECT_EQ(blocked.body["error"], "Origin not allowed");
  EXPECT_EQ(blocked.headers.count(boost::beast::http::field::access_control_allow_origin), 0u);

  // Origin이 없는 요청은 막지 않는다.
  auto no_origin = Get("/api/scenarios");
  EXPECT_EQ(no_origin.status, boost::beast::http::status::ok);
}

TEST_F(HttpRoutesFixture, WebSocketRouteRejectsBadRequestsBeforeUpgrade) {
  auto plain = Get("/ws?scenario=a1_taxi_bogota");
  EXPECT_EQ(plain.status, boost::beast::http::status::upgrade_required);
  EXPECT_EQ(plain.body["error"], "Expected WebSocket upgrade");

  EXPECT_EQ(UpgradeStatus("/ws"), boost::beast::http::status::bad_request);
  EXPECT_EQ(UpgradeStatus("/ws?scenario="), boost::beast::http::status::bad_request);
  EXPECT_EQ(UpgradeStatus("/ws?scenario=b2_museum&user=ana"), boost::beast::http::status::bad_request);
  EXPECT_EQ(UpgradeStatus("/ws?scenario=a1_taxi_bogota", std::string("https://evil.example")),
            boost::beast::http::status::forbidden);

  // 거절된 업그레이드는 세션을 만들지 않는다.
  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.body["sessions"]["total"], 0);
  EXPECT_EQ(metrics.body["sessions"]["active"], 0);
}

TEST_F(HttpRoutesFixture, MetricsCountRequestsAndErrors) {
  Get("/api/health");
  Get("/api/scenarios/b2_museum");
  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.status, boost::beast::http::status::ok);
  EXPECT_GE(metrics.body["requests"]["total"].get<int>(), 3);
  EXPECT_GE(metrics.body["requests"]["errors"].get<int>(), 1);
  EXPECT_EQ(metrics.body["tools"]["executed"], 0);
}

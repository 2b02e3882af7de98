/*
 * 설명: HTTP 연결을 처리하고 헬스체크/시나리오/메트릭 엔드포인트와 /ws 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/e2e/http_routes_test.cpp, tutor/tests/e2e/bridge_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "tutor/config.hpp"
#include "tutor/observability.hpp"
#include "tutor/scenario_catalog.hpp"
#include "tutor/tool_dispatcher.hpp"

namespace tutor {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<const ScenarioCatalog> catalog, std::shared_ptr<const ToolDispatcher> dispatcher,
              std::shared_ptr<Observability> observability, std::shared_ptr<boost::asio::ssl::context> ssl_context);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest(const std::string& path);
  void HandleWebSocket(const std::string& query);
  std::shared_ptr<Response> MakeResponse(boost::beast::http::status status, const nlohmann::json& body) const;
  void SendResponse(std::shared_ptr<Response> res);
  std::optional<std::string> RequestOrigin() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<const ScenarioCatalog> catalog_;
  std::shared_ptr<const ToolDispatcher> dispatcher_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<boost::asio::ssl::context> ssl_context_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace tutor

/*
 * 설명: HTTP 요청을 라우팅하고 CORS/오리진 검사를 적용하며 /ws 업그레이드를 세션 액터에 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/e2e/http_routes_test.cpp, tutor/tests/e2e/bridge_flow_test.cpp
 */
#include "tutor/http_session.hpp"

#include <utility>

#include <boost/beast/http.hpp>

#include "tutor/api_response.hpp"
#include "tutor/cors.hpp"
#include "tutor/session_bridge.hpp"
#include "tutor/url.hpp"
#include "tutor/websocket_session.hpp"

namespace tutor {

namespace {
constexpr std::string_view kScenarioPrefix = "/api/scenarios/";

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<const ScenarioCatalog> catalog,
                         std::shared_ptr<const ToolDispatcher> dispatcher,
                         std::shared_ptr<Observability> observability,
                         std::shared_ptr<boost::asio::ssl::context> ssl_context)
    : stream_(std::move(socket)), config_(config), catalog_(std::move(catalog)), dispatcher_(std::move(dispatcher)),
      observability_(std::move(observability)), ssl_context_(std::move(ssl_context)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  std::string target = std::string(req_.target());
  std::string path = target;
  std::string query;
  auto qpos = target.find('?');
  if (qpos != std::string::npos) {
    path = target.substr(0, qpos);
    query = target.substr(qpos + 1);
  }

  if (path == "/ws") {
    return HandleWebSocket(query);
  }
  HandleRequest(path);
}

void HttpSession::HandleRequest(const std::string& path) {
  using namespace boost::beast;

  if (req_.method() == http::verb::options) {
    return SendResponse(MakeResponse(http::status::no_content, nullptr));
  }

  // Origin 헤더가 없는 요청(서버 간 호출, curl)은 차단하지 않는다.
  auto origin = RequestOrigin();
  if (req_.method() == http::verb::get && StartsWith(path, "/api/") && origin &&
      !IsOriginAllowed(origin, config_.allowed_origins)) {
    return SendResponse(MakeResponse(http::status::forbidden, MakeErrorBody("Origin not allowed")));
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    return SendResponse(MakeResponse(http::status::ok, MakeHealthBody()));
  }

  if (req_.method() == http::verb::get && path == "/api/scenarios") {
    return SendResponse(MakeResponse(http::status::ok, MakeScenarioIndexBody(*catalog_)));
  }

  if (req_.method() == http::verb::get && StartsWith(path, kScenarioPrefix)) {
    auto id = PercentDecode(std::string_view(path).substr(kScenarioPrefix.size()));
    auto scenario = catalog_->Find(id);
    if (!scenario) {
      return SendResponse(MakeResponse(http::status::not_found, MakeErrorBody("Scenario not found")));
    }
    return SendResponse(MakeResponse(http::status::ok, ToJson(*scenario)));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_ ? observability_->Snapshot() : MetricsSnapshot{};
    return SendResponse(MakeResponse(http::status::ok, MakeMetricsBody(snapshot)));
  }

  SendResponse(MakeResponse(http::status::not_found, MakeErrorBody("Not found")));
}

void HttpSession::HandleWebSocket(const std::string& query) {
  using namespace boost::beast;

  if (!websocket::is_upgrade(req_)) {
    return SendResponse(MakeResponse(http::status::upgrade_required, MakeErrorBody("Expected WebSocket upgrade")));
  }
  auto origin = RequestOrigin();
  if (origin && !IsOriginAllowed(origin, config_.allowed_origins)) {
    return SendResponse(MakeResponse(http::status::forbidden, MakeErrorBody("Origin not allowed")));
  }

  auto params = ParseQueryParams(query);
  SessionRequest request;
  if (auto it = params.find("scenario"); it != params.end()) {
    request.scenario_id = it->second;
  }
  auto user_it = params.find("user");
  request.user_id = user_it == params.end() || user_it->second.empty() ? "anonymous" : user_it->second;

  std::string error_message;
  auto scenario = ResolveSessionRequest(*catalog_, request, error_message);
  if (!scenario) {
    return SendResponse(MakeResponse(http::status::bad_request, MakeErrorBody(error_message)));
  }

  if (observability_ && observability_->Enabled(LogLevel::kInfo)) {
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.scenario_id = request.scenario_id;
    ctx.user_id = request.user_id;
    ctx.name = "http.upgrade";
    ctx.detail = std::string(req_.target());
    ctx.latency_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                           std::chrono::steady_clock::now() - request_start_)
                                           .count());
    observability_->Log(ctx);
  }

  // WebSocket 스트림이 자체 타임아웃을 쓰므로 HTTP 읽기용 만료는 해제한다.
  stream_.expires_never();
  std::make_shared<WebSocketSession>(std::move(stream_), std::move(*scenario), std::move(request), dispatcher_,
                                     observability_, config_, ssl_context_)
      ->Run(std::move(req_));
}

std::shared_ptr<HttpSession::Response> HttpSession::MakeResponse(boost::beast::http::status status,
                                                                 const nlohmann::json& body) const {
  using namespace boost::beast;
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(http::field::server, "tutor-bridge");
  ApplyCorsHeaders(RequestOrigin(), config_.allowed_origins, res->base());
  if (!body.is_null()) {
    res->set(http::field::content_type, "application/json; charset=utf-8");
    res->body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
  res->content_length(res->body().size());
  return res;
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    auto status = static_cast<unsigned>(res->result_int());
    if (status >= 400) {
      observability_->IncrementError();
    }
    LogContext ctx;
    ctx.level = status >= 500 ? LogLevel::kError : LogLevel::kInfo;
    ctx.trace_id = trace_id_;
    ctx.name = "http.request";
    ctx.detail = std::string(req_.method_string()) + " " + std::string(req_.target()) + " " + std::to_string(status);
    ctx.latency_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                           std::chrono::steady_clock::now() - request_start_)
                                           .count());
    if (observability_->Enabled(ctx.level)) {
      observability_->Log(ctx);
    }
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

std::optional<std::string> HttpSession::RequestOrigin() const {
  auto it = req_.find(boost::beast::http::field::origin);
  if (it == req_.end()) {
    return std::nullopt;
  }
  return std::string(it->value());
}

}  // namespace tutor

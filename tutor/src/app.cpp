/*
 * 설명: 리스너와 워커 스레드, 업스트림 TLS 컨텍스트를 구성하고 환경설정을 로드한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/config_test.cpp, tutor/tests/e2e/http_routes_test.cpp,
 *         tutor/tests/e2e/bridge_flow_test.cpp
 */
#include "tutor/app.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "tutor/http_session.hpp"

namespace tutor {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<const ScenarioCatalog> catalog, std::shared_ptr<const ToolDispatcher> dispatcher,
           std::shared_ptr<Observability> observability, std::shared_ptr<boost::asio::ssl::context> ssl_context)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), catalog_(std::move(catalog)),
        dispatcher_(std::move(dispatcher)), observability_(std::move(observability)),
        ssl_context_(std::move(ssl_context)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    // 연결마다 별도 strand를 배정한다. 업스트림 스트림도 같은 strand 위에서 만들어진다.
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->catalog_, self->dispatcher_,
                                          self->observability_, self->ssl_context_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<const ScenarioCatalog> catalog_;
  std::shared_ptr<const ToolDispatcher> dispatcher_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<boost::asio::ssl::context> ssl_context_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<const ScenarioCatalog> catalog)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM),
      catalog_(std::move(catalog)), dispatcher_(std::make_shared<const ToolDispatcher>()) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level).value_or(LogLevel::kInfo));
  ssl_context_ = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tlsv12_client);
  boost::beast::error_code ec;
  ssl_context_->set_default_verify_paths(ec);
  if (ec && observability_->Enabled(LogLevel::kWarn)) {
    LogContext ctx;
    ctx.level = LogLevel::kWarn;
    ctx.trace_id = observability_->NextTraceId();
    ctx.name = "tls.verify_paths_unavailable";
    ctx.detail = ec.message();
    observability_->Log(ctx);
  }
  WarnUnimplementedTools();
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, catalog_, dispatcher_, observability_,
                                           ssl_context_);
    listener_->Run();
    signals_.async_wait([this](const boost::beast::error_code& ec, int /*signal*/) {
      if (!ec) {
        ioc_.stop();
      }
    });
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.name = "server.start";
    ctx.detail = "port " + std::to_string(config_.port) + ", scenarios " + std::to_string(catalog_->Size());
    if (observability_->Enabled(LogLevel::kInfo)) {
      observability_->Log(ctx);
    }
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    LogContext ctx;
    ctx.level = LogLevel::kError;
    ctx.trace_id = observability_->NextTraceId();
    ctx.name = "server.run_failed";
    ctx.detail = ex.what();
    observability_->Log(ctx);
  }
  Stop();
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  boost::beast::error_code ec;
  signals_.cancel(ec);
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
}

void ServerApp::WarnUnimplementedTools() const {
  const auto& implemented = ToolDispatcher::ToolNames();
  for (const auto& entry : catalog_->Index()) {
    auto scenario = catalog_->Find(entry.id);
    if (!scenario) {
      continue;
    }
    for (const auto& tool : scenario->tools) {
      if (std::find(implemented.begin(), implemented.end(), tool.name) != implemented.end()) {
        continue;
      }
      LogContext ctx;
      ctx.level = LogLevel::kWarn;
      ctx.trace_id = observability_->NextTraceId();
      ctx.scenario_id = scenario->id;
      ctx.name = "catalog.tool_unimplemented";
      ctx.detail = tool.name;
      if (observability_->Enabled(ctx.level)) {
        observability_->Log(ctx);
      }
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  auto port = std::stoi(get_env("SERVER_PORT", "8787"));
  if (port <= 0 || port > 65535) {
    throw std::out_of_range("SERVER_PORT 범위가 올바르지 않습니다: " + std::to_string(port));
  }
  cfg.port = static_cast<unsigned short>(port);
  cfg.openai_api_key = get_env("OPENAI_API_KEY", "");
  cfg.realtime_url = get_env("OPENAI_REALTIME_URL", "wss://api.openai.com/v1/realtime");
  cfg.realtime_model = get_env("OPENAI_REALTIME_MODEL", "gpt-realtime-mini-2025-12-15");

  auto auth_mode = get_env("UPSTREAM_AUTH_MODE", "header");
  if (auth_mode == "header") {
    cfg.upstream_auth_mode = UpstreamAuthMode::kHeader;
  } else if (auth_mode == "subprotocol") {
    cfg.upstream_auth_mode = UpstreamAuthMode::kSubprotocol;
  } else {
    throw std::invalid_argument("UPSTREAM_AUTH_MODE는 header 또는 subprotocol이어야 합니다: " + auth_mode);
  }

  cfg.allowed_origins = get_env("ALLOWED_ORIGINS", "");
  cfg.scenario_dir = get_env("SCENARIO_DIR", "scenarios");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  if (!ParseLogLevel(cfg.log_level)) {
    throw std::invalid_argument("LOG_LEVEL 값이 올바르지 않습니다: " + cfg.log_level);
  }
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "256")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "4194304")));
  return cfg;
}

}  // namespace tutor

/*
 * 설명: 브리지 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/e2e/http_routes_test.cpp, tutor/tests/e2e/bridge_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>

#include "tutor/config.hpp"
#include "tutor/observability.hpp"
#include "tutor/scenario_catalog.hpp"
#include "tutor/tool_dispatcher.hpp"

namespace tutor {

class Listener;

class ServerApp {
 public:
  ServerApp(const AppConfig& config, std::shared_ptr<const ScenarioCatalog> catalog);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void WarnUnimplementedTools() const;

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<const ScenarioCatalog> catalog_;
  std::shared_ptr<const ToolDispatcher> dispatcher_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<boost::asio::ssl::context> ssl_context_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace tutor

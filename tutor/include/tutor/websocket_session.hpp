/*
 * 설명: 클라이언트 WebSocket 하나와 업스트림 연결 하나를 소유하는 세션 액터.
 *       두 연결의 모든 완료 핸들러는 같은 strand에서 실행되므로 세션 상태는 한 번에 하나의 이벤트만 다룬다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/e2e/bridge_flow_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "tutor/config.hpp"
#include "tutor/observability.hpp"
#include "tutor/scenario_catalog.hpp"
#include "tutor/session_bridge.hpp"
#include "tutor/tool_dispatcher.hpp"
#include "tutor/upstream_connection.hpp"

namespace tutor {

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession>, public BridgeSink {
 public:
  WebSocketSession(boost::beast::tcp_stream stream, ScenarioDefinition scenario, SessionRequest request,
                   std::shared_ptr<const ToolDispatcher> dispatcher, std::shared_ptr<Observability> observability,
                   const AppConfig& config, std::shared_ptr<boost::asio::ssl::context> ssl_context);
  ~WebSocketSession() override;

  void Run(boost::beast::http::request<boost::beast::http::string_body> req);

  void SendToClient(std::string message, bool binary) override;
  void SendToUpstream(std::string message) override;
  void CloseClient(unsigned short code, const std::string& reason) override;
  void CloseUpstream(unsigned short code, const std::string& reason) override;

 private:
  struct OutboundFrame {
    std::string data;
    bool binary{false};
  };

  void OnAccept(boost::beast::error_code ec);
  void ConnectUpstream();
  void OnUpstreamOpen();
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(OutboundFrame frame);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void DoClose();
  void TriggerBackpressureClose();
  void Log(LogLevel level, const std::string& name, const std::string& detail = "") const;

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  SessionRequest request_;
  std::string session_id_;
  std::shared_ptr<Observability> observability_;
  AppConfig config_;
  std::shared_ptr<boost::asio::ssl::context> ssl_context_;
  SessionBridge bridge_;
  std::shared_ptr<UpstreamConnection> upstream_;
  // 업스트림이 열리기 전에 도착한 클라이언트 메시지. 열리면 순서대로 다시 처리한다.
  std::deque<OutboundFrame> early_messages_;
  std::deque<OutboundFrame> send_queue_;
  std::size_t queued_bytes_{0};
  bool accepted_{false};
  bool writing_{false};
  bool close_requested_{false};
  bool client_gone_{false};
  boost::beast::websocket::close_reason close_reason_;
};

}  // namespace tutor

/*
 * 설명: 클라이언트 WebSocket 수락, 업스트림 연결, 양방향 프레임 중계, 백프레셔와 종료 전파를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/e2e/bridge_flow_test.cpp
 */
#include "tutor/websocket_session.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>
#include <openssl/rand.h>

namespace tutor {
namespace {

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string GenerateSessionId(const std::shared_ptr<Observability>& observability) {
  std::vector<unsigned char> buffer(16);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) == 1) {
    return BytesToHex(buffer.data(), buffer.size());
  }
  return observability ? observability->NextTraceId() : std::string{"session"};
}

}  // namespace

WebSocketSession::WebSocketSession(boost::beast::tcp_stream stream, ScenarioDefinition scenario,
                                   SessionRequest request, std::shared_ptr<const ToolDispatcher> dispatcher,
                                   std::shared_ptr<Observability> observability, const AppConfig& config,
                                   std::shared_ptr<boost::asio::ssl::context> ssl_context)
    : ws_(std::move(stream)), request_(request), session_id_(GenerateSessionId(observability)),
      observability_(std::move(observability)), config_(config), ssl_context_(std::move(ssl_context)),
      bridge_(*this, std::move(scenario), request_, session_id_, std::move(dispatcher), observability_) {}

WebSocketSession::~WebSocketSession() {
  if (upstream_) {
    upstream_->Close(kCloseNormal, "Client disconnected");
  }
  if (accepted_ && observability_) {
    observability_->SessionClosed();
  }
  Log(LogLevel::kInfo, "session.closed");
}

void WebSocketSession::Run(boost::beast::http::request<boost::beast::http::string_body> req) {
  req_ = std::move(req);
  ws_.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws_.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "tutor-bridge");
  }));
  auto self = shared_from_this();
  ws_.async_accept(req_, [self](boost::beast::error_code ec) { self->OnAccept(ec); });
}

void WebSocketSession::OnAccept(boost::beast::error_code ec) {
  if (ec) {
    Log(LogLevel::kWarn, "client.accept_failed", ec.message());
    return;
  }
  accepted_ = true;
  if (observability_) {
    observability_->SessionOpened();
  }
  Log(LogLevel::kInfo, "session.accepted");
  // 연결 실패 알림을 받을 수 있도록 클라이언트를 먼저 수락한 뒤 업스트림에 연결한다.
  DoRead();
  ConnectUpstream();
}

void WebSocketSession::ConnectUpstream() {
  std::string error_message;
  auto url = ParseWebSocketUrl(BuildUpstreamUrl(config_), error_message);
  if (!url) {
    bridge_.OnUpstreamConnectFailed(error_message);
    return;
  }
  upstream_ = MakeUpstreamConnection(ws_.get_executor(), ssl_context_, std::move(*url),
                                     UpstreamCredentials{config_.openai_api_key, config_.upstream_auth_mode},
                                     config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes);

  std::weak_ptr<WebSocketSession> weak = weak_from_this();
  UpstreamHandlers handlers;
  handlers.on_open = [weak]() {
    if (auto self = weak.lock()) {
      self->OnUpstreamOpen();
    }
  };
  handlers.on_message = [weak](std::string message, bool binary) {
    if (auto self = weak.lock()) {
      self->bridge_.OnUpstreamMessage(message, binary);
    }
  };
  handlers.on_close = [weak](unsigned short code, std::string reason) {
    if (auto self = weak.lock()) {
      self->bridge_.OnUpstreamClosed(code, reason);
    }
  };
  handlers.on_error = [weak](std::string message) {
    if (auto self = weak.lock()) {
      self->bridge_.OnUpstreamError(message);
    }
  };
  upstream_->Connect(std::move(handlers));
}

void WebSocketSession::OnUpstreamOpen() {
  bridge_.OnUpstreamOpen();
  while (!early_messages_.empty() && bridge_.State() == BridgeState::kActive) {
    auto frame = std::move(early_messages_.front());
    early_messages_.pop_front();
    bridge_.OnClientMessage(frame.data, frame.binary);
  }
  early_messages_.clear();
}

void WebSocketSession::DoRead() {
  if (client_gone_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    client_gone_ = true;
    if (ec != boost::beast::websocket::error::closed) {
      Log(LogLevel::kDebug, "client.read_failed", ec.message());
    }
    bridge_.OnClientClosed();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  const bool binary = !ws_.got_text();
  switch (bridge_.State()) {
    case BridgeState::kConnectingUpstream:
      if (early_messages_.size() < config_.ws_queue_limit_messages) {
        early_messages_.push_back(OutboundFrame{std::move(data), binary});
      } else {
        Log(LogLevel::kWarn, "client.early_message_dropped");
      }
      break;
    case BridgeState::kActive:
      bridge_.OnClientMessage(data, binary);
      break;
    case BridgeState::kClosed:
      break;
  }
  DoRead();
}

void WebSocketSession::SendToClient(std::string message, bool binary) {
  EnqueueMessage(OutboundFrame{std::move(message), binary});
}

void WebSocketSession::SendToUpstream(std::string message) {
  if (upstream_) {
    upstream_->Send(std::move(message));
  }
}

void WebSocketSession::CloseClient(unsigned short code, const std::string& reason) {
  if (client_gone_ || close_requested_ || !accepted_) {
    return;
  }
  close_requested_ = true;
  close_reason_ = boost::beast::websocket::close_reason{code};
  close_reason_.reason = reason.substr(0, close_reason_.reason.max_size());
  // 대기 중인 프레임(예: 마지막 오류 이벤트)을 먼저 보낸 뒤 닫는다.
  if (!writing_ && send_queue_.empty()) {
    DoClose();
  }
}

void WebSocketSession::CloseUpstream(unsigned short code, const std::string& reason) {
  if (upstream_) {
    upstream_->Close(code, reason);
  }
}

void WebSocketSession::EnqueueMessage(OutboundFrame frame) {
  if (client_gone_ || close_requested_ || !accepted_) {
    return;
  }
  const auto message_size = frame.data.size();
  if (send_queue_.size() >= config_.ws_queue_limit_messages ||
      queued_bytes_ + message_size > config_.ws_queue_limit_bytes) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(frame));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || client_gone_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(!send_queue_.front().binary);
  ws_.async_write(boost::asio::buffer(send_queue_.front().data),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  writing_ = false;
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().data.size();
    send_queue_.pop_front();
  }
  if (ec) {
    client_gone_ = true;
    send_queue_.clear();
    queued_bytes_ = 0;
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
    return;
  }
  if (close_requested_) {
    DoClose();
  }
}

void WebSocketSession::DoClose() {
  if (client_gone_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_close(close_reason_, [self](boost::beast::error_code) {});
}

void WebSocketSession::TriggerBackpressureClose() {
  if (close_requested_) {
    return;
  }
  Log(LogLevel::kWarn, "client.backpressure_exceeded");
  close_requested_ = true;
  // 전송 중인 프레임의 버퍼는 쓰기가 끝날 때까지 유지해야 한다.
  while (send_queue_.size() > (writing_ ? 1u : 0u)) {
    queued_bytes_ -= send_queue_.back().data.size();
    send_queue_.pop_back();
  }
  close_reason_ = boost::beast::websocket::close_reason{boost::beast::websocket::close_code::policy_error};
  close_reason_.reason = "backpressure_exceeded";
  if (!writing_) {
    DoClose();
  }
  // 브리지 처리 도중 호출될 수 있으므로 종료 전파는 strand에 다시 올려 처리한다.
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self]() { self->bridge_.OnClientClosed(); });
}

void WebSocketSession::Log(LogLevel level, const std::string& name, const std::string& detail) const {
  if (!observability_ || !observability_->Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.level = level;
  ctx.trace_id = session_id_;
  ctx.session_id = session_id_;
  ctx.scenario_id = bridge_.Scenario().id;
  ctx.user_id = request_.user_id;
  ctx.name = name;
  ctx.detail = detail;
  observability_->Log(ctx);
}

}  // namespace tutor

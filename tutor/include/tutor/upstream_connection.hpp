/*
 * 설명: AI 스트리밍 서비스로 나가는 WebSocket 연결(ws/wss)과 인증 정보 전달 방식을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/e2e/bridge_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/fields.hpp>

#include "tutor/config.hpp"
#include "tutor/url.hpp"

namespace tutor {

struct UpstreamCredentials {
  std::string api_key;
  UpstreamAuthMode mode{UpstreamAuthMode::kHeader};
};

// 핸들러는 연결의 executor(세션 strand) 위에서만 호출된다.
struct UpstreamHandlers {
  std::function<void()> on_open;
  std::function<void(std::string message, bool binary)> on_message;
  std::function<void(unsigned short code, std::string reason)> on_close;
  std::function<void(std::string message)> on_error;
};

class UpstreamConnection {
 public:
  virtual ~UpstreamConnection() = default;
  virtual void Connect(UpstreamHandlers handlers) = 0;
  virtual void Send(std::string message) = 0;
  virtual void Close(unsigned short code, std::string reason) = 0;
};

// 핸드셰이크 요청에 인증 정보를 싣는다. 헤더 방식이 기본이고 subprotocol 방식은 호환용이다.
void ApplyCredentials(const UpstreamCredentials& credentials, boost::beast::http::fields& request);

std::string BuildUpstreamUrl(const AppConfig& config);

std::shared_ptr<UpstreamConnection> MakeUpstreamConnection(boost::asio::any_io_executor executor,
                                                           std::shared_ptr<boost::asio::ssl::context> ssl_context,
                                                           WebSocketUrl url, UpstreamCredentials credentials,
                                                           std::size_t max_queue_messages,
                                                           std::size_t max_queue_bytes);

}  // namespace tutor

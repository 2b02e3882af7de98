/*
 * 설명: resolve → TCP 연결 → (TLS) → WebSocket 핸드셰이크 순으로 업스트림에 연결하고 프레임을 송수신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/e2e/bridge_flow_test.cpp
 */
#include "tutor/upstream_connection.hpp"

#include <chrono>
#include <deque>
#include <type_traits>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace tutor {
namespace {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;

using TlsStream = beast::ssl_stream<beast::tcp_stream>;

template <class NextLayer>
class WebSocketUpstream : public UpstreamConnection,
                          public std::enable_shared_from_this<WebSocketUpstream<NextLayer>> {
 public:
  static constexpr bool kTls = std::is_same_v<NextLayer, TlsStream>;

  WebSocketUpstream(net::any_io_executor executor, std::shared_ptr<net::ssl::context> ssl_context, WebSocketUrl url,
                    UpstreamCredentials credentials, std::size_t max_queue_messages, std::size_t max_queue_bytes)
      : ssl_context_(std::move(ssl_context)), resolver_(executor), ws_(MakeStream(executor, ssl_context_)),
        url_(std::move(url)), credentials_(std::move(credentials)), max_queue_messages_(max_queue_messages),
        max_queue_bytes_(max_queue_bytes) {}

  void Connect(UpstreamHandlers handlers) override {
    handlers_ = std::move(handlers);
    auto self = this->shared_from_this();
    resolver_.async_resolve(url_.host, url_.port,
                            [self](beast::error_code ec, net::ip::tcp::resolver::results_type results) {
                              self->OnResolve(ec, results);
                            });
  }

  void Send(std::string message) override {
    if (closing_) {
      return;
    }
    const auto message_size = message.size();
    if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
      Fail("Upstream send queue overflow");
      return;
    }
    send_queue_.push_back(std::move(message));
    queued_bytes_ += message_size;
    if (open_ && !writing_) {
      WriteNext();
    }
  }

  void Close(unsigned short code, std::string reason) override {
    if (closing_) {
      return;
    }
    closing_ = true;
    close_reason_ = websocket::close_reason{code};
    // close 프레임의 reason은 123바이트를 넘을 수 없다.
    close_reason_.reason = reason.substr(0, close_reason_.reason.max_size());
    if (!open_) {
      Abort();
      return;
    }
    // 쓰기 도중에는 close 프레임을 보낼 수 없으므로 대기 중인 쓰기가 끝난 뒤 닫는다.
    if (!writing_) {
      DoClose();
    }
  }

 private:
  static websocket::stream<NextLayer> MakeStream(net::any_io_executor executor,
                                                 const std::shared_ptr<net::ssl::context>& ssl_context) {
    if constexpr (kTls) {
      return websocket::stream<NextLayer>(executor, *ssl_context);
    } else {
      return websocket::stream<NextLayer>(executor);
    }
  }

  void OnResolve(beast::error_code ec, net::ip::tcp::resolver::results_type results) {
    if (closing_) {
      return;
    }
    if (ec) {
      return Fail("Upstream DNS resolution failed: " + ec.message());
    }
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    auto self = this->shared_from_this();
    beast::get_lowest_layer(ws_).async_connect(
        results, [self](beast::error_code connect_ec, net::ip::tcp::resolver::results_type::endpoint_type) {
          self->OnConnect(connect_ec);
        });
  }

  void OnConnect(beast::error_code ec) {
    if (closing_) {
      return;
    }
    if (ec) {
      return Fail("Upstream TCP connection failed: " + ec.message());
    }
    if constexpr (kTls) {
      if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
        beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        return Fail("Upstream TLS SNI setup failed: " + sni_ec.message());
      }
      ws_.next_layer().set_verify_mode(net::ssl::verify_peer);
      ws_.next_layer().set_verify_callback(net::ssl::host_name_verification(url_.host));
      auto self = this->shared_from_this();
      ws_.next_layer().async_handshake(net::ssl::stream_base::client,
                                       [self](beast::error_code tls_ec) { self->OnTlsHandshake(tls_ec); });
    } else {
      DoWebSocketHandshake();
    }
  }

  void OnTlsHandshake(beast::error_code ec) {
    if (closing_) {
      return;
    }
    if (ec) {
      return Fail("Upstream TLS handshake failed: " + ec.message());
    }
    DoWebSocketHandshake();
  }

  void DoWebSocketHandshake() {
    // 핸드셰이크 이후의 타임아웃은 websocket stream이 관리한다.
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    auto credentials = credentials_;
    ws_.set_option(websocket::stream_base::decorator([credentials](websocket::request_type& req) {
      req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " tutor-bridge");
      ApplyCredentials(credentials, req);
    }));
    const bool default_port = url_.port == (kTls ? "443" : "80");
    auto host = default_port ? url_.host : url_.host + ":" + url_.port;
    auto self = this->shared_from_this();
    ws_.async_handshake(handshake_response_, host, url_.target,
                        [self](beast::error_code ec) { self->OnWebSocketHandshake(ec); });
  }

  void OnWebSocketHandshake(beast::error_code ec) {
    if (closing_) {
      return;
    }
    if (ec) {
      auto message = "Upstream WebSocket connection failed: " + ec.message();
      if (ec == websocket::error::upgrade_declined) {
        message += " (HTTP " + std::to_string(handshake_response_.result_int()) + ")";
      }
      return Fail(message);
    }
    open_ = true;
    if (handlers_.on_open) {
      handlers_.on_open();
    }
    DoRead();
    if (!writing_ && !send_queue_.empty() && !closing_) {
      WriteNext();
    }
  }

  void DoRead() {
    auto self = this->shared_from_this();
    ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t bytes_transferred) {
      self->OnRead(ec, bytes_transferred);
    });
  }

  void OnRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (closing_) {
      return;
    }
    if (ec == websocket::error::closed) {
      closing_ = true;
      auto handlers = std::move(handlers_);
      if (handlers.on_close) {
        handlers.on_close(ws_.reason().code, std::string(ws_.reason().reason.data(), ws_.reason().reason.size()));
      }
      return;
    }
    if (ec) {
      return Fail(ec.message());
    }
    auto data = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    const bool binary = !ws_.got_text();
    if (handlers_.on_message) {
      handlers_.on_message(std::move(data), binary);
    }
    if (!closing_) {
      DoRead();
    }
  }

  void WriteNext() {
    writing_ = true;
    ws_.text(true);
    auto self = this->shared_from_this();
    ws_.async_write(net::buffer(send_queue_.front()),
                    [self](beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
  }

  void OnWrite(beast::error_code ec) {
    writing_ = false;
    if (!send_queue_.empty()) {
      queued_bytes_ -= send_queue_.front().size();
      send_queue_.pop_front();
    }
    if (closing_) {
      if (open_ && !ec) {
        DoClose();
      }
      return;
    }
    if (ec) {
      return Fail(ec.message());
    }
    if (!send_queue_.empty()) {
      WriteNext();
    }
  }

  void DoClose() {
    send_queue_.clear();
    queued_bytes_ = 0;
    auto self = this->shared_from_this();
    ws_.async_close(close_reason_, [self](beast::error_code) {});
  }

  void Abort() {
    beast::error_code ignored;
    resolver_.cancel();
    beast::get_lowest_layer(ws_).socket().close(ignored);
  }

  void Fail(const std::string& message) {
    if (closing_) {
      return;
    }
    closing_ = true;
    auto handlers = std::move(handlers_);
    Abort();
    if (handlers.on_error) {
      handlers.on_error(message);
    }
  }

  std::shared_ptr<net::ssl::context> ssl_context_;
  net::ip::tcp::resolver resolver_;
  websocket::stream<NextLayer> ws_;
  WebSocketUrl url_;
  UpstreamCredentials credentials_;
  UpstreamHandlers handlers_;
  beast::flat_buffer buffer_;
  websocket::response_type handshake_response_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
  websocket::close_reason close_reason_;
  bool open_{false};
  bool writing_{false};
  bool closing_{false};
};

}  // namespace

void ApplyCredentials(const UpstreamCredentials& credentials, boost::beast::http::fields& request) {
  if (credentials.mode == UpstreamAuthMode::kSubprotocol) {
    // 커스텀 헤더를 쓸 수 없는 환경과 같은 형식으로 subprotocol에 키를 싣는다.
    request.set(boost::beast::http::field::sec_websocket_protocol,
                "realtime, openai-insecure-api-key." + credentials.api_key + ", openai-beta.realtime-v1");
    return;
  }
  request.set(boost::beast::http::field::authorization, "Bearer " + credentials.api_key);
  request.set("OpenAI-Beta", "realtime=v1");
}

std::string BuildUpstreamUrl(const AppConfig& config) {
  const char separator = config.realtime_url.find('?') == std::string::npos ? '?' : '&';
  return config.realtime_url + separator + "model=" + PercentEncode(config.realtime_model);
}

std::shared_ptr<UpstreamConnection> MakeUpstreamConnection(boost::asio::any_io_executor executor,
                                                           std::shared_ptr<boost::asio::ssl::context> ssl_context,
                                                           WebSocketUrl url, UpstreamCredentials credentials,
                                                           std::size_t max_queue_messages,
                                                           std::size_t max_queue_bytes) {
  if (url.tls) {
    return std::make_shared<WebSocketUpstream<TlsStream>>(std::move(executor), std::move(ssl_context),
                                                          std::move(url), std::move(credentials),
                                                          max_queue_messages, max_queue_bytes);
  }
  return std::make_shared<WebSocketUpstream<beast::tcp_stream>>(std::move(executor), std::move(ssl_context),
                                                                std::move(url), std::move(credentials),
                                                                max_queue_messages, max_queue_bytes);
}

}  // namespace tutor

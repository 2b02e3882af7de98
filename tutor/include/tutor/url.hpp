/*
 * 설명: 쿼리 문자열 파싱, 퍼센트 인코딩/디코딩, WebSocket URL 분해를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/url_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tutor {

struct WebSocketUrl {
  bool tls{false};
  std::string host;
  std::string port;
  std::string target;
};

std::string PercentEncode(std::string_view value);
std::string PercentDecode(std::string_view value);
std::unordered_map<std::string, std::string> ParseQueryParams(std::string_view query);
std::optional<WebSocketUrl> ParseWebSocketUrl(std::string_view url, std::string& error_message);

}  // namespace tutor

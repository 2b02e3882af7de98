/*
 * 설명: 쿼리 문자열과 WebSocket URL을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/url_test.cpp
 */
#include "tutor/url.hpp"

#include <cctype>
#include <utility>

namespace tutor {
namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string PercentEncode(std::string_view value) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string PercentDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < value.size() && HexValue(value[i + 1]) >= 0 && HexValue(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(value[i + 1]) * 16 + HexValue(value[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(std::string_view query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string_view::npos) {
      // 같은 키가 여러 번 오면 첫 값을 쓴다.
      params.emplace(PercentDecode(pair.substr(0, eq)), PercentDecode(pair.substr(eq + 1)));
    } else if (!pair.empty()) {
      params.emplace(PercentDecode(pair), std::string{});
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<WebSocketUrl> ParseWebSocketUrl(std::string_view url, std::string& error_message) {
  WebSocketUrl result;
  std::string_view rest;
  if (url.substr(0, 6) == "wss://") {
    result.tls = true;
    rest = url.substr(6);
  } else if (url.substr(0, 5) == "ws://") {
    rest = url.substr(5);
  } else {
    error_message = "Unsupported upstream URL scheme: " + std::string(url);
    return std::nullopt;
  }

  auto slash = rest.find_first_of("/?");
  auto authority = rest.substr(0, slash);
  std::string target = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));
  if (!target.empty() && target.front() == '?') {
    target.insert(target.begin(), '/');
  }

  auto colon = authority.rfind(':');
  auto bracket = authority.rfind(']');
  if (colon != std::string_view::npos && (bracket == std::string_view::npos || colon > bracket)) {
    result.host = std::string(authority.substr(0, colon));
    result.port = std::string(authority.substr(colon + 1));
  } else {
    result.host = std::string(authority);
    result.port = result.tls ? "443" : "80";
  }
  if (result.host.empty()) {
    error_message = "Upstream URL has no host: " + std::string(url);
    return std::nullopt;
  }
  if (result.port.empty()) {
    error_message = "Upstream URL has an empty port: " + std::string(url);
    return std::nullopt;
  }
  for (char c : result.port) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      error_message = "Upstream URL has an invalid port: " + std::string(url);
      return std::nullopt;
    }
  }
  result.target = std::move(target);
  return result;
}

}  // namespace tutor

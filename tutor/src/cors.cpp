/*
 * 설명: 허용 오리진 목록을 해석하고 CORS 헤더를 설정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/cors_test.cpp
 */
#include "tutor/cors.hpp"

namespace tutor {
namespace {

std::string_view Trim(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace

bool IsOriginAllowed(const std::optional<std::string>& origin, std::string_view allowed_origins) {
  if (allowed_origins.empty()) {
    return true;
  }
  if (!origin) {
    return false;
  }
  std::size_t pos = 0;
  while (pos <= allowed_origins.size()) {
    auto comma = allowed_origins.find(',', pos);
    auto item = Trim(allowed_origins.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos));
    if (item == *origin) {
      return true;
    }
    if (comma == std::string_view::npos) {
      break;
    }
    pos = comma + 1;
  }
  return false;
}

void ApplyCorsHeaders(const std::optional<std::string>& origin, std::string_view allowed_origins,
                      boost::beast::http::fields& headers) {
  headers.set(boost::beast::http::field::access_control_allow_methods, "GET, OPTIONS");
  headers.set(boost::beast::http::field::access_control_allow_headers, "Content-Type");
  if (IsOriginAllowed(origin, allowed_origins)) {
    headers.set(boost::beast::http::field::access_control_allow_origin, origin ? *origin : std::string("*"));
  }
}

}  // namespace tutor

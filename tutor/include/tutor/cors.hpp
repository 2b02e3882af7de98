/*
 * 설명: 허용 오리진 검사와 CORS 응답 헤더 구성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/cors_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/http/fields.hpp>

namespace tutor {

// allowed_origins가 비어 있으면 모든 오리진을 허용한다. 그 외에는 쉼표 구분 목록과 정확히 일치해야 한다.
bool IsOriginAllowed(const std::optional<std::string>& origin, std::string_view allowed_origins);

void ApplyCorsHeaders(const std::optional<std::string>& origin, std::string_view allowed_origins,
                      boost::beast::http::fields& headers);

}  // namespace tutor

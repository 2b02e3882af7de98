/*
 * 설명: HTTP 응답 본문(JSON) 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "tutor/observability.hpp"
#include "tutor/scenario_catalog.hpp"

namespace tutor {

nlohmann::json MakeHealthBody();
nlohmann::json MakeErrorBody(std::string_view message);
nlohmann::json MakeScenarioIndexBody(const ScenarioCatalog& catalog);
nlohmann::json MakeMetricsBody(const MetricsSnapshot& snapshot);

}  // namespace tutor

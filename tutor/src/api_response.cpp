/*
 * 설명: 헬스체크, 오류, 시나리오 목록, 메트릭 응답 본문을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/json_envelope_test.cpp
 */
#include "tutor/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace tutor {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeHealthBody() { return {{"ok", true}}; }

nlohmann::json MakeErrorBody(std::string_view message) { return {{"error", message}}; }

nlohmann::json MakeScenarioIndexBody(const ScenarioCatalog& catalog) {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& entry : catalog.Index()) {
    entries.push_back(ToJson(entry));
  }
  return entries;
}

nlohmann::json MakeMetricsBody(const MetricsSnapshot& snapshot) {
  return {{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
          {"sessions", {{"active", snapshot.sessions_active}, {"total", snapshot.sessions_total}}},
          {"tools", {{"executed", snapshot.tools_executed}}},
          {"events", {{"rejected", snapshot.events_rejected}}},
          {"meta", {{"timestamp", CurrentTimestamp()}}}};
}

}  // namespace tutor

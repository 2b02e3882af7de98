/*
 * 설명: 브리지 서버 진입점으로 환경설정과 시나리오 카탈로그를 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/e2e/http_routes_test.cpp
 */
#include <exception>
#include <string>

#include "tutor/app.hpp"

namespace {

int FailStartup(const std::string& name, const std::string& detail) {
  tutor::Observability observability;
  tutor::LogContext ctx;
  ctx.level = tutor::LogLevel::kError;
  ctx.trace_id = observability.NextTraceId();
  ctx.name = name;
  ctx.detail = detail;
  observability.Log(ctx);
  return 1;
}

}  // namespace

int main() {
  using namespace tutor;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    return FailStartup("config.invalid", ex.what());
  }

  std::string error_message;
  auto catalog = ScenarioCatalog::LoadFromDirectory(config.scenario_dir, error_message);
  if (!catalog) {
    return FailStartup("catalog.load_failed", error_message);
  }

  ServerApp app(config, catalog);
  app.Run();
  return 0;
}

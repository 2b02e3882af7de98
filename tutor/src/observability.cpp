/*
 * 설명: 구조화 로그를 한 줄 JSON으로 출력하고 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/observability_test.cpp, tutor/tests/e2e/http_routes_test.cpp
 */
#include "tutor/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace tutor {

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SessionOpened() {
  sessions_active_.fetch_add(1);
  sessions_total_.fetch_add(1);
}

void Observability::SessionClosed() { sessions_active_.fetch_sub(1); }

void Observability::IncrementToolExecuted() { tools_executed_.fetch_add(1); }

void Observability::IncrementEventRejected() { events_rejected_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.sessions_active = sessions_active_.load();
  snapshot.sessions_total = sessions_total_.load();
  snapshot.tools_executed = tools_executed_.load();
  snapshot.events_rejected = events_rejected_.load();
  return snapshot;
}

nlohmann::json Observability::Format(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.scenario_id) {
    log_json["scenarioId"] = *ctx.scenario_id;
  }
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  return log_json;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  // 사용자 입력이 섞일 수 있으므로 잘못된 UTF-8은 치환한다.
  auto line = Format(ctx).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(log_mutex_);
  std::cout << line << std::endl;
}

}  // namespace tutor

/*
 * 설명: 구조화 로그와 세션/요청/도구 실행 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/observability_test.cpp, tutor/tests/e2e/http_routes_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace tutor {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view value);
const char* ToString(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string trace_id;
  std::optional<std::string> session_id;
  std::optional<std::string> scenario_id;
  std::optional<std::string> user_id;
  std::string name;
  std::string detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t sessions_active{0};
  std::uint64_t sessions_total{0};
  std::uint64_t tools_executed{0};
  std::uint64_t events_rejected{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SessionOpened();
  void SessionClosed();
  void IncrementToolExecuted();
  void IncrementEventRejected();
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  nlohmann::json Format(const LogContext& ctx) const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> sessions_active_{0};
  std::atomic<std::uint64_t> sessions_total_{0};
  std::atomic<std::uint64_t> tools_executed_{0};
  std::atomic<std::uint64_t> events_rejected_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex log_mutex_;
};

}  // namespace tutor

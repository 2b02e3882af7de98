#include <gtest/gtest.h>

#include "tutor/observability.hpp"

TEST(ObservabilityTest, ParsesLogLevels) {
  EXPECT_EQ(tutor::ParseLogLevel("debug"), tutor::LogLevel::kDebug);
  EXPECT_EQ(tutor::ParseLogLevel("info"), tutor::LogLevel::kInfo);
  EXPECT_EQ(tutor::ParseLogLevel("warn"), tutor::LogLevel::kWarn);
  EXPECT_EQ(tutor::ParseLogLevel("error"), tutor::LogLevel::kError);
  EXPECT_FALSE(tutor::ParseLogLevel("verbose").has_value());
}

TEST(ObservabilityTest, FiltersBelowMinimumLevel) {
  tutor::Observability observability(tutor::LogLevel::kWarn);
  EXPECT_FALSE(observability.Enabled(tutor::LogLevel::kDebug));
  EXPECT_FALSE(observability.Enabled(tutor::LogLevel::kInfo));
  EXPECT_TRUE(observability.Enabled(tutor::LogLevel::kWarn));
  EXPECT_TRUE(observability.Enabled(tutor::LogLevel::kError));
}

TEST(ObservabilityTest, FormatsOneRecord) {
  tutor::Observability observability;
  tutor::LogContext ctx;
  ctx.level = tutor::LogLevel::kWarn;
  ctx.trace_id = "t-1";
  ctx.session_id = "s-1";
  ctx.scenario_id = "a1_taxi_bogota";
  ctx.name = "client.event_rejected";
  ctx.detail = "input_audio_buffer.clear";
  ctx.latency_ms = 3;
  auto record = observability.Format(ctx);
  EXPECT_EQ(record["level"], "warn");
  EXPECT_EQ(record["traceId"], "t-1");
  EXPECT_EQ(record["eventName"], "client.event_rejected");
  EXPECT_EQ(record["latencyMs"], 3);
  EXPECT_EQ(record["sessionId"], "s-1");
  EXPECT_EQ(record["scenarioId"], "a1_taxi_bogota");
  EXPECT_FALSE(record.contains("userId"));
  EXPECT_EQ(record["detail"], "input_audio_buffer.clear");
}

TEST(ObservabilityTest, CountersTrackSessionsAndTools) {
  tutor::Observability observability;
  observability.IncrementRequest();
  observability.IncrementRequest();
  observability.IncrementError();
  observability.SessionOpened();
  observability.SessionOpened();
  observability.SessionClosed();
  observability.IncrementToolExecuted();
  observability.IncrementEventRejected();
  auto snapshot = observability.Snapshot();
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.sessions_active, 1u);
  EXPECT_EQ(snapshot.sessions_total, 2u);
  EXPECT_EQ(snapshot.tools_executed, 1u);
  EXPECT_EQ(snapshot.events_rejected, 1u);
  EXPECT_NE(observability.NextTraceId(), observability.NextTraceId());
}

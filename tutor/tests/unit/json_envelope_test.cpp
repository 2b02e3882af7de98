#include <unordered_map>

#include <gtest/gtest.h>

#include "tutor/api_response.hpp"

TEST(JsonEnvelopeTest, HealthShape) {
  auto body = tutor::MakeHealthBody();
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body["ok"].get<bool>());
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto body = tutor::MakeErrorBody("Scenario not found");
  ASSERT_TRUE(body.is_object());
  EXPECT_EQ(body.size(), 1u);
  EXPECT_EQ(body["error"], "Scenario not found");
}

TEST(JsonEnvelopeTest, MetricsShape) {
  tutor::MetricsSnapshot snapshot;
  snapshot.request_total = 5;
  snapshot.request_errors = 2;
  snapshot.sessions_active = 1;
  snapshot.sessions_total = 3;
  snapshot.tools_executed = 4;
  snapshot.events_rejected = 6;
  auto body = tutor::MakeMetricsBody(snapshot);
  EXPECT_EQ(body["requests"]["total"], 5);
  EXPECT_EQ(body["requests"]["errors"], 2);
  EXPECT_EQ(body["sessions"]["active"], 1);
  EXPECT_EQ(body["sessions"]["total"], 3);
  EXPECT_EQ(body["tools"]["executed"], 4);
  EXPECT_EQ(body["events"]["rejected"], 6);
  EXPECT_TRUE(body["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ScenarioIndexIsArray) {
  nlohmann::json index = nlohmann::json::array({{{"id", "a"}, {"level", "A1"}, {"title", "A"}}});
  std::unordered_map<std::string, nlohmann::json> defs{
      {"a", {{"id", "a"}, {"level", "A1"}, {"title", "A"}, {"system", "s"}, {"opening_line", "hola"}}}};
  std::string error;
  auto catalog = tutor::ScenarioCatalog::FromJson(index, defs, error);
  ASSERT_TRUE(catalog) << error;
  auto body = tutor::MakeScenarioIndexBody(*catalog);
  ASSERT_TRUE(body.is_array());
  ASSERT_EQ(body.size(), 1u);
  EXPECT_EQ(body[0], (nlohmann::json{{"id", "a"}, {"level", "A1"}, {"title", "A"}}));
}

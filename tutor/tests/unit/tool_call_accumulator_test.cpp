#include <gtest/gtest.h>

#include "tutor/tool_call_accumulator.hpp"

namespace {

nlohmann::json Delta(const std::string& call_id, const std::string& delta) {
  return {{"type", "response.function_call_arguments.delta"}, {"call_id", call_id}, {"delta", delta}};
}

nlohmann::json Done(const std::string& call_id) {
  return {{"type", "response.function_call_arguments.done"}, {"call_id", call_id}};
}

}  // namespace

TEST(ToolCallAccumulatorTest, ConcatenatesFragmentsInArrivalOrder) {
  tutor::ToolCallAccumulator acc;
  auto first = Delta("c1", "{\"vocabulary_");
  first["name"] = "grade_lesson";
  ASSERT_TRUE(acc.OnDelta(first));
  ASSERT_TRUE(acc.OnDelta(Delta("c1", "score\":")));
  ASSERT_TRUE(acc.OnDelta(Delta("c1", "8}")));
  EXPECT_TRUE(acc.HasPending("c1"));

  auto call = acc.OnDone(Done("c1"));
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->call_id, "c1");
  EXPECT_EQ(call->name, "grade_lesson");
  EXPECT_EQ(call->arguments, "{\"vocabulary_score\":8}");
  EXPECT_FALSE(acc.HasPending("c1"));
  EXPECT_EQ(acc.PendingCount(), 0u);
}

TEST(ToolCallAccumulatorTest, InterleavedCallsStayIndependent) {
  tutor::ToolCallAccumulator acc;
  acc.OnDelta(Delta("a", "{\"x\":"));
  acc.OnDelta(Delta("b", "{\"y\":"));
  acc.OnDelta(Delta("a", "1}"));
  acc.OnDelta(Delta("b", "2}"));
  EXPECT_EQ(acc.PendingCount(), 2u);

  auto b = acc.OnDone(Done("b"));
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->arguments, "{\"y\":2}");
  EXPECT_TRUE(acc.HasPending("a"));
  auto a = acc.OnDone(Done("a"));
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->arguments, "{\"x\":1}");
}

TEST(ToolCallAccumulatorTest, DoneWithoutDeltasFallsBack) {
  tutor::ToolCallAccumulator acc;
  auto with_args = Done("c2");
  with_args["name"] = "trigger_quiz";
  with_args["arguments"] = "{\"focus\":\"numbers\"}";
  auto call = acc.OnDone(with_args);
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->name, "trigger_quiz");
  EXPECT_EQ(call->arguments, "{\"focus\":\"numbers\"}");

  auto bare = acc.OnDone(Done("c3"));
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->arguments, "{}");
  EXPECT_TRUE(bare->name.empty());
}

TEST(ToolCallAccumulatorTest, EmptyOrNonStringArgumentsBecomeEmptyObject) {
  tutor::ToolCallAccumulator acc;
  auto empty = Done("c6");
  empty["name"] = "trigger_quiz";
  empty["arguments"] = "";
  auto call = acc.OnDone(empty);
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->arguments, "{}");

  auto numeric = Done("c7");
  numeric["arguments"] = 5;
  auto other = acc.OnDone(numeric);
  ASSERT_TRUE(other.has_value());
  EXPECT_EQ(other->arguments, "{}");
}

TEST(ToolCallAccumulatorTest, DoneNameUsedWhenDeltasCarriedNone) {
  tutor::ToolCallAccumulator acc;
  acc.OnDelta(Delta("c4", "{}"));
  auto done = Done("c4");
  done["name"] = "grade_lesson";
  auto call = acc.OnDone(done);
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->name, "grade_lesson");
}

TEST(ToolCallAccumulatorTest, ReusedCallIdStartsFresh) {
  tutor::ToolCallAccumulator acc;
  acc.OnDelta(Delta("c5", "{\"a\":1}"));
  acc.OnDone(Done("c5"));
  acc.OnDelta(Delta("c5", "{\"b\":2}"));
  auto call = acc.OnDone(Done("c5"));
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->arguments, "{\"b\":2}");
}

TEST(ToolCallAccumulatorTest, IgnoresMalformedEvents) {
  tutor::ToolCallAccumulator acc;
  EXPECT_FALSE(acc.OnDelta({{"delta", "x"}}));
  EXPECT_FALSE(acc.OnDelta({{"call_id", ""}, {"delta", "x"}}));
  EXPECT_FALSE(acc.OnDelta({{"call_id", 5}, {"delta", "x"}}));
  EXPECT_FALSE(acc.OnDelta({{"call_id", "c"}}));
  EXPECT_EQ(acc.PendingCount(), 0u);
  EXPECT_FALSE(acc.OnDone(nlohmann::json::object()).has_value());
  EXPECT_FALSE(acc.OnDone({{"call_id", ""}}).has_value());
}

TEST(ToolCallAccumulatorTest, ClearDiscardsPendingCalls) {
  tutor::ToolCallAccumulator acc;
  acc.OnDelta(Delta("c6", "{"));
  acc.OnDelta(Delta("c7", "{"));
  acc.Clear();
  EXPECT_EQ(acc.PendingCount(), 0u);
}

/*
 * 설명: grade_lesson, trigger_quiz 도구를 순수 함수로 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/tool_dispatcher_test.cpp
 */
#include "tutor/tool_dispatcher.hpp"

#include <cmath>

namespace tutor {
namespace {

constexpr const char* kGradeLesson = "grade_lesson";
constexpr const char* kTriggerQuiz = "trigger_quiz";
constexpr const char* kDefaultQuizFocus = "vocabulary";

// 받은 숫자를 그대로 돌려주고, 숫자가 아니면 0이다.
nlohmann::json ScoreOrZero(const nlohmann::json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end() || !it->is_number()) {
    return 0;
  }
  return *it;
}

std::string StringOr(const nlohmann::json& args, const char* key, const std::string& fallback) {
  auto it = args.find(key);
  if (it == args.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

// 소수점 둘째 자리에서 반올림(0.5는 올림)한다.
double RoundTwoDecimals(double value) { return std::floor(value * 100.0 + 0.5) / 100.0; }

}  // namespace

ToolResult MakeToolFailure(const std::string& message) { return {{"ok", false}, {"error", message}}; }

ToolResult ToolDispatcher::Execute(const std::string& name, const nlohmann::json& args,
                                   const std::string& scenario_id) const {
  if (name == kGradeLesson) {
    return GradeLesson(args);
  }
  if (name == kTriggerQuiz) {
    return TriggerQuiz(args, scenario_id);
  }
  return MakeToolFailure("Unknown tool: " + name);
}

const std::vector<std::string>& ToolDispatcher::ToolNames() {
  static const std::vector<std::string> names{kGradeLesson, kTriggerQuiz};
  return names;
}

ToolResult ToolDispatcher::GradeLesson(const nlohmann::json& args) {
  const auto vocabulary = ScoreOrZero(args, "vocabulary_score");
  const auto grammar = ScoreOrZero(args, "grammar_score");
  const auto fluency = ScoreOrZero(args, "fluency_score");
  const double average = (vocabulary.get<double>() + grammar.get<double>() + fluency.get<double>()) / 3.0;

  ToolResult result{{"ok", true},
                    {"score", RoundTwoDecimals(average)},
                    {"vocabulary_score", vocabulary},
                    {"grammar_score", grammar},
                    {"fluency_score", fluency}};
  auto notes_it = args.find("notes");
  if (notes_it != args.end() && notes_it->is_string()) {
    result["notes"] = *notes_it;
  }
  return result;
}

ToolResult ToolDispatcher::TriggerQuiz(const nlohmann::json& args, const std::string& scenario_id) {
  return {{"ok", true},
          {"quiz",
           {{"lesson_id", StringOr(args, "lesson_id", scenario_id)},
            {"focus", StringOr(args, "focus", kDefaultQuizFocus)}}}};
}

}  // namespace tutor

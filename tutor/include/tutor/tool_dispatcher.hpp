/*
 * 설명: 업스트림이 요청한 함수 호출을 이름으로 분기해 실행하고 결과 JSON을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/tool_dispatcher_test.cpp
 */
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tutor {

// 모든 결과는 "ok" 불리언을 가진 객체이다. 알 수 없는 도구도 예외가 아니라 실패 결과로 돌려준다.
using ToolResult = nlohmann::json;

ToolResult MakeToolFailure(const std::string& message);

class ToolDispatcher {
 public:
  ToolResult Execute(const std::string& name, const nlohmann::json& args, const std::string& scenario_id) const;
  static const std::vector<std::string>& ToolNames();

 private:
  static ToolResult GradeLesson(const nlohmann::json& args);
  static ToolResult TriggerQuiz(const nlohmann::json& args, const std::string& scenario_id);
};

}  // namespace tutor

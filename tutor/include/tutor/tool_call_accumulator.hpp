/*
 * 설명: 스트리밍으로 도착하는 함수 호출 인자 조각을 call_id별로 모아 완성된 호출로 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/tool_call_accumulator_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace tutor {

struct PendingToolCall {
  std::string call_id;
  std::string name;
  std::vector<std::string> fragments;
};

struct CompletedToolCall {
  std::string call_id;
  std::string name;
  std::string arguments;
};

class ToolCallAccumulator {
 public:
  // response.function_call_arguments.delta 이벤트를 반영한다. 형식이 맞지 않으면 false.
  bool OnDelta(const nlohmann::json& event);
  // response.function_call_arguments.done 이벤트로 호출을 완성하고 항목을 제거한다.
  std::optional<CompletedToolCall> OnDone(const nlohmann::json& event);

  bool HasPending(const std::string& call_id) const { return pending_.count(call_id) != 0; }
  std::size_t PendingCount() const { return pending_.size(); }
  void Clear() { pending_.clear(); }

 private:
  std::unordered_map<std::string, PendingToolCall> pending_;
};

}  // namespace tutor

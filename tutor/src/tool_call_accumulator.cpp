/*
 * 설명: 함수 호출 인자 조각 누적과 완료 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/tool_call_accumulator_test.cpp
 */
#include "tutor/tool_call_accumulator.hpp"

#include <utility>

namespace tutor {
namespace {

std::optional<std::string> StringField(const nlohmann::json& event, const char* key) {
  auto it = event.find(key);
  if (it == event.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

}  // namespace

bool ToolCallAccumulator::OnDelta(const nlohmann::json& event) {
  auto call_id = StringField(event, "call_id");
  auto delta = StringField(event, "delta");
  if (!call_id || call_id->empty() || !delta) {
    return false;
  }
  auto& entry = pending_[*call_id];
  if (entry.call_id.empty()) {
    entry.call_id = *call_id;
  }
  // 이름은 보통 첫 조각에만 실려 온다.
  auto name = StringField(event, "name");
  if (name && !name->empty()) {
    entry.name = *name;
  }
  entry.fragments.push_back(std::move(*delta));
  return true;
}

std::optional<CompletedToolCall> ToolCallAccumulator::OnDone(const nlohmann::json& event) {
  auto call_id = StringField(event, "call_id");
  if (!call_id || call_id->empty()) {
    return std::nullopt;
  }
  CompletedToolCall call;
  call.call_id = *call_id;
  auto event_name = StringField(event, "name").value_or("");

  auto it = pending_.find(*call_id);
  if (it != pending_.end()) {
    for (const auto& fragment : it->second.fragments) {
      call.arguments += fragment;
    }
    call.name = it->second.name.empty() ? event_name : it->second.name;
    pending_.erase(it);
  } else {
    // 조각도 인자도 없으면(빈 문자열 포함) 빈 객체로 본다.
    auto arguments = StringField(event, "arguments");
    call.arguments = (arguments && !arguments->empty()) ? std::move(*arguments) : std::string("{}");
    call.name = event_name;
  }
  return call;
}

}  // namespace tutor

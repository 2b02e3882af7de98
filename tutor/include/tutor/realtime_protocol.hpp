/*
 * 설명: Realtime 이벤트 엔벨로프 해석과 브리지가 직접 보내는 이벤트 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/realtime_protocol_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "tutor/scenario_catalog.hpp"

namespace tutor {

extern const char* const kGlobalTutorRules;

inline constexpr std::string_view kFunctionCallArgumentsDelta = "response.function_call_arguments.delta";
inline constexpr std::string_view kFunctionCallArgumentsDone = "response.function_call_arguments.done";

enum class EventKind { kFunctionCallArgumentsDelta, kFunctionCallArgumentsDone, kOpaque };

// type 이외의 필드는 해석하지 않고 body에 그대로 보존한다.
struct RelayedEvent {
  std::string type;
  EventKind kind{EventKind::kOpaque};
  nlohmann::json body;
};

// JSON 객체가 아니면 nullopt. type이 없거나 문자열이 아니면 빈 문자열이다.
std::optional<RelayedEvent> ParseEvent(std::string_view text);
EventKind ClassifyEventType(std::string_view type);

std::string BuildInstructions(const ScenarioDefinition& scenario);
nlohmann::json MakeSessionUpdate(const ScenarioDefinition& scenario);
nlohmann::json MakeOpeningMessage(const std::string& opening_line);
nlohmann::json MakeResponseCreate();
nlohmann::json MakeFunctionCallOutput(const std::string& call_id, const std::string& output);
nlohmann::json MakeClientError(const std::string& message);

// 잘못된 UTF-8은 치환해 직렬화한다.
std::string Serialize(const nlohmann::json& event);

}  // namespace tutor

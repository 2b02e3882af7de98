/*
 * 설명: Realtime 이벤트 파싱과 session.update/응답 요청/함수 결과 이벤트를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/realtime_protocol_test.cpp
 */
#include "tutor/realtime_protocol.hpp"

#include <utility>

namespace tutor {

const char* const kGlobalTutorRules =
    "You are a friendly, encouraging language tutor having a real-time voice conversation with a student.\n"
    "\n"
    "Rules:\n"
    "- Speak in the target language at the student's level. Use simple vocabulary and short sentences for "
    "beginners.\n"
    "- If the student makes a mistake, gently correct them and explain briefly.\n"
    "- Keep your responses concise — this is a spoken conversation, not a written essay.\n"
    "- Encourage the student frequently.\n"
    "- Stay in character for the scenario described below.\n"
    "- If the student asks to switch topics, politely steer them back to the lesson scenario.\n"
    "- Use the provided tools (grade_lesson, trigger_quiz) when appropriate.\n";

std::optional<RelayedEvent> ParseEvent(std::string_view text) {
  auto body = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    return std::nullopt;
  }
  RelayedEvent event;
  auto type_it = body.find("type");
  if (type_it != body.end() && type_it->is_string()) {
    event.type = type_it->get<std::string>();
  }
  event.kind = ClassifyEventType(event.type);
  event.body = std::move(body);
  return event;
}

EventKind ClassifyEventType(std::string_view type) {
  if (type == kFunctionCallArgumentsDelta) {
    return EventKind::kFunctionCallArgumentsDelta;
  }
  if (type == kFunctionCallArgumentsDone) {
    return EventKind::kFunctionCallArgumentsDone;
  }
  return EventKind::kOpaque;
}

std::string BuildInstructions(const ScenarioDefinition& scenario) {
  return std::string(kGlobalTutorRules) + "\n\n" + scenario.system;
}

nlohmann::json MakeSessionUpdate(const ScenarioDefinition& scenario) {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : scenario.tools) {
    tools.push_back(ToJson(tool));
  }
  return {{"type", "session.update"},
          {"session",
           {{"instructions", BuildInstructions(scenario)},
            {"turn_detection", {{"type", "server_vad"}, {"interrupt_response", true}, {"create_response", true}}},
            {"modalities", nlohmann::json::array({"audio", "text"})},
            {"input_audio_format", "pcm16"},
            {"output_audio_format", "pcm16"},
            {"tools", tools}}}};
}

nlohmann::json MakeOpeningMessage(const std::string& opening_line) {
  nlohmann::json content = nlohmann::json::array();
  content.push_back({{"type", "input_text"}, {"text", opening_line}});
  return {{"type", "conversation.item.create"},
          {"item", {{"type", "message"}, {"role", "assistant"}, {"content", content}}}};
}

nlohmann::json MakeResponseCreate() { return {{"type", "response.create"}}; }

nlohmann::json MakeFunctionCallOutput(const std::string& call_id, const std::string& output) {
  return {{"type", "conversation.item.create"},
          {"item", {{"type", "function_call_output"}, {"call_id", call_id}, {"output", output}}}};
}

nlohmann::json MakeClientError(const std::string& message) {
  return {{"type", "error"}, {"error", {{"message", message}}}};
}

std::string Serialize(const nlohmann::json& event) {
  return event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace tutor

/*
 * 설명: 세션 상태 전이, 화이트리스트 기반 클라이언트 중계, 함수 호출 누적/실행을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/session_bridge_test.cpp, tutor/tests/e2e/bridge_flow_test.cpp
 */
#include "tutor/session_bridge.hpp"

#include <utility>

#include "tutor/event_whitelist.hpp"
#include "tutor/realtime_protocol.hpp"

namespace tutor {
namespace {

// 1005/1006/1015는 프레임으로 보낼 수 없는 예약 코드이다.
unsigned short SendableCloseCode(unsigned short code) {
  if (code < 1000 || code == 1005 || code == 1006 || code == 1015 || code >= 5000) {
    return kCloseNormal;
  }
  return code;
}

std::string DescribeEventType(const nlohmann::json& event) {
  auto it = event.find("type");
  if (it == event.end()) {
    return "undefined";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return Serialize(*it);
}

}  // namespace

const char* ToString(BridgeState state) {
  switch (state) {
    case BridgeState::kConnectingUpstream:
      return "connecting_upstream";
    case BridgeState::kActive:
      return "active";
    case BridgeState::kClosed:
      return "closed";
  }
  return "closed";
}

std::optional<ScenarioDefinition> ResolveSessionRequest(const ScenarioCatalog& catalog, const SessionRequest& request,
                                                        std::string& error_message) {
  if (request.scenario_id.empty()) {
    error_message = "Missing scenario query parameter";
    return std::nullopt;
  }
  auto scenario = catalog.Find(request.scenario_id);
  if (!scenario) {
    error_message = "Unknown scenario: " + request.scenario_id;
    return std::nullopt;
  }
  return scenario;
}

SessionBridge::SessionBridge(BridgeSink& sink, ScenarioDefinition scenario, SessionRequest request,
                             std::string session_id, std::shared_ptr<const ToolDispatcher> dispatcher,
                             std::shared_ptr<Observability> observability)
    : sink_(sink), scenario_(std::move(scenario)), request_(std::move(request)), session_id_(std::move(session_id)),
      dispatcher_(std::move(dispatcher)), observability_(std::move(observability)) {}

void SessionBridge::OnUpstreamOpen() {
  if (state_ != BridgeState::kConnectingUpstream) {
    return;
  }
  state_ = BridgeState::kActive;
  sink_.SendToUpstream(Serialize(MakeSessionUpdate(scenario_)));
  sink_.SendToUpstream(Serialize(MakeOpeningMessage(scenario_.opening_line)));
  // 오프닝 대사를 실제로 말하게 하려면 응답 요청이 필요하다.
  sink_.SendToUpstream(Serialize(MakeResponseCreate()));
  LogEvent(LogLevel::kInfo, "session.active");
}

void SessionBridge::OnUpstreamConnectFailed(const std::string& message) {
  if (state_ != BridgeState::kConnectingUpstream) {
    return;
  }
  LogEvent(LogLevel::kError, "upstream.connect_failed", message);
  sink_.SendToClient(Serialize(MakeClientError(message)), false);
  Teardown();
  sink_.CloseClient(kCloseInternalError, message);
}

void SessionBridge::OnUpstreamError(const std::string& message) {
  if (state_ == BridgeState::kConnectingUpstream) {
    OnUpstreamConnectFailed(message);
    return;
  }
  if (state_ == BridgeState::kClosed) {
    return;
  }
  LogEvent(LogLevel::kError, "upstream.error", message);
  sink_.SendToClient(Serialize(MakeClientError(message)), false);
  Teardown();
  sink_.CloseClient(kCloseInternalError, "Upstream connection lost");
}

void SessionBridge::OnUpstreamClosed(unsigned short code, const std::string& reason) {
  if (state_ == BridgeState::kConnectingUpstream) {
    OnUpstreamConnectFailed(reason.empty() ? "Upstream closed" : reason);
    return;
  }
  if (state_ == BridgeState::kClosed) {
    return;
  }
  LogEvent(LogLevel::kInfo, "upstream.closed", std::to_string(code) + " " + reason);
  Teardown();
  sink_.CloseClient(SendableCloseCode(code), reason.empty() ? "Upstream closed" : reason);
}

void SessionBridge::OnClientClosed() {
  if (state_ == BridgeState::kClosed) {
    return;
  }
  LogEvent(LogLevel::kInfo, "client.closed");
  Teardown();
  sink_.CloseUpstream(kCloseNormal, "Client disconnected");
}

void SessionBridge::OnClientMessage(std::string_view data, bool binary) {
  if (state_ != BridgeState::kActive || binary) {
    return;
  }
  auto event = ParseEvent(data);
  if (!event) {
    LogEvent(LogLevel::kDebug, "client.malformed_dropped");
    return;
  }
  if (!IsClientEventAllowed(event->type)) {
    RejectClientEvent(event->body);
    return;
  }
  sink_.SendToUpstream(std::string(data));
}

void SessionBridge::OnUpstreamMessage(std::string_view data, bool binary) {
  if (state_ != BridgeState::kActive) {
    return;
  }
  sink_.SendToClient(std::string(data), binary);
  if (binary || state_ != BridgeState::kActive) {
    return;
  }
  auto event = ParseEvent(data);
  if (!event) {
    return;
  }
  switch (event->kind) {
    case EventKind::kFunctionCallArgumentsDelta:
      if (!accumulator_.OnDelta(event->body)) {
        LogEvent(LogLevel::kWarn, "tool_call.delta_ignored");
      }
      break;
    case EventKind::kFunctionCallArgumentsDone:
      HandleToolCallDone(event->body);
      break;
    case EventKind::kOpaque:
      break;
  }
}

void SessionBridge::HandleToolCallDone(const nlohmann::json& event) {
  auto call = accumulator_.OnDone(event);
  if (!call) {
    LogEvent(LogLevel::kWarn, "tool_call.done_ignored");
    return;
  }
  nlohmann::json args;
  try {
    args = nlohmann::json::parse(call->arguments);
  } catch (const nlohmann::json::parse_error& ex) {
    LogEvent(LogLevel::kWarn, "tool_call.bad_arguments", call->call_id);
    SendToolOutput(call->call_id, MakeToolFailure(std::string("Failed to parse tool arguments: ") + ex.what()));
    return;
  }
  if (!args.is_object()) {
    LogEvent(LogLevel::kWarn, "tool_call.bad_arguments", call->call_id);
    SendToolOutput(call->call_id, MakeToolFailure("Failed to parse tool arguments: expected a JSON object"));
    return;
  }
  auto result = dispatcher_->Execute(call->name, args, scenario_.id);
  if (observability_) {
    observability_->IncrementToolExecuted();
  }
  LogEvent(LogLevel::kInfo, "tool_call.executed",
           call->name + (result.value("ok", false) ? " ok" : " failed"));
  SendToolOutput(call->call_id, result);
}

void SessionBridge::SendToolOutput(const std::string& call_id, const ToolResult& result) {
  sink_.SendToUpstream(Serialize(MakeFunctionCallOutput(call_id, Serialize(result))));
  // 도구 결과 이후에도 대화가 이어지도록 응답을 다시 요청한다.
  sink_.SendToUpstream(Serialize(MakeResponseCreate()));
}

void SessionBridge::RejectClientEvent(const nlohmann::json& event) {
  auto type = DescribeEventType(event);
  if (observability_) {
    observability_->IncrementEventRejected();
  }
  LogEvent(LogLevel::kWarn, "client.event_rejected", type);
  sink_.SendToClient(Serialize(MakeClientError("Event type not allowed: " + type)), false);
}

void SessionBridge::Teardown() {
  state_ = BridgeState::kClosed;
  accumulator_.Clear();
}

void SessionBridge::LogEvent(LogLevel level, const std::string& name, const std::string& detail) const {
  if (!observability_ || !observability_->Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.level = level;
  ctx.trace_id = session_id_;
  ctx.session_id = session_id_;
  ctx.scenario_id = scenario_.id;
  ctx.user_id = request_.user_id;
  ctx.name = name;
  ctx.detail = detail;
  observability_->Log(ctx);
}

}  // namespace tutor

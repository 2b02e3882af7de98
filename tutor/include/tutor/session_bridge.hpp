/*
 * 설명: 클라이언트 연결과 업스트림 연결 사이의 세션 상태 머신과 이벤트 중계 규칙을 구현한다.
 *       연결 자체는 BridgeSink 뒤에 있으며 이 클래스는 I/O를 직접 하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/session_bridge_test.cpp, tutor/tests/e2e/bridge_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "tutor/observability.hpp"
#include "tutor/scenario_catalog.hpp"
#include "tutor/tool_call_accumulator.hpp"
#include "tutor/tool_dispatcher.hpp"

namespace tutor {

// WebSocket close code
inline constexpr unsigned short kCloseNormal = 1000;
inline constexpr unsigned short kCloseInternalError = 1011;

enum class BridgeState { kConnectingUpstream, kActive, kClosed };

const char* ToString(BridgeState state);

class BridgeSink {
 public:
  virtual ~BridgeSink() = default;
  virtual void SendToClient(std::string message, bool binary) = 0;
  virtual void SendToUpstream(std::string message) = 0;
  virtual void CloseClient(unsigned short code, const std::string& reason) = 0;
  virtual void CloseUpstream(unsigned short code, const std::string& reason) = 0;
};

struct SessionRequest {
  std::string scenario_id;
  std::string user_id;
};

// 업그레이드 전에 호출한다. 시나리오가 없으면 WebSocket을 열지 않고 거절해야 한다.
std::optional<ScenarioDefinition> ResolveSessionRequest(const ScenarioCatalog& catalog, const SessionRequest& request,
                                                        std::string& error_message);

class SessionBridge {
 public:
  SessionBridge(BridgeSink& sink, ScenarioDefinition scenario, SessionRequest request, std::string session_id,
                std::shared_ptr<const ToolDispatcher> dispatcher, std::shared_ptr<Observability> observability);

  void OnUpstreamOpen();
  void OnUpstreamConnectFailed(const std::string& message);
  void OnUpstreamError(const std::string& message);
  void OnUpstreamClosed(unsigned short code, const std::string& reason);
  void OnUpstreamMessage(std::string_view data, bool binary);
  void OnClientMessage(std::string_view data, bool binary);
  void OnClientClosed();

  BridgeState State() const { return state_; }
  std::size_t PendingToolCallCount() const { return accumulator_.PendingCount(); }
  bool HasPendingToolCall(const std::string& call_id) const { return accumulator_.HasPending(call_id); }
  const ScenarioDefinition& Scenario() const { return scenario_; }
  const std::string& SessionId() const { return session_id_; }

 private:
  void HandleToolCallDone(const nlohmann::json& event);
  void SendToolOutput(const std::string& call_id, const ToolResult& result);
  void RejectClientEvent(const nlohmann::json& event);
  void Teardown();
  void LogEvent(LogLevel level, const std::string& name, const std::string& detail = "") const;

  BridgeSink& sink_;
  ScenarioDefinition scenario_;
  SessionRequest request_;
  std::string session_id_;
  std::shared_ptr<const ToolDispatcher> dispatcher_;
  std::shared_ptr<Observability> observability_;
  ToolCallAccumulator accumulator_;
  BridgeState state_{BridgeState::kConnectingUpstream};
};

}  // namespace tutor

/*
 * 설명: 브리지 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/config_test.cpp, tutor/tests/e2e/bridge_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace tutor {

enum class UpstreamAuthMode { kHeader, kSubprotocol };

struct AppConfig {
  unsigned short port{8787};
  std::string openai_api_key;
  std::string realtime_url{"wss://api.openai.com/v1/realtime"};
  std::string realtime_model{"gpt-realtime-mini-2025-12-15"};
  UpstreamAuthMode upstream_auth_mode{UpstreamAuthMode::kHeader};
  std::string allowed_origins;
  std::string scenario_dir{"scenarios"};
  std::string log_level{"info"};
  std::size_t ws_queue_limit_messages{256};
  std::size_t ws_queue_limit_bytes{4 * 1024 * 1024};
};

AppConfig LoadConfigFromEnv();

}  // namespace tutor

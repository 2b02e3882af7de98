/*
 * 설명: 클라이언트가 업스트림으로 보낼 수 있는 이벤트 타입 화이트리스트를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/event_whitelist_test.cpp
 */
#pragma once

#include <array>
#include <string_view>

namespace tutor {

inline constexpr std::array<std::string_view, 7> kAllowedClientEventTypes{
    "input_audio_buffer.append", "input_audio_buffer.commit", "response.cancel",
    "conversation.item.truncate", "response.create", "conversation.item.create",
    "session.update"};

// 정확히 일치하는 타입만 허용한다. 빈 문자열은 항상 거부된다.
bool IsClientEventAllowed(std::string_view type);

}  // namespace tutor

/*
 * 설명: 클라이언트 이벤트 타입 화이트리스트 검사를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/event_whitelist_test.cpp
 */
#include "tutor/event_whitelist.hpp"

#include <algorithm>

namespace tutor {

bool IsClientEventAllowed(std::string_view type) {
  if (type.empty()) {
    return false;
  }
  return std::find(kAllowedClientEventTypes.begin(), kAllowedClientEventTypes.end(), type) !=
         kAllowedClientEventTypes.end();
}

}  // namespace tutor

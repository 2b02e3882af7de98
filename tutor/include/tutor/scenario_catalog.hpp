/*
 * 설명: 레슨 시나리오 정의를 프로세스 시작 시 한 번 로드하고 읽기 전용으로 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/scenario_catalog_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace tutor {

struct ScenarioTool {
  std::string name;
  std::string description;
  nlohmann::json parameters;
};

struct ScenarioIndexEntry {
  std::string id;
  std::string level;
  std::string title;
};

struct ScenarioDefinition {
  std::string id;
  std::string level;
  std::string title;
  std::string system;
  std::string opening_line;
  std::vector<ScenarioTool> tools;
};

nlohmann::json ToJson(const ScenarioTool& tool);
nlohmann::json ToJson(const ScenarioIndexEntry& entry);
nlohmann::json ToJson(const ScenarioDefinition& scenario);

class ScenarioCatalog {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  // 생성은 FromJson/LoadFromDirectory로만 한다.
  explicit ScenarioCatalog(PrivateTag) {}

  // index는 {id, level, title} 배열, definitions는 id별 전체 정의이다.
  static std::shared_ptr<const ScenarioCatalog> FromJson(const nlohmann::json& index,
                                                         const std::unordered_map<std::string, nlohmann::json>& definitions,
                                                         std::string& error_message);
  // <dir>/index.json 과 <dir>/<id>.json 을 읽는다.
  static std::shared_ptr<const ScenarioCatalog> LoadFromDirectory(const std::string& dir,
                                                                  std::string& error_message);

  const std::vector<ScenarioIndexEntry>& Index() const { return index_; }
  std::optional<ScenarioDefinition> Find(const std::string& id) const;
  std::size_t Size() const { return scenarios_.size(); }

 private:
  std::vector<ScenarioIndexEntry> index_;
  std::unordered_map<std::string, ScenarioDefinition> scenarios_;
};

}  // namespace tutor

/*
 * 설명: 시나리오 인덱스와 정의 JSON을 검증해 불변 카탈로그를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tutor/tests/unit/scenario_catalog_test.cpp
 */
#include "tutor/scenario_catalog.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace tutor {
namespace {

bool ReadStringField(const nlohmann::json& obj, const char* key, std::string& out) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool ParseTool(const nlohmann::json& raw, ScenarioTool& tool, std::string& error_message) {
  if (!raw.is_object()) {
    error_message = "tool 항목이 객체가 아닙니다";
    return false;
  }
  auto type_it = raw.find("type");
  if (type_it != raw.end() && (!type_it->is_string() || *type_it != "function")) {
    error_message = "tool type은 function이어야 합니다";
    return false;
  }
  if (!ReadStringField(raw, "name", tool.name) || tool.name.empty()) {
    error_message = "tool name이 필요합니다";
    return false;
  }
  if (raw.contains("description") && !ReadStringField(raw, "description", tool.description)) {
    error_message = "tool description 형식이 올바르지 않습니다: " + tool.name;
    return false;
  }
  auto params_it = raw.find("parameters");
  if (params_it == raw.end()) {
    tool.parameters = {{"type", "object"}, {"properties", nlohmann::json::object()}};
  } else if (params_it->is_object()) {
    tool.parameters = *params_it;
  } else {
    error_message = "tool parameters는 객체여야 합니다: " + tool.name;
    return false;
  }
  return true;
}

bool ParseDefinition(const nlohmann::json& raw, ScenarioDefinition& scenario, std::string& error_message) {
  if (!raw.is_object()) {
    error_message = "시나리오 정의가 객체가 아닙니다";
    return false;
  }
  const std::pair<const char*, std::string*> fields[] = {{"id", &scenario.id},
                                                         {"level", &scenario.level},
                                                         {"title", &scenario.title},
                                                         {"system", &scenario.system},
                                                         {"opening_line", &scenario.opening_line}};
  for (const auto& [key, dest] : fields) {
    if (!ReadStringField(raw, key, *dest)) {
      error_message = std::string("시나리오 필드가 없거나 문자열이 아닙니다: ") + key;
      return false;
    }
  }
  auto tools_it = raw.find("tools");
  if (tools_it == raw.end()) {
    return true;
  }
  if (!tools_it->is_array()) {
    error_message = "tools는 배열이어야 합니다: " + scenario.id;
    return false;
  }
  for (const auto& raw_tool : *tools_it) {
    ScenarioTool tool;
    if (!ParseTool(raw_tool, tool, error_message)) {
      error_message += " (" + scenario.id + ")";
      return false;
    }
    scenario.tools.push_back(std::move(tool));
  }
  return true;
}

bool ReadJsonFile(const std::string& path, nlohmann::json& out, std::string& error_message) {
  std::ifstream in(path);
  if (!in) {
    error_message = "파일을 열 수 없습니다: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  try {
    out = nlohmann::json::parse(ss.str());
  } catch (const nlohmann::json::parse_error& ex) {
    error_message = "JSON 파싱 오류 (" + path + "): " + ex.what();
    return false;
  }
  return true;
}

}  // namespace

nlohmann::json ToJson(const ScenarioTool& tool) {
  return {{"type", "function"},
          {"name", tool.name},
          {"description", tool.description},
          {"parameters", tool.parameters}};
}

nlohmann::json ToJson(const ScenarioIndexEntry& entry) {
  return {{"id", entry.id}, {"level", entry.level}, {"title", entry.title}};
}

nlohmann::json ToJson(const ScenarioDefinition& scenario) {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : scenario.tools) {
    tools.push_back(ToJson(tool));
  }
  return {{"id", scenario.id},
          {"level", scenario.level},
          {"title", scenario.title},
          {"system", scenario.system},
          {"opening_line", scenario.opening_line},
          {"tools", tools}};
}

std::shared_ptr<const ScenarioCatalog> ScenarioCatalog::FromJson(
    const nlohmann::json& index, const std::unordered_map<std::string, nlohmann::json>& definitions,
    std::string& error_message) {
  if (!index.is_array()) {
    error_message = "index는 배열이어야 합니다";
    return nullptr;
  }
  auto catalog = std::make_shared<ScenarioCatalog>(PrivateTag{});
  for (const auto& raw_entry : index) {
    ScenarioIndexEntry entry;
    if (!raw_entry.is_object() || !ReadStringField(raw_entry, "id", entry.id) ||
        !ReadStringField(raw_entry, "level", entry.level) || !ReadStringField(raw_entry, "title", entry.title)) {
      error_message = "index 항목에는 id, level, title 문자열이 필요합니다";
      return nullptr;
    }
    if (entry.id.empty()) {
      error_message = "index 항목의 id가 비어 있습니다";
      return nullptr;
    }
    if (catalog->scenarios_.count(entry.id) != 0) {
      error_message = "중복된 시나리오 id: " + entry.id;
      return nullptr;
    }
    auto def_it = definitions.find(entry.id);
    if (def_it == definitions.end()) {
      error_message = "시나리오 정의가 없습니다: " + entry.id;
      return nullptr;
    }
    ScenarioDefinition scenario;
    if (!ParseDefinition(def_it->second, scenario, error_message)) {
      return nullptr;
    }
    if (scenario.id != entry.id) {
      error_message = "시나리오 id 불일치: " + entry.id + " != " + scenario.id;
      return nullptr;
    }
    catalog->scenarios_.emplace(entry.id, std::move(scenario));
    catalog->index_.push_back(std::move(entry));
  }
  return catalog;
}

std::shared_ptr<const ScenarioCatalog> ScenarioCatalog::LoadFromDirectory(const std::string& dir,
                                                                         std::string& error_message) {
  nlohmann::json index;
  if (!ReadJsonFile(dir + "/index.json", index, error_message)) {
    return nullptr;
  }
  if (!index.is_array()) {
    error_message = "index.json은 배열이어야 합니다";
    return nullptr;
  }
  std::unordered_map<std::string, nlohmann::json> definitions;
  for (const auto& entry : index) {
    if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
      error_message = "index 항목에는 id 문자열이 필요합니다";
      return nullptr;
    }
    auto id = entry["id"].get<std::string>();
    if (id.empty() || id.find('/') != std::string::npos || id.find("..") != std::string::npos) {
      error_message = "사용할 수 없는 시나리오 id: " + id;
      return nullptr;
    }
    nlohmann::json definition;
    if (!ReadJsonFile(dir + "/" + id + ".json", definition, error_message)) {
      return nullptr;
    }
    definitions.emplace(id, std::move(definition));
  }
  return FromJson(index, definitions, error_message);
}

std::optional<ScenarioDefinition> ScenarioCatalog::Find(const std::string& id) const {
  auto it = scenarios_.find(id);
  if (it == scenarios_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace tutor

#include "config/warden_config.h"
#include "core/warden_errors.h"
#include <fstream>
#include <map>
#include <sstream>

namespace warden {

namespace {

using json = nlohmann::json;

json ParseDocument(const std::string& text, const std::string& what) {
  try {
    return json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigurationError(what + " is not valid JSON: " + e.what());
  }
}

std::string ReadFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw ConfigurationError("cannot open config file: " + path);
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    throw ConfigurationError("error reading config file: " + path);
  }
  return ss.str();
}

const json& RequireObject(const json& j, const std::string& where) {
  if (!j.is_object()) {
    throw ConfigurationError(where + " must be an object");
  }
  return j;
}

double RequireNumber(const json& j, const std::string& where) {
  if (!j.is_number()) {
    throw ConfigurationError(where + " must be a number");
  }
  return j.get<double>();
}

size_t RequireCount(const json& j, const std::string& where) {
  if (!j.is_number_integer() || j.get<int64_t>() < 0) {
    throw ConfigurationError(where + " must be a non-negative integer");
  }
  return j.get<size_t>();
}

bool RequireBool(const json& j, const std::string& where) {
  if (!j.is_boolean()) {
    throw ConfigurationError(where + " must be true or false");
  }
  return j.get<bool>();
}

std::string RequireString(const json& j, const std::string& where) {
  if (!j.is_string()) {
    throw ConfigurationError(where + " must be a string");
  }
  return j.get<std::string>();
}

SecurityLevel RequireLevel(const std::string& name, const std::string& where) {
  SecurityLevel level;
  if (!ParseSecurityLevel(name, &level)) {
    throw ConfigurationError(where + ": unknown security level '" + name + "'");
  }
  return level;
}

Category RequireCategory(const std::string& name, const std::string& where) {
  Category category;
  if (!ParseCategory(name, &category)) {
    throw ConfigurationError(where + ": unknown category '" + name + "'");
  }
  return category;
}

void ParseThresholds(const json& j, PolicyConfig* config) {
  RequireObject(j, "thresholds");
  for (auto it = j.begin(); it != j.end(); ++it) {
    RequireLevel(it.key(), "thresholds");
  }

  for (SecurityLevel level : AllSecurityLevels()) {
    const std::string level_name = SecurityLevelName(level);
    if (!j.contains(level_name)) {
      throw ConfigurationError("thresholds: missing level '" + level_name + "'");
    }
    const std::string where = "thresholds." + level_name;
    const json& level_json = RequireObject(j.at(level_name), where);
    for (auto it = level_json.begin(); it != level_json.end(); ++it) {
      RequireCategory(it.key(), where);
    }

    for (Category category : AllCategories()) {
      const std::string category_name = CategoryName(category);
      if (!level_json.contains(category_name)) {
        throw ConfigurationError("missing threshold " + where + "." + category_name);
      }
      config->level(level).set_threshold(
          category, RequireNumber(level_json.at(category_name), where + "." + category_name));
    }
  }
}

void ParseHardBlock(const json& j, PolicyConfig* config) {
  RequireObject(j, "hard_block");
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string where = "hard_block." + it.key();
    LevelPolicy& policy = config->level(RequireLevel(it.key(), "hard_block"));
    if (!it.value().is_array()) {
      throw ConfigurationError(where + " must be an array of category names");
    }
    policy.hard_block.fill(false);
    for (const auto& entry : it.value()) {
      policy.set_hard_block(RequireCategory(RequireString(entry, where), where), true);
    }
  }
}

void ParseCooccurrence(const json& j, PolicyConfig* config) {
  RequireObject(j, "cooccurrence");
  for (SecurityLevel level : AllSecurityLevels()) {
    config->level(level).cooccurrence.clear();
  }

  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string level_where = "cooccurrence." + it.key();
    LevelPolicy& policy = config->level(RequireLevel(it.key(), "cooccurrence"));
    const json& rules = RequireObject(it.value(), level_where);

    for (auto rule_it = rules.begin(); rule_it != rules.end(); ++rule_it) {
      const std::string where = level_where + "." + rule_it.key();
      Category category = RequireCategory(rule_it.key(), level_where);
      const json& rule_json = RequireObject(rule_it.value(), where);
      if (!rule_json.contains("min_count") || !rule_json.contains("soft_threshold")) {
        throw ConfigurationError(where + " needs min_count and soft_threshold");
      }

      CooccurrenceRule rule;
      rule.min_count = RequireCount(rule_json.at("min_count"), where + ".min_count");
      rule.soft_threshold = RequireNumber(rule_json.at("soft_threshold"), where + ".soft_threshold");
      policy.cooccurrence[category] = rule;
    }
  }
}

const char* const kConfigKeys[] = {
  "security_level", "max_input_length", "thresholds", "hard_block",
  "cooccurrence", "audit", "logging",
};

bool IsConfigKey(const std::string& key) {
  for (const char* known : kConfigKeys) {
    if (key == known) {
      return true;
    }
  }
  return false;
}

PatternRule ParseRule(const json& j, const std::string& where) {
  RequireObject(j, where);
  if (!j.contains("id") || !j.contains("pattern") || !j.contains("weight")) {
    throw ConfigurationError(where + " needs id, pattern and weight");
  }
  PatternRule rule;
  rule.id = RequireString(j.at("id"), where + ".id");
  rule.pattern = RequireString(j.at("pattern"), where + ".pattern");
  rule.weight = RequireNumber(j.at("weight"), where + ".weight");
  return rule;
}

}  // namespace

// ============================================================
// Policy documents
// ============================================================

WardenConfig ParseConfig(const std::string& json_text) {
  json doc = ParseDocument(json_text, "policy document");
  RequireObject(doc, "policy document");

  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (!IsConfigKey(it.key())) {
      throw ConfigurationError("policy document: unknown key '" + it.key() + "'");
    }
  }

  WardenConfig config;
  PolicyConfig& policy = config.policy;

  if (doc.contains("security_level")) {
    policy.security_level =
        RequireLevel(RequireString(doc["security_level"], "security_level"), "security_level");
  }
  if (doc.contains("max_input_length")) {
    policy.max_input_length = RequireCount(doc["max_input_length"], "max_input_length");
  }
  if (doc.contains("thresholds")) {
    ParseThresholds(doc["thresholds"], &policy);
  }
  if (doc.contains("hard_block")) {
    ParseHardBlock(doc["hard_block"], &policy);
  }
  if (doc.contains("cooccurrence")) {
    ParseCooccurrence(doc["cooccurrence"], &policy);
  }
  if (doc.contains("audit")) {
    const json& audit = RequireObject(doc["audit"], "audit");
    if (audit.contains("include_content_on_block")) {
      policy.audit.include_content_on_block =
          RequireBool(audit["include_content_on_block"], "audit.include_content_on_block");
    }
  }
  if (doc.contains("logging")) {
    const json& logging = RequireObject(doc["logging"], "logging");
    if (logging.contains("level")) {
      std::string name = RequireString(logging["level"], "logging.level");
      if (!Logger::ParseLevel(name, &config.logging.level)) {
        throw ConfigurationError("logging.level: unknown level '" + name + "'");
      }
    }
    if (logging.contains("file")) {
      config.logging.file = RequireString(logging["file"], "logging.file");
    }
  }

  policy.Validate();
  return config;
}

WardenConfig LoadConfig(const std::string& path) {
  return ParseConfig(ReadFile(path));
}

PolicyConfig ParsePolicyConfig(const std::string& json_text) {
  return ParseConfig(json_text).policy;
}

PolicyConfig LoadPolicyConfig(const std::string& path) {
  return LoadConfig(path).policy;
}

nlohmann::json PolicyConfigToJson(const PolicyConfig& config) {
  json thresholds = json::object();
  json hard_block = json::object();
  json cooccurrence = json::object();

  for (SecurityLevel level : AllSecurityLevels()) {
    const std::string level_name = SecurityLevelName(level);
    const LevelPolicy& policy = config.level(level);

    json level_thresholds = json::object();
    json level_blocks = json::array();
    for (Category category : AllCategories()) {
      level_thresholds[CategoryName(category)] = policy.threshold(category);
      if (policy.is_hard_block(category)) {
        level_blocks.push_back(CategoryName(category));
      }
    }
    thresholds[level_name] = level_thresholds;
    hard_block[level_name] = level_blocks;

    if (!policy.cooccurrence.empty()) {
      json rules = json::object();
      for (const auto& [category, rule] : policy.cooccurrence) {
        rules[CategoryName(category)] = {
          {"min_count", rule.min_count},
          {"soft_threshold", rule.soft_threshold}
        };
      }
      cooccurrence[level_name] = rules;
    }
  }

  return {
    {"security_level", SecurityLevelName(config.security_level)},
    {"max_input_length", config.max_input_length},
    {"thresholds", thresholds},
    {"hard_block", hard_block},
    {"cooccurrence", cooccurrence},
    {"audit", {{"include_content_on_block", config.audit.include_content_on_block}}}
  };
}

void ConfigureLogging(const LoggingOptions& options) {
  if (options.file.empty()) {
    Logger::Init();
  } else if (!Logger::Init(options.file)) {
    throw ConfigurationError("cannot open log file: " + options.file);
  }
  Logger::SetLevel(options.level);
}

// ============================================================
// Pattern library documents
// ============================================================

std::shared_ptr<const PatternLibrary> ParsePatternLibrary(const std::string& json_text) {
  json doc = ParseDocument(json_text, "pattern library document");
  RequireObject(doc, "pattern library document");

  bool include_builtin = false;
  if (doc.contains("include_builtin")) {
    include_builtin = RequireBool(doc["include_builtin"], "include_builtin");
  }

  std::map<std::string, PatternSetSource> sources;
  if (include_builtin) {
    for (auto& source : BuiltinPatternSources()) {
      std::string name = source.name;
      sources[name] = std::move(source);
    }
  }

  if (!doc.contains("sets")) {
    throw ConfigurationError("pattern library document needs a 'sets' object");
  }
  const json& sets = RequireObject(doc["sets"], "sets");

  for (auto it = sets.begin(); it != sets.end(); ++it) {
    const std::string where = "sets." + it.key();
    const json& set_json = RequireObject(it.value(), where);

    auto existing = sources.find(it.key());
    PatternSetSource& source = existing != sources.end() ? existing->second : sources[it.key()];
    source.name = it.key();

    if (set_json.contains("combine")) {
      std::string mode = RequireString(set_json["combine"], where + ".combine");
      if (!ParseCombineMode(mode, &source.combine)) {
        throw ConfigurationError(where + ".combine: unknown combining rule '" + mode + "'");
      }
    }
    if (set_json.contains("cap")) {
      source.cap = RequireNumber(set_json["cap"], where + ".cap");
    }
    if (set_json.contains("rules")) {
      if (!set_json["rules"].is_array()) {
        throw ConfigurationError(where + ".rules must be an array");
      }
      size_t index = 0;
      for (const auto& rule_json : set_json["rules"]) {
        source.rules.push_back(
            ParseRule(rule_json, where + ".rules[" + std::to_string(index++) + "]"));
      }
    }
  }

  PatternLibraryBuilder builder;
  for (const auto& [name, source] : sources) {
    builder.AddSet(source);
  }
  return builder.Build();
}

std::shared_ptr<const PatternLibrary> LoadPatternLibrary(const std::string& path) {
  return ParsePatternLibrary(ReadFile(path));
}

}  // namespace warden

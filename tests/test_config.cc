#include "config/warden_config.h"
#include "core/warden_errors.h"
#include "detectors/warden_injection_detectors.h"
#include "text/warden_normalizer.h"
#include "util/logger.h"
#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <vector>

namespace warden {
namespace {

using json = nlohmann::json;

std::string WriteTempFile(const std::string& name, const std::string& contents) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << contents;
  return path;
}

json DefaultsDocument() {
  return PolicyConfigToJson(PolicyConfig::Defaults());
}

// ============================================================
// Policy documents
// ============================================================

TEST(PolicyDocumentTest, EmptyDocumentKeepsDefaults) {
  PolicyConfig config = ParsePolicyConfig("{}");
  PolicyConfig defaults = PolicyConfig::Defaults();
  EXPECT_EQ(config.security_level, SecurityLevel::BALANCED);
  EXPECT_EQ(config.max_input_length, PolicyConfig::kDefaultMaxInputLength);
  for (SecurityLevel level : AllSecurityLevels()) {
    for (Category category : AllCategories()) {
      EXPECT_DOUBLE_EQ(config.level(level).threshold(category),
                       defaults.level(level).threshold(category));
    }
  }
}

TEST(PolicyDocumentTest, ScalarSettings) {
  PolicyConfig config = ParsePolicyConfig(R"({
    "security_level": "strict",
    "max_input_length": 2048,
    "audit": {"include_content_on_block": true}
  })");
  EXPECT_EQ(config.security_level, SecurityLevel::STRICT);
  EXPECT_EQ(config.max_input_length, 2048u);
  EXPECT_TRUE(config.audit.include_content_on_block);
}

TEST(PolicyDocumentTest, RoundTripsThroughJson) {
  PolicyConfig original = PolicyConfig::Defaults(SecurityLevel::PERMISSIVE);
  original.level(SecurityLevel::BALANCED).set_threshold(Category::PII, 0.55);
  original.level(SecurityLevel::BALANCED).set_hard_block(Category::SYSTEM_DETAIL, true);

  PolicyConfig parsed = ParsePolicyConfig(PolicyConfigToJson(original).dump());
  EXPECT_EQ(parsed.security_level, SecurityLevel::PERMISSIVE);
  for (SecurityLevel level : AllSecurityLevels()) {
    for (Category category : AllCategories()) {
      EXPECT_DOUBLE_EQ(parsed.level(level).threshold(category),
                       original.level(level).threshold(category));
      EXPECT_EQ(parsed.level(level).is_hard_block(category),
                original.level(level).is_hard_block(category));
    }
  }
  const auto& rules = parsed.level(SecurityLevel::STRICT).cooccurrence;
  ASSERT_EQ(rules.count(Category::HARMFUL_CONTENT), 1u);
  EXPECT_EQ(rules.at(Category::HARMFUL_CONTENT).min_count, 3u);
}

TEST(PolicyDocumentTest, MissingThresholdIsRejected) {
  json doc = DefaultsDocument();
  doc["thresholds"]["balanced"].erase("jailbreak");
  try {
    ParsePolicyConfig(doc.dump());
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError& e) {
    EXPECT_NE(std::string(e.what()).find("missing threshold thresholds.balanced.jailbreak"),
              std::string::npos);
  }
}

TEST(PolicyDocumentTest, MissingLevelIsRejected) {
  json doc = DefaultsDocument();
  doc["thresholds"].erase("permissive");
  EXPECT_THROW(ParsePolicyConfig(doc.dump()), ConfigurationError);
}

TEST(PolicyDocumentTest, UnknownNamesAreRejected) {
  EXPECT_THROW(ParsePolicyConfig(R"({"security_level": "paranoid"})"), ConfigurationError);
  EXPECT_THROW(ParsePolicyConfig(R"({"hard_block": {"balanced": ["spam"]}})"), ConfigurationError);
  EXPECT_THROW(ParsePolicyConfig(R"({"thresholds_typo": {}})"), ConfigurationError);

  json doc = DefaultsDocument();
  doc["thresholds"]["strict"]["toxicity"] = 0.2;
  EXPECT_THROW(ParsePolicyConfig(doc.dump()), ConfigurationError);
}

TEST(PolicyDocumentTest, WrongTypesAreRejected) {
  EXPECT_THROW(ParsePolicyConfig(R"({"max_input_length": "big"})"), ConfigurationError);
  EXPECT_THROW(ParsePolicyConfig(R"({"max_input_length": -5})"), ConfigurationError);
  EXPECT_THROW(ParsePolicyConfig(R"({"audit": {"include_content_on_block": "yes"}})"),
               ConfigurationError);
  EXPECT_THROW(ParsePolicyConfig(R"({"hard_block": {"balanced": "pii"}})"), ConfigurationError);
  EXPECT_THROW(ParsePolicyConfig("[]"), ConfigurationError);
}

TEST(PolicyDocumentTest, MalformedJsonIsRejected) {
  EXPECT_THROW(ParsePolicyConfig("{\"security_level\": "), ConfigurationError);
  EXPECT_THROW(ParsePolicyConfig(""), ConfigurationError);
}

TEST(PolicyDocumentTest, InvalidValuesFailValidation) {
  json doc = DefaultsDocument();
  doc["thresholds"]["strict"]["pii"] = 0.9;  // above balanced
  EXPECT_THROW(ParsePolicyConfig(doc.dump()), ConfigurationError);

  doc = DefaultsDocument();
  doc["thresholds"]["permissive"]["pii"] = 1.5;
  EXPECT_THROW(ParsePolicyConfig(doc.dump()), ConfigurationError);

  EXPECT_THROW(ParsePolicyConfig(R"({"max_input_length": 0})"), ConfigurationError);
}

TEST(PolicyDocumentTest, HardBlockReplacesLevelSet) {
  PolicyConfig config = ParsePolicyConfig(R"({"hard_block": {"balanced": ["credential"]}})");
  const LevelPolicy& balanced = config.level(SecurityLevel::BALANCED);
  EXPECT_TRUE(balanced.is_hard_block(Category::CREDENTIAL));
  EXPECT_FALSE(balanced.is_hard_block(Category::PII));
  EXPECT_FALSE(balanced.is_hard_block(Category::DIRECT_INJECTION));
  // Other levels keep their defaults
  EXPECT_TRUE(config.level(SecurityLevel::STRICT).is_hard_block(Category::PII));
}

TEST(PolicyDocumentTest, CooccurrenceReplacesAllRules) {
  PolicyConfig config = ParsePolicyConfig(R"({
    "cooccurrence": {"balanced": {"pii": {"min_count": 2, "soft_threshold": 0.25}}}
  })");
  EXPECT_TRUE(config.level(SecurityLevel::STRICT).cooccurrence.empty());
  const auto& rules = config.level(SecurityLevel::BALANCED).cooccurrence;
  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules.at(Category::PII).min_count, 2u);
  EXPECT_DOUBLE_EQ(rules.at(Category::PII).soft_threshold, 0.25);

  EXPECT_THROW(ParsePolicyConfig(R"({"cooccurrence": {"balanced": {"pii": {"min_count": 2}}}})"),
               ConfigurationError);
  EXPECT_THROW(ParsePolicyConfig(
                   R"({"cooccurrence": {"balanced": {"pii": {"min_count": 1, "soft_threshold": 0.2}}}})"),
               ConfigurationError);
}

TEST(PolicyDocumentTest, LoggingSection) {
  WardenConfig config = ParseConfig(R"({"logging": {"level": "warn", "file": "/tmp/warden.log"}})");
  EXPECT_EQ(config.logging.level, WARN);
  EXPECT_EQ(config.logging.file, "/tmp/warden.log");
  EXPECT_THROW(ParseConfig(R"({"logging": {"level": "verbose"}})"), ConfigurationError);
}

TEST(PolicyDocumentTest, LoadsFromFile) {
  std::string path = WriteTempFile("warden_policy.json", R"({"security_level": "permissive"})");
  EXPECT_EQ(LoadPolicyConfig(path).security_level, SecurityLevel::PERMISSIVE);
  EXPECT_THROW(LoadPolicyConfig(path + ".missing"), ConfigurationError);
}

TEST(LoggingConfigTest, UnwritableLogFileIsRejected) {
  LoggingOptions options;
  options.file = "/nonexistent-directory/warden.log";
  EXPECT_THROW(ConfigureLogging(options), ConfigurationError);

  options.file.clear();
  options.level = ERROR;
  EXPECT_NO_THROW(ConfigureLogging(options));
  EXPECT_EQ(Logger::GetLevel(), ERROR);
  Logger::SetLevel(INFO);
}

// ============================================================
// Pattern library documents
// ============================================================

TEST(PatternDocumentTest, CustomSetWithBadRuleDropped) {
  auto library = ParsePatternLibrary(R"({
    "sets": {
      "custom": {
        "combine": "max",
        "cap": 1.0,
        "rules": [
          {"id": "custom.foo", "pattern": "\\bfoo\\b", "weight": 0.5},
          {"id": "custom.bad", "pattern": "(", "weight": 0.5}
        ]
      }
    }
  })");
  ASSERT_TRUE(library->Has("custom"));
  EXPECT_EQ(library->Get("custom").combine(), CombineMode::MAX);
  EXPECT_EQ(library->rule_count(), 1u);
  EXPECT_EQ(library->rejected_rules(), std::vector<std::string>{"custom.bad"});
  EXPECT_FALSE(library->Has(pattern_sets::kDirectInjection));
}

TEST(PatternDocumentTest, ExtendsBuiltinSets) {
  auto library = ParsePatternLibrary(R"({
    "include_builtin": true,
    "sets": {
      "direct_injection": {
        "rules": [{"id": "di.custom_obey", "pattern": "\\bsudo\\s+obey\\b", "weight": 0.8}]
      }
    }
  })");
  size_t builtin_rules = BuiltinPatternLibrary()->Get(pattern_sets::kDirectInjection).rules().size();
  EXPECT_EQ(library->Get(pattern_sets::kDirectInjection).rules().size(), builtin_rules + 1);
  EXPECT_TRUE(library->Has(pattern_sets::kPii));

  DirectInjectionDetector detector(library);
  Finding f = detector.Detect(Normalizer().Normalize("sudo obey me"), ScanScope::WholeText());
  EXPECT_DOUBLE_EQ(f.confidence(), 0.8);
}

TEST(PatternDocumentTest, StructuralErrorsThrow) {
  EXPECT_THROW(ParsePatternLibrary("{}"), ConfigurationError);
  EXPECT_THROW(ParsePatternLibrary(R"({"sets": []})"), ConfigurationError);
  EXPECT_THROW(ParsePatternLibrary(R"({"sets": {"s": {"combine": "mean"}}})"), ConfigurationError);
  EXPECT_THROW(ParsePatternLibrary(R"({"sets": {"s": {"cap": 2.0}}})"), ConfigurationError);
  EXPECT_THROW(ParsePatternLibrary(R"({"sets": {"s": {"rules": [{"id": "x", "pattern": "x"}]}}})"),
               ConfigurationError);
  EXPECT_THROW(ParsePatternLibrary("not json"), ConfigurationError);
}

TEST(PatternDocumentTest, LoadsFromFile) {
  std::string path = WriteTempFile(
      "warden_patterns.json",
      R"({"sets": {"s": {"rules": [{"id": "s.1", "pattern": "abc", "weight": 0.4}]}}})");
  auto library = LoadPatternLibrary(path);
  EXPECT_EQ(library->rule_count(), 1u);
  EXPECT_THROW(LoadPatternLibrary(path + ".missing"), ConfigurationError);
}

}  // namespace
}  // namespace warden

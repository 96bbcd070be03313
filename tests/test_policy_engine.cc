#include "policy/warden_policy.h"
#include "core/warden_errors.h"
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace {

Finding At(Category category, double confidence) {
  std::optional<HarmCategory> harm;
  if (category == Category::HARMFUL_CONTENT) {
    harm = HarmCategory::VIOLENCE;
  }
  std::vector<Span> spans;
  if (confidence > 0.0) {
    spans.push_back({0, 4});
  }
  return Finding("test", category, confidence, spans, "test", {}, harm);
}

Decision DecideAt(SecurityLevel level, const std::vector<Finding>& findings) {
  auto snapshot = PolicySnapshot::Create(PolicyConfig::Defaults());
  return PolicyEngine::Decide(*snapshot, findings, level).decision;
}

// ============================================================
// Defaults
// ============================================================

TEST(PolicyConfigTest, DefaultsValidate) {
  for (SecurityLevel level : AllSecurityLevels()) {
    EXPECT_NO_THROW(PolicyConfig::Defaults(level).Validate());
  }
}

TEST(PolicyConfigTest, DefaultBalancedThresholds) {
  const LevelPolicy& balanced = PolicyConfig::Defaults().level(SecurityLevel::BALANCED);
  EXPECT_DOUBLE_EQ(balanced.threshold(Category::DIRECT_INJECTION), 0.30);
  EXPECT_DOUBLE_EQ(balanced.threshold(Category::INDIRECT_INJECTION), 0.40);
  EXPECT_DOUBLE_EQ(balanced.threshold(Category::JAILBREAK), 0.30);
  EXPECT_DOUBLE_EQ(balanced.threshold(Category::SYSTEM_EXTRACTION), 0.40);
  EXPECT_DOUBLE_EQ(balanced.threshold(Category::PII), 0.50);
  EXPECT_DOUBLE_EQ(balanced.threshold(Category::HARMFUL_CONTENT), 0.50);
}

TEST(PolicyConfigTest, StricterLevelsHaveLowerThresholds) {
  PolicyConfig config = PolicyConfig::Defaults();
  for (Category category : AllCategories()) {
    EXPECT_LE(config.level(SecurityLevel::STRICT).threshold(category),
              config.level(SecurityLevel::BALANCED).threshold(category));
    EXPECT_LE(config.level(SecurityLevel::BALANCED).threshold(category),
              config.level(SecurityLevel::PERMISSIVE).threshold(category));
  }
}

TEST(PolicyConfigTest, DefaultHardBlockSets) {
  PolicyConfig config = PolicyConfig::Defaults();
  const LevelPolicy& strict = config.level(SecurityLevel::STRICT);
  const LevelPolicy& balanced = config.level(SecurityLevel::BALANCED);
  const LevelPolicy& permissive = config.level(SecurityLevel::PERMISSIVE);

  EXPECT_TRUE(balanced.is_hard_block(Category::DIRECT_INJECTION));
  EXPECT_TRUE(balanced.is_hard_block(Category::PII));
  EXPECT_FALSE(balanced.is_hard_block(Category::INDIRECT_INJECTION));
  EXPECT_FALSE(balanced.is_hard_block(Category::HARMFUL_CONTENT));
  EXPECT_TRUE(strict.is_hard_block(Category::INDIRECT_INJECTION));
  EXPECT_TRUE(strict.is_hard_block(Category::HARMFUL_CONTENT));
  EXPECT_FALSE(permissive.is_hard_block(Category::PII));
  EXPECT_TRUE(permissive.is_hard_block(Category::CREDENTIAL));
  EXPECT_FALSE(permissive.is_hard_block(Category::SYSTEM_DETAIL));
}

// ============================================================
// Validation
// ============================================================

TEST(PolicyConfigTest, ThresholdOutsideUnitIntervalIsRejected) {
  PolicyConfig config = PolicyConfig::Defaults();
  config.level(SecurityLevel::PERMISSIVE).set_threshold(Category::PII, 1.2);
  EXPECT_THROW(config.Validate(), ConfigurationError);

  config = PolicyConfig::Defaults();
  config.level(SecurityLevel::STRICT).set_threshold(Category::PII, -0.1);
  EXPECT_THROW(config.Validate(), ConfigurationError);
}

TEST(PolicyConfigTest, LevelOrderingIsEnforced) {
  PolicyConfig config = PolicyConfig::Defaults();
  config.level(SecurityLevel::STRICT).set_threshold(Category::JAILBREAK, 0.9);
  EXPECT_THROW(config.Validate(), ConfigurationError);
}

TEST(PolicyConfigTest, CooccurrenceRulesAreValidated) {
  PolicyConfig config = PolicyConfig::Defaults();
  config.level(SecurityLevel::BALANCED).cooccurrence[Category::HARMFUL_CONTENT] = {1, 0.3};
  EXPECT_THROW(config.Validate(), ConfigurationError);

  config = PolicyConfig::Defaults();
  config.level(SecurityLevel::BALANCED).cooccurrence[Category::HARMFUL_CONTENT] = {3, 0.6};
  EXPECT_THROW(config.Validate(), ConfigurationError);
}

TEST(PolicyConfigTest, ZeroInputLengthIsRejected) {
  PolicyConfig config = PolicyConfig::Defaults();
  config.max_input_length = 0;
  EXPECT_THROW(config.Validate(), ConfigurationError);
  EXPECT_THROW(PolicySnapshot::Create(config), ConfigurationError);
}

TEST(PolicyConfigTest, InputLengthAboveLimitIsRejected) {
  PolicyConfig config = PolicyConfig::Defaults();
  config.max_input_length = PolicyConfig::kMaxInputLengthLimit;
  EXPECT_NO_THROW(config.Validate());
  config.max_input_length = PolicyConfig::kMaxInputLengthLimit + 1;
  EXPECT_THROW(config.Validate(), ConfigurationError);
}

// ============================================================
// Decisions
// ============================================================

TEST(PolicyEngineTest, NoFindingsAllows) {
  for (SecurityLevel level : AllSecurityLevels()) {
    EXPECT_EQ(DecideAt(level, {}), Decision::ALLOW);
  }
}

TEST(PolicyEngineTest, HardBlockCategoryBlocks) {
  EXPECT_EQ(DecideAt(SecurityLevel::BALANCED, {At(Category::DIRECT_INJECTION, 0.9)}),
            Decision::BLOCK);
}

TEST(PolicyEngineTest, SoftCategorySanitizes) {
  EXPECT_EQ(DecideAt(SecurityLevel::BALANCED, {At(Category::INDIRECT_INJECTION, 0.7)}),
            Decision::SANITIZE);
  EXPECT_EQ(DecideAt(SecurityLevel::STRICT, {At(Category::INDIRECT_INJECTION, 0.7)}),
            Decision::BLOCK);
}

TEST(PolicyEngineTest, BelowThresholdAllows) {
  EXPECT_EQ(DecideAt(SecurityLevel::BALANCED, {At(Category::DIRECT_INJECTION, 0.2)}),
            Decision::ALLOW);
  EXPECT_EQ(DecideAt(SecurityLevel::STRICT, {At(Category::DIRECT_INJECTION, 0.25)}),
            Decision::BLOCK);
}

TEST(PolicyEngineTest, ThresholdIsInclusive) {
  EXPECT_EQ(DecideAt(SecurityLevel::BALANCED, {At(Category::SYSTEM_EXTRACTION, 0.4)}),
            Decision::BLOCK);
}

TEST(PolicyEngineTest, ZeroConfidenceNeverTriggers) {
  PolicyConfig config = PolicyConfig::Defaults();
  for (Category category : AllCategories()) {
    config.level(SecurityLevel::STRICT).set_threshold(category, 0.0);
  }
  config.level(SecurityLevel::STRICT).cooccurrence.clear();
  auto snapshot = PolicySnapshot::Create(config);
  std::vector<Finding> findings;
  for (Category category : AllCategories()) {
    findings.push_back(At(category, 0.0));
  }
  Verdict verdict = PolicyEngine::Decide(*snapshot, findings, SecurityLevel::STRICT);
  EXPECT_EQ(verdict.decision, Decision::ALLOW);
  EXPECT_TRUE(verdict.triggering_findings.empty());
}

TEST(PolicyEngineTest, AllTriggeringFindingsAreReportedInOrder) {
  auto snapshot = PolicySnapshot::Create(PolicyConfig::Defaults());
  Verdict verdict = PolicyEngine::Decide(
      *snapshot,
      {At(Category::DIRECT_INJECTION, 0.9), At(Category::PII, 0.1),
       At(Category::SYSTEM_EXTRACTION, 0.7)},
      SecurityLevel::BALANCED);
  EXPECT_EQ(verdict.decision, Decision::BLOCK);
  EXPECT_EQ(verdict.level_used, SecurityLevel::BALANCED);
  ASSERT_EQ(verdict.triggering_findings.size(), 2u);
  EXPECT_EQ(verdict.triggering_findings[0].category(), Category::DIRECT_INJECTION);
  EXPECT_EQ(verdict.triggering_findings[1].category(), Category::SYSTEM_EXTRACTION);
  EXPECT_TRUE(verdict.HasCategory(Category::SYSTEM_EXTRACTION));
  EXPECT_FALSE(verdict.HasCategory(Category::PII));
}

TEST(PolicyEngineTest, CooccurringHarmTriggersTogether) {
  std::vector<Finding> three(3, At(Category::HARMFUL_CONTENT, 0.35));
  std::vector<Finding> two(2, At(Category::HARMFUL_CONTENT, 0.35));

  EXPECT_EQ(DecideAt(SecurityLevel::BALANCED, three), Decision::SANITIZE);
  EXPECT_EQ(DecideAt(SecurityLevel::BALANCED, two), Decision::ALLOW);
  EXPECT_EQ(DecideAt(SecurityLevel::STRICT, three), Decision::BLOCK);
  EXPECT_EQ(DecideAt(SecurityLevel::PERMISSIVE, three), Decision::ALLOW);
}

TEST(PolicyEngineTest, RaisingThresholdNeverTightensDecision) {
  const std::vector<Finding> findings = {At(Category::DIRECT_INJECTION, 0.5),
                                         At(Category::PII, 0.6),
                                         At(Category::HARMFUL_CONTENT, 0.4)};
  for (Category category : {Category::DIRECT_INJECTION, Category::PII}) {
    Decision previous = Decision::BLOCK;
    for (int step = 0; step <= 20; ++step) {
      PolicyConfig config = PolicyConfig::Defaults();
      config.level(SecurityLevel::STRICT).set_threshold(category, 0.0);
      config.level(SecurityLevel::PERMISSIVE).set_threshold(category, 1.0);
      config.level(SecurityLevel::BALANCED).set_threshold(category, step * 0.05);
      auto snapshot = PolicySnapshot::Create(config);
      Decision decision =
          PolicyEngine::Decide(*snapshot, findings, SecurityLevel::BALANCED).decision;
      EXPECT_LE(static_cast<int>(decision), static_cast<int>(previous)) << "step " << step;
      previous = decision;
    }
  }
}

TEST(PolicyEngineTest, RaisingConfidenceNeverLoosensDecision) {
  for (Category category : AllCategories()) {
    for (SecurityLevel level : AllSecurityLevels()) {
      Decision previous = Decision::ALLOW;
      for (int step = 0; step <= 20; ++step) {
        Decision decision = DecideAt(level, {At(category, step * 0.05)});
        EXPECT_GE(static_cast<int>(decision), static_cast<int>(previous));
        previous = decision;
      }
    }
  }
}

TEST(PolicyEngineTest, StricterLevelNeverLoosensDecision) {
  const std::vector<std::vector<Finding>> cases = {
      {At(Category::INDIRECT_INJECTION, 0.35)},
      {At(Category::HARMFUL_CONTENT, 0.6)},
      {At(Category::PII, 0.45), At(Category::SYSTEM_DETAIL, 0.2)},
      {At(Category::JAILBREAK, 0.25)},
  };
  for (const auto& findings : cases) {
    int strict = static_cast<int>(DecideAt(SecurityLevel::STRICT, findings));
    int balanced = static_cast<int>(DecideAt(SecurityLevel::BALANCED, findings));
    int permissive = static_cast<int>(DecideAt(SecurityLevel::PERMISSIVE, findings));
    EXPECT_GE(strict, balanced);
    EXPECT_GE(balanced, permissive);
  }
}

// ============================================================
// Snapshot swapping
// ============================================================

TEST(PolicyEngineTest, NullSnapshotIsRejected) {
  EXPECT_THROW(PolicyEngine(nullptr), ConfigurationError);
  PolicyEngine engine(PolicySnapshot::Create(PolicyConfig::Defaults()));
  EXPECT_THROW(engine.Update(nullptr), ConfigurationError);
}

TEST(PolicyEngineTest, UpdateSwapsActiveLevel) {
  PolicyEngine engine(PolicySnapshot::Create(PolicyConfig::Defaults(SecurityLevel::BALANCED)));
  auto previous = engine.snapshot();
  std::vector<Finding> findings = {At(Category::INDIRECT_INJECTION, 0.7)};
  EXPECT_EQ(engine.Decide(findings).decision, Decision::SANITIZE);

  engine.Update(PolicySnapshot::Create(PolicyConfig::Defaults(SecurityLevel::STRICT)));
  Verdict verdict = engine.Decide(findings);
  EXPECT_EQ(verdict.decision, Decision::BLOCK);
  EXPECT_EQ(verdict.level_used, SecurityLevel::STRICT);

  // Holders of the old snapshot keep a valid, unchanged policy
  EXPECT_EQ(previous->security_level(), SecurityLevel::BALANCED);
  EXPECT_EQ(PolicyEngine::Decide(*previous, findings, previous->security_level()).decision,
            Decision::SANITIZE);
}

TEST(PolicyEngineTest, ExplicitLevelOverridesActiveLevel) {
  PolicyEngine engine(PolicySnapshot::Create(PolicyConfig::Defaults(SecurityLevel::PERMISSIVE)));
  std::vector<Finding> findings = {At(Category::JAILBREAK, 0.25)};
  EXPECT_EQ(engine.Decide(findings).decision, Decision::ALLOW);
  EXPECT_EQ(engine.Decide(findings, SecurityLevel::STRICT).decision, Decision::BLOCK);
}

}  // namespace
}  // namespace warden

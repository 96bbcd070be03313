#include "policy/warden_policy.h"
#include "core/warden_errors.h"
#include "util/logger.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <sstream>

namespace warden {

namespace {

constexpr double kStrictScale = 0.7;
constexpr double kPermissiveScale = 1.3;

struct BaseThreshold {
  Category category;
  double balanced;
};

const BaseThreshold kBalancedThresholds[] = {
  {Category::DIRECT_INJECTION, 0.30},
  {Category::INDIRECT_INJECTION, 0.40},
  {Category::JAILBREAK, 0.30},
  {Category::SYSTEM_EXTRACTION, 0.40},
  {Category::PII, 0.50},
  {Category::CREDENTIAL, 0.50},
  {Category::SYSTEM_DETAIL, 0.50},
  {Category::HARMFUL_CONTENT, 0.50},
};

const Category kHardBlockBalanced[] = {
  Category::DIRECT_INJECTION, Category::JAILBREAK, Category::SYSTEM_EXTRACTION,
  Category::CREDENTIAL, Category::PII,
};

const Category kHardBlockStrictExtra[] = {
  Category::INDIRECT_INJECTION, Category::HARMFUL_CONTENT,
};

const Category kHardBlockPermissive[] = {
  Category::DIRECT_INJECTION, Category::JAILBREAK, Category::SYSTEM_EXTRACTION,
  Category::CREDENTIAL,
};

const CooccurrenceRule kHarmfulCooccurrence = {3, 0.30};

bool InUnitInterval(double value) {
  return !std::isnan(value) && value >= 0.0 && value <= 1.0;
}

std::string Where(SecurityLevel level, Category category) {
  return SecurityLevelName(level) + "/" + CategoryName(category);
}

}  // namespace

// ============================================================
// PolicyConfig
// ============================================================

PolicyConfig PolicyConfig::Defaults(SecurityLevel active) {
  PolicyConfig config;
  config.security_level = active;

  for (const auto& base : kBalancedThresholds) {
    config.level(SecurityLevel::BALANCED).set_threshold(base.category, base.balanced);
    config.level(SecurityLevel::STRICT).set_threshold(base.category, base.balanced * kStrictScale);
    config.level(SecurityLevel::PERMISSIVE)
        .set_threshold(base.category, std::min(1.0, base.balanced * kPermissiveScale));
  }

  for (Category category : kHardBlockBalanced) {
    config.level(SecurityLevel::BALANCED).set_hard_block(category, true);
    config.level(SecurityLevel::STRICT).set_hard_block(category, true);
  }
  for (Category category : kHardBlockStrictExtra) {
    config.level(SecurityLevel::STRICT).set_hard_block(category, true);
  }
  for (Category category : kHardBlockPermissive) {
    config.level(SecurityLevel::PERMISSIVE).set_hard_block(category, true);
  }

  config.level(SecurityLevel::STRICT).cooccurrence[Category::HARMFUL_CONTENT] = kHarmfulCooccurrence;
  config.level(SecurityLevel::BALANCED).cooccurrence[Category::HARMFUL_CONTENT] = kHarmfulCooccurrence;
  return config;
}

void PolicyConfig::Validate() const {
  if (max_input_length == 0) {
    throw ConfigurationError("max_input_length must be positive");
  }
  if (max_input_length > kMaxInputLengthLimit) {
    throw ConfigurationError("max_input_length " + std::to_string(max_input_length) +
                             " exceeds the limit of " + std::to_string(kMaxInputLengthLimit));
  }

  for (SecurityLevel level : AllSecurityLevels()) {
    const LevelPolicy& policy = this->level(level);
    for (Category category : AllCategories()) {
      double value = policy.threshold(category);
      if (!InUnitInterval(value)) {
        std::ostringstream msg;
        msg << "threshold " << Where(level, category) << " = " << value << " is outside [0, 1]";
        throw ConfigurationError(msg.str());
      }
    }

    for (const auto& [category, rule] : policy.cooccurrence) {
      if (rule.min_count < 2) {
        throw ConfigurationError("co-occurrence rule " + Where(level, category) +
                                 " needs min_count of at least 2");
      }
      if (!InUnitInterval(rule.soft_threshold) ||
          rule.soft_threshold > policy.threshold(category)) {
        throw ConfigurationError("co-occurrence soft threshold " + Where(level, category) +
                                 " must lie in [0, category threshold]");
      }
    }
  }

  const LevelPolicy& strict = level(SecurityLevel::STRICT);
  const LevelPolicy& balanced = level(SecurityLevel::BALANCED);
  const LevelPolicy& permissive = level(SecurityLevel::PERMISSIVE);
  for (Category category : AllCategories()) {
    if (strict.threshold(category) > balanced.threshold(category) ||
        balanced.threshold(category) > permissive.threshold(category)) {
      std::ostringstream msg;
      msg << "thresholds for " << CategoryName(category)
          << " must satisfy strict <= balanced <= permissive (got "
          << strict.threshold(category) << ", " << balanced.threshold(category) << ", "
          << permissive.threshold(category) << ")";
      throw ConfigurationError(msg.str());
    }
  }
}

// ============================================================
// PolicySnapshot
// ============================================================

std::shared_ptr<const PolicySnapshot> PolicySnapshot::Create(PolicyConfig config) {
  config.Validate();
  return std::shared_ptr<const PolicySnapshot>(new PolicySnapshot(std::move(config)));
}

// ============================================================
// PolicyEngine
// ============================================================

PolicyEngine::PolicyEngine(std::shared_ptr<const PolicySnapshot> snapshot)
    : snapshot_(std::move(snapshot)) {
  if (!snapshot_) {
    throw ConfigurationError("policy engine requires a policy snapshot");
  }
}

std::shared_ptr<const PolicySnapshot> PolicyEngine::snapshot() const {
  return std::atomic_load(&snapshot_);
}

void PolicyEngine::Update(std::shared_ptr<const PolicySnapshot> snapshot) {
  if (!snapshot) {
    throw ConfigurationError("cannot update policy with an empty snapshot");
  }
  LOG_INFO("PolicyEngine", "Activating policy, security level " +
           SecurityLevelName(snapshot->security_level()));
  std::atomic_store(&snapshot_, std::move(snapshot));
}

Verdict PolicyEngine::Decide(const std::vector<Finding>& findings) const {
  auto active = snapshot();
  return Decide(*active, findings, active->security_level());
}

Verdict PolicyEngine::Decide(const std::vector<Finding>& findings, SecurityLevel level) const {
  auto active = snapshot();
  return Decide(*active, findings, level);
}

Verdict PolicyEngine::Decide(const PolicySnapshot& snapshot,
                             const std::vector<Finding>& findings,
                             SecurityLevel level) {
  const LevelPolicy& policy = snapshot.level(level);
  std::vector<bool> triggering(findings.size(), false);

  for (size_t i = 0; i < findings.size(); ++i) {
    double confidence = findings[i].confidence();
    // A zero-confidence finding is a non-detection, even at threshold 0
    triggering[i] = confidence > 0.0 && confidence >= policy.threshold(findings[i].category());
  }

  for (const auto& [category, rule] : policy.cooccurrence) {
    std::vector<size_t> soft_hits;
    for (size_t i = 0; i < findings.size(); ++i) {
      const Finding& finding = findings[i];
      if (finding.category() == category && finding.confidence() > 0.0 &&
          finding.confidence() >= rule.soft_threshold) {
        soft_hits.push_back(i);
      }
    }
    if (soft_hits.size() >= rule.min_count) {
      for (size_t i : soft_hits) {
        triggering[i] = true;
      }
    }
  }

  Verdict verdict;
  verdict.level_used = level;
  verdict.timestamp = std::chrono::system_clock::now();

  bool hard_block = false;
  for (size_t i = 0; i < findings.size(); ++i) {
    if (!triggering[i]) {
      continue;
    }
    verdict.triggering_findings.push_back(findings[i]);
    if (policy.is_hard_block(findings[i].category())) {
      hard_block = true;
    }
  }

  if (hard_block) {
    verdict.decision = Decision::BLOCK;
  } else if (!verdict.triggering_findings.empty()) {
    verdict.decision = Decision::SANITIZE;
  } else {
    verdict.decision = Decision::ALLOW;
  }
  return verdict;
}

}  // namespace warden

#ifndef WARDEN_POLICY_H_
#define WARDEN_POLICY_H_

#include "core/warden_types.h"
#include <array>
#include <map>
#include <memory>
#include <vector>

namespace warden {

// ============================================================
// Policy configuration
// ============================================================

// N findings of one category at or above a lower "soft" threshold trigger
// together, even when none reaches the category threshold on its own
struct CooccurrenceRule {
  size_t min_count = 0;
  double soft_threshold = 0.0;
};

// Thresholds and hard-block flags for one security level
struct LevelPolicy {
  std::array<double, kCategoryCount> thresholds{};
  std::array<bool, kCategoryCount> hard_block{};
  std::map<Category, CooccurrenceRule> cooccurrence;

  double threshold(Category category) const {
    return thresholds[static_cast<size_t>(category)];
  }
  bool is_hard_block(Category category) const {
    return hard_block[static_cast<size_t>(category)];
  }
  void set_threshold(Category category, double value) {
    thresholds[static_cast<size_t>(category)] = value;
  }
  void set_hard_block(Category category, bool value) {
    hard_block[static_cast<size_t>(category)] = value;
  }
};

struct AuditOptions {
  // Attach the raw text to the event when the call is blocked
  bool include_content_on_block = false;
};

struct PolicyConfig {
  static constexpr size_t kDefaultMaxInputLength = 10000;
  static constexpr size_t kMaxInputLengthLimit = 1 << 20;

  SecurityLevel security_level = SecurityLevel::BALANCED;
  size_t max_input_length = kDefaultMaxInputLength;
  std::array<LevelPolicy, kSecurityLevelCount> levels{};
  AuditOptions audit;

  LevelPolicy& level(SecurityLevel level) { return levels[static_cast<size_t>(level)]; }
  const LevelPolicy& level(SecurityLevel level) const {
    return levels[static_cast<size_t>(level)];
  }

  // Built-in thresholds for all three levels, with the given one active
  static PolicyConfig Defaults(SecurityLevel active = SecurityLevel::BALANCED);

  // Throws ConfigurationError describing the first problem found:
  // a threshold outside [0,1], strict > balanced or balanced > permissive,
  // a soft threshold above its category threshold, a zero length limit.
  void Validate() const;
};

// ============================================================
// PolicySnapshot - validated, immutable policy
// ============================================================
class PolicySnapshot {
 public:
  // Validates first; throws ConfigurationError
  static std::shared_ptr<const PolicySnapshot> Create(PolicyConfig config);

  const PolicyConfig& config() const { return config_; }
  SecurityLevel security_level() const { return config_.security_level; }
  size_t max_input_length() const { return config_.max_input_length; }
  const LevelPolicy& level(SecurityLevel level) const { return config_.level(level); }

 private:
  explicit PolicySnapshot(PolicyConfig config) : config_(std::move(config)) {}

  PolicyConfig config_;
};

// ============================================================
// PolicyEngine
// ============================================================
//
// Decisions are a pure function of (findings, level policy). The active
// snapshot is swapped atomically; a call that already loaded a snapshot
// finishes with it.
class PolicyEngine {
 public:
  explicit PolicyEngine(std::shared_ptr<const PolicySnapshot> snapshot);

  std::shared_ptr<const PolicySnapshot> snapshot() const;
  void Update(std::shared_ptr<const PolicySnapshot> snapshot);

  // Decide at the snapshot's active level
  Verdict Decide(const std::vector<Finding>& findings) const;
  Verdict Decide(const std::vector<Finding>& findings, SecurityLevel level) const;

  static Verdict Decide(const PolicySnapshot& snapshot,
                        const std::vector<Finding>& findings,
                        SecurityLevel level);

 private:
  std::shared_ptr<const PolicySnapshot> snapshot_;
};

}  // namespace warden

#endif  // WARDEN_POLICY_H_

#ifndef WARDEN_TYPES_H_
#define WARDEN_TYPES_H_

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace warden {

// ============================================================
// Closed enumerations
// ============================================================

enum class Category {
  DIRECT_INJECTION,
  INDIRECT_INJECTION,
  JAILBREAK,
  SYSTEM_EXTRACTION,
  PII,
  CREDENTIAL,
  SYSTEM_DETAIL,
  HARMFUL_CONTENT
};

constexpr size_t kCategoryCount = 8;

// Sub-tag for Category::HARMFUL_CONTENT
enum class HarmCategory {
  HATE_SPEECH,
  VIOLENCE,
  SELF_HARM,
  HARASSMENT,
  SEXUAL_CONTENT,
  ILLEGAL_ACTIVITY,
  MISINFORMATION,
  UNETHICAL
};

constexpr size_t kHarmCategoryCount = 8;

// Ordered by restrictiveness: STRICT is the most restrictive
enum class SecurityLevel {
  STRICT,
  BALANCED,
  PERMISSIVE
};

constexpr size_t kSecurityLevelCount = 3;

// Ordered ALLOW < SANITIZE < BLOCK
enum class Decision {
  ALLOW,
  SANITIZE,
  BLOCK
};

const std::array<Category, kCategoryCount>& AllCategories();
const std::array<HarmCategory, kHarmCategoryCount>& AllHarmCategories();
const std::array<SecurityLevel, kSecurityLevelCount>& AllSecurityLevels();

// Names are the snake_case identifiers used in config documents and events
std::string CategoryName(Category category);
std::string HarmCategoryName(HarmCategory category);
std::string SecurityLevelName(SecurityLevel level);
std::string DecisionName(Decision decision);

bool ParseCategory(const std::string& name, Category* out);
bool ParseHarmCategory(const std::string& name, HarmCategory* out);
bool ParseSecurityLevel(const std::string& name, SecurityLevel* out);

// ============================================================
// Findings and verdicts
// ============================================================

// Half-open byte range [start, end)
struct Span {
  size_t start = 0;
  size_t end = 0;

  size_t length() const { return end - start; }
  bool Overlaps(const Span& other) const {
    return start < other.end && other.start < end;
  }
  bool operator==(const Span& other) const {
    return start == other.start && end == other.end;
  }
  bool operator!=(const Span& other) const { return !(*this == other); }
};

// Result of one detector on one text. Immutable once built.
class Finding {
 public:
  // Throws InvariantViolation if confidence is outside [0,1] or a span is
  // inverted. Spans are sorted and must not overlap.
  Finding(std::string detector_id,
          Category category,
          double confidence,
          std::vector<Span> spans,
          std::string rationale,
          std::vector<std::string> matched_rules = {},
          std::optional<HarmCategory> harm_category = std::nullopt);

  // Confidence 0 result for a detector that had nothing to report
  static Finding Empty(std::string detector_id, Category category,
                       std::string rationale = "no_match");

  const std::string& detector_id() const { return detector_id_; }
  Category category() const { return category_; }
  double confidence() const { return confidence_; }
  const std::vector<Span>& spans() const { return spans_; }
  const std::string& rationale() const { return rationale_; }
  const std::vector<std::string>& matched_rules() const { return matched_rules_; }
  const std::optional<HarmCategory>& harm_category() const { return harm_category_; }

  // "harmful_content/violence" for harm findings, category name otherwise
  std::string Label() const;

 private:
  std::string detector_id_;
  Category category_;
  double confidence_;
  std::vector<Span> spans_;
  std::string rationale_;
  std::vector<std::string> matched_rules_;
  std::optional<HarmCategory> harm_category_;
};

struct Verdict {
  Decision decision = Decision::ALLOW;
  std::vector<Finding> triggering_findings;
  SecurityLevel level_used = SecurityLevel::BALANCED;
  std::chrono::system_clock::time_point timestamp;

  bool IsBlocked() const { return decision == Decision::BLOCK; }
  bool HasCategory(Category category) const;
};

std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

}  // namespace warden

#endif  // WARDEN_TYPES_H_

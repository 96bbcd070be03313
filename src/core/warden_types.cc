#include "core/warden_types.h"
#include "core/warden_errors.h"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace warden {

const std::array<Category, kCategoryCount>& AllCategories() {
  static const std::array<Category, kCategoryCount> categories = {
    Category::DIRECT_INJECTION,
    Category::INDIRECT_INJECTION,
    Category::JAILBREAK,
    Category::SYSTEM_EXTRACTION,
    Category::PII,
    Category::CREDENTIAL,
    Category::SYSTEM_DETAIL,
    Category::HARMFUL_CONTENT,
  };
  return categories;
}

const std::array<HarmCategory, kHarmCategoryCount>& AllHarmCategories() {
  static const std::array<HarmCategory, kHarmCategoryCount> categories = {
    HarmCategory::HATE_SPEECH,
    HarmCategory::VIOLENCE,
    HarmCategory::SELF_HARM,
    HarmCategory::HARASSMENT,
    HarmCategory::SEXUAL_CONTENT,
    HarmCategory::ILLEGAL_ACTIVITY,
    HarmCategory::MISINFORMATION,
    HarmCategory::UNETHICAL,
  };
  return categories;
}

const std::array<SecurityLevel, kSecurityLevelCount>& AllSecurityLevels() {
  static const std::array<SecurityLevel, kSecurityLevelCount> levels = {
    SecurityLevel::STRICT,
    SecurityLevel::BALANCED,
    SecurityLevel::PERMISSIVE,
  };
  return levels;
}

std::string CategoryName(Category category) {
  switch (category) {
    case Category::DIRECT_INJECTION: return "direct_injection";
    case Category::INDIRECT_INJECTION: return "indirect_injection";
    case Category::JAILBREAK: return "jailbreak";
    case Category::SYSTEM_EXTRACTION: return "system_extraction";
    case Category::PII: return "pii";
    case Category::CREDENTIAL: return "credential";
    case Category::SYSTEM_DETAIL: return "system_detail";
    case Category::HARMFUL_CONTENT: return "harmful_content";
    default: return "unknown";
  }
}

std::string HarmCategoryName(HarmCategory category) {
  switch (category) {
    case HarmCategory::HATE_SPEECH: return "hate_speech";
    case HarmCategory::VIOLENCE: return "violence";
    case HarmCategory::SELF_HARM: return "self_harm";
    case HarmCategory::HARASSMENT: return "harassment";
    case HarmCategory::SEXUAL_CONTENT: return "sexual_content";
    case HarmCategory::ILLEGAL_ACTIVITY: return "illegal_activity";
    case HarmCategory::MISINFORMATION: return "misinformation";
    case HarmCategory::UNETHICAL: return "unethical";
    default: return "unknown";
  }
}

std::string SecurityLevelName(SecurityLevel level) {
  switch (level) {
    case SecurityLevel::STRICT: return "strict";
    case SecurityLevel::BALANCED: return "balanced";
    case SecurityLevel::PERMISSIVE: return "permissive";
    default: return "unknown";
  }
}

std::string DecisionName(Decision decision) {
  switch (decision) {
    case Decision::ALLOW: return "allow";
    case Decision::SANITIZE: return "sanitize";
    case Decision::BLOCK: return "block";
    default: return "unknown";
  }
}

bool ParseCategory(const std::string& name, Category* out) {
  for (Category category : AllCategories()) {
    if (CategoryName(category) == name) {
      *out = category;
      return true;
    }
  }
  return false;
}

bool ParseHarmCategory(const std::string& name, HarmCategory* out) {
  for (HarmCategory category : AllHarmCategories()) {
    if (HarmCategoryName(category) == name) {
      *out = category;
      return true;
    }
  }
  return false;
}

bool ParseSecurityLevel(const std::string& name, SecurityLevel* out) {
  for (SecurityLevel level : AllSecurityLevels()) {
    if (SecurityLevelName(level) == name) {
      *out = level;
      return true;
    }
  }
  return false;
}

// ============================================================
// Finding
// ============================================================

Finding::Finding(std::string detector_id,
                 Category category,
                 double confidence,
                 std::vector<Span> spans,
                 std::string rationale,
                 std::vector<std::string> matched_rules,
                 std::optional<HarmCategory> harm_category)
    : detector_id_(std::move(detector_id)),
      category_(category),
      confidence_(confidence),
      spans_(std::move(spans)),
      rationale_(std::move(rationale)),
      matched_rules_(std::move(matched_rules)),
      harm_category_(harm_category) {
  if (std::isnan(confidence_) || confidence_ < 0.0 || confidence_ > 1.0) {
    std::ostringstream msg;
    msg << "detector '" << detector_id_ << "' produced confidence "
        << confidence_ << " outside [0,1]";
    throw InvariantViolation(msg.str());
  }
  if (harm_category_.has_value() && category_ != Category::HARMFUL_CONTENT) {
    throw InvariantViolation("harm sub-tag on a " + CategoryName(category_) + " finding");
  }
  for (size_t i = 0; i < spans_.size(); i++) {
    if (spans_[i].end < spans_[i].start) {
      throw InvariantViolation("detector '" + detector_id_ + "' produced an inverted span");
    }
    if (i > 0 && spans_[i].start < spans_[i - 1].end) {
      throw InvariantViolation("detector '" + detector_id_ + "' produced overlapping spans");
    }
  }
}

Finding Finding::Empty(std::string detector_id, Category category, std::string rationale) {
  return Finding(std::move(detector_id), category, 0.0, {}, std::move(rationale));
}

std::string Finding::Label() const {
  if (harm_category_.has_value()) {
    return CategoryName(category_) + "/" + HarmCategoryName(*harm_category_);
  }
  return CategoryName(category_);
}

bool Verdict::HasCategory(Category category) const {
  return std::any_of(triggering_findings.begin(), triggering_findings.end(),
                     [category](const Finding& f) { return f.category() == category; });
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      tp.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(tp);
  std::tm bt{};
  gmtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

}  // namespace warden

#include "detectors/warden_content_safety_classifier.h"
#include "core/warden_errors.h"
#include "detectors/warden_detector.h"

namespace warden {

namespace {
const std::string kContentSafetyId = "content_safety";
}  // namespace

ContentSafetyClassifier::ContentSafetyClassifier(std::shared_ptr<const PatternLibrary> library)
    : library_(std::move(library)) {
  if (!library_) {
    throw ConfigurationError("content safety classifier requires a pattern library");
  }
}

const std::string& ContentSafetyClassifier::id() const {
  return kContentSafetyId;
}

Finding ContentSafetyClassifier::Score(const NormalizedText& text, HarmCategory category) const {
  const std::string name = HarmCategoryName(category);
  RuleEvaluation evaluation = EvaluateRules(library_->Get(pattern_sets::HarmfulSetName(name)),
                                            text,
                                            ScanScope::WholeText().Resolve(text.size()));
  if (!evaluation.matched() || evaluation.confidence <= 0.0) {
    return Finding(kContentSafetyId, Category::HARMFUL_CONTENT, 0.0, {}, "no_match", {},
                   category);
  }
  return Finding(kContentSafetyId, Category::HARMFUL_CONTENT, evaluation.confidence,
                 evaluation.spans, "harm_" + name, evaluation.matched_rules, category);
}

std::vector<Finding> ContentSafetyClassifier::Classify(const NormalizedText& text) const {
  std::vector<Finding> findings;
  if (text.empty()) {
    return findings;
  }
  for (HarmCategory category : AllHarmCategories()) {
    Finding finding = Score(text, category);
    if (finding.confidence() > 0.0) {
      findings.push_back(std::move(finding));
    }
  }
  return findings;
}

}  // namespace warden

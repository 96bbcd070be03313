#include "detectors/warden_injection_detectors.h"
#include "core/warden_errors.h"

namespace warden {

namespace {

const std::string kJailbreakId = "jailbreak";
const char kFramedTopicRule[] = "jb.framed_restricted_topic";

}  // namespace

JailbreakDetector::JailbreakDetector(std::shared_ptr<const PatternLibrary> library)
    : library_(std::move(library)) {
  if (!library_) {
    throw ConfigurationError("jailbreak detector requires a pattern library");
  }
}

const std::string& JailbreakDetector::id() const {
  return kJailbreakId;
}

Finding JailbreakDetector::Detect(const NormalizedText& text, const ScanScope& scope) const {
  std::vector<Span> regions = scope.Resolve(text.size());
  const PatternSet& persona = library_->Get(pattern_sets::kJailbreakPersona);

  RuleEvaluation evaluation = EvaluateRules(persona, text, regions);
  std::string rationale = "persona_escape";

  RuleEvaluation framing =
      EvaluateRules(library_->Get(pattern_sets::kJailbreakFraming), text, regions);
  if (framing.matched()) {
    RuleEvaluation topic =
        EvaluateRules(library_->Get(pattern_sets::kJailbreakRestrictedTopic), text, regions);
    if (topic.matched()) {
      evaluation.matched_rules.push_back(kFramedTopicRule);
      evaluation.matched_weights.push_back(kFramedTopicWeight);
      evaluation.spans.insert(evaluation.spans.end(), framing.spans.begin(), framing.spans.end());
      evaluation.spans.insert(evaluation.spans.end(), topic.spans.begin(), topic.spans.end());
      evaluation.spans = MergeSpans(std::move(evaluation.spans));
      evaluation.confidence = persona.Combine(evaluation.matched_weights);
      rationale = evaluation.matched_rules.size() > 1 ? "persona_escape_framed_topic"
                                                      : "framed_restricted_topic";
    }
  }

  return MakeFinding(kJailbreakId, category(), evaluation, rationale);
}

}  // namespace warden

#include "detectors/warden_injection_detectors.h"
#include "core/warden_errors.h"

namespace warden {

namespace {

const std::string kIndirectInjectionId = "indirect_injection";

void Append(RuleEvaluation* into, const RuleEvaluation& from) {
  into->matched_rules.insert(into->matched_rules.end(),
                             from.matched_rules.begin(), from.matched_rules.end());
  into->matched_weights.insert(into->matched_weights.end(),
                               from.matched_weights.begin(), from.matched_weights.end());
  into->spans.insert(into->spans.end(), from.spans.begin(), from.spans.end());
}

}  // namespace

IndirectInjectionDetector::IndirectInjectionDetector(std::shared_ptr<const PatternLibrary> library)
    : library_(std::move(library)) {
  if (!library_) {
    throw ConfigurationError("indirect injection detector requires a pattern library");
  }
}

const std::string& IndirectInjectionDetector::id() const {
  return kIndirectInjectionId;
}

std::vector<Span> IndirectInjectionDetector::FindEmbeddedBlocks(const NormalizedText& text) const {
  std::vector<Span> whole = ScanScope::WholeText().Resolve(text.size());
  return EvaluateRules(library_->Get(pattern_sets::kEmbeddedBlocks), text, whole).spans;
}

Finding IndirectInjectionDetector::Detect(const NormalizedText& text, const ScanScope& scope) const {
  const PatternSet& overrides = library_->Get(pattern_sets::kIndirectInjection);
  const PatternSet& markers = library_->Get(pattern_sets::kIndirectMarkers);

  std::vector<Span> override_regions;
  std::vector<Span> marker_regions;
  std::string rationale;

  if (scope.mode() == ScanScope::Mode::AUTO_DELIMITED) {
    override_regions = FindEmbeddedBlocks(text);
    marker_regions = scope.Resolve(text.size());
    rationale = "embedded_block_instructions";
  } else {
    override_regions = scope.Resolve(text.size());
    marker_regions = override_regions;
    rationale = scope.mode() == ScanScope::Mode::REGIONS ? "external_content_instructions"
                                                         : "data_borne_instructions";
  }

  RuleEvaluation evaluation = EvaluateRules(overrides, text, override_regions);
  Append(&evaluation, EvaluateRules(markers, text, marker_regions));

  // Both sets feed one score under the override set's combining rule
  evaluation.confidence = overrides.Combine(evaluation.matched_weights);
  evaluation.spans = MergeSpans(std::move(evaluation.spans));
  return MakeFinding(kIndirectInjectionId, category(), evaluation, rationale);
}

}  // namespace warden

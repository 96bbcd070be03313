#include "detectors/warden_injection_detectors.h"
#include "core/warden_errors.h"

namespace warden {

namespace {
const std::string kSystemPromptId = "system_extraction";
}  // namespace

SystemPromptDetector::SystemPromptDetector(std::shared_ptr<const PatternLibrary> library)
    : library_(std::move(library)) {
  if (!library_) {
    throw ConfigurationError("system prompt detector requires a pattern library");
  }
}

const std::string& SystemPromptDetector::id() const {
  return kSystemPromptId;
}

Finding SystemPromptDetector::Detect(const NormalizedText& text, const ScanScope& scope) const {
  std::vector<Span> regions = scope.Resolve(text.size());

  RuleEvaluation direct =
      EvaluateRules(library_->Get(pattern_sets::kSystemExtraction), text, regions);
  if (direct.matched()) {
    return MakeFinding(kSystemPromptId, category(), direct, "direct_request");
  }

  RuleEvaluation meta =
      EvaluateRules(library_->Get(pattern_sets::kSystemExtractionMeta), text, regions);
  return MakeFinding(kSystemPromptId, category(), meta, "meta_query");
}

}  // namespace warden

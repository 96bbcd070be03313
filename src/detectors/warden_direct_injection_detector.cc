#include "detectors/warden_injection_detectors.h"
#include "core/warden_errors.h"
#include <algorithm>

namespace warden {

namespace {

const std::string kDirectInjectionId = "direct_injection";

constexpr size_t kMaxWordsAfterBoundary = 3;
constexpr double kUnanchoredFactor = 0.5;

bool IsSentenceBoundary(char c) {
  return c == '.' || c == '!' || c == '?' || c == ';' || c == ':' || c == '\n';
}

}  // namespace

DirectInjectionDetector::DirectInjectionDetector(std::shared_ptr<const PatternLibrary> library)
    : library_(std::move(library)) {
  if (!library_) {
    throw ConfigurationError("direct injection detector requires a pattern library");
  }
}

const std::string& DirectInjectionDetector::id() const {
  return kDirectInjectionId;
}

double DirectInjectionDetector::AnchorFactor(const NormalizedText& text,
                                             const Span& region,
                                             const Span& match) {
  const std::string& folded = text.folded();
  if (match.start >= folded.size() || match.start < region.start) {
    return 1.0;
  }

  // Quoted text ("he said \"ignore previous instructions\"") is reported, not obeyed
  size_t quotes = std::count(folded.begin() + region.start, folded.begin() + match.start, '"');
  if (quotes % 2 == 1) {
    return kUnanchoredFactor;
  }

  if (folded[match.start] == '\n') {
    return 1.0;
  }

  size_t boundary = region.start;
  for (size_t i = match.start; i > region.start; --i) {
    if (IsSentenceBoundary(folded[i - 1])) {
      boundary = i;
      break;
    }
  }

  size_t words = 0;
  bool in_word = false;
  for (size_t i = boundary; i < match.start; ++i) {
    if (folded[i] == ' ' || folded[i] == '\n') {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }

  return words > kMaxWordsAfterBoundary ? kUnanchoredFactor : 1.0;
}

Finding DirectInjectionDetector::Detect(const NormalizedText& text, const ScanScope& scope) const {
  RuleEvaluation evaluation = EvaluateRules(library_->Get(pattern_sets::kDirectInjection),
                                            text,
                                            scope.Resolve(text.size()),
                                            &DirectInjectionDetector::AnchorFactor);
  return MakeFinding(kDirectInjectionId, category(), evaluation, "override_phrasing");
}

}  // namespace warden

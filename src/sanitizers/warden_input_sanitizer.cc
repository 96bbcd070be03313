#include "sanitizers/warden_input_sanitizer.h"
#include "core/warden_errors.h"
#include "detectors/warden_detector.h"

namespace warden {

const char InputSanitizer::kPlaceholder[] = "[filtered]";

InputSanitizer::InputSanitizer(std::shared_ptr<const PatternLibrary> library)
    : library_(std::move(library)) {
  if (!library_) {
    throw ConfigurationError("input sanitizer requires a pattern library");
  }
}

SanitizationResult InputSanitizer::Sanitize(const NormalizedText& text,
                                            const std::vector<Finding>& triggering_findings) const {
  SanitizationResult result;
  const std::string& source = text.text();

  // Step 1: placeholder replacement of flagged spans and delimiter tokens
  std::vector<Span> spans;
  for (const auto& finding : triggering_findings) {
    for (const auto& span : finding.spans()) {
      if (span.end <= source.size()) {
        spans.push_back(span);
      }
    }
  }
  bool had_finding_spans = !spans.empty();

  RuleEvaluation delimiters =
      EvaluateRules(library_->Get(pattern_sets::kPromptDelimiters), text,
                    ScanScope::WholeText().Resolve(source.size()));
  spans.insert(spans.end(), delimiters.spans.begin(), delimiters.spans.end());
  spans = MergeSpans(std::move(spans));

  std::string sanitized;
  sanitized.reserve(source.size());
  size_t cursor = 0;
  for (const auto& span : spans) {
    sanitized.append(source, cursor, span.start - cursor);
    sanitized += kPlaceholder;
    cursor = span.end;
  }
  sanitized.append(source, cursor, std::string::npos);

  if (had_finding_spans) {
    result.actions.push_back("spans_filtered");
  }
  if (delimiters.matched()) {
    result.actions.push_back("delimiters_neutralized");
  }

  // Step 2: remove excessive repetition (obfuscation)
  std::string before_repetition = sanitized;
  sanitized = RemoveExcessiveRepetition(sanitized);
  if (sanitized != before_repetition) {
    result.actions.push_back("repetition_capped");
  }

  // Step 3: placeholders may have left whitespace runs behind
  std::string before_whitespace = sanitized;
  sanitized = Normalizer::CollapseWhitespace(sanitized);
  if (sanitized != before_whitespace) {
    result.actions.push_back("whitespace_collapsed");
  }

  result.was_modified = sanitized != source;
  result.sanitized_content = std::move(sanitized);
  return result;
}

std::string InputSanitizer::RemoveExcessiveRepetition(const std::string& text) {
  std::string result;
  result.reserve(text.length());

  char last_char = '\0';
  size_t repeat_count = 0;

  for (char ch : text) {
    if (repeat_count > 0 && ch == last_char) {
      repeat_count++;
      if (repeat_count <= kMaxRepeats) {
        result += ch;
      }
    } else {
      result += ch;
      last_char = ch;
      repeat_count = 1;
    }
  }

  return result;
}

}  // namespace warden

#include "sanitizers/warden_output_validator.h"
#include "util/logger.h"
#include <algorithm>

namespace warden {

namespace {

bool IsLeakCategory(Category category) {
  return category == Category::PII || category == Category::CREDENTIAL ||
         category == Category::SYSTEM_DETAIL;
}

// Higher wins when matches overlap
int RedactionPriority(Category category) {
  switch (category) {
    case Category::CREDENTIAL: return 3;
    case Category::PII: return 2;
    case Category::SYSTEM_DETAIL: return 1;
    default: return 0;
  }
}

struct LabeledSpan {
  Span span;
  Category category;
};

constexpr int kMaxRedactionPasses = 8;

// Leak spans of the findings, as byte ranges of text.original()
void CollectLeakSpans(const NormalizedText& text,
                      const std::vector<Finding>& findings,
                      std::vector<LabeledSpan>* labeled) {
  const std::string& original = text.original();
  for (const auto& finding : findings) {
    if (!IsLeakCategory(finding.category()) || finding.confidence() <= 0.0) {
      continue;
    }
    for (const auto& span : finding.spans()) {
      Span mapped = text.ToOriginal(span);
      if (mapped.length() > 0 && mapped.end <= original.size()) {
        labeled->push_back({mapped, finding.category()});
      }
    }
  }
}

// Union overlapping ranges; the cluster keeps the strongest label
std::vector<LabeledSpan> MergeLabeled(std::vector<LabeledSpan> labeled) {
  std::sort(labeled.begin(), labeled.end(), [](const LabeledSpan& a, const LabeledSpan& b) {
    return a.span.start < b.span.start ||
           (a.span.start == b.span.start && a.span.end > b.span.end);
  });

  std::vector<LabeledSpan> merged;
  for (const auto& item : labeled) {
    if (!merged.empty() && item.span.start < merged.back().span.end) {
      LabeledSpan& last = merged.back();
      last.span.end = std::max(last.span.end, item.span.end);
      if (RedactionPriority(item.category) > RedactionPriority(last.category)) {
        last.category = item.category;
      }
    } else {
      merged.push_back(item);
    }
  }
  return merged;
}

std::string ApplyRedactions(const std::string& original, const std::vector<LabeledSpan>& merged) {
  std::string redacted;
  redacted.reserve(original.size());
  size_t cursor = 0;
  for (const auto& item : merged) {
    redacted.append(original, cursor, item.span.start - cursor);
    redacted += OutputValidator::RedactionTag(item.category);
    cursor = item.span.end;
  }
  redacted.append(original, cursor, std::string::npos);
  return redacted;
}

void RecordRedactions(const std::string& original,
                      const std::vector<LabeledSpan>& merged,
                      std::vector<Redaction>* redactions) {
  for (const auto& item : merged) {
    redactions->push_back({item.category, item.span,
                           OutputValidator::MaskSensitive(
                               original.substr(item.span.start, item.span.length()))});
  }
}

// Map a position of the redacted text back to the original. A position
// inside a tag maps to the start (or, for an end, the end) of what the tag
// replaced.
size_t ToSourcePosition(const std::vector<LabeledSpan>& merged, size_t pos, bool is_end) {
  size_t redacted_cursor = 0;
  size_t original_cursor = 0;
  for (const auto& item : merged) {
    size_t gap = item.span.start - original_cursor;
    if (pos < redacted_cursor + gap || (is_end && pos == redacted_cursor + gap)) {
      return original_cursor + (pos - redacted_cursor);
    }
    redacted_cursor += gap;

    size_t tag = OutputValidator::RedactionTag(item.category).size();
    if (pos < redacted_cursor + tag || (is_end && pos == redacted_cursor + tag)) {
      return is_end ? item.span.end : item.span.start;
    }
    redacted_cursor += tag;
    original_cursor = item.span.end;
  }
  return original_cursor + (pos - redacted_cursor);
}

Span ToSourceSpan(const std::vector<LabeledSpan>& merged, const Span& span) {
  return {ToSourcePosition(merged, span.start, false), ToSourcePosition(merged, span.end, true)};
}

}  // namespace

OutputValidator::OutputValidator(std::shared_ptr<const PatternLibrary> library)
    : pii_("output_pii", Category::PII, pattern_sets::kPii, library),
      credential_("output_credential", Category::CREDENTIAL, pattern_sets::kCredential, library),
      system_detail_("output_system_detail", Category::SYSTEM_DETAIL,
                     pattern_sets::kSystemDetail, library),
      classifier_(library) {}

std::vector<Finding> OutputValidator::Scan(const NormalizedText& text) const {
  ScanScope whole = ScanScope::WholeText();
  return {pii_.Detect(text, whole), credential_.Detect(text, whole),
          system_detail_.Detect(text, whole)};
}

OutputValidation OutputValidator::Validate(const NormalizedText& text,
                                           const PolicySnapshot& policy,
                                           SecurityLevel level) const {
  OutputValidation result;
  result.findings = Scan(text);
  result.redacted = RedactUntilClean(text, result.findings, &result.redactions);

  std::vector<Finding> harm = classifier_.Classify(text);
  result.findings.insert(result.findings.end(), harm.begin(), harm.end());

  result.verdict = PolicyEngine::Decide(policy, result.findings, level);

  if (!result.redactions.empty()) {
    LOG_DEBUG("OutputValidator", "Redacted " + std::to_string(result.redactions.size()) +
              " item(s) from model output");
  }
  return result;
}

std::string OutputValidator::Redact(const NormalizedText& text,
                                    const std::vector<Finding>& findings,
                                    std::vector<Redaction>* redactions) {
  std::vector<LabeledSpan> labeled;
  CollectLeakSpans(text, findings, &labeled);
  std::vector<LabeledSpan> merged = MergeLabeled(labeled);
  if (redactions) {
    RecordRedactions(text.original(), merged, redactions);
  }
  return ApplyRedactions(text.original(), merged);
}

std::string OutputValidator::RedactUntilClean(const NormalizedText& text,
                                              const std::vector<Finding>& findings,
                                              std::vector<Redaction>* redactions) const {
  const std::string& original = text.original();
  std::vector<LabeledSpan> labeled;
  CollectLeakSpans(text, findings, &labeled);

  std::vector<LabeledSpan> merged = MergeLabeled(labeled);
  std::string redacted = ApplyRedactions(original, merged);

  // Normalization can hide a match that the emitted bytes still contain
  for (int pass = 0; pass < kMaxRedactionPasses; pass++) {
    NormalizedText emitted = Normalizer::Verbatim(redacted);
    std::vector<LabeledSpan> residual;
    CollectLeakSpans(emitted, Scan(emitted), &residual);
    if (residual.empty()) {
      break;
    }
    for (const auto& item : residual) {
      labeled.push_back({ToSourceSpan(merged, item.span), item.category});
    }
    merged = MergeLabeled(labeled);
    redacted = ApplyRedactions(original, merged);
    LOG_DEBUG("OutputValidator", "Redaction pass " + std::to_string(pass + 1) + " found " +
              std::to_string(residual.size()) + " residual match(es)");
  }

  if (redactions) {
    RecordRedactions(original, merged, redactions);
  }
  return redacted;
}

std::string OutputValidator::RedactionTag(Category category) {
  switch (category) {
    case Category::PII: return "[REDACTED:PII]";
    case Category::CREDENTIAL: return "[REDACTED:CREDENTIAL]";
    case Category::SYSTEM_DETAIL: return "[REDACTED:SYSTEM_DETAIL]";
    default: return "[REDACTED]";
  }
}

std::string OutputValidator::MaskSensitive(const std::string& value) {
  if (value.length() > 8) {
    return value.substr(0, 4) + std::string(value.length() - 8, '*') +
           value.substr(value.length() - 4);
  }
  return std::string(value.length(), '*');
}

}  // namespace warden

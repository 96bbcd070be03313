#ifndef WARDEN_OUTPUT_VALIDATOR_H_
#define WARDEN_OUTPUT_VALIDATOR_H_

#include "core/warden_types.h"
#include "detectors/warden_content_safety_classifier.h"
#include "detectors/warden_detector.h"
#include "patterns/warden_pattern_library.h"
#include "policy/warden_policy.h"
#include "text/warden_normalizer.h"
#include <memory>
#include <string>
#include <vector>

namespace warden {

// One replaced range of the model output
struct Redaction {
  Category category;     // pii, credential or system_detail
  Span original_span;    // byte range in the raw output
  std::string masked;    // safe-to-log form of the replaced value
};

struct OutputValidation {
  std::string redacted;
  Verdict verdict;
  std::vector<Finding> findings;  // leak findings first, then harm findings
  std::vector<Redaction> redactions;
};

// ============================================================
// OutputValidator - leak detection and redaction for model output
// ============================================================
//
// Redaction is unconditional: every PII, credential and system-detail match
// is replaced in the ORIGINAL text with [REDACTED:<TYPE>] whatever the
// verdict says. Overlapping matches are merged and tagged with the highest
// priority category (credential > pii > system_detail). The redacted text is
// scanned again as emitted, so a match that normalization hid is redacted
// too. Output is never truncated.
class OutputValidator {
 public:
  explicit OutputValidator(std::shared_ptr<const PatternLibrary> library);

  // One Finding each for pii, credential and system_detail (in that order)
  std::vector<Finding> Scan(const NormalizedText& text) const;

  // Scan, redact, classify harm, and decide with the given policy
  OutputValidation Validate(const NormalizedText& text,
                            const PolicySnapshot& policy,
                            SecurityLevel level) const;

  // Replace the spans of leak findings in text.original()
  static std::string Redact(const NormalizedText& text,
                            const std::vector<Finding>& findings,
                            std::vector<Redaction>* redactions = nullptr);

  // "[REDACTED:PII]", "[REDACTED:CREDENTIAL]", "[REDACTED:SYSTEM_DETAIL]"
  static std::string RedactionTag(Category category);

  // Keep the first and last four characters of long values, star the rest
  static std::string MaskSensitive(const std::string& value);

 private:
  // Redact, then rescan the emitted bytes and widen the redactions until no
  // leak pattern matches them
  std::string RedactUntilClean(const NormalizedText& text,
                               const std::vector<Finding>& findings,
                               std::vector<Redaction>* redactions) const;

  PatternDetector pii_;
  PatternDetector credential_;
  PatternDetector system_detail_;
  ContentSafetyClassifier classifier_;
};

}  // namespace warden

#endif  // WARDEN_OUTPUT_VALIDATOR_H_

#ifndef WARDEN_CONTENT_SAFETY_CLASSIFIER_H_
#define WARDEN_CONTENT_SAFETY_CLASSIFIER_H_

#include "core/warden_types.h"
#include "patterns/warden_pattern_library.h"
#include "text/warden_normalizer.h"
#include <memory>
#include <string>
#include <vector>

namespace warden {

// Keyword-driven harmful content scorer, independent of the injection
// detectors. Every harm subcategory has its own "harmful.<name>" set
// (capped sum). Runs over the whole text on both input and output.
class ContentSafetyClassifier {
 public:
  explicit ContentSafetyClassifier(std::shared_ptr<const PatternLibrary> library);

  const std::string& id() const;

  // One harmful_content Finding per subcategory that matched, in
  // HarmCategory order. Empty when nothing matched.
  std::vector<Finding> Classify(const NormalizedText& text) const;

  // Score a single subcategory; confidence 0 when it did not match
  Finding Score(const NormalizedText& text, HarmCategory category) const;

 private:
  std::shared_ptr<const PatternLibrary> library_;
};

}  // namespace warden

#endif  // WARDEN_CONTENT_SAFETY_CLASSIFIER_H_

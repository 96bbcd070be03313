#ifndef WARDEN_DETECTOR_H_
#define WARDEN_DETECTOR_H_

#include "core/warden_types.h"
#include "patterns/warden_pattern_library.h"
#include "text/warden_normalizer.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace warden {

// ============================================================
// ScanScope - which part of a normalized text a detector looks at
// ============================================================
//
// Spans are offsets into NormalizedText::text(). The orchestrator builds the
// scope from the call site: external-data spans go to the indirect detector
// as REGIONS and to the direct detector as EXCLUDE_REGIONS.
class ScanScope {
 public:
  enum class Mode {
    WHOLE_TEXT,
    REGIONS,          // only the listed spans
    EXCLUDE_REGIONS,  // everything except the listed spans
    AUTO_DELIMITED    // detector finds embedded blocks itself
  };

  static ScanScope WholeText();
  static ScanScope Regions(std::vector<Span> regions);
  static ScanScope Excluding(std::vector<Span> regions);
  static ScanScope AutoDelimited();

  Mode mode() const { return mode_; }
  const std::vector<Span>& regions() const { return regions_; }

  // Sorted, merged spans to scan in a text of text_size bytes.
  // AUTO_DELIMITED resolves to the whole text.
  std::vector<Span> Resolve(size_t text_size) const;

 private:
  ScanScope(Mode mode, std::vector<Span> regions);

  Mode mode_;
  std::vector<Span> regions_;
};

// Sort and union overlapping or touching spans
std::vector<Span> MergeSpans(std::vector<Span> spans);

// ============================================================
// Rule evaluation
// ============================================================

struct RuleEvaluation {
  double confidence = 0.0;
  std::vector<Span> spans;                 // merged, sorted
  std::vector<std::string> matched_rules;  // in rule-table order
  std::vector<double> matched_weights;     // effective weight per matched rule

  bool matched() const { return !matched_rules.empty(); }
  double max_weight() const;
};

// Scales the weight of a single match: (text, region scanned, match span) -> factor
using WeightAdjuster =
    std::function<double(const NormalizedText&, const Span&, const Span&)>;

// Run every rule of a set over the given regions of text.folded(). A rule
// counts once, at the highest adjusted weight among its matches; confidence
// is the set's combining rule over those weights. Never throws on content.
RuleEvaluation EvaluateRules(const PatternSet& set,
                             const NormalizedText& text,
                             const std::vector<Span>& regions,
                             const WeightAdjuster& adjust = nullptr);

// Confidence must already be in [0,1]; builds the Finding or an empty one
Finding MakeFinding(const std::string& detector_id,
                    Category category,
                    const RuleEvaluation& evaluation,
                    const std::string& rationale);

// ============================================================
// Detector - uniform capability interface
// ============================================================
//
// One implementation per threat category. Implementations hold only
// immutable rule tables and never read each other's results, so a single
// instance can be shared by concurrent inspection calls.
class Detector {
 public:
  virtual ~Detector() = default;

  virtual const std::string& id() const = 0;
  virtual Category category() const = 0;

  // Always returns a Finding; confidence 0 when nothing matched
  virtual Finding Detect(const NormalizedText& text, const ScanScope& scope) const = 0;
};

// Detector backed by a single pattern set (used for output leakage)
class PatternDetector : public Detector {
 public:
  PatternDetector(std::string id,
                  Category category,
                  std::string set_name,
                  std::shared_ptr<const PatternLibrary> library);

  const std::string& id() const override { return id_; }
  Category category() const override { return category_; }
  Finding Detect(const NormalizedText& text, const ScanScope& scope) const override;

 private:
  std::string id_;
  Category category_;
  std::string set_name_;
  std::shared_ptr<const PatternLibrary> library_;
};

}  // namespace warden

#endif  // WARDEN_DETECTOR_H_

#include "detectors/warden_detector.h"
#include "core/warden_errors.h"
#include "util/logger.h"
#include <algorithm>
#include <cmath>

namespace warden {

namespace {

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Widen a byte span so it never splits a UTF-8 sequence
Span SnapToCharacters(const std::string& text, Span span) {
  while (span.start > 0 && span.start < text.size() && IsContinuationByte(text[span.start])) {
    --span.start;
  }
  while (span.end < text.size() && IsContinuationByte(text[span.end])) {
    ++span.end;
  }
  return span;
}

// libstdc++'s matcher recurses once per consumed character, so each regex
// run is confined to a bounded window. Consecutive windows overlap by
// kScanOverlap bytes; a match no longer than that is always seen whole. A
// match cut off by the window end continues in a window starting at the cut.
constexpr size_t kScanWindow = 4096;
constexpr size_t kScanOverlap = 1024;

size_t BackToCharacter(const std::string& text, size_t pos, size_t floor) {
  while (pos > floor && pos < text.size() && IsContinuationByte(text[pos])) {
    --pos;
  }
  return pos;
}

// End of the window starting at start; prefers whitespace so tokens are not split
size_t WindowEnd(const std::string& text, size_t start, size_t region_end) {
  if (region_end - start <= kScanWindow) {
    return region_end;
  }
  size_t limit = start + kScanWindow;
  size_t floor = limit - kScanOverlap;
  for (size_t end = limit; end > floor; --end) {
    if (text[end] == ' ' || text[end] == '\n') {
      return end;
    }
  }
  return BackToCharacter(text, limit, floor);
}

}  // namespace

// ============================================================
// ScanScope
// ============================================================

ScanScope::ScanScope(Mode mode, std::vector<Span> regions)
    : mode_(mode), regions_(std::move(regions)) {}

ScanScope ScanScope::WholeText() {
  return ScanScope(Mode::WHOLE_TEXT, {});
}

ScanScope ScanScope::Regions(std::vector<Span> regions) {
  return ScanScope(Mode::REGIONS, MergeSpans(std::move(regions)));
}

ScanScope ScanScope::Excluding(std::vector<Span> regions) {
  return ScanScope(Mode::EXCLUDE_REGIONS, MergeSpans(std::move(regions)));
}

ScanScope ScanScope::AutoDelimited() {
  return ScanScope(Mode::AUTO_DELIMITED, {});
}

std::vector<Span> ScanScope::Resolve(size_t text_size) const {
  std::vector<Span> resolved;
  if (text_size == 0) {
    return resolved;
  }

  switch (mode_) {
    case Mode::WHOLE_TEXT:
    case Mode::AUTO_DELIMITED:
      resolved.push_back({0, text_size});
      break;

    case Mode::REGIONS:
      for (const auto& region : regions_) {
        Span clipped{std::min(region.start, text_size), std::min(region.end, text_size)};
        if (clipped.length() > 0) {
          resolved.push_back(clipped);
        }
      }
      break;

    case Mode::EXCLUDE_REGIONS: {
      size_t cursor = 0;
      for (const auto& region : regions_) {
        size_t start = std::min(region.start, text_size);
        if (start > cursor) {
          resolved.push_back({cursor, start});
        }
        cursor = std::max(cursor, std::min(region.end, text_size));
      }
      if (cursor < text_size) {
        resolved.push_back({cursor, text_size});
      }
      break;
    }
  }
  return resolved;
}

std::vector<Span> MergeSpans(std::vector<Span> spans) {
  spans.erase(std::remove_if(spans.begin(), spans.end(),
                             [](const Span& s) { return s.end <= s.start; }),
              spans.end());
  std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
    return a.start < b.start || (a.start == b.start && a.end < b.end);
  });

  std::vector<Span> merged;
  for (const auto& span : spans) {
    if (!merged.empty() && span.start <= merged.back().end) {
      merged.back().end = std::max(merged.back().end, span.end);
    } else {
      merged.push_back(span);
    }
  }
  return merged;
}

// ============================================================
// Rule evaluation
// ============================================================

double RuleEvaluation::max_weight() const {
  if (matched_weights.empty()) {
    return 0.0;
  }
  return *std::max_element(matched_weights.begin(), matched_weights.end());
}

RuleEvaluation EvaluateRules(const PatternSet& set,
                             const NormalizedText& text,
                             const std::vector<Span>& regions,
                             const WeightAdjuster& adjust) {
  RuleEvaluation evaluation;
  const std::string& folded = text.folded();
  std::vector<Span> spans;

  for (const auto& rule : set.rules()) {
    double best = 0.0;
    std::vector<Span> rule_spans;

    try {
      for (const auto& region : regions) {
        if (region.length() == 0 || region.end > folded.size()) {
          continue;
        }
        size_t start = region.start;
        bool continuing = false;
        while (true) {
          size_t stop = WindowEnd(folded, start, region.end);
          auto flags = std::regex_constants::match_default;
          if (start > 0) {
            flags = continuing ? std::regex_constants::match_not_bol
                               : std::regex_constants::match_prev_avail;
          }

          bool cut = false;
          for (std::sregex_iterator it(folded.cbegin() + start, folded.cbegin() + stop,
                                       rule.regex, flags), end;
               it != end; ++it) {
            const auto& m = (*it)[0];
            if (m.length() == 0) {
              continue;
            }
            Span span{static_cast<size_t>(m.first - folded.cbegin()),
                      static_cast<size_t>(m.second - folded.cbegin())};
            cut = span.end == stop;

            double factor = adjust ? adjust(text, region, span) : 1.0;
            if (std::isnan(factor) || factor < 0.0 || factor > 1.0) {
              throw InvariantViolation("weight adjustment for rule '" + rule.id +
                                       "' outside [0,1]");
            }
            best = std::max(best, rule.weight * factor);
            rule_spans.push_back(SnapToCharacters(folded, span));
          }

          if (stop == region.end) {
            break;
          }
          continuing = cut;
          start = cut ? stop : BackToCharacter(folded, stop - kScanOverlap, start + 1);
        }
      }
    } catch (const std::regex_error& e) {
      // Matcher gave up on this input (complexity or stack limits)
      LOG_WARN("RuleEvaluator", "Rule '" + rule.id + "' in set '" + set.name() +
               "' failed during matching: " + e.what());
      continue;
    }

    if (!rule_spans.empty() && best > 0.0) {
      evaluation.matched_rules.push_back(rule.id);
      evaluation.matched_weights.push_back(best);
      spans.insert(spans.end(), rule_spans.begin(), rule_spans.end());
    }
  }

  evaluation.confidence = set.Combine(evaluation.matched_weights);
  evaluation.spans = MergeSpans(std::move(spans));
  return evaluation;
}

Finding MakeFinding(const std::string& detector_id,
                    Category category,
                    const RuleEvaluation& evaluation,
                    const std::string& rationale) {
  if (!evaluation.matched() || evaluation.confidence <= 0.0) {
    return Finding::Empty(detector_id, category);
  }
  return Finding(detector_id, category, evaluation.confidence, evaluation.spans,
                 rationale, evaluation.matched_rules);
}

// ============================================================
// PatternDetector
// ============================================================

PatternDetector::PatternDetector(std::string id,
                                 Category category,
                                 std::string set_name,
                                 std::shared_ptr<const PatternLibrary> library)
    : id_(std::move(id)),
      category_(category),
      set_name_(std::move(set_name)),
      library_(std::move(library)) {
  if (!library_) {
    throw ConfigurationError("detector '" + id_ + "' constructed without a pattern library");
  }
}

Finding PatternDetector::Detect(const NormalizedText& text, const ScanScope& scope) const {
  RuleEvaluation evaluation =
      EvaluateRules(library_->Get(set_name_), text, scope.Resolve(text.size()));
  return MakeFinding(id_, category_, evaluation, set_name_ + "_match");
}

}  // namespace warden

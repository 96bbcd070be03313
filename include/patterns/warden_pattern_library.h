#ifndef WARDEN_PATTERN_LIBRARY_H_
#define WARDEN_PATTERN_LIBRARY_H_

#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace warden {

// How the weights of the rules that matched in one set become a confidence.
// Each rule counts once no matter how often it matches.
enum class CombineMode {
  MAX,         // highest matched weight
  CAPPED_SUM   // sum of matched weights, capped at the set's cap
};

std::string CombineModeName(CombineMode mode);
bool ParseCombineMode(const std::string& name, CombineMode* out);

// Source form of one rule, as written in the built-in table or a document
struct PatternRule {
  std::string id;
  std::string pattern;  // ECMAScript regex, matched case-insensitively
  double weight = 0.0;  // (0, 1]
};

// Source form of a whole set
struct PatternSetSource {
  std::string name;
  CombineMode combine = CombineMode::CAPPED_SUM;
  double cap = 1.0;
  std::vector<PatternRule> rules;
};

struct CompiledRule {
  std::string id;
  std::string pattern;
  std::regex regex;
  double weight;
};

// Immutable, ordered list of compiled rules with a combining rule
class PatternSet {
 public:
  PatternSet() = default;

  const std::string& name() const { return name_; }
  CombineMode combine() const { return combine_; }
  double cap() const { return cap_; }
  const std::vector<CompiledRule>& rules() const { return rules_; }
  bool empty() const { return rules_.empty(); }

  // Apply the combining rule to per-rule weights (one entry per matched rule)
  double Combine(const std::vector<double>& matched_weights) const;

 private:
  friend class PatternLibraryBuilder;

  std::string name_;
  CombineMode combine_ = CombineMode::CAPPED_SUM;
  double cap_ = 1.0;
  std::vector<CompiledRule> rules_;
};

// Names of the sets the detectors consume
namespace pattern_sets {
extern const char kDirectInjection[];
extern const char kIndirectInjection[];
extern const char kIndirectMarkers[];
extern const char kEmbeddedBlocks[];
extern const char kJailbreakPersona[];
extern const char kJailbreakFraming[];
extern const char kJailbreakRestrictedTopic[];
extern const char kSystemExtraction[];
extern const char kSystemExtractionMeta[];
extern const char kPii[];
extern const char kCredential[];
extern const char kSystemDetail[];
extern const char kPromptDelimiters[];

// "harmful.<subcategory>"
std::string HarmfulSetName(const std::string& harm_category_name);
}  // namespace pattern_sets

// ============================================================
// PatternLibrary - process-wide, read-only after Build()
// ============================================================
//
// Safe for unsynchronized concurrent reads. Reconfiguration builds a new
// library and swaps the shared_ptr; a live library is never mutated.
class PatternLibrary {
 public:
  // Missing sets resolve to an empty set, which scores 0
  const PatternSet& Get(const std::string& name) const;
  bool Has(const std::string& name) const;
  std::vector<std::string> SetNames() const;
  size_t rule_count() const;

  // Ids of rules excluded because they failed to compile or validate
  const std::vector<std::string>& rejected_rules() const { return rejected_rules_; }

 private:
  friend class PatternLibraryBuilder;

  std::map<std::string, PatternSet> sets_;
  std::vector<std::string> rejected_rules_;
};

class PatternLibraryBuilder {
 public:
  // A rule that fails to compile is logged and skipped; the rest of the set
  // is kept. Adding a set twice replaces the earlier one.
  PatternLibraryBuilder& AddSet(const std::string& name,
                                CombineMode combine,
                                double cap,
                                const std::vector<PatternRule>& rules);
  PatternLibraryBuilder& AddSet(const PatternSetSource& source);

  std::shared_ptr<const PatternLibrary> Build();

  // Throws PatternCompilationError
  static CompiledRule CompileRule(const PatternRule& rule);

 private:
  std::unique_ptr<PatternLibrary> library_ = std::make_unique<PatternLibrary>();
};

// Rule tables shipped with the library
std::vector<PatternSetSource> BuiltinPatternSources();
std::shared_ptr<const PatternLibrary> BuiltinPatternLibrary();

}  // namespace warden

#endif  // WARDEN_PATTERN_LIBRARY_H_

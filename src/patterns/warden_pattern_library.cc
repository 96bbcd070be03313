#include "patterns/warden_pattern_library.h"
#include "core/warden_errors.h"
#include "util/logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace warden {

namespace pattern_sets {
const char kDirectInjection[] = "direct_injection";
const char kIndirectInjection[] = "indirect_injection";
const char kIndirectMarkers[] = "indirect_injection.markers";
const char kEmbeddedBlocks[] = "indirect_injection.blocks";
const char kJailbreakPersona[] = "jailbreak.persona";
const char kJailbreakFraming[] = "jailbreak.framing";
const char kJailbreakRestrictedTopic[] = "jailbreak.restricted_topic";
const char kSystemExtraction[] = "system_extraction";
const char kSystemExtractionMeta[] = "system_extraction.meta";
const char kPii[] = "output.pii";
const char kCredential[] = "output.credential";
const char kSystemDetail[] = "output.system_detail";
const char kPromptDelimiters[] = "sanitizer.delimiters";

std::string HarmfulSetName(const std::string& harm_category_name) {
  return "harmful." + harm_category_name;
}
}  // namespace pattern_sets

std::string CombineModeName(CombineMode mode) {
  switch (mode) {
    case CombineMode::MAX: return "max";
    case CombineMode::CAPPED_SUM: return "capped_sum";
    default: return "unknown";
  }
}

bool ParseCombineMode(const std::string& name, CombineMode* out) {
  if (name == "max") {
    *out = CombineMode::MAX;
  } else if (name == "capped_sum") {
    *out = CombineMode::CAPPED_SUM;
  } else {
    return false;
  }
  return true;
}

double PatternSet::Combine(const std::vector<double>& matched_weights) const {
  if (matched_weights.empty()) {
    return 0.0;
  }

  double combined = 0.0;
  switch (combine_) {
    case CombineMode::MAX:
      combined = *std::max_element(matched_weights.begin(), matched_weights.end());
      break;
    case CombineMode::CAPPED_SUM:
      for (double w : matched_weights) {
        combined += w;
      }
      break;
  }
  return std::min(combined, cap_);
}

// ============================================================
// PatternLibrary
// ============================================================

const PatternSet& PatternLibrary::Get(const std::string& name) const {
  static const PatternSet kEmptySet;
  auto it = sets_.find(name);
  if (it == sets_.end()) {
    return kEmptySet;
  }
  return it->second;
}

bool PatternLibrary::Has(const std::string& name) const {
  return sets_.find(name) != sets_.end();
}

std::vector<std::string> PatternLibrary::SetNames() const {
  std::vector<std::string> names;
  names.reserve(sets_.size());
  for (const auto& [name, set] : sets_) {
    names.push_back(name);
  }
  return names;
}

size_t PatternLibrary::rule_count() const {
  size_t count = 0;
  for (const auto& [name, set] : sets_) {
    count += set.rules().size();
  }
  return count;
}

// ============================================================
// PatternLibraryBuilder
// ============================================================

CompiledRule PatternLibraryBuilder::CompileRule(const PatternRule& rule) {
  if (rule.id.empty()) {
    throw PatternCompilationError("<unnamed>", "rule id is empty");
  }
  if (std::isnan(rule.weight) || rule.weight <= 0.0 || rule.weight > 1.0) {
    std::ostringstream msg;
    msg << "weight " << rule.weight << " outside (0, 1]";
    throw PatternCompilationError(rule.id, msg.str());
  }
  if (rule.pattern.empty()) {
    throw PatternCompilationError(rule.id, "pattern is empty");
  }

  try {
    std::regex regex(rule.pattern,
                     std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return CompiledRule{rule.id, rule.pattern, std::move(regex), rule.weight};
  } catch (const std::regex_error& e) {
    throw PatternCompilationError(rule.id, e.what());
  }
}

PatternLibraryBuilder& PatternLibraryBuilder::AddSet(const std::string& name,
                                                     CombineMode combine,
                                                     double cap,
                                                     const std::vector<PatternRule>& rules) {
  if (name.empty()) {
    throw ConfigurationError("pattern set name is empty");
  }
  if (std::isnan(cap) || cap <= 0.0 || cap > 1.0) {
    throw ConfigurationError("pattern set '" + name + "' has cap outside (0, 1]");
  }

  PatternSet set;
  set.name_ = name;
  set.combine_ = combine;
  set.cap_ = cap;
  set.rules_.reserve(rules.size());

  for (const auto& rule : rules) {
    try {
      set.rules_.push_back(CompileRule(rule));
    } catch (const PatternCompilationError& e) {
      LOG_WARN("PatternLibrary", std::string("Excluding rule from set '") + name + "': " + e.what());
      library_->rejected_rules_.push_back(e.rule_id());
    }
  }

  if (set.rules_.empty()) {
    LOG_WARN("PatternLibrary", "Pattern set '" + name + "' has no usable rules; it will score 0");
  }

  library_->sets_[name] = std::move(set);
  return *this;
}

PatternLibraryBuilder& PatternLibraryBuilder::AddSet(const PatternSetSource& source) {
  return AddSet(source.name, source.combine, source.cap, source.rules);
}

std::shared_ptr<const PatternLibrary> PatternLibraryBuilder::Build() {
  std::shared_ptr<const PatternLibrary> built(std::move(library_));
  library_ = std::make_unique<PatternLibrary>();

  LOG_DEBUG("PatternLibrary", "Built library with " + std::to_string(built->rule_count()) +
            " rules (" + std::to_string(built->rejected_rules().size()) + " rejected)");
  return built;
}

}  // namespace warden

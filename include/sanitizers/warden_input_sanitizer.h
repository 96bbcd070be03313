#ifndef WARDEN_INPUT_SANITIZER_H_
#define WARDEN_INPUT_SANITIZER_H_

#include "core/warden_types.h"
#include "patterns/warden_pattern_library.h"
#include "text/warden_normalizer.h"
#include <memory>
#include <string>
#include <vector>

namespace warden {

struct SanitizationResult {
  std::string sanitized_content;
  bool was_modified = false;
  std::vector<std::string> actions;  // e.g. "spans_filtered", "repetition_capped"
};

// ============================================================
// InputSanitizer - neutralize flagged input before forwarding
// ============================================================
//
// Works on NormalizedText::text(). Steps:
// 1. Replace every span of the triggering findings, and every prompt
//    delimiter token (<|im_start|>, [INST], </system>, ...), with kPlaceholder
// 2. Cap runs of one repeated character at kMaxRepeats
// 3. Collapse whitespace the way the normalizer does
//
// Sanitizing already-sanitized text with no new findings returns it unchanged.
class InputSanitizer {
 public:
  static const char kPlaceholder[];
  static constexpr size_t kMaxRepeats = 10;

  explicit InputSanitizer(std::shared_ptr<const PatternLibrary> library);

  SanitizationResult Sanitize(const NormalizedText& text,
                              const std::vector<Finding>& triggering_findings) const;

  // Remove repeated characters (obfuscation technique)
  static std::string RemoveExcessiveRepetition(const std::string& text);

 private:
  std::shared_ptr<const PatternLibrary> library_;
};

}  // namespace warden

#endif  // WARDEN_INPUT_SANITIZER_H_

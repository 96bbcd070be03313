#ifndef WARDEN_INJECTION_DETECTORS_H_
#define WARDEN_INJECTION_DETECTORS_H_

#include "detectors/warden_detector.h"
#include <memory>
#include <string>

namespace warden {

// ============================================================
// Injection detectors
// ============================================================
//
// Each reads its rule sets from the pattern library it was built with.
// Missing sets score 0, so a library without injection rules produces
// empty findings rather than errors.

// Imperative override phrasing typed by the user ("ignore previous
// instructions", "you are now a ..."). Combining rule: capped sum over
// distinct rules. A match that does not start within three words of a
// sentence boundary, or that sits inside double quotes, counts half.
class DirectInjectionDetector : public Detector {
 public:
  explicit DirectInjectionDetector(std::shared_ptr<const PatternLibrary> library);

  const std::string& id() const override;
  Category category() const override { return Category::DIRECT_INJECTION; }
  Finding Detect(const NormalizedText& text, const ScanScope& scope) const override;

  // Weight factor for one match (1.0 anchored, 0.5 otherwise)
  static double AnchorFactor(const NormalizedText& text, const Span& region, const Span& match);

 private:
  std::shared_ptr<const PatternLibrary> library_;
};

// The same override phrasing, plus hidden-instruction markers, found in
// content that came from somewhere other than the user. Scope REGIONS scans
// caller-marked external spans; AUTO_DELIMITED scans embedded blocks
// (<tag>..</tag>, fenced code, HTML comments) for override phrasing and the
// whole text for markers. Combining rule: capped sum over distinct rules.
class IndirectInjectionDetector : public Detector {
 public:
  explicit IndirectInjectionDetector(std::shared_ptr<const PatternLibrary> library);

  const std::string& id() const override;
  Category category() const override { return Category::INDIRECT_INJECTION; }
  Finding Detect(const NormalizedText& text, const ScanScope& scope) const override;

  // Embedded blocks found by the delimiter rules
  std::vector<Span> FindEmbeddedBlocks(const NormalizedText& text) const;

 private:
  std::shared_ptr<const PatternLibrary> library_;
};

// Persona escapes (DAN, developer mode, "no restrictions") with a capped
// sum, plus a fixed weight when a fictional framing and a restricted topic
// appear in the same text.
class JailbreakDetector : public Detector {
 public:
  static constexpr double kFramedTopicWeight = 0.4;

  explicit JailbreakDetector(std::shared_ptr<const PatternLibrary> library);

  const std::string& id() const override;
  Category category() const override { return Category::JAILBREAK; }
  Finding Detect(const NormalizedText& text, const ScanScope& scope) const override;

 private:
  std::shared_ptr<const PatternLibrary> library_;
};

// Requests for the system prompt or initial instructions (max over rules).
// Meta questions about limitations only count when no direct request
// matched, and are capped by their set (0.7 in the built-in library).
class SystemPromptDetector : public Detector {
 public:
  explicit SystemPromptDetector(std::shared_ptr<const PatternLibrary> library);

  const std::string& id() const override;
  Category category() const override { return Category::SYSTEM_EXTRACTION; }
  Finding Detect(const NormalizedText& text, const ScanScope& scope) const override;

 private:
  std::shared_ptr<const PatternLibrary> library_;
};

}  // namespace warden

#endif  // WARDEN_INJECTION_DETECTORS_H_

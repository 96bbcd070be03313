#ifndef WARDEN_DEFENSE_SYSTEM_H_
#define WARDEN_DEFENSE_SYSTEM_H_

#include "audit/warden_audit_sink.h"
#include "core/warden_security_event.h"
#include "core/warden_types.h"
#include "detectors/warden_content_safety_classifier.h"
#include "detectors/warden_injection_detectors.h"
#include "patterns/warden_pattern_library.h"
#include "policy/warden_policy.h"
#include "sanitizers/warden_input_sanitizer.h"
#include "sanitizers/warden_output_validator.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden {

// ============================================================
// Warden Defense System - inspection around a model call
// ============================================================
//
// Input path:
//   raw -> Normalizer -> injection detectors + content classifier
//       -> PolicyEngine -> (sanitize) InputSanitizer -> forwarded text
// Output path:
//   model output -> Normalizer -> OutputValidator -> redacted text
//
// Every call normalizes once, emits exactly one SecurityEvent to the audit
// sink, and never throws on the text it inspects. Policy and pattern updates
// swap immutable snapshots; calls already running keep what they loaded.

struct InspectionContext {
  // Raw byte ranges of the input that came from retrieved or external
  // content. They are scanned by the indirect detector only.
  std::vector<Span> external_spans;

  // Without external spans, look for embedded blocks (<tag>..</tag>, code
  // fences, HTML comments) and scan those for indirect injection
  bool scan_embedded_blocks = true;

  // Overrides the policy's active level for this call
  std::optional<SecurityLevel> level;

  // Generated when empty
  std::string correlation_id;
};

struct InputInspection {
  Verdict verdict;
  std::string forwarded;          // empty when blocked
  std::vector<Finding> findings;  // every detector result, including zeros
  SecurityEvent event;

  bool IsBlocked() const { return verdict.IsBlocked(); }
};

struct OutputInspection {
  std::string redacted;
  Verdict verdict;  // informational; redaction happens regardless
  std::vector<Finding> findings;
  std::vector<Redaction> redactions;
  SecurityEvent event;
};

struct DefenseStatistics {
  uint64_t inputs_inspected = 0;
  uint64_t inputs_blocked = 0;
  uint64_t inputs_sanitized = 0;
  uint64_t outputs_inspected = 0;
  uint64_t outputs_flagged = 0;  // output verdict other than allow
  uint64_t items_redacted = 0;

  std::string ToString() const;
};

// Detectors built over one pattern library, replaced as a unit
class DetectorBundle {
 public:
  explicit DetectorBundle(std::shared_ptr<const PatternLibrary> library);

  const PatternLibrary& library() const { return *library_; }
  const DirectInjectionDetector& direct() const { return direct_; }
  const IndirectInjectionDetector& indirect() const { return indirect_; }
  const JailbreakDetector& jailbreak() const { return jailbreak_; }
  const SystemPromptDetector& system_prompt() const { return system_prompt_; }
  const ContentSafetyClassifier& classifier() const { return classifier_; }
  const InputSanitizer& sanitizer() const { return sanitizer_; }
  const OutputValidator& validator() const { return validator_; }

 private:
  std::shared_ptr<const PatternLibrary> library_;
  DirectInjectionDetector direct_;
  IndirectInjectionDetector indirect_;
  JailbreakDetector jailbreak_;
  SystemPromptDetector system_prompt_;
  ContentSafetyClassifier classifier_;
  InputSanitizer sanitizer_;
  OutputValidator validator_;
};

class DefenseSystem {
 public:
  // Events reserve room for this many stage latencies up front
  static constexpr size_t kMaxTimedStages = 16;

  // Throws ConfigurationError if any dependency is missing
  DefenseSystem(std::shared_ptr<const PolicySnapshot> policy,
                std::shared_ptr<const PatternLibrary> patterns,
                std::shared_ptr<AuditSink> audit_sink);

  DefenseSystem(const DefenseSystem&) = delete;
  DefenseSystem& operator=(const DefenseSystem&) = delete;

  InputInspection InspectInput(const std::string& text,
                               const InspectionContext& context = InspectionContext());

  // Only context.level and context.correlation_id apply to output
  OutputInspection InspectOutput(const std::string& text,
                                 const InspectionContext& context = InspectionContext());

  void UpdatePolicy(std::shared_ptr<const PolicySnapshot> policy);
  void UpdatePatterns(std::shared_ptr<const PatternLibrary> patterns);

  std::shared_ptr<const PolicySnapshot> policy() const { return policy_.snapshot(); }
  std::shared_ptr<const DetectorBundle> detectors() const;

  DefenseStatistics statistics() const;
  std::string GetStatistics() const;

 private:
  void EmitEvent(const SecurityEvent& event);

  PolicyEngine policy_;
  std::shared_ptr<const DetectorBundle> bundle_;
  std::shared_ptr<AuditSink> audit_sink_;

  std::atomic<uint64_t> inputs_inspected_{0};
  std::atomic<uint64_t> inputs_blocked_{0};
  std::atomic<uint64_t> inputs_sanitized_{0};
  std::atomic<uint64_t> outputs_inspected_{0};
  std::atomic<uint64_t> outputs_flagged_{0};
  std::atomic<uint64_t> items_redacted_{0};
};

}  // namespace warden

#endif  // WARDEN_DEFENSE_SYSTEM_H_

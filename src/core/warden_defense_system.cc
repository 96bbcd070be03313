#include "core/warden_defense_system.h"
#include "core/warden_errors.h"
#include "text/warden_normalizer.h"
#include "util/logger.h"
#include "util/warden_digest.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace warden {

namespace {

using SteadyClock = std::chrono::steady_clock;

int64_t MicrosSince(SteadyClock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start).count();
}

// Times one pipeline stage into the event
class StageTimer {
 public:
  StageTimer(SecurityEvent* event, std::string component)
      : event_(event), component_(std::move(component)), start_(SteadyClock::now()) {}
  ~StageTimer() { event_->latencies.push_back({std::move(component_), MicrosSince(start_)}); }

 private:
  SecurityEvent* event_;
  std::string component_;
  SteadyClock::time_point start_;
};

std::string Labels(const std::vector<Finding>& findings) {
  std::string labels;
  for (const auto& finding : findings) {
    if (!labels.empty()) labels += ", ";
    labels += finding.Label();
  }
  return labels;
}

void FillEventHeader(SecurityEvent* event,
                     Direction direction,
                     const std::string& raw,
                     const InspectionContext& context) {
  event->correlation_id =
      context.correlation_id.empty() ? GenerateCorrelationId() : context.correlation_id;
  event->direction = direction;
  event->input_digest = Sha256Hex(raw);
  event->input_length = raw.size();
  // StageTimer appends from its destructor and must not allocate there
  event->latencies.reserve(DefenseSystem::kMaxTimedStages);
}

void FillEventBody(SecurityEvent* event,
                   const NormalizedText& normalized,
                   const std::vector<Finding>& findings,
                   const Verdict& verdict,
                   const PolicySnapshot& policy) {
  event->verdict = verdict;
  event->truncated_at = normalized.original_truncated_at();
  event->transformations = normalized.transformations();
  for (const auto& finding : findings) {
    if (finding.confidence() > 0.0) {
      event->findings.push_back(finding);
    }
  }
  if (verdict.IsBlocked() && policy.config().audit.include_content_on_block) {
    event->content = normalized.original();
  }
}

}  // namespace

// ============================================================
// DefenseStatistics
// ============================================================

std::string DefenseStatistics::ToString() const {
  std::ostringstream stats;
  stats << "Warden Defense Statistics:\n";
  stats << "  Inputs inspected: " << inputs_inspected << "\n";
  stats << "  Inputs blocked: " << inputs_blocked << "\n";
  stats << "  Inputs sanitized: " << inputs_sanitized << "\n";

  if (inputs_inspected > 0) {
    double block_rate = (static_cast<double>(inputs_blocked) / inputs_inspected) * 100.0;
    stats << "  Block rate: " << std::fixed << std::setprecision(1) << block_rate << "%\n";
  }

  stats << "  Outputs inspected: " << outputs_inspected << "\n";
  stats << "  Outputs flagged: " << outputs_flagged << "\n";
  stats << "  Items redacted: " << items_redacted << "\n";
  return stats.str();
}

// ============================================================
// DetectorBundle
// ============================================================

DetectorBundle::DetectorBundle(std::shared_ptr<const PatternLibrary> library)
    : library_(std::move(library)),
      direct_(library_),
      indirect_(library_),
      jailbreak_(library_),
      system_prompt_(library_),
      classifier_(library_),
      sanitizer_(library_),
      validator_(library_) {}

// ============================================================
// DefenseSystem
// ============================================================

DefenseSystem::DefenseSystem(std::shared_ptr<const PolicySnapshot> policy,
                             std::shared_ptr<const PatternLibrary> patterns,
                             std::shared_ptr<AuditSink> audit_sink)
    : policy_(std::move(policy)),
      bundle_(std::make_shared<const DetectorBundle>(std::move(patterns))),
      audit_sink_(std::move(audit_sink)) {
  if (!audit_sink_) {
    throw ConfigurationError("defense system requires an audit sink");
  }

  auto active = policy_.snapshot();
  LOG_INFO("DefenseSystem", "Initialized at level " + SecurityLevelName(active->security_level()) +
           " with " + std::to_string(bundle_->library().rule_count()) + " rules (" +
           std::to_string(bundle_->library().rejected_rules().size()) + " rejected)");
}

std::shared_ptr<const DetectorBundle> DefenseSystem::detectors() const {
  return std::atomic_load(&bundle_);
}

void DefenseSystem::UpdatePolicy(std::shared_ptr<const PolicySnapshot> policy) {
  policy_.Update(std::move(policy));
}

void DefenseSystem::UpdatePatterns(std::shared_ptr<const PatternLibrary> patterns) {
  auto bundle = std::make_shared<const DetectorBundle>(std::move(patterns));
  LOG_INFO("DefenseSystem", "Activating pattern library with " +
           std::to_string(bundle->library().rule_count()) + " rules");
  std::atomic_store(&bundle_, std::shared_ptr<const DetectorBundle>(std::move(bundle)));
}

InputInspection DefenseSystem::InspectInput(const std::string& text,
                                            const InspectionContext& context) {
  auto policy = policy_.snapshot();
  auto bundle = detectors();
  SecurityLevel level = context.level.value_or(policy->security_level());

  InputInspection result;
  SecurityEvent& event = result.event;
  FillEventHeader(&event, Direction::INPUT, text, context);

  // Step 1: normalize once for every detector
  NormalizedText normalized;
  {
    StageTimer timer(&event, "normalize");
    normalized = Normalizer(policy->max_input_length()).Normalize(text);
  }

  // Step 2: scopes from the call site
  std::vector<Span> external;
  for (const auto& raw_span : context.external_spans) {
    Span span = normalized.FromOriginal(raw_span);
    if (span.length() > 0) {
      external.push_back(span);
    }
  }

  // Only direct injection skips external content; persona and extraction
  // phrasing counts wherever it appears
  ScanScope whole_scope = ScanScope::WholeText();
  ScanScope user_scope = ScanScope::WholeText();
  ScanScope external_scope = ScanScope::Regions({});
  if (!external.empty()) {
    user_scope = ScanScope::Excluding(external);
    external_scope = ScanScope::Regions(external);
  } else if (context.scan_embedded_blocks) {
    external_scope = ScanScope::AutoDelimited();
  }

  // Step 3: detectors
  std::vector<Finding>& findings = result.findings;
  {
    StageTimer timer(&event, "direct_injection");
    findings.push_back(bundle->direct().Detect(normalized, user_scope));
  }
  {
    StageTimer timer(&event, "indirect_injection");
    findings.push_back(bundle->indirect().Detect(normalized, external_scope));
  }
  {
    StageTimer timer(&event, "jailbreak");
    findings.push_back(bundle->jailbreak().Detect(normalized, whole_scope));
  }
  {
    StageTimer timer(&event, "system_extraction");
    findings.push_back(bundle->system_prompt().Detect(normalized, whole_scope));
  }
  {
    StageTimer timer(&event, "content_safety");
    std::vector<Finding> harm = bundle->classifier().Classify(normalized);
    findings.insert(findings.end(), harm.begin(), harm.end());
  }

  // Step 4: policy
  {
    StageTimer timer(&event, "policy");
    result.verdict = PolicyEngine::Decide(*policy, findings, level);
  }

  // Step 5: forward
  switch (result.verdict.decision) {
    case Decision::ALLOW:
      result.forwarded = normalized.text();
      break;
    case Decision::SANITIZE: {
      StageTimer timer(&event, "sanitize");
      result.forwarded =
          bundle->sanitizer().Sanitize(normalized, result.verdict.triggering_findings)
              .sanitized_content;
      inputs_sanitized_++;
      break;
    }
    case Decision::BLOCK:
      inputs_blocked_++;
      LOG_WARN("DefenseSystem", "Blocked input " + event.correlation_id + " (" +
               Labels(result.verdict.triggering_findings) + ")");
      break;
  }
  inputs_inspected_++;

  FillEventBody(&event, normalized, findings, result.verdict, *policy);
  EmitEvent(event);
  return result;
}

OutputInspection DefenseSystem::InspectOutput(const std::string& text,
                                              const InspectionContext& context) {
  auto policy = policy_.snapshot();
  auto bundle = detectors();
  SecurityLevel level = context.level.value_or(policy->security_level());

  OutputInspection result;
  SecurityEvent& event = result.event;
  FillEventHeader(&event, Direction::OUTPUT, text, context);

  // Output is never truncated: everything the model produced gets redacted
  NormalizedText normalized;
  {
    StageTimer timer(&event, "normalize");
    normalized = Normalizer().Normalize(text);
  }

  OutputValidation validation;
  {
    StageTimer timer(&event, "output_validator");
    validation = bundle->validator().Validate(normalized, *policy, level);
  }

  result.redacted = std::move(validation.redacted);
  result.verdict = std::move(validation.verdict);
  result.findings = std::move(validation.findings);
  result.redactions = std::move(validation.redactions);

  outputs_inspected_++;
  if (result.verdict.decision != Decision::ALLOW) {
    outputs_flagged_++;
  }
  items_redacted_ += result.redactions.size();
  for (const auto& redaction : result.redactions) {
    event.redaction_counts[redaction.category]++;
  }

  FillEventBody(&event, normalized, result.findings, result.verdict, *policy);
  EmitEvent(event);
  return result;
}

void DefenseSystem::EmitEvent(const SecurityEvent& event) {
  try {
    audit_sink_->Emit(event);
  } catch (const std::exception& e) {
    // The verdict stands even when the audit trail is unavailable
    LOG_ERROR("DefenseSystem", "Audit sink failed for event " + event.correlation_id + ": " +
              e.what());
  }
}

DefenseStatistics DefenseSystem::statistics() const {
  DefenseStatistics stats;
  stats.inputs_inspected = inputs_inspected_.load();
  stats.inputs_blocked = inputs_blocked_.load();
  stats.inputs_sanitized = inputs_sanitized_.load();
  stats.outputs_inspected = outputs_inspected_.load();
  stats.outputs_flagged = outputs_flagged_.load();
  stats.items_redacted = items_redacted_.load();
  return stats;
}

std::string DefenseSystem::GetStatistics() const {
  return statistics().ToString();
}

}  // namespace warden

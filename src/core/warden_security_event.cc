#include "core/warden_security_event.h"

namespace warden {

using json = nlohmann::json;

std::string DirectionName(Direction direction) {
  switch (direction) {
    case Direction::INPUT: return "input";
    case Direction::OUTPUT: return "output";
    default: return "unknown";
  }
}

int64_t SecurityEvent::total_micros() const {
  int64_t total = 0;
  for (const auto& latency : latencies) {
    total += latency.micros;
  }
  return total;
}

json FindingToJson(const Finding& finding) {
  json spans = json::array();
  for (const auto& span : finding.spans()) {
    spans.push_back({span.start, span.end});
  }

  json j = {
    {"detector", finding.detector_id()},
    {"category", CategoryName(finding.category())},
    {"confidence", finding.confidence()},
    {"rationale", finding.rationale()},
    {"rules", finding.matched_rules()},
    {"spans", spans}
  };
  if (finding.harm_category()) {
    j["harm_category"] = HarmCategoryName(*finding.harm_category());
  }
  return j;
}

json SecurityEvent::ToJson() const {
  json triggering = json::array();
  for (const auto& finding : verdict.triggering_findings) {
    triggering.push_back(finding.Label());
  }

  json all_findings = json::array();
  for (const auto& finding : findings) {
    all_findings.push_back(FindingToJson(finding));
  }

  json timings = json::object();
  for (const auto& latency : latencies) {
    timings[latency.component] = latency.micros;
  }
  timings["total"] = total_micros();

  json j = {
    {"correlation_id", correlation_id},
    {"direction", DirectionName(direction)},
    {"decision", DecisionName(verdict.decision)},
    {"level", SecurityLevelName(verdict.level_used)},
    {"timestamp", FormatTimestamp(verdict.timestamp)},
    {"triggering", triggering},
    {"input_digest", input_digest},
    {"input_length", input_length},
    {"transformations", transformations},
    {"latency_us", timings},
    {"findings", all_findings}
  };

  if (truncated_at) {
    j["truncated_at"] = *truncated_at;
  }
  if (!redaction_counts.empty()) {
    json redactions = json::object();
    for (const auto& [category, count] : redaction_counts) {
      redactions[CategoryName(category)] = count;
    }
    j["redactions"] = redactions;
  }
  if (content) {
    j["content"] = *content;
  }
  return j;
}

std::string SecurityEvent::ToJsonString() const {
  return ToJson().dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace warden

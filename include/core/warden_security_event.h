#ifndef WARDEN_SECURITY_EVENT_H_
#define WARDEN_SECURITY_EVENT_H_

#include "core/warden_types.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace warden {

enum class Direction {
  INPUT,
  OUTPUT
};

std::string DirectionName(Direction direction);

struct ComponentLatency {
  std::string component;
  int64_t micros = 0;
};

// ============================================================
// SecurityEvent - one audit record per inspection call
// ============================================================
//
// Carries a digest of the raw text rather than the text itself. Raw content
// is attached only for blocked calls when the policy asks for it.
struct SecurityEvent {
  std::string correlation_id;
  Direction direction = Direction::INPUT;
  Verdict verdict;
  std::string input_digest;   // SHA-256 hex of the raw text
  size_t input_length = 0;    // bytes
  std::optional<size_t> truncated_at;  // offset into the raw text
  std::vector<std::string> transformations;
  std::vector<ComponentLatency> latencies;
  std::vector<Finding> findings;  // every finding with confidence > 0
  std::map<Category, size_t> redaction_counts;  // output only
  std::optional<std::string> content;

  int64_t total_micros() const;

  nlohmann::json ToJson() const;

  // Single-line JSON; invalid UTF-8 in content is replaced, never thrown on
  std::string ToJsonString() const;
};

nlohmann::json FindingToJson(const Finding& finding);

}  // namespace warden

#endif  // WARDEN_SECURITY_EVENT_H_

#ifndef WARDEN_CONFIG_H_
#define WARDEN_CONFIG_H_

#include "patterns/warden_pattern_library.h"
#include "policy/warden_policy.h"
#include "util/logger.h"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace warden {

struct LoggingOptions {
  LogLevel level = INFO;
  std::string file;  // empty: stderr only
};

// Everything a policy document can carry
struct WardenConfig {
  PolicyConfig policy = PolicyConfig::Defaults();
  LoggingOptions logging;
};

// ============================================================
// Policy documents
// ============================================================
//
// {
//   "security_level": "balanced",
//   "max_input_length": 10000,
//   "thresholds":  { "<level>": { "<category>": 0.3, ... }, ... },
//   "hard_block":  { "<level>": ["<category>", ...] },
//   "cooccurrence": { "<level>": { "<category>": {"min_count": 3, "soft_threshold": 0.3} } },
//   "audit":   { "include_content_on_block": false },
//   "logging": { "level": "info", "file": "/var/log/warden.log" }
// }
//
// Every key is optional; absent sections keep the built-in defaults. When
// "thresholds" is present it must name every (level, category) pair. A
// "hard_block" level replaces that level's set; "cooccurrence" replaces all
// rules. The result is validated. All failures throw ConfigurationError.
WardenConfig ParseConfig(const std::string& json_text);
WardenConfig LoadConfig(const std::string& path);

PolicyConfig ParsePolicyConfig(const std::string& json_text);
PolicyConfig LoadPolicyConfig(const std::string& path);

// Inverse of ParsePolicyConfig (all sections written out)
nlohmann::json PolicyConfigToJson(const PolicyConfig& config);

// Apply level and file to the process logger
void ConfigureLogging(const LoggingOptions& options);

// ============================================================
// Pattern library documents
// ============================================================
//
// {
//   "include_builtin": true,
//   "sets": {
//     "direct_injection": {
//       "combine": "capped_sum", "cap": 1.0,
//       "rules": [ {"id": "x.rule", "pattern": "\\bregex\\b", "weight": 0.5} ]
//     }
//   }
// }
//
// With include_builtin, a set named like a built-in one adds its rules to
// it (combine and cap default to the built-in ones). Rules that fail to
// compile are dropped by the builder; structural errors throw
// ConfigurationError.
std::shared_ptr<const PatternLibrary> ParsePatternLibrary(const std::string& json_text);
std::shared_ptr<const PatternLibrary> LoadPatternLibrary(const std::string& path);

}  // namespace warden

#endif  // WARDEN_CONFIG_H_

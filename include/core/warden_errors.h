#ifndef WARDEN_ERRORS_H_
#define WARDEN_ERRORS_H_

#include <stdexcept>
#include <string>

namespace warden {

class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Malformed or incomplete policy. Thrown while loading or constructing; a
// system that saw one of these is never usable.
class ConfigurationError : public Error {
 public:
  explicit ConfigurationError(const std::string& message) : Error(message) {}
};

// A single matcher failed to compile or carries an invalid weight. The
// pattern library builder catches it and drops only that rule.
class PatternCompilationError : public Error {
 public:
  PatternCompilationError(const std::string& rule_id, const std::string& message)
      : Error("pattern '" + rule_id + "': " + message), rule_id_(rule_id) {}

  const std::string& rule_id() const { return rule_id_; }

 private:
  std::string rule_id_;
};

// Programming error, e.g. a confidence outside [0,1]. Never clamped.
class InvariantViolation : public Error {
 public:
  explicit InvariantViolation(const std::string& message) : Error(message) {}
};

}  // namespace warden

#endif  // WARDEN_ERRORS_H_

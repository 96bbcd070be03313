#ifndef WARDEN_AUDIT_SINK_H_
#define WARDEN_AUDIT_SINK_H_

#include "core/warden_security_event.h"
#include <mutex>
#include <vector>

namespace warden {

// Receives one SecurityEvent per inspection call. Implementations must be
// safe to call from concurrent inspections.
class AuditSink {
 public:
  virtual ~AuditSink() = default;
  virtual void Emit(const SecurityEvent& event) = 0;
};

// Writes each event as one JSON line through the process logger
// (INFO when allowed, WARN when sanitized or blocked)
class LoggerAuditSink : public AuditSink {
 public:
  void Emit(const SecurityEvent& event) override;
};

// Keeps events in memory, for tests and embedders that ship them elsewhere
class MemoryAuditSink : public AuditSink {
 public:
  void Emit(const SecurityEvent& event) override;

  std::vector<SecurityEvent> events() const;
  size_t size() const;
  void Clear();

 private:
  mutable std::mutex mutex_;
  std::vector<SecurityEvent> events_;
};

}  // namespace warden

#endif  // WARDEN_AUDIT_SINK_H_

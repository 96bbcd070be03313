#include "audit/warden_audit_sink.h"
#include "util/logger.h"

namespace warden {

void LoggerAuditSink::Emit(const SecurityEvent& event) {
  LogLevel level = event.verdict.decision == Decision::ALLOW ? INFO : WARN;
  Logger::Log(level, "Audit", event.ToJsonString());
}

void MemoryAuditSink::Emit(const SecurityEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<SecurityEvent> MemoryAuditSink::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

size_t MemoryAuditSink::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

void MemoryAuditSink::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
}

}  // namespace warden

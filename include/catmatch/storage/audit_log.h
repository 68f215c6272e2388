#pragma once

#include "catmatch/storage/audit_event.h"

#include <mutex>
#include <string>
#include <vector>

namespace catmatch::storage {

class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // query returns the events of one trace in append order; an empty
  // trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
};

// InMemoryAuditLog keeps events for the lifetime of the process only.
// append() may be called from several threads.
class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
};

}  // namespace catmatch::storage

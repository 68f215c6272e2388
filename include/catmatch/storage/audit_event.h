#pragma once

#include <string>
#include <vector>

namespace catmatch::storage {

// AuditEvent is one structured entry of a run's trail.
// payload is a JSON object rendered as text; refs name the entities involved.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace catmatch::storage

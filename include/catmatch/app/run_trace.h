#pragma once

#include "catmatch/storage/audit_event.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace catmatch::app {

// RunTrace stamps the audit events of one matching run.
// Every event carries the run's trace id, an event id numbered in emission
// order ("<trace>/evt-1", "<trace>/evt-2", ...) and a created_at taken from
// the timestamp source.
class RunTrace {
 public:
  using TimestampSource = std::function<std::string()>;

  RunTrace(std::string trace_id, TimestampSource now);

  // Trace id derived from the wall clock ("run-<utc>-<micros>"), real timestamps.
  [[nodiscard]] static RunTrace from_wall_clock();

  // Fixed trace id and timestamp; two runs produce identical trails.
  [[nodiscard]] static RunTrace fixed(std::string trace_id, std::string timestamp);

  [[nodiscard]] const std::string& trace_id() const { return trace_id_; }

  [[nodiscard]] storage::AuditEvent event(std::string event_type, const nlohmann::json& payload,
                                          std::vector<std::string> refs = {});

 private:
  std::string trace_id_;
  TimestampSource now_;
  std::size_t next_event_{1};
};

// utc_timestamp_now returns the current time as ISO 8601 UTC ("2026-01-01T00:00:00Z").
[[nodiscard]] std::string utc_timestamp_now();

}  // namespace catmatch::app

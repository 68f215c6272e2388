#include "catmatch/app/run_trace.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace catmatch::app {

namespace {

std::string format_utc(const std::chrono::system_clock::time_point when, const char* format) {
  const auto time_t_when = std::chrono::system_clock::to_time_t(when);

  std::tm utc{};
  gmtime_r(&time_t_when, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, format);
  return oss.str();
}

}  // namespace

RunTrace::RunTrace(std::string trace_id, TimestampSource now)
    : trace_id_(std::move(trace_id)), now_(std::move(now)) {
  if (trace_id_.empty()) {
    throw std::invalid_argument("trace id must not be empty");
  }
  if (!now_) {
    throw std::invalid_argument("run trace needs a timestamp source");
  }
}

RunTrace RunTrace::from_wall_clock() {
  const auto now = std::chrono::system_clock::now();
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
      1000000;
  return RunTrace("run-" + format_utc(now, "%Y%m%dT%H%M%SZ") + "-" + std::to_string(micros),
                  &utc_timestamp_now);
}

RunTrace RunTrace::fixed(std::string trace_id, std::string timestamp) {
  return RunTrace(std::move(trace_id), [timestamp = std::move(timestamp)]() { return timestamp; });
}

storage::AuditEvent RunTrace::event(std::string event_type, const nlohmann::json& payload,
                                    std::vector<std::string> refs) {
  return storage::AuditEvent{
      .event_id = trace_id_ + "/evt-" + std::to_string(next_event_++),
      .trace_id = trace_id_,
      .event_type = std::move(event_type),
      .payload = payload.dump(),
      .created_at = now_(),
      .refs = std::move(refs),
  };
}

std::string utc_timestamp_now() {
  return format_utc(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%SZ");
}

}  // namespace catmatch::app

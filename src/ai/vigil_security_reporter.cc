#include "vigil_security_reporter.h"
#include "logger.h"
#include <chrono>

namespace VigilGuard {

nlohmann::json SecurityReport::ToJson() const {
  nlohmann::json event_list = nlohmann::json::array();
  for (const auto& event : events) {
    event_list.push_back(SecurityEventToJson(event));
  }

  return {
    {"total_security_events", total_security_events},
    {"events", event_list},
    {"configuration", configuration.ToJson()}
  };
}

SecurityReporter::SecurityReporter(const SecurityConfig& config)
    : config_(config),
      capacity_(config.max_security_events > 0 ? config.max_security_events : 1) {}

int64_t SecurityReporter::NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

void SecurityReporter::Record(const SecurityEvent& event) {
  LOG_WARN("SecurityReporter", "Threat in " + RoleToString(event.source_role) +
           " message: " + event.finding.signature_id + " (" +
           SeverityToString(event.finding.severity) + ")");

  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
  total_events_++;

  while (events_.size() > capacity_) {
    events_.pop_front();
  }
}

void SecurityReporter::RecordFindings(const std::vector<ThreatFinding>& findings,
                                      Role source_role) {
  for (const auto& finding : findings) {
    SecurityEvent event;
    event.timestamp = NowMillis();
    event.finding = finding;
    event.source_role = source_role;
    Record(event);
  }
}

SecurityReport SecurityReporter::GetReport() const {
  SecurityReport report;
  report.configuration = config_;

  std::lock_guard<std::mutex> lock(mutex_);
  report.total_security_events = total_events_;
  report.events.assign(events_.begin(), events_.end());
  return report;
}

uint64_t SecurityReporter::GetTotalEvents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_events_;
}

size_t SecurityReporter::GetRetainedEvents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

}  // namespace VigilGuard

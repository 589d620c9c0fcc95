#ifndef VIGIL_SECURITY_REPORTER_H_
#define VIGIL_SECURITY_REPORTER_H_

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "vigil_message.h"
#include "vigil_security_config.h"

namespace VigilGuard {

struct SecurityReport {
  uint64_t total_security_events = 0;  // Monotonic, unaffected by eviction
  std::vector<SecurityEvent> events;   // Oldest first
  SecurityConfig configuration;

  nlohmann::json ToJson() const;
};

// Append-only audit log of threat findings, shared by every pipeline call
// on one processor. Keeps the most recent max_security_events entries;
// the total counter keeps counting after older entries are evicted.
class SecurityReporter {
 public:
  explicit SecurityReporter(const SecurityConfig& config);

  void Record(const SecurityEvent& event);

  // Stamps each finding with the current time
  void RecordFindings(const std::vector<ThreatFinding>& findings, Role source_role);

  // Snapshot taken under the log lock
  SecurityReport GetReport() const;

  uint64_t GetTotalEvents() const;
  size_t GetRetainedEvents() const;
  size_t GetCapacity() const { return capacity_; }

 private:
  static int64_t NowMillis();

  const SecurityConfig config_;
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::deque<SecurityEvent> events_;
  uint64_t total_events_ = 0;
};

}  // namespace VigilGuard

#endif  // VIGIL_SECURITY_REPORTER_H_

#ifndef VIGIL_SYSTEM_COMBINER_H_
#define VIGIL_SYSTEM_COMBINER_H_

#include <string>
#include <vector>
#include "vigil_message.h"
#include "vigil_content_sanitizer.h"

namespace VigilGuard {

struct CombineResult {
  bool has_message = false;  // false only for an empty input list
  Message message;
  bool was_modified = false;  // Something was redacted or truncated
  std::vector<ThreatFinding> findings;
};

// Merges the system messages of one conversation into a single system
// message. Malicious fragments are redacted in place, never dropped, so the
// filtering stays visible downstream.
class SystemMessageCombiner {
 public:
  SystemMessageCombiner(const ContentSanitizer& sanitizer, size_t max_system_length);

  // Contents are taken in input order; roles are not re-checked.
  CombineResult Combine(const std::vector<Message>& system_messages) const;

  static constexpr char kSeparator = '\n';

 private:
  const ContentSanitizer& sanitizer_;
  size_t max_system_length_;
};

}  // namespace VigilGuard

#endif  // VIGIL_SYSTEM_COMBINER_H_

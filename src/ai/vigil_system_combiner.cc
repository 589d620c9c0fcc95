#include "vigil_system_combiner.h"
#include "logger.h"

namespace VigilGuard {

SystemMessageCombiner::SystemMessageCombiner(const ContentSanitizer& sanitizer,
                                             size_t max_system_length)
    : sanitizer_(sanitizer), max_system_length_(max_system_length) {}

CombineResult SystemMessageCombiner::Combine(const std::vector<Message>& system_messages) const {
  CombineResult result;
  if (system_messages.empty()) {
    return result;
  }

  std::string joined;
  for (size_t i = 0; i < system_messages.size(); i++) {
    SanitizationResult part = sanitizer_.SanitizeWithReport(
        system_messages[i].content, max_system_length_);

    if (part.was_redacted || part.was_truncated) {
      result.was_modified = true;
      LOG_WARN("SystemCombiner", "System message " + std::to_string(i) + " sanitized (" +
               std::to_string(part.findings.size()) + " findings" +
               (part.was_truncated ? ", truncated" : "") + ")");
    }
    result.findings.insert(result.findings.end(),
                           part.findings.begin(), part.findings.end());

    if (i > 0) {
      joined += kSeparator;
    }
    joined += part.content;
  }

  // Second pass over the whole: enforces the final bound and catches a
  // phrase formed across the separator
  SanitizationResult whole = sanitizer_.SanitizeWithReport(joined, max_system_length_);
  if (whole.was_redacted || whole.was_truncated) {
    result.was_modified = true;
  }
  result.findings.insert(result.findings.end(),
                         whole.findings.begin(), whole.findings.end());

  result.has_message = true;
  result.message = Message(Role::SYSTEM, whole.content);

  LOG_DEBUG("SystemCombiner", "Combined " + std::to_string(system_messages.size()) +
            " system messages into " + std::to_string(whole.content.length()) + " bytes");

  return result;
}

}  // namespace VigilGuard

#ifndef VIGIL_CONTENT_SANITIZER_H_
#define VIGIL_CONTENT_SANITIZER_H_

#include <string>
#include <vector>
#include "vigil_message.h"
#include "vigil_threat_scanner.h"

namespace VigilGuard {

struct SanitizationResult {
  std::string content;
  bool was_redacted = false;
  bool was_truncated = false;
  std::vector<ThreatFinding> findings;  // Scan of the input, before rewriting
};

// User-authored content is flagged, never rewritten
struct UserContentResult {
  std::string content;
  std::vector<ThreatFinding> findings;
};

// ============================================================
// Content Sanitizer - Redaction + Bounded Truncation
// ============================================================
//
// Sanitize(content, L):
//   1. every catalog match is replaced with [SECURITY_FILTERED]
//   2. content longer than L is cut to L - 24 bytes and
//      [TRUNCATED_FOR_SECURITY] is appended
// The two steps alternate until the content is stable, so the result is
// never longer than L + 24 bytes and Sanitize(Sanitize(x, L), L) equals
// Sanitize(x, L).
class ContentSanitizer {
 public:
  explicit ContentSanitizer(const ThreatScanner& scanner);

  std::string Sanitize(const std::string& content, size_t max_length) const;

  SanitizationResult SanitizeWithReport(const std::string& content,
                                        size_t max_length) const;

  UserContentResult ValidateUserContent(const std::string& content) const;

  // Truncation step alone. Never splits a UTF-8 sequence.
  static std::string Truncate(const std::string& content, size_t max_length);

 private:
  const ThreatScanner& scanner_;
};

}  // namespace VigilGuard

#endif  // VIGIL_CONTENT_SANITIZER_H_

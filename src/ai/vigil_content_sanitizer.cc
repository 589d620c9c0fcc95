#include "vigil_content_sanitizer.h"
#include "logger.h"
#include <cstring>

namespace VigilGuard {

namespace {

constexpr int kMaxSanitizePasses = 6;

}  // namespace

ContentSanitizer::ContentSanitizer(const ThreatScanner& scanner)
    : scanner_(scanner) {}

std::string ContentSanitizer::Truncate(const std::string& content, size_t max_length) {
  if (content.length() <= max_length) {
    return content;
  }

  const size_t marker_length = std::strlen(kTruncationMarker);
  size_t keep = max_length > marker_length ? max_length - marker_length : 0;
  keep = Utf8SafePrefixLength(content, keep);

  return content.substr(0, keep) + kTruncationMarker;
}

std::string ContentSanitizer::Sanitize(const std::string& content, size_t max_length) const {
  return SanitizeWithReport(content, max_length).content;
}

SanitizationResult ContentSanitizer::SanitizeWithReport(const std::string& content,
                                                        size_t max_length) const {
  SanitizationResult result;
  result.findings = scanner_.Scan(content);

  // Cutting can leave a word fragment next to the marker that now matches
  // a rule, so redaction runs again on the truncated text.
  std::string current = content;
  for (int pass = 0; pass < kMaxSanitizePasses; pass++) {
    std::string redacted = scanner_.Redact(current);
    std::string truncated = Truncate(redacted, max_length);

    if (redacted != current) {
      result.was_redacted = true;
    }
    if (truncated != redacted) {
      result.was_truncated = true;
    }

    if (truncated == current) {
      result.content = current;
      return result;
    }
    current = truncated;
  }

  LOG_WARN("ContentSanitizer", "Content did not settle after " +
           std::to_string(kMaxSanitizePasses) + " passes, replacing it with the truncation marker");
  result.content = kTruncationMarker;
  result.was_truncated = true;
  return result;
}

UserContentResult ContentSanitizer::ValidateUserContent(const std::string& content) const {
  UserContentResult result;
  result.content = content;
  result.findings = scanner_.Scan(content);
  return result;
}

}  // namespace VigilGuard

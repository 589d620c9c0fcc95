#include "vigil_threat_scanner.h"
#include "logger.h"

namespace VigilGuard {

namespace {

constexpr int kMaxRedactionPasses = 8;

}  // namespace

size_t Utf8SafePrefixLength(const std::string& text, size_t max_bytes) {
  if (max_bytes >= text.size()) {
    return text.size();
  }

  size_t cut = max_bytes;
  // Back off continuation bytes (10xxxxxx) so the lead byte goes too
  while (cut > 0 &&
         (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    cut--;
  }
  return cut;
}

ThreatScanner::ThreatScanner(std::shared_ptr<const ThreatCatalog> catalog)
    : catalog_(std::move(catalog)) {}

std::vector<ThreatFinding> ThreatScanner::Scan(const std::string& content) const {
  std::vector<ThreatFinding> findings;
  if (!catalog_ || content.empty()) {
    return findings;
  }

  for (const auto& entry : catalog_->GetRules()) {
    std::smatch match;
    if (!std::regex_search(content, match, entry.regex)) {
      continue;
    }

    std::string matched = match.str(0);
    ThreatFinding finding;
    finding.category = entry.rule.category;
    finding.signature_id = entry.rule.id;
    finding.severity = entry.rule.severity;
    finding.snippet = matched.substr(0, Utf8SafePrefixLength(matched, kMaxSnippetLength));
    findings.push_back(finding);

    LOG_DEBUG("ThreatScanner", "Rule " + entry.rule.id + " matched: " + finding.snippet);
  }

  return findings;
}

bool ThreatScanner::HasThreats(const std::string& content) const {
  if (!catalog_) {
    return false;
  }
  for (const auto& entry : catalog_->GetRules()) {
    if (std::regex_search(content, entry.regex)) {
      return true;
    }
  }
  return false;
}

std::string ThreatScanner::Redact(const std::string& content) const {
  std::string result = content;
  if (!catalog_) {
    return result;
  }

  // Each pass strictly shrinks the unredacted text, so this settles quickly
  for (int pass = 0; pass < kMaxRedactionPasses; pass++) {
    bool changed = false;
    for (const auto& entry : catalog_->GetRules()) {
      if (!std::regex_search(result, entry.regex)) {
        continue;
      }
      result = std::regex_replace(result, entry.regex, kFilteredMarker);
      changed = true;
    }
    if (!changed) {
      break;
    }
  }

  return result;
}

}  // namespace VigilGuard

#ifndef VIGIL_THREAT_SCANNER_H_
#define VIGIL_THREAT_SCANNER_H_

#include <memory>
#include <string>
#include <vector>
#include "vigil_message.h"
#include "vigil_threat_catalog.h"

namespace VigilGuard {

// ============================================================
// Threat Scanner - Match Content Against the Catalog
// ============================================================
//
// Stateless apart from the shared catalog, so one scanner may be used from
// any number of threads at once.
class ThreatScanner {
 public:
  explicit ThreatScanner(std::shared_ptr<const ThreatCatalog> catalog);

  // At most one finding per rule, in catalog order. Clean content yields
  // an empty list.
  std::vector<ThreatFinding> Scan(const std::string& content) const;

  bool HasThreats(const std::string& content) const;

  // Replace every matched span with kFilteredMarker, repeating until no
  // rule matches (a replacement can expose a new word boundary).
  std::string Redact(const std::string& content) const;

  const ThreatCatalog& GetCatalog() const { return *catalog_; }

  static constexpr size_t kMaxSnippetLength = 80;

 private:
  std::shared_ptr<const ThreatCatalog> catalog_;
};

// Largest n <= max_bytes such that text[0, n) does not end inside a UTF-8
// sequence
size_t Utf8SafePrefixLength(const std::string& text, size_t max_bytes);

}  // namespace VigilGuard

#endif  // VIGIL_THREAT_SCANNER_H_

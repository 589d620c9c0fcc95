#ifndef VIGIL_THREAT_CATALOG_H_
#define VIGIL_THREAT_CATALOG_H_

#include <memory>
#include <regex>
#include <string>
#include <vector>
#include "vigil_message.h"

namespace VigilGuard {

// Sanitization markers. No catalog rule may match either of them,
// otherwise sanitizing twice would keep rewriting its own output.
constexpr const char* kFilteredMarker = "[SECURITY_FILTERED]";
constexpr const char* kTruncationMarker = "[TRUNCATED_FOR_SECURITY]";

// A signature as supplied by the catalog author. Patterns are ECMAScript
// regular expressions, always compiled case-insensitive.
struct ThreatRule {
  std::string id;
  std::string category;
  Severity severity = Severity::MEDIUM;
  std::string pattern;
};

struct CompiledThreatRule {
  ThreatRule rule;
  std::regex regex;
};

// ============================================================
// Threat Catalog - Versioned, Ordered Signature Table
// ============================================================
//
// Immutable after Create(). Findings are always reported in catalog order,
// so rule order is part of the catalog's contract along with its version.
class ThreatCatalog {
 public:
  // Returns nullptr and sets error when a rule is malformed: empty fields,
  // duplicate id, a pattern that does not compile, matches the empty
  // string, or matches a sanitization marker.
  static std::shared_ptr<const ThreatCatalog> Create(
      const std::string& version,
      const std::vector<ThreatRule>& rules,
      std::string* error);

  // The built-in catalog, version kDefaultRuleCatalogVersion
  static std::shared_ptr<const ThreatCatalog> Builtin();

  // Rules of the built-in catalog, for callers extending it
  static std::vector<ThreatRule> BuiltinRules();

  const std::string& GetVersion() const { return version_; }
  const std::vector<CompiledThreatRule>& GetRules() const { return rules_; }
  size_t GetRuleCount() const { return rules_.size(); }

  // nullptr if no rule has this id
  const CompiledThreatRule* FindRule(const std::string& id) const;

 private:
  ThreatCatalog(std::string version, std::vector<CompiledThreatRule> rules)
      : version_(std::move(version)), rules_(std::move(rules)) {}

  std::string version_;
  std::vector<CompiledThreatRule> rules_;
};

}  // namespace VigilGuard

#endif  // VIGIL_THREAT_CATALOG_H_

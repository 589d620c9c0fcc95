#include "vigil_threat_catalog.h"
#include "vigil_security_config.h"
#include "logger.h"
#include <set>

namespace VigilGuard {

// Quantifiers are bounded ({1,8} instead of +) so a match never spans
// more than a few dozen bytes, whatever the input length.
std::vector<ThreatRule> ThreatCatalog::BuiltinRules() {
  return {
    // Instruction override
    {"override.ignore_previous", "instruction_override", Severity::HIGH,
     R"(\bignore\s{1,8}((all|any|the)\s{1,8})?(previous|prior|above|earlier|preceding)\s{1,8}(instructions?|prompts?|rules?|directions?)\b)"},
    {"override.disregard_previous", "instruction_override", Severity::HIGH,
     R"(\bdisregard\s{1,8}((all|any|the)\s{1,8})?(previous|prior|above|earlier|preceding)\s{1,8}(instructions?|prompts?|rules?|directions?)\b)"},
    {"override.forget_instructions", "instruction_override", Severity::HIGH,
     R"(\bforget\s{1,8}((all|everything|about)\s{1,8})?(your|the|previous|prior|earlier)\s{1,8}(instructions?|rules?|guidelines?|programming)\b)"},
    {"override.new_instructions", "instruction_override", Severity::MEDIUM,
     R"(\bnew\s{1,8}instructions?\s{0,8}:)"},

    // Role reassignment
    {"role.you_are_now", "role_reassignment", Severity::MEDIUM,
     R"(\byou\s{1,8}are\s{1,8}now\s{1,8}((a|an)\s{1,8})?(different|new|unrestricted|uncensored|jailbroken|evil|free)\b)"},
    {"role.forget_role", "role_reassignment", Severity::HIGH,
     R"(\bforget\s{1,8}(your\s{1,8}(role|identity|persona|character|purpose)|who\s{1,8}you\s{1,8}are)\b)"},
    {"role.act_as", "role_reassignment", Severity::MEDIUM,
     R"(\bact\s{1,8}as\b)"},
    {"role.pretend_to_be", "role_reassignment", Severity::MEDIUM,
     R"(\bpretend\s{1,8}(to\s{1,8}be|you\s{1,8}are|that\s{1,8}you)\b)"},

    // Explicit system override markers
    {"system.marker", "system_override", Severity::HIGH,
     R"(\bsystem\s{0,8}:)"},
    {"system.override", "system_override", Severity::HIGH,
     R"(\boverride\b)"},

    // Fake system blocks
    {"fence.system_block", "fake_system_block", Severity::HIGH,
     R"((```|~~~)\s{0,8}system\b)"},
    {"fence.system_tag", "fake_system_block", Severity::HIGH,
     R"(<\s{0,8}/?\s{0,8}system\s{0,8}>)"},

    // System prompt exfiltration
    {"exfiltration.reveal_prompt", "prompt_exfiltration", Severity::HIGH,
     R"(\b(reveal|show|print|repeat|output|display|leak)\s{1,8}(me\s{1,8})?(your|the)\s{1,8}((system|hidden|initial|original)\s{1,8})?(prompt|instructions)\b)"},
  };
}

std::shared_ptr<const ThreatCatalog> ThreatCatalog::Create(
    const std::string& version,
    const std::vector<ThreatRule>& rules,
    std::string* error) {
  auto fail = [error](const std::string& reason) -> std::shared_ptr<const ThreatCatalog> {
    LOG_ERROR("ThreatCatalog", "Rejected catalog: " + reason);
    if (error) {
      *error = reason;
    }
    return nullptr;
  };

  if (version.empty()) {
    return fail("catalog version must not be empty");
  }

  std::vector<CompiledThreatRule> compiled;
  compiled.reserve(rules.size());
  std::set<std::string> seen_ids;

  for (const auto& rule : rules) {
    if (rule.id.empty() || rule.category.empty() || rule.pattern.empty()) {
      return fail("rule '" + rule.id + "' has an empty id, category or pattern");
    }
    if (!seen_ids.insert(rule.id).second) {
      return fail("duplicate rule id '" + rule.id + "'");
    }

    CompiledThreatRule entry;
    entry.rule = rule;
    try {
      entry.regex = std::regex(rule.pattern,
                               std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
      return fail("rule '" + rule.id + "' does not compile: " + e.what());
    }

    if (std::regex_search(std::string(), entry.regex)) {
      return fail("rule '" + rule.id + "' matches the empty string");
    }
    if (std::regex_search(std::string(kFilteredMarker), entry.regex) ||
        std::regex_search(std::string(kTruncationMarker), entry.regex)) {
      return fail("rule '" + rule.id + "' matches a sanitization marker");
    }

    compiled.push_back(std::move(entry));
  }

  LOG_DEBUG("ThreatCatalog", "Catalog " + version + " loaded with " +
            std::to_string(compiled.size()) + " rules");

  return std::shared_ptr<const ThreatCatalog>(
      new ThreatCatalog(version, std::move(compiled)));
}

std::shared_ptr<const ThreatCatalog> ThreatCatalog::Builtin() {
  static const std::shared_ptr<const ThreatCatalog> builtin = [] {
    std::string error;
    return Create(kDefaultRuleCatalogVersion, BuiltinRules(), &error);
  }();
  return builtin;
}

const CompiledThreatRule* ThreatCatalog::FindRule(const std::string& id) const {
  for (const auto& entry : rules_) {
    if (entry.rule.id == id) {
      return &entry;
    }
  }
  return nullptr;
}

}  // namespace VigilGuard

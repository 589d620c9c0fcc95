#ifndef VIGIL_SECURITY_CONFIG_H_
#define VIGIL_SECURITY_CONFIG_H_

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace VigilGuard {

// Defaults for the message-role security pipeline
constexpr size_t kDefaultMaxSystemLength = 2048;
constexpr size_t kDefaultMaxMessages = 20;
constexpr size_t kDefaultMaxSecurityEvents = 100;
constexpr const char* kDefaultRuleCatalogVersion = "2025.09.1";

// Immutable once handed to a processor. Invalid values are a
// construction-time failure, see Validate().
struct SecurityConfig {
  size_t max_system_length = kDefaultMaxSystemLength;  // Bytes, before the truncation marker
  size_t max_messages = kDefaultMaxMessages;           // Non-system messages kept
  std::string rule_catalog_version = kDefaultRuleCatalogVersion;
  size_t max_security_events = kDefaultMaxSecurityEvents;  // Reporter ring capacity

  bool Validate(std::string* error) const;

  nlohmann::json ToJson() const;

  bool operator==(const SecurityConfig& other) const {
    return max_system_length == other.max_system_length &&
           max_messages == other.max_messages &&
           rule_catalog_version == other.rule_catalog_version &&
           max_security_events == other.max_security_events;
  }
};

}  // namespace VigilGuard

#endif  // VIGIL_SECURITY_CONFIG_H_

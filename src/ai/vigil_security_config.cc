#include "vigil_security_config.h"

namespace VigilGuard {

bool SecurityConfig::Validate(std::string* error) const {
  std::string reason;

  if (max_system_length == 0) {
    reason = "max_system_length must be at least 1";
  } else if (max_messages == 0) {
    reason = "max_messages must be at least 1";
  } else if (max_security_events == 0) {
    reason = "max_security_events must be at least 1";
  } else if (rule_catalog_version.empty()) {
    reason = "rule_catalog_version must not be empty";
  }

  if (reason.empty()) {
    return true;
  }
  if (error) {
    *error = reason;
  }
  return false;
}

nlohmann::json SecurityConfig::ToJson() const {
  return {
    {"max_system_length", max_system_length},
    {"max_messages", max_messages},
    {"rule_catalog_version", rule_catalog_version},
    {"max_security_events", max_security_events}
  };
}

}  // namespace VigilGuard

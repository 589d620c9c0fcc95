#include "vigil_message.h"

namespace VigilGuard {

std::string RoleToString(Role role) {
  switch (role) {
    case Role::SYSTEM: return "system";
    case Role::USER: return "user";
    case Role::ASSISTANT: return "assistant";
  }
  return "unknown";
}

bool ParseRole(const std::string& name, Role* role) {
  // Exact, case-sensitive match: chat-completion APIs reject "User" too
  if (name == "system") {
    *role = Role::SYSTEM;
  } else if (name == "user") {
    *role = Role::USER;
  } else if (name == "assistant") {
    *role = Role::ASSISTANT;
  } else {
    return false;
  }
  return true;
}

std::string SeverityToString(Severity severity) {
  switch (severity) {
    case Severity::LOW: return "low";
    case Severity::MEDIUM: return "medium";
    case Severity::HIGH: return "high";
  }
  return "unknown";
}

nlohmann::json MessageToJson(const Message& message) {
  return {
    {"role", RoleToString(message.role)},
    {"content", message.content}
  };
}

nlohmann::json MessagesToJson(const std::vector<Message>& messages) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& message : messages) {
    array.push_back(MessageToJson(message));
  }
  return array;
}

nlohmann::json ThreatFindingToJson(const ThreatFinding& finding) {
  return {
    {"category", finding.category},
    {"signature_id", finding.signature_id},
    {"severity", SeverityToString(finding.severity)},
    {"snippet", finding.snippet}
  };
}

nlohmann::json SecurityEventToJson(const SecurityEvent& event) {
  return {
    {"timestamp", event.timestamp},
    {"source_role", RoleToString(event.source_role)},
    {"finding", ThreatFindingToJson(event.finding)}
  };
}

}  // namespace VigilGuard

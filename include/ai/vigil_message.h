#ifndef VIGIL_MESSAGE_H_
#define VIGIL_MESSAGE_H_

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// ============================================================
// Conversation Message Model
// ============================================================
//
// Role-tagged chat turns as they flow through the security pipeline,
// plus the threat findings and audit events the pipeline produces.

namespace VigilGuard {

enum class Role {
  SYSTEM,
  USER,
  ASSISTANT
};

enum class Severity {
  LOW,
  MEDIUM,
  HIGH
};

struct Message {
  Role role = Role::USER;
  std::string content;

  Message() = default;
  Message(Role r, std::string c) : role(r), content(std::move(c)) {}

  bool operator==(const Message& other) const {
    return role == other.role && content == other.content;
  }
  bool operator!=(const Message& other) const { return !(*this == other); }
};

// One finding per matching catalog rule, not per occurrence
struct ThreatFinding {
  std::string category;      // e.g. "instruction_override"
  std::string signature_id;  // e.g. "override.ignore_previous"
  Severity severity = Severity::LOW;
  std::string snippet;       // First matched text, capped
};

struct SecurityEvent {
  int64_t timestamp = 0;     // Unix timestamp in milliseconds
  ThreatFinding finding;
  Role source_role = Role::USER;
};

// Wire names: "system", "user", "assistant"
std::string RoleToString(Role role);
bool ParseRole(const std::string& name, Role* role);

// Wire names: "low", "medium", "high"
std::string SeverityToString(Severity severity);

nlohmann::json MessageToJson(const Message& message);
nlohmann::json MessagesToJson(const std::vector<Message>& messages);
nlohmann::json ThreatFindingToJson(const ThreatFinding& finding);
nlohmann::json SecurityEventToJson(const SecurityEvent& event);

}  // namespace VigilGuard

#endif  // VIGIL_MESSAGE_H_

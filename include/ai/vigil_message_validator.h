#ifndef VIGIL_MESSAGE_VALIDATOR_H_
#define VIGIL_MESSAGE_VALIDATOR_H_

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "vigil_message.h"

namespace VigilGuard {

enum class StructuralError {
  NONE,
  NOT_A_RECORD,
  MISSING_ROLE,
  MISSING_CONTENT,
  INVALID_ROLE,
  CONTENT_NOT_STRING
};

std::string StructuralErrorToString(StructuralError error);

struct MessageValidation {
  bool is_valid = false;
  Message message;  // Only meaningful when is_valid
  StructuralError error = StructuralError::NONE;
  std::string reason;
};

// Structural well-formedness of one raw {role, content} record.
// Empty content is structurally valid; blank turns are dropped by
// SequenceValidator.
class MessageValidator {
 public:
  static MessageValidation Validate(const nlohmann::json& raw);
};

// Filters a whole message list, preserving the order of survivors.
// Does not enforce user/assistant alternation.
class SequenceValidator {
 public:
  // Drops entries that fail MessageValidator or whose trimmed content is
  // empty. A non-array input yields an empty list.
  static std::vector<Message> Filter(const nlohmann::json& raw_messages);

  // Typed input is already well-formed; only blank turns are dropped
  static std::vector<Message> Filter(const std::vector<Message>& messages);

  static bool IsBlank(const std::string& content);
};

}  // namespace VigilGuard

#endif  // VIGIL_MESSAGE_VALIDATOR_H_

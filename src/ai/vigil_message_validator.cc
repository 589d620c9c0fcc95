#include "vigil_message_validator.h"
#include "logger.h"

namespace VigilGuard {

std::string StructuralErrorToString(StructuralError error) {
  switch (error) {
    case StructuralError::NONE: return "none";
    case StructuralError::NOT_A_RECORD: return "not_a_record";
    case StructuralError::MISSING_ROLE: return "missing_role";
    case StructuralError::MISSING_CONTENT: return "missing_content";
    case StructuralError::INVALID_ROLE: return "invalid_role";
    case StructuralError::CONTENT_NOT_STRING: return "content_not_string";
  }
  return "unknown";
}

MessageValidation MessageValidator::Validate(const nlohmann::json& raw) {
  MessageValidation result;

  auto reject = [&result](StructuralError error, const std::string& reason) {
    result.is_valid = false;
    result.error = error;
    result.reason = reason;
    return result;
  };

  if (!raw.is_object()) {
    return reject(StructuralError::NOT_A_RECORD,
                  std::string("message is not a record (got ") + raw.type_name() + ")");
  }

  auto role_it = raw.find("role");
  if (role_it == raw.end()) {
    return reject(StructuralError::MISSING_ROLE, "message has no 'role' field");
  }

  auto content_it = raw.find("content");
  if (content_it == raw.end()) {
    return reject(StructuralError::MISSING_CONTENT, "message has no 'content' field");
  }

  if (!role_it->is_string()) {
    return reject(StructuralError::INVALID_ROLE,
                  std::string("'role' must be a string (got ") + role_it->type_name() + ")");
  }

  const std::string& role_name = role_it->get_ref<const std::string&>();
  Role role;
  if (!ParseRole(role_name, &role)) {
    return reject(StructuralError::INVALID_ROLE,
                  "'" + role_name + "' is not one of system, user, assistant");
  }

  if (!content_it->is_string()) {
    return reject(StructuralError::CONTENT_NOT_STRING,
                  std::string("'content' must be a string (got ") + content_it->type_name() + ")");
  }

  result.is_valid = true;
  result.message = Message(role, content_it->get<std::string>());
  return result;
}

bool SequenceValidator::IsBlank(const std::string& content) {
  return content.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

std::vector<Message> SequenceValidator::Filter(const nlohmann::json& raw_messages) {
  std::vector<Message> messages;
  if (!raw_messages.is_array()) {
    return messages;
  }

  size_t index = 0;
  for (const auto& raw : raw_messages) {
    MessageValidation validation = MessageValidator::Validate(raw);
    if (!validation.is_valid) {
      LOG_DEBUG("SequenceValidator", "Dropping message " + std::to_string(index) +
                ": " + validation.reason);
    } else if (IsBlank(validation.message.content)) {
      LOG_DEBUG("SequenceValidator", "Dropping blank message " + std::to_string(index));
    } else {
      messages.push_back(std::move(validation.message));
    }
    index++;
  }

  return messages;
}

std::vector<Message> SequenceValidator::Filter(const std::vector<Message>& messages) {
  std::vector<Message> result;
  result.reserve(messages.size());
  for (const auto& message : messages) {
    if (!IsBlank(message.content)) {
      result.push_back(message);
    }
  }
  return result;
}

}  // namespace VigilGuard

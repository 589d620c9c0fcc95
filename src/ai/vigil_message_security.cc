#include "vigil_message_security.h"
#include "logger.h"
#include <sstream>

namespace VigilGuard {

std::unique_ptr<MessageSecurityProcessor> MessageSecurityProcessor::Create(
    const SecurityConfig& config, std::string* error) {
  return Create(config, ThreatCatalog::Builtin(), error);
}

std::unique_ptr<MessageSecurityProcessor> MessageSecurityProcessor::Create(
    const SecurityConfig& config,
    std::shared_ptr<const ThreatCatalog> catalog,
    std::string* error) {
  std::string reason;

  if (!config.Validate(&reason)) {
    // reason already set
  } else if (!catalog) {
    reason = "no threat catalog supplied";
  } else if (catalog->GetVersion() != config.rule_catalog_version) {
    reason = "rule_catalog_version '" + config.rule_catalog_version +
             "' does not match catalog version '" + catalog->GetVersion() + "'";
  }

  if (!reason.empty()) {
    LOG_ERROR("MessageSecurity", "Invalid configuration: " + reason);
    if (error) {
      *error = reason;
    }
    return nullptr;
  }

  LOG_INFO("MessageSecurity", "Processor ready (catalog " + catalog->GetVersion() + ", " +
           std::to_string(catalog->GetRuleCount()) + " rules, max_system_length=" +
           std::to_string(config.max_system_length) + ", max_messages=" +
           std::to_string(config.max_messages) + ")");

  return std::unique_ptr<MessageSecurityProcessor>(
      new MessageSecurityProcessor(config, std::move(catalog)));
}

MessageSecurityProcessor::MessageSecurityProcessor(
    const SecurityConfig& config,
    std::shared_ptr<const ThreatCatalog> catalog)
    : config_(config),
      catalog_(catalog),
      scanner_(catalog),
      sanitizer_(scanner_),
      combiner_(sanitizer_, config.max_system_length),
      reporter_(config) {}

std::vector<Message> MessageSecurityProcessor::Process(const std::vector<Message>& messages) {
  invocations_++;

  // Step 1: partition, keeping relative order inside each side
  std::vector<Message> system_messages;
  std::vector<Message> other_messages;
  for (const auto& message : messages) {
    if (message.role == Role::SYSTEM) {
      system_messages.push_back(message);
    } else {
      other_messages.push_back(message);
    }
  }

  // Step 2: drop blank turns, flag (never rewrite) user/assistant content
  size_t before = system_messages.size() + other_messages.size();
  system_messages = SequenceValidator::Filter(system_messages);
  other_messages = SequenceValidator::Filter(other_messages);
  size_t dropped = before - system_messages.size() - other_messages.size();
  if (dropped > 0) {
    messages_dropped_ += dropped;
    LOG_DEBUG("MessageSecurity", "Dropped " + std::to_string(dropped) + " blank messages");
  }

  for (const auto& message : other_messages) {
    UserContentResult scan = sanitizer_.ValidateUserContent(message.content);
    reporter_.RecordFindings(scan.findings, message.role);
  }

  // Step 3: one sanitized system message
  CombineResult combined = combiner_.Combine(system_messages);
  reporter_.RecordFindings(combined.findings, Role::SYSTEM);

  // Step 4: keep the most recent max_messages turns
  if (other_messages.size() > config_.max_messages) {
    size_t excess = other_messages.size() - config_.max_messages;
    other_messages.erase(other_messages.begin(),
                         other_messages.begin() + static_cast<std::ptrdiff_t>(excess));
    messages_capped_ += excess;
    LOG_INFO("MessageSecurity", "Message limit reached, dropped " +
             std::to_string(excess) + " oldest messages");
  }

  // Step 5: assemble
  std::vector<Message> output;
  output.reserve(other_messages.size() + 1);
  if (combined.has_message) {
    output.push_back(std::move(combined.message));
  }
  for (auto& message : other_messages) {
    output.push_back(std::move(message));
  }
  return output;
}

std::vector<Message> MessageSecurityProcessor::ProcessRecords(const nlohmann::json& records) {
  const nlohmann::json* list = &records;
  if (records.is_object()) {
    auto it = records.find("messages");
    if (it != records.end()) {
      list = &(*it);
    }
  }

  if (!list->is_array()) {
    LOG_WARN("MessageSecurity", std::string("Expected a message array, got ") +
             list->type_name());
    invocations_++;
    return {};
  }

  std::vector<Message> messages;
  messages.reserve(list->size());
  size_t malformed = 0;
  for (const auto& raw : *list) {
    MessageValidation validation = MessageValidator::Validate(raw);
    if (validation.is_valid) {
      messages.push_back(std::move(validation.message));
    } else {
      malformed++;
      LOG_DEBUG("MessageSecurity", "Dropping malformed message: " + validation.reason);
    }
  }
  messages_dropped_ += malformed;

  return Process(messages);
}

UserContentResult MessageSecurityProcessor::ValidateUserContent(const std::string& content) const {
  return sanitizer_.ValidateUserContent(content);
}

std::string MessageSecurityProcessor::SanitizeSystemContent(const std::string& content) const {
  return sanitizer_.Sanitize(content, config_.max_system_length);
}

SecurityReport MessageSecurityProcessor::GetSecurityReport() const {
  return reporter_.GetReport();
}

std::string MessageSecurityProcessor::GetStatistics() const {
  std::ostringstream stats;
  stats << "Message Security Statistics:\n";
  stats << "  Rule catalog: " << catalog_->GetVersion()
        << " (" << catalog_->GetRuleCount() << " rules)\n";
  stats << "  Conversations processed: " << invocations_.load() << "\n";
  stats << "  Security events recorded: " << reporter_.GetTotalEvents() << "\n";
  stats << "  Security events retained: " << reporter_.GetRetainedEvents()
        << "/" << reporter_.GetCapacity() << "\n";
  stats << "  Messages dropped (malformed or blank): " << messages_dropped_.load() << "\n";
  stats << "  Messages dropped (over limit): " << messages_capped_.load() << "\n";
  return stats.str();
}

}  // namespace VigilGuard

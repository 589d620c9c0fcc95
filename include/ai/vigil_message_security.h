#ifndef VIGIL_MESSAGE_SECURITY_H_
#define VIGIL_MESSAGE_SECURITY_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "vigil_message.h"
#include "vigil_security_config.h"
#include "vigil_threat_catalog.h"
#include "vigil_threat_scanner.h"
#include "vigil_content_sanitizer.h"
#include "vigil_message_validator.h"
#include "vigil_system_combiner.h"
#include "vigil_security_reporter.h"

// ============================================================
// Message-Role Security Pipeline
// ============================================================
//
// Turns an untrusted, role-tagged conversation into a sequence that is safe
// to hand to a chat-completion API:
//
//   raw messages
//     -> partition (system / non-system, order kept within each)
//     -> drop malformed and blank turns
//     -> scan user/assistant turns (flag only, never rewritten)
//     -> combine + sanitize system turns into one system message
//     -> keep the most recent max_messages non-system turns
//     -> [combined system] + non-system turns
//
// Every threat finding is forwarded to the SecurityReporter. Process() never
// fails on malformed input; it drops or redacts instead. The only fatal path
// is an invalid configuration, which makes Create() return nullptr.
//
// One processor is meant to be shared by the whole application. Process()
// may run concurrently from any number of threads.

namespace VigilGuard {

class MessageSecurityProcessor {
 public:
  // Uses the built-in catalog
  static std::unique_ptr<MessageSecurityProcessor> Create(
      const SecurityConfig& config, std::string* error);

  // config.rule_catalog_version must equal catalog->GetVersion()
  static std::unique_ptr<MessageSecurityProcessor> Create(
      const SecurityConfig& config,
      std::shared_ptr<const ThreatCatalog> catalog,
      std::string* error);

  // Full pipeline over typed messages
  std::vector<Message> Process(const std::vector<Message>& messages);

  // Full pipeline over raw records: a JSON array, or an object holding a
  // "messages" array. Anything else yields an empty sequence.
  std::vector<Message> ProcessRecords(const nlohmann::json& records);

  // Scan only; the content is returned untouched
  UserContentResult ValidateUserContent(const std::string& content) const;

  // Redact + truncate to max_system_length
  std::string SanitizeSystemContent(const std::string& content) const;

  SecurityReport GetSecurityReport() const;
  std::string GetStatistics() const;

  const SecurityConfig& GetConfig() const { return config_; }
  const ThreatScanner& GetScanner() const { return scanner_; }

 private:
  MessageSecurityProcessor(const SecurityConfig& config,
                           std::shared_ptr<const ThreatCatalog> catalog);

  const SecurityConfig config_;
  std::shared_ptr<const ThreatCatalog> catalog_;
  ThreatScanner scanner_;
  ContentSanitizer sanitizer_;
  SystemMessageCombiner combiner_;
  SecurityReporter reporter_;

  std::atomic<uint64_t> invocations_{0};
  std::atomic<uint64_t> messages_dropped_{0};
  std::atomic<uint64_t> messages_capped_{0};
};

}  // namespace VigilGuard

#endif  // VIGIL_MESSAGE_SECURITY_H_

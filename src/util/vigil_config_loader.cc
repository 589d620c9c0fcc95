#include "vigil_config_loader.h"
#include "logger.h"
#include <cstdlib>
#include <fstream>
#include <limits>

namespace VigilConfig {

namespace {

bool ReadSizeField(const nlohmann::json& json, const char* key,
                   size_t* out, std::string* error) {
  const nlohmann::json& value = json.at(key);
  if (value.is_number_integer()) {
    if (!value.is_number_unsigned() && value.get<int64_t>() < 0) {
      if (error) *error = std::string(key) + " must not be negative";
      return false;
    }
    *out = value.get<size_t>();
    return true;
  }
  if (value.is_string() && ParseSizeValue(value.get<std::string>(), out)) {
    return true;
  }
  if (error) *error = std::string(key) + " must be a non-negative integer";
  return false;
}

bool ReadSizeEnv(const char* name, size_t* out, std::string* error) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return true;
  }
  if (!ParseSizeValue(raw, out)) {
    if (error) *error = std::string(name) + "='" + raw + "' is not a valid size";
    return false;
  }
  LOG_DEBUG("Config", std::string("Override from environment: ") + name + "=" + raw);
  return true;
}

}  // namespace

bool ParseSizeValue(const std::string& text, size_t* value) {
  if (text.empty()) {
    return false;
  }

  size_t result = 0;
  const size_t max = std::numeric_limits<size_t>::max();
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    size_t digit = static_cast<size_t>(c - '0');
    if (result > (max - digit) / 10) {
      return false;
    }
    result = result * 10 + digit;
  }

  *value = result;
  return true;
}

bool ApplyConfigJson(const nlohmann::json& json,
                     VigilGuard::SecurityConfig* config,
                     std::string* error) {
  if (!json.is_object()) {
    if (error) *error = "configuration must be a JSON object";
    return false;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    const std::string& key = it.key();
    if (key == "max_system_length") {
      if (!ReadSizeField(json, "max_system_length", &config->max_system_length, error)) return false;
    } else if (key == "max_messages") {
      if (!ReadSizeField(json, "max_messages", &config->max_messages, error)) return false;
    } else if (key == "max_security_events") {
      if (!ReadSizeField(json, "max_security_events", &config->max_security_events, error)) return false;
    } else if (key == "rule_catalog_version") {
      if (!it.value().is_string()) {
        if (error) *error = "rule_catalog_version must be a string";
        return false;
      }
      config->rule_catalog_version = it.value().get<std::string>();
    } else {
      LOG_WARN("Config", "Ignoring unknown configuration key: " + key);
    }
  }
  return true;
}

bool LoadConfigFile(const std::string& file_path,
                    VigilGuard::SecurityConfig* config,
                    std::string* error) {
  std::ifstream file(file_path);
  if (!file.is_open()) {
    if (error) *error = "cannot open config file: " + file_path;
    return false;
  }

  nlohmann::json json = nlohmann::json::parse(file, nullptr, false);
  if (json.is_discarded()) {
    if (error) *error = "config file is not valid JSON: " + file_path;
    return false;
  }

  std::string reason;
  if (!ApplyConfigJson(json, config, &reason)) {
    if (error) *error = file_path + ": " + reason;
    return false;
  }

  LOG_INFO("Config", "Loaded configuration from " + file_path);
  return true;
}

bool ApplyEnvironmentOverrides(VigilGuard::SecurityConfig* config,
                               std::string* error) {
  if (!ReadSizeEnv(kEnvMaxSystemLength, &config->max_system_length, error)) return false;
  if (!ReadSizeEnv(kEnvMaxMessages, &config->max_messages, error)) return false;
  if (!ReadSizeEnv(kEnvMaxSecurityEvents, &config->max_security_events, error)) return false;

  const char* version = std::getenv(kEnvRuleCatalogVersion);
  if (version) {
    config->rule_catalog_version = version;
  }
  return true;
}

}  // namespace VigilConfig

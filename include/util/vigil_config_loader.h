/**
 * Vigil - Configuration Loader
 *
 * Builds a SecurityConfig for the command-line filter.
 * Priority order: CLI args > Environment variables > Config file > Defaults
 *
 * The core library never reads the environment or the filesystem; only the
 * CLI calls these functions.
 */

#ifndef VIGIL_CONFIG_LOADER_H_
#define VIGIL_CONFIG_LOADER_H_

#include <string>
#include <nlohmann/json.hpp>
#include "vigil_security_config.h"

namespace VigilConfig {

// Environment variable names
constexpr const char* kEnvMaxSystemLength = "VIGIL_MAX_SYSTEM_LENGTH";
constexpr const char* kEnvMaxMessages = "VIGIL_MAX_MESSAGES";
constexpr const char* kEnvMaxSecurityEvents = "VIGIL_MAX_SECURITY_EVENTS";
constexpr const char* kEnvRuleCatalogVersion = "VIGIL_RULE_CATALOG_VERSION";
constexpr const char* kEnvLogLevel = "VIGIL_LOG_LEVEL";

/**
 * Parse a non-negative decimal size. Rejects signs, whitespace, trailing
 * garbage and values that overflow size_t.
 *
 * @param text Input text
 * @param value Output: parsed value, untouched on failure
 * @return true on success
 */
bool ParseSizeValue(const std::string& text, size_t* value);

/**
 * Apply the keys of a JSON object onto config. Recognised keys:
 * max_system_length, max_messages, max_security_events,
 * rule_catalog_version. Unknown keys are logged and ignored.
 *
 * @param json Configuration object
 * @param config In/out: fields present in json are overwritten
 * @param error Output: reason on failure
 * @return true on success. On failure config may be partially updated.
 */
bool ApplyConfigJson(const nlohmann::json& json,
                     VigilGuard::SecurityConfig* config,
                     std::string* error);

/**
 * Load a JSON configuration file and apply it onto config.
 *
 * @return true on success
 */
bool LoadConfigFile(const std::string& file_path,
                    VigilGuard::SecurityConfig* config,
                    std::string* error);

/**
 * Apply VIGIL_* environment overrides onto config. Unset variables are
 * left alone; set-but-malformed numbers are an error.
 *
 * @return true on success
 */
bool ApplyEnvironmentOverrides(VigilGuard::SecurityConfig* config,
                               std::string* error);

}  // namespace VigilConfig

#endif  // VIGIL_CONFIG_LOADER_H_

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <vector>

#include <nlohmann/json.hpp>

#include "logger.h"
#include "vigil_config_loader.h"
#include "vigil_message.h"
#include "vigil_message_security.h"

using json = nlohmann::json;

namespace {

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitBadInput = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitUsage = 3;

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]\n\n";
    std::cout << "Reads a JSON conversation and prints the filtered, role-secured message list.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --input FILE              Read the conversation from FILE (default: stdin)\n";
    std::cout << "  --config FILE             JSON configuration file\n";
    std::cout << "  --max-system-length N     Maximum combined system message length\n";
    std::cout << "  --max-messages N          Maximum non-system messages kept\n";
    std::cout << "  --max-security-events N   Security events retained for the report\n";
    std::cout << "  --report                  Include the security report in the output\n";
    std::cout << "  --log-level LEVEL         debug, info, warn, error (default: warn)\n";
    std::cout << "  --log-file FILE           Also append log lines to FILE\n";
    std::cout << "  --help                    Show this help message\n";
    std::cout << "\n";
    std::cout << "Input:\n";
    std::cout << "  A JSON array of {\"role\", \"content\"} records, or an object with a\n";
    std::cout << "  \"messages\" array. Roles are \"system\", \"user\" and \"assistant\".\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  " << VigilConfig::kEnvMaxSystemLength << ", "
              << VigilConfig::kEnvMaxMessages << ",\n";
    std::cout << "  " << VigilConfig::kEnvMaxSecurityEvents << ", "
              << VigilConfig::kEnvRuleCatalogVersion << ",\n";
    std::cout << "  " << VigilConfig::kEnvLogLevel << "\n";
    std::cout << "  Priority: command line > environment > config file > defaults\n";
    std::cout << "\n";
    std::cout << "Exit codes:\n";
    std::cout << "  0 success, 1 unreadable input, 2 configuration error, 3 usage error\n";
}

bool ReadInput(const std::string& path, std::string* content) {
    std::stringstream buffer;
    if (path.empty() || path == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }
        buffer << file.rdbuf();
    }
    *content = buffer.str();
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string config_path;
    std::string log_file;
    std::string log_level_name;
    std::string max_system_length_arg;
    std::string max_messages_arg;
    std::string max_security_events_arg;
    bool include_report = false;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return kExitOk;
        } else if (strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
            input_path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--max-system-length") == 0 && i + 1 < argc) {
            max_system_length_arg = argv[++i];
        } else if (strcmp(argv[i], "--max-messages") == 0 && i + 1 < argc) {
            max_messages_arg = argv[++i];
        } else if (strcmp(argv[i], "--max-security-events") == 0 && i + 1 < argc) {
            max_security_events_arg = argv[++i];
        } else if (strcmp(argv[i], "--report") == 0) {
            include_report = true;
        } else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level_name = argv[++i];
        } else if (strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            PrintUsage(argv[0]);
            return kExitUsage;
        }
    }

    // Logging: CLI > environment > WARN
    if (log_file.empty()) {
        VigilLogger::Logger::Init();
    } else {
        VigilLogger::Logger::Init(log_file);
    }
    VigilLogger::Level level = VigilLogger::WARN;
    if (log_level_name.empty()) {
        const char* env_level = std::getenv(VigilConfig::kEnvLogLevel);
        if (env_level && !VigilLogger::Logger::ParseLevel(env_level, &level)) {
            std::cerr << "[ERROR] Invalid " << VigilConfig::kEnvLogLevel << ": " << env_level << std::endl;
            return kExitConfigError;
        }
    } else if (!VigilLogger::Logger::ParseLevel(log_level_name, &level)) {
        std::cerr << "Invalid log level: " << log_level_name << std::endl;
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    VigilLogger::Logger::SetLevel(level);

    // Configuration: defaults < file < environment < CLI
    VigilGuard::SecurityConfig config;
    std::string error;

    if (!config_path.empty() && !VigilConfig::LoadConfigFile(config_path, &config, &error)) {
        std::cerr << "[ERROR] " << error << std::endl;
        return kExitConfigError;
    }
    if (!VigilConfig::ApplyEnvironmentOverrides(&config, &error)) {
        std::cerr << "[ERROR] " << error << std::endl;
        return kExitConfigError;
    }

    struct SizeFlag {
        const char* name;
        const std::string* text;
        size_t* target;
    };
    const SizeFlag size_flags[] = {
        {"--max-system-length", &max_system_length_arg, &config.max_system_length},
        {"--max-messages", &max_messages_arg, &config.max_messages},
        {"--max-security-events", &max_security_events_arg, &config.max_security_events},
    };
    for (const auto& flag : size_flags) {
        if (flag.text->empty()) {
            continue;
        }
        if (!VigilConfig::ParseSizeValue(*flag.text, flag.target)) {
            std::cerr << "Invalid value for " << flag.name << ": " << *flag.text << std::endl;
            PrintUsage(argv[0]);
            return kExitUsage;
        }
    }

    auto processor = VigilGuard::MessageSecurityProcessor::Create(config, &error);
    if (!processor) {
        std::cerr << "[ERROR] Invalid configuration: " << error << std::endl;
        return kExitConfigError;
    }

    // Input
    std::string raw_input;
    if (!ReadInput(input_path, &raw_input)) {
        std::cerr << "[ERROR] Cannot read input: " << input_path << std::endl;
        return kExitBadInput;
    }

    json records = json::parse(raw_input, nullptr, false);
    if (records.is_discarded()) {
        std::cerr << "[ERROR] Input is not valid JSON" << std::endl;
        return kExitBadInput;
    }

    std::vector<VigilGuard::Message> secured = processor->ProcessRecords(records);

    json output;
    output["messages"] = VigilGuard::MessagesToJson(secured);
    if (include_report) {
        output["security_report"] = processor->GetSecurityReport().ToJson();
    }

    // Content may carry invalid UTF-8 from the caller
    std::cout << output.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;

    LOG_INFO("Filter", processor->GetStatistics());
    return kExitOk;
}

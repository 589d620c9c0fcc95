#include <iostream>
#include <string>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <uuid/uuid.h>

#include "logger.h"
#include "test_runner.h"
#include "report_generator.h"
#include "guard_tests.h"
#include "vigil_threat_catalog.h"

// Generate UUID for test run
std::string GenerateUUID() {
    uuid_t uuid;
    uuid_generate(uuid);
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

// Get current timestamp
std::string GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm utc;
    gmtime_r(&time, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --category NAME       Only run one category\n";
    std::cout << "  --verbose             Print every test and pipeline log output\n";
    std::cout << "  --json-report FILE    Output JSON report to file\n";
    std::cout << "  --help                Show this help message\n";
    std::cout << "\n";
    std::cout << "Categories:\n";
    std::cout << "  message, validator, catalog, scanner, sanitizer, combiner,\n";
    std::cout << "  reporter, processor, config, logger\n";
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string json_report_path;
    std::string category;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--json-report") == 0 && i + 1 < argc) {
            json_report_path = argv[++i];
        } else if (strcmp(argv[i], "--category") == 0 && i + 1 < argc) {
            category = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            PrintUsage(argv[0]);
            return 3;
        }
    }

    // Pipeline warnings are expected while tests feed it attacks
    VigilLogger::Logger::Init();
    VigilLogger::Logger::SetOutputStream(verbose ? &std::cerr : nullptr);

    std::cout << "========================================\n";
    std::cout << "VIGIL GUARD UNIT TESTS\n";
    std::cout << "========================================\n";
    std::cout << "Catalog:  " << VigilGuard::ThreatCatalog::Builtin()->GetVersion() << " ("
              << VigilGuard::ThreatCatalog::Builtin()->GetRuleCount() << " rules)\n";
    std::cout << "Category: " << (category.empty() ? "all" : category) << "\n";
    std::cout << "========================================\n\n";

    TestRunner runner;
    runner.SetVerbose(verbose);
    runner.SetCategoryFilter(category);

    RunMessageTests(runner);
    RunValidatorTests(runner);
    RunCatalogTests(runner);
    RunScannerTests(runner);
    RunSanitizerTests(runner);
    RunCombinerTests(runner);
    RunReporterTests(runner);
    RunProcessorTests(runner);
    RunConfigTests(runner);
    RunLoggerTests(runner);

    if (runner.GetResults().empty()) {
        std::cerr << "[FATAL] No tests matched category '" << category << "'" << std::endl;
        return 2;
    }

    bool all_passed = runner.PrintSummary();

    if (!json_report_path.empty()) {
        ReportMetadata metadata;
        metadata.test_run_id = GenerateUUID();
        metadata.timestamp = GetTimestamp();
        metadata.category_filter = category;
        metadata.rule_catalog_version = VigilGuard::ThreatCatalog::Builtin()->GetVersion();
        metadata.rule_count = VigilGuard::ThreatCatalog::Builtin()->GetRuleCount();

        ReportGenerator report;
        report.SetMetadata(metadata);
        report.SetResults(runner.GetResults());
        report.SetCategoryStats(runner.GetCategoryStats());
        if (report.SaveJSON(json_report_path)) {
            std::cout << "\n[INFO] JSON report written to " << json_report_path << std::endl;
        } else {
            return 2;
        }
    }

    return all_passed ? 0 : 1;
}

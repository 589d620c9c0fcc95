#include "report_generator.h"
#include <fstream>
#include <iostream>

json ReportMetadata::to_json() const {
    return {
        {"test_run_id", test_run_id},
        {"timestamp", timestamp},
        {"category_filter", category_filter},
        {"rule_catalog_version", rule_catalog_version},
        {"rule_count", rule_count}
    };
}

void ReportGenerator::SetMetadata(const ReportMetadata& metadata) {
    metadata_ = metadata;
}

void ReportGenerator::SetResults(const std::vector<TestResult>& results) {
    results_ = results;
}

void ReportGenerator::SetCategoryStats(const std::map<std::string, CategoryStats>& categories) {
    category_stats_ = categories;
}

json ReportGenerator::BuildSummary() const {
    int passed = 0, failed = 0, checks = 0;
    double total_ms = 0.0;
    for (const auto& r : results_) {
        if (r.success) passed++;
        else failed++;
        checks += r.checks;
        total_ms += r.duration_ms;
    }

    return {
        {"total_tests", results_.size()},
        {"passed", passed},
        {"failed", failed},
        {"total_checks", checks},
        {"total_duration_ms", total_ms}
    };
}

json ReportGenerator::BuildFailures() const {
    json failures = json::array();

    for (const auto& r : results_) {
        if (!r.success) {
            failures.push_back({
                {"name", r.name},
                {"category", r.category},
                {"failed_checks", r.failed_checks},
                {"message", r.error}
            });
        }
    }

    return failures;
}

json ReportGenerator::GenerateJSON() const {
    json categories = json::object();
    for (const auto& [name, stats] : category_stats_) {
        categories[name] = stats.to_json();
    }

    json tests = json::array();
    for (const auto& r : results_) {
        tests.push_back(r.to_json());
    }

    return {
        {"metadata", metadata_.to_json()},
        {"summary", BuildSummary()},
        {"categories", categories},
        {"failures", BuildFailures()},
        {"tests", tests}
    };
}

bool ReportGenerator::SaveJSON(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Failed to open report file: " << filepath << std::endl;
        return false;
    }

    // Test errors echo adversarial content, which may not be valid UTF-8
    file << GenerateJSON().dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return file.good();
}

#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "test_runner.h"

using json = nlohmann::json;

struct ReportMetadata {
    std::string test_run_id;
    std::string timestamp;
    std::string category_filter;
    std::string rule_catalog_version;
    size_t rule_count = 0;

    json to_json() const;
};

class ReportGenerator {
public:
    ReportGenerator() = default;

    // Set report data
    void SetMetadata(const ReportMetadata& metadata);
    void SetResults(const std::vector<TestResult>& results);
    void SetCategoryStats(const std::map<std::string, CategoryStats>& categories);

    // Generate report
    json GenerateJSON() const;
    bool SaveJSON(const std::string& filepath) const;

private:
    ReportMetadata metadata_;
    std::vector<TestResult> results_;
    std::map<std::string, CategoryStats> category_stats_;

    json BuildSummary() const;
    json BuildFailures() const;
};

#include "guard_tests.h"
#include "vigil_message.h"
#include "vigil_security_config.h"
#include "vigil_security_reporter.h"
#include <thread>
#include <vector>

using namespace VigilGuard;

namespace {

ThreatFinding MakeFinding(const std::string& id) {
    ThreatFinding finding;
    finding.category = "test";
    finding.signature_id = id;
    finding.severity = Severity::MEDIUM;
    finding.snippet = id;
    return finding;
}

}  // namespace

void RunReporterTests(TestRunner& runner) {
    runner.Run("starts_empty", "reporter", [](TestCase& t) {
        SecurityConfig config;
        SecurityReporter reporter(config);
        SecurityReport report = reporter.GetReport();
        t.ExpectEq(report.total_security_events, uint64_t(0), "no events counted");
        t.Expect(report.events.empty(), "no events retained");
        t.Expect(report.configuration == config, "configuration echoed");
        t.ExpectEq(reporter.GetCapacity(), kDefaultMaxSecurityEvents, "default capacity");
    });

    runner.Run("records_findings_with_role", "reporter", [](TestCase& t) {
        SecurityReporter reporter(SecurityConfig{});
        reporter.RecordFindings({MakeFinding("a"), MakeFinding("b")}, Role::USER);
        reporter.RecordFindings({MakeFinding("c")}, Role::SYSTEM);

        SecurityReport report = reporter.GetReport();
        t.ExpectEq(report.total_security_events, uint64_t(3), "three events");
        t.ExpectEq(report.events.size(), size_t(3), "three retained");
        if (report.events.size() == 3) {
            t.ExpectEq(report.events[0].finding.signature_id, "a", "oldest first");
            t.Expect(report.events[0].source_role == Role::USER, "user role");
            t.Expect(report.events[2].source_role == Role::SYSTEM, "system role");
            t.Expect(report.events[0].timestamp > 0, "timestamped");
            t.Expect(report.events[0].timestamp <= report.events[2].timestamp, "timestamps ordered");
        }
    });

    runner.Run("evicts_oldest_beyond_capacity", "reporter", [](TestCase& t) {
        SecurityConfig config;
        config.max_security_events = 3;
        SecurityReporter reporter(config);
        for (int i = 0; i < 5; i++) {
            reporter.RecordFindings({MakeFinding("e" + std::to_string(i))}, Role::USER);
        }

        SecurityReport report = reporter.GetReport();
        t.ExpectEq(report.total_security_events, uint64_t(5), "counter unaffected by eviction");
        t.ExpectEq(report.events.size(), size_t(3), "window bounded");
        if (report.events.size() == 3) {
            t.ExpectEq(report.events[0].finding.signature_id, "e2", "oldest two evicted");
            t.ExpectEq(report.events[2].finding.signature_id, "e4", "newest kept");
        }
        t.ExpectEq(reporter.GetRetainedEvents(), size_t(3), "retained count");
        t.ExpectEq(reporter.GetTotalEvents(), uint64_t(5), "total count");
    });

    runner.Run("concurrent_appends", "reporter", [](TestCase& t) {
        SecurityConfig config;
        config.max_security_events = 100;
        SecurityReporter reporter(config);

        const int kThreads = 8;
        const int kPerThread = 250;
        std::vector<std::thread> threads;
        for (int i = 0; i < kThreads; i++) {
            threads.emplace_back([&reporter, i]() {
                for (int j = 0; j < kPerThread; j++) {
                    reporter.RecordFindings({MakeFinding("t" + std::to_string(i))}, Role::USER);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        SecurityReport report = reporter.GetReport();
        t.ExpectEq(report.total_security_events, uint64_t(kThreads * kPerThread), "no lost increments");
        t.ExpectEq(report.events.size(), size_t(100), "window full");
    });

    runner.Run("report_json_shape", "reporter", [](TestCase& t) {
        SecurityReporter reporter(SecurityConfig{});
        reporter.RecordFindings({MakeFinding("x")}, Role::ASSISTANT);

        json j = reporter.GetReport().ToJson();
        t.ExpectEq(j["total_security_events"].get<uint64_t>(), uint64_t(1), "total");
        t.Expect(j["events"].is_array() && j["events"].size() == 1, "events array");
        t.ExpectEq(j["events"][0]["source_role"].get<std::string>(), "assistant", "source role");
        t.ExpectEq(j["configuration"]["max_system_length"].get<size_t>(), kDefaultMaxSystemLength,
                   "configuration included");
        t.ExpectEq(j["configuration"]["rule_catalog_version"].get<std::string>(),
                   kDefaultRuleCatalogVersion, "catalog version included");
    });
}

#include <catch2/catch_test_macros.hpp>
#include "report/report_serializer.hpp"

using namespace logcleaner;
using json = nlohmann::json;

namespace {

CleaningReport sample_report() {
    CleaningReport report;
    report.total_lines = 3;
    report.kept = 1;
    report.removed = 1;
    report.malformed = 1;
    report.malformed_lines.push_back({3, "unparsable timestamp 'x'", "x,,bad"});
    report.rule_hits["too_old"] = 1;
    return report;
}

} // namespace

TEST_CASE("ReportSerializer: report fields", "[report]") {
    const auto j = ReportSerializer::to_json(sample_report());

    CHECK(j["total_lines"] == 3);
    CHECK(j["kept"] == 1);
    CHECK(j["removed"] == 1);
    CHECK(j["anonymized"] == 0);
    CHECK(j["malformed"] == 1);
    CHECK(j["rule_hits"]["too_old"] == 1);
    REQUIRE(j["malformed_lines"].size() == 1);
    CHECK(j["malformed_lines"][0]["line"] == 3);
    CHECK(j["malformed_lines"][0]["reason"] == "unparsable timestamp 'x'");
    CHECK(j["malformed_lines"][0]["raw"] == "x,,bad");
}

TEST_CASE("ReportSerializer: successful run with backup", "[report]") {
    BackupHandle backup{"/logs/a.log", "/logs/a.log.20230601T000000Z.bak", 120, true};
    const auto result = RunResult::success("/logs/a.log", sample_report(), false, backup);
    const auto j = ReportSerializer::to_json(result);

    CHECK(j["input"] == "/logs/a.log");
    CHECK(j["status"] == "success");
    CHECK(j["dry_run"] == false);
    CHECK_FALSE(j.contains("error"));
    CHECK_FALSE(j.contains("reason"));
    CHECK(j["backup"]["path"] == "/logs/a.log.20230601T000000Z.bak");
    CHECK(j["backup"]["bytes"] == 120);
    CHECK(j["backup"]["retained"] == true);
    CHECK(j["report"]["kept"] == 1);
}

TEST_CASE("ReportSerializer: failed runs carry category and reason", "[report]") {
    const auto aborted = ReportSerializer::to_json(RunResult::aborted(
        "/logs/a.log", ErrorCategory::RULE_EVALUATION_ERROR, "Rule 'x' failed on line 2: boom", sample_report()));
    CHECK(aborted["status"] == "aborted");
    CHECK(aborted["error"] == error_category_to_string(ErrorCategory::RULE_EVALUATION_ERROR));
    CHECK(aborted["reason"] == "Rule 'x' failed on line 2: boom");
    CHECK_FALSE(aborted.contains("backup"));

    const auto fatal = ReportSerializer::to_json(RunResult::fatal_io("/logs/b.log", "Cannot open input file"));
    CHECK(fatal["status"] == "fatal_io");
    CHECK(fatal["report"]["total_lines"] == 0);
}

TEST_CASE("ReportSerializer: invocation summary totals", "[report]") {
    std::vector<RunResult> results;
    results.push_back(RunResult::success("/logs/a.log", sample_report(), true));
    results.push_back(RunResult::success("/logs/b.log", sample_report(), true));
    results.push_back(RunResult::fatal_io("/logs/c.log", "Cannot open input file"));

    const auto j = ReportSerializer::to_json(results);
    REQUIRE(j["files"].size() == 3);
    CHECK(j["files"][2]["input"] == "/logs/c.log");
    CHECK(j["summary"]["files"] == 3);
    CHECK(j["summary"]["succeeded"] == 2);
    CHECK(j["summary"]["fatal_io"] == 1);
    CHECK(j["summary"]["total_lines"] == 6);
    CHECK(j["summary"]["removed"] == 2);
}

TEST_CASE("ReportSerializer: serialize tolerates non-UTF-8 raw lines", "[report]") {
    auto report = sample_report();
    report.malformed_lines[0].raw = "bad\xff\xfe";
    std::vector<RunResult> results{RunResult::success("/logs/a.log", report, false)};

    const auto text = ReportSerializer::serialize(results);
    const auto parsed = json::parse(text);
    CHECK(parsed["files"][0]["report"]["malformed"] == 1);
}

#include "report/report_serializer.hpp"

using json = nlohmann::json;

namespace logcleaner {

json ReportSerializer::to_json(const CleaningReport& report) {
    json malformed = json::array();
    for (const auto& diag : report.malformed_lines) {
        malformed.push_back({
            {"line", diag.line_number},
            {"reason", diag.reason},
            {"raw", diag.raw},
        });
    }

    json hits = json::object();
    for (const auto& [rule, count] : report.rule_hits) {
        hits[rule] = count;
    }

    return {
        {"total_lines", report.total_lines},
        {"kept", report.kept},
        {"removed", report.removed},
        {"anonymized", report.anonymized},
        {"malformed", report.malformed},
        {"rule_hits", std::move(hits)},
        {"malformed_lines", std::move(malformed)},
    };
}

json ReportSerializer::to_json(const RunResult& result) {
    json j = {
        {"input", result.input_path},
        {"status", run_status_to_string(result.status)},
        {"dry_run", result.dry_run},
        {"report", to_json(result.report)},
    };

    if (!result.ok()) {
        j["error"] = error_category_to_string(result.error_category);
        j["reason"] = result.reason;
    }

    if (result.backup) {
        j["backup"] = {
            {"path", result.backup->backup_path},
            {"bytes", result.backup->bytes},
            {"retained", result.backup->retained},
        };
    }
    return j;
}

json ReportSerializer::to_json(const std::vector<RunResult>& results) {
    json files = json::array();
    size_t total = 0, kept = 0, removed = 0, anonymized = 0, malformed = 0;
    size_t succeeded = 0, aborted = 0, fatal = 0;

    for (const auto& r : results) {
        files.push_back(to_json(r));
        total += r.report.total_lines;
        kept += r.report.kept;
        removed += r.report.removed;
        anonymized += r.report.anonymized;
        malformed += r.report.malformed;
        switch (r.status) {
            case RunStatus::SUCCESS:  ++succeeded; break;
            case RunStatus::ABORTED:  ++aborted; break;
            case RunStatus::FATAL_IO: ++fatal; break;
        }
    }

    return {
        {"files", std::move(files)},
        {"summary", {
            {"files", results.size()},
            {"succeeded", succeeded},
            {"aborted", aborted},
            {"fatal_io", fatal},
            {"total_lines", total},
            {"kept", kept},
            {"removed", removed},
            {"anonymized", anonymized},
            {"malformed", malformed},
        }},
    };
}

std::string ReportSerializer::serialize(const std::vector<RunResult>& results, int indent) {
    // Raw log lines are not guaranteed to be valid UTF-8
    return to_json(results).dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace logcleaner

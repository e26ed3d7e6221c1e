#include "advgate/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using namespace advgate::pipeline;

json pattern_to_json(const DangerousPattern& pattern) {
    return json{
        {"line", pattern.line_number},
        {"type", std::string{to_string(pattern.pattern_type)}},
        {"severity", std::string{to_string(pattern.severity)}},
        {"description", pattern.description},
        {"snippet", pattern.code_snippet},
    };
}

json failure_to_json(const TestFailure& failure) {
    json out{
        {"test_name", failure.test_name},
        {"claim_violated", failure.claim_violated},
        {"error_type", failure.error_type},
        {"error_message", failure.error_message},
    };
    out["trace"] = failure.trace ? json(*failure.trace) : json(nullptr);
    return out;
}

json status_to_json(const WorkflowStatus& status) {
    json out{{"tag", std::string{status_name(status)}}};
    std::visit(
        [&out](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, status::FailedTimeout> ||
                          std::is_same_v<T, status::BlockedDangerousScript>) {
                out["stage"] = std::string{to_string(value.stage)};
            } else if constexpr (std::is_same_v<T, status::FailedImport>) {
                out["module"] = value.module;
            } else if constexpr (std::is_same_v<T, status::FailedAdversarial>) {
                out["cause"] = value.cause == status::FailedAdversarial::Cause::Generation ? "generation" : "tests";
            }
        },
        status);
    return out;
}

json optional_usd(const std::optional<Usd>& value) {
    return value ? json(value->to_string()) : json(nullptr);
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
    if (!output) {
        throw std::runtime_error("Failed to write output file: " + destination.string());
    }
}

}  // namespace

namespace advgate::pipeline {

json ReportWriter::to_json(const WorkflowResult& result) {
    json report{
        {"run_id", result.run_id},
        {"status", status_to_json(result.status)},
        {"exit_code", exit_code_for(result.status)},
        {"message", result.message},
        {"captured_stderr", result.captured_stderr},
        {"failures", json::array()},
        {"blocked_patterns", json::array()},
        {"warnings", result.warnings},
        {"cost_usd", optional_usd(result.cost)},
        {"estimated_cost_usd", optional_usd(result.estimated_cost)},
        {"stages", json::array()},
    };
    for (const auto& failure : result.failures) {
        report["failures"].push_back(failure_to_json(failure));
    }
    for (const auto& pattern : result.blocked_patterns) {
        report["blocked_patterns"].push_back(pattern_to_json(pattern));
    }
    for (const auto& stage : result.stages) {
        report["stages"].push_back(json{{"name", stage.name}, {"duration_ms", stage.duration.count()}});
    }
    if (!result.dry_run_preview.empty()) {
        report["dry_run_preview"] = result.dry_run_preview;
    }
    return report;
}

std::string ReportWriter::render_html(const WorkflowResult& result) {
    const std::string tag{status_name(result.status)};
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>Adversarial Verification Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << "pre{background:#f8f8f8;padding:0.5rem;overflow-x:auto;}"
        << ".ok{color:#0a7c2f;font-weight:bold;}"
        << ".fail{color:#c1121f;font-weight:bold;}"
        << ".blocked{color:#ff8800;font-weight:bold;}"
        << "</style></head><body>";

    const auto code = exit_code_for(result.status);
    const char* css = code == 0 ? "ok" : (code == 2 ? "blocked" : "fail");
    oss << "<h1>Adversarial Verification Report</h1>";
    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Run: " << escape_html(result.run_id) << "</li>";
    oss << "<li>Status: <span class=\"" << css << "\">" << escape_html(tag) << "</span></li>";
    oss << "<li>Message: " << escape_html(result.message) << "</li>";
    oss << "<li>Cost: " << (result.cost ? escape_html(result.cost->to_string()) : "n/a") << " USD</li>";
    if (result.estimated_cost) {
        oss << "<li>Estimated cost: " << escape_html(result.estimated_cost->to_string()) << " USD</li>";
    }
    oss << "</ul></section>";

    if (!result.warnings.empty()) {
        oss << "<section><h2>Warnings</h2><ul>";
        for (const auto& warning : result.warnings) {
            oss << "<li>" << escape_html(warning) << "</li>";
        }
        oss << "</ul></section>";
    }

    if (!result.blocked_patterns.empty()) {
        oss << "<section><h2>Blocked patterns</h2><table><thead><tr>"
            << "<th>Line</th><th>Type</th><th>Severity</th><th>Description</th><th>Code</th>"
            << "</tr></thead><tbody>";
        for (const auto& pattern : result.blocked_patterns) {
            oss << "<tr><td>" << pattern.line_number << "</td>"
                << "<td>" << to_string(pattern.pattern_type) << "</td>"
                << "<td>" << to_string(pattern.severity) << "</td>"
                << "<td>" << escape_html(pattern.description) << "</td>"
                << "<td><code>" << escape_html(pattern.code_snippet) << "</code></td></tr>";
        }
        oss << "</tbody></table></section>";
    }

    if (!result.failures.empty()) {
        oss << "<section><h2>Failures</h2><table><thead><tr>"
            << "<th>#</th><th>Test</th><th>Claim</th><th>Error</th><th>Trace</th>"
            << "</tr></thead><tbody>";
        for (std::size_t index = 0; index < result.failures.size(); ++index) {
            const auto& failure = result.failures[index];
            oss << "<tr><td>" << (index + 1) << "</td>"
                << "<td>" << escape_html(failure.test_name) << "</td>"
                << "<td>" << escape_html(failure.claim_violated) << "</td>"
                << "<td><strong>" << escape_html(failure.error_type) << "</strong> "
                << escape_html(failure.error_message) << "</td>"
                << "<td>" << (failure.trace ? "<pre>" + escape_html(*failure.trace) + "</pre>" : std::string{})
                << "</td></tr>";
        }
        oss << "</tbody></table></section>";
    }

    if (!result.stages.empty()) {
        oss << "<section><h2>Stages</h2><table><thead><tr><th>Stage</th><th>Duration (ms)</th></tr></thead><tbody>";
        for (const auto& stage : result.stages) {
            oss << "<tr><td>" << escape_html(stage.name) << "</td><td>" << stage.duration.count() << "</td></tr>";
        }
        oss << "</tbody></table></section>";
    }

    if (!result.captured_stderr.empty()) {
        oss << "<section><h2>Captured stderr</h2><pre>" << escape_html(result.captured_stderr) << "</pre></section>";
    }
    if (!result.dry_run_preview.empty()) {
        oss << "<section><h2>Dry-run preview</h2><pre>" << escape_html(result.dry_run_preview) << "</pre></section>";
    }

    oss << "</body></html>";
    return oss.str();
}

void ReportWriter::write_json(const std::filesystem::path& destination, const WorkflowResult& result) const {
    write_file(destination, to_json(result).dump(2));
}

void ReportWriter::write_html(const std::filesystem::path& destination, const WorkflowResult& result) const {
    write_file(destination, render_html(result));
}

}  // namespace advgate::pipeline

/**
 * @file test_report_writer.cpp
 * @brief JSON and HTML reports for a finished run
 */

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "advgate/report_writer.hpp"
#include "test_support.hpp"

using advgate::pipeline::DangerousPattern;
using advgate::pipeline::PatternType;
using advgate::pipeline::ReportWriter;
using advgate::pipeline::Severity;
using advgate::pipeline::Stage;
using advgate::pipeline::StageTiming;
using advgate::pipeline::TestFailure;
using advgate::pipeline::Usd;
using advgate::pipeline::WorkflowResult;
namespace status = advgate::pipeline::status;

static WorkflowResult failed_result()
{
    WorkflowResult result;
    result.run_id = "run-42";
    result.status = status::FailedAdversarial{status::FailedAdversarial::Cause::Tests};
    result.message = "1 adversarial test(s) failed";
    result.captured_stderr = "warning: <deprecated>\n";
    TestFailure failure;
    failure.test_name = "test_sorted";
    failure.claim_violated = "returns a sorted list";
    failure.error_type = "AssertionError";
    failure.error_message = "assert [2, 1] == [1, 2]";
    failure.trace = "E   assert [2, 1] == [1, 2]\n";
    result.failures.push_back(failure);
    result.warnings.push_back("allowed by --allow-dangerous");
    result.cost = Usd::parse("0.061740");
    result.estimated_cost = Usd::parse("0.061740");
    result.stages.push_back(StageTiming{"verification", std::chrono::milliseconds{120}});
    return result;
}

TEST_CASE("JSON report carries the full result", "[report][json]")
{
    const auto doc = ReportWriter::to_json(failed_result());

    CHECK(doc["run_id"] == "run-42");
    CHECK(doc["status"]["tag"] == "FailedAdversarial");
    CHECK(doc["status"]["cause"] == "tests");
    CHECK(doc["exit_code"] == 1);
    CHECK(doc["cost_usd"] == "0.061740");
    REQUIRE(doc["failures"].size() == 1);
    CHECK(doc["failures"][0]["claim_violated"] == "returns a sorted list");
    CHECK(doc["failures"][0]["trace"] == "E   assert [2, 1] == [1, 2]\n");
    CHECK(doc["blocked_patterns"].empty());
    CHECK(doc["warnings"][0] == "allowed by --allow-dangerous");
    CHECK(doc["stages"][0]["name"] == "verification");
    CHECK(doc["stages"][0]["duration_ms"] == 120);
    CHECK_FALSE(doc.contains("dry_run_preview"));
}

TEST_CASE("JSON report names the stage and blocked patterns", "[report][json]")
{
    WorkflowResult result;
    result.run_id = "run-blocked";
    result.status = status::BlockedDangerousScript{Stage::Verification};
    DangerousPattern pattern;
    pattern.line_number = 2;
    pattern.pattern_type = PatternType::NetworkAccess;
    pattern.severity = Severity::Critical;
    pattern.description = "network client 'curl'";
    pattern.code_snippet = "curl http://x.example";
    result.blocked_patterns.push_back(pattern);

    const auto doc = ReportWriter::to_json(result);
    CHECK(doc["status"]["stage"] == "Verification");
    CHECK(doc["exit_code"] == 2);
    CHECK(doc["cost_usd"].is_null());
    REQUIRE(doc["blocked_patterns"].size() == 1);
    CHECK(doc["blocked_patterns"][0]["line"] == 2);
    CHECK(doc["blocked_patterns"][0]["type"] == "NetworkAccess");
    CHECK(doc["blocked_patterns"][0]["severity"] == "Critical");

    WorkflowResult timeout;
    timeout.status = status::FailedTimeout{Stage::Adversarial};
    CHECK(ReportWriter::to_json(timeout)["status"]["stage"] == "Adversarial");

    WorkflowResult missing;
    missing.status = status::FailedImport{"foo"};
    CHECK(ReportWriter::to_json(missing)["status"]["module"] == "foo");
}

TEST_CASE("HTML report escapes captured text", "[report][html]")
{
    const auto html = ReportWriter::render_html(failed_result());
    CHECK(html.find("<!DOCTYPE html>") == 0);
    CHECK(html.find("FailedAdversarial") != std::string::npos);
    CHECK(html.find("&lt;deprecated&gt;") != std::string::npos);
    CHECK(html.find("<deprecated>") == std::string::npos);
    CHECK(html.find("test_sorted") != std::string::npos);
}

TEST_CASE("Reports are written to disk", "[report][file]")
{
    advgate::test::TempDir dir("advgate_report");
    ReportWriter writer;

    const auto json_path = dir.path() / "out" / "result.json";
    writer.write_json(json_path, failed_result());
    const auto parsed = nlohmann::json::parse(advgate::test::read_all(json_path));
    CHECK(parsed["run_id"] == "run-42");

    const auto html_path = dir.path() / "report.html";
    writer.write_html(html_path, failed_result());
    CHECK(advgate::test::read_all(html_path).find("</html>") != std::string::npos);

    const auto blocker = dir.write("file", "x");
    CHECK_THROWS_AS(writer.write_json(blocker / "result.json", failed_result()), std::exception);
}

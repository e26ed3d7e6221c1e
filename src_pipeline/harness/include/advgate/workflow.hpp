#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "script_scanner.hpp"
#include "usd.hpp"

namespace advgate::pipeline {

/**
 * \brief One adversarial test that did not hold.
 *
 * Produced only by parsing the adversarial run output; `claim_violated` is the
 * claim text the failing test was written against (empty when the generated
 * test carried no claim tag).
 */
struct TestFailure {
    std::string test_name;
    std::string claim_violated;
    std::string error_type;
    std::string error_message;
    std::optional<std::string> trace;
};

enum class Stage { Verification, Adversarial };

[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

// Terminal outcomes. Each variant carries only what its outcome needs.
namespace status {

struct Pass {};
struct DryRun {};
struct Cancelled {};
struct FailedVerification {};
struct FailedImport {
    std::string module;
};
struct FailedAdversarial {
    enum class Cause { Generation, Tests };
    Cause cause{Cause::Tests};
};
struct FailedTimeout {
    Stage stage{Stage::Verification};
};
struct BlockedDangerousScript {
    Stage stage{Stage::Verification};
};
struct BlockedDangerousOperation {};

}  // namespace status

using WorkflowStatus = std::variant<status::Pass,
                                    status::DryRun,
                                    status::Cancelled,
                                    status::FailedVerification,
                                    status::FailedImport,
                                    status::FailedAdversarial,
                                    status::FailedTimeout,
                                    status::BlockedDangerousScript,
                                    status::BlockedDangerousOperation>;

/// Stable tag used in reports, the ledger and log lines (e.g. "FailedTimeout").
[[nodiscard]] std::string_view status_name(const WorkflowStatus& status) noexcept;

/// Process exit code: 0 Pass/DryRun, 1 Failed*, 2 Blocked*, 3 Cancelled.
[[nodiscard]] int exit_code_for(const WorkflowStatus& status) noexcept;

[[nodiscard]] bool is_success(const WorkflowStatus& status) noexcept;

struct StageTiming {
    std::string name;
    std::chrono::milliseconds duration{0};
};

/**
 * \brief Outcome of one pipeline run.
 *
 * Owned by the pipeline while the run executes and handed out once at the end.
 * `status` is set exactly once, by the transition into a terminal state.
 */
struct WorkflowResult {
    std::string run_id;
    WorkflowStatus status{status::Pass{}};
    std::string message;
    std::string captured_stderr;
    std::vector<TestFailure> failures;
    std::vector<DangerousPattern> blocked_patterns;
    std::vector<std::string> warnings;
    std::optional<Usd> cost;
    std::optional<Usd> estimated_cost;
    std::string dry_run_preview;
    std::vector<StageTiming> stages;
};

}  // namespace advgate::pipeline

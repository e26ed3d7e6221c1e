#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "agent.hpp"
#include "confirmation.hpp"
#include "cost_ledger.hpp"
#include "generation_client.hpp"
#include "policy_loader.hpp"
#include "sandbox.hpp"
#include "script_scanner.hpp"
#include "workflow.hpp"

namespace advgate::pipeline {

struct RunRequest {
    std::string run_id;
    std::filesystem::path verification_script;
    std::vector<SourceFile> files;
    std::vector<std::string> claims;
    std::filesystem::path workspace;
    bool dry_run{false};
    bool allow_network{false};
    bool allow_dangerous{false};
};

/**
 * \brief Adversarial verification state machine.
 *
 * Stages run strictly in order on the calling thread:
 * preflight, scan of the verification script, confirmation, sandboxed
 * verification run, failure triage, budget check, adversarial generation,
 * scan of the generated module, sandboxed adversarial run and result parsing.
 * Each stage either advances or ends the run with exactly one WorkflowStatus.
 *
 * Every run, including one aborted by SandboxSetupError, appends exactly one
 * ledger row before `run` returns or rethrows.
 */
class Pipeline {
public:
    struct Collaborators {
        std::shared_ptr<SandboxRunner> sandbox;
        std::shared_ptr<ConfirmationGate> confirmation;
        std::shared_ptr<AgentInvoker> agent;
        std::shared_ptr<LedgerSink> ledger;
    };

    Pipeline(Policy policy, Collaborators collaborators);

    /// Throws SandboxSetupError when isolation cannot be established and
    /// std::runtime_error when an input file cannot be read.
    [[nodiscard]] WorkflowResult run(const RunRequest& request);

    [[nodiscard]] const Policy& policy() const noexcept { return policy_; }

    /// Sandbox settings for one stage, built fresh on every call.
    [[nodiscard]] SandboxConfig sandbox_config(Stage stage,
                                               const RunRequest& request,
                                               const std::filesystem::path& script) const;

private:
    class Run;

    Policy policy_;
    Collaborators collaborators_;
    ScriptScanner scanner_;
    CostEstimator estimator_;
    CostLedger ledger_;
    GenerationClient generator_;
};

}  // namespace advgate::pipeline

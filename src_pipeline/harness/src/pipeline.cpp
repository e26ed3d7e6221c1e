#include "advgate/pipeline.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "advgate/failure_triage.hpp"

namespace fs = std::filesystem;

namespace advgate::pipeline {

namespace {

constexpr std::array<std::string_view, 12> kSystemDirectories{{
    "bin", "boot", "dev", "etc", "lib", "lib64", "proc", "root", "sbin", "sys", "usr", "var",
}};

std::string read_text(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open file: " + path.string());
    }
    std::ostringstream ss;
    ss << input.rdbuf();
    return ss.str();
}

std::string join(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& word : words) {
        if (!out.empty()) {
            out += ' ';
        }
        out += word;
    }
    return out;
}

std::string describe(const DangerousPattern& pattern) {
    return "line " + std::to_string(pattern.line_number) + " [" + std::string{to_string(pattern.severity)} + " " +
           std::string{to_string(pattern.pattern_type)} + "] " + pattern.description + ": " + pattern.code_snippet;
}

std::string sanitize_for_filename(std::string_view run_id) {
    std::string out;
    for (char ch : run_id) {
        const bool safe = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
                          ch == '-' || ch == '_';
        out.push_back(safe ? ch : '_');
    }
    return out.empty() ? "run" : out;
}

/// Host-owned 0700 directory outside the workspace, removed with its contents.
class PrivateDirectory {
public:
    explicit PrivateDirectory(std::string_view run_id) {
        auto pattern = (fs::temp_directory_path() / ("advgate-" + sanitize_for_filename(run_id) + "-XXXXXX")).string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("Unable to create private directory " + pattern + ": " + std::strerror(errno));
        }
        path_ = pattern;
    }

    ~PrivateDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            spdlog::warn("failed to remove private directory {}: {}", path_.string(), ec.message());
        }
    }

    PrivateDirectory(const PrivateDirectory&) = delete;
    PrivateDirectory& operator=(const PrivateDirectory&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

/// Creates `path` exclusively, never through a symlink, and writes `content` to it.
void write_exclusive(const fs::path& path, const std::string& content) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0400);
    if (fd < 0) {
        throw std::runtime_error("Unable to create " + path.string() + ": " + std::strerror(errno));
    }
    std::size_t offset = 0;
    while (offset < content.size()) {
        const auto written = ::write(fd, content.data() + offset, content.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int write_errno = errno;
            ::close(fd);
            throw std::runtime_error("Failed to write " + path.string() + ": " + std::strerror(write_errno));
        }
        offset += static_cast<std::size_t>(written);
    }
    if (::close(fd) != 0) {
        throw std::runtime_error("Failed to close " + path.string() + ": " + std::strerror(errno));
    }
}

/// Reason to refuse the whole operation, if any.
std::optional<std::string> refused_operation(const RunRequest& request) {
    if (request.allow_network && !request.allow_dangerous) {
        return "--allow-network requires --allow-dangerous";
    }
    std::error_code ec;
    if (request.workspace.empty() || !fs::exists(request.workspace, ec)) {
        return "workspace does not exist: " + request.workspace.string();
    }
    if (!fs::is_directory(request.workspace, ec)) {
        return "workspace is not a directory: " + request.workspace.string();
    }
    const auto workspace = fs::canonical(request.workspace, ec);
    if (ec) {
        return "workspace cannot be resolved: " + request.workspace.string();
    }
    if (workspace == workspace.root_path()) {
        return "refusing to use the filesystem root as workspace";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        const auto home_path = fs::weakly_canonical(home, ec);
        if (!ec && workspace == home_path) {
            return "refusing to use the home directory as workspace: " + workspace.string();
        }
    }
    if (workspace.parent_path() == workspace.root_path()) {
        const auto name = workspace.filename().string();
        if (std::find(kSystemDirectories.begin(), kSystemDirectories.end(), name) != kSystemDirectories.end()) {
            return "refusing to use system directory as workspace: " + workspace.string();
        }
    }
    return std::nullopt;
}

class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace

// One execution of the state machine. Owns the WorkflowResult until it is returned.
class Pipeline::Run {
public:
    Run(Pipeline& owner, const RunRequest& request) : owner_(owner), request_(request) {
        result_.run_id = request.run_id;
    }

    WorkflowResult execute() {
        try {
            advance();
        } catch (const SandboxSetupError& ex) {
            spdlog::critical("[{}] isolation setup failed: {}", request_.run_id, ex.what());
            record("Aborted");
            throw;
        } catch (const std::exception& ex) {
            spdlog::error("[{}] run aborted: {}", request_.run_id, ex.what());
            record("Aborted");
            throw;
        }
        record(std::string{status_name(result_.status)});
        spdlog::info("[{}] finished: {} ({})", request_.run_id, status_name(result_.status), result_.message);
        return std::move(result_);
    }

private:
    void advance() {
        if (!preflight()) {
            return;
        }
        if (request_.dry_run) {
            dry_run();
            return;
        }
        if (!scan_verification()) {
            return;
        }
        if (!confirm()) {
            return;
        }
        if (!run_verification()) {
            return;
        }
        if (!check_budget()) {
            return;
        }
        std::string test_code;
        if (!generate(test_code)) {
            return;
        }
        const auto test_path = write_adversarial(test_code);
        if (!scan_adversarial(test_path)) {
            return;
        }
        run_adversarial(test_path, test_code);
    }

    void finish(WorkflowStatus status, std::string message) {
        result_.status = std::move(status);
        result_.message = std::move(message);
        if (!result_.cost) {
            result_.cost = Usd{};
        }
    }

    void time_stage(std::string name, const Stopwatch& watch) {
        result_.stages.push_back(StageTiming{std::move(name), watch.elapsed()});
    }

    void warn(std::string text) {
        spdlog::warn("[{}] {}", request_.run_id, text);
        result_.warnings.push_back(std::move(text));
    }

    bool preflight() {
        Stopwatch watch;
        spdlog::info("[{}] stage: preflight", request_.run_id);
        const auto refusal = refused_operation(request_);
        time_stage("preflight", watch);
        if (refusal) {
            finish(status::BlockedDangerousOperation{}, "Operation refused: " + *refusal);
            return false;
        }
        if (owner_.policy_.isolation == Isolation::ProcessOnly) {
            warn("sandbox isolation is process-only: filesystem and network are not namespaced");
        }
        return true;
    }

    Usd estimate() {
        if (!estimate_) {
            estimate_ = owner_.estimator_.estimate(request_.files, request_.claims, GenerationClient::system_prompt());
            result_.estimated_cost = estimate_;
        }
        return *estimate_;
    }

    std::string preview(const std::string& script_text) {
        const auto& policy = owner_.policy_;
        const auto verification = owner_.sandbox_config(Stage::Verification, request_, request_.verification_script);
        std::ostringstream os;
        os << "Run " << request_.run_id << "\n";
        os << "Workspace: " << request_.workspace.string() << "\n";
        os << "Sandbox: memory " << (verification.memory_limit / (1024 * 1024)) << " MiB, " << verification.cpu_limit
           << " CPU(s), network " << (verification.network_enabled ? "ENABLED" : "disabled") << ", isolation "
           << (verification.isolation == Isolation::Namespaces ? "namespaces" : "process-only") << "\n";
        os << "Verification: " << join(verification.interpreter) << " " << request_.verification_script.string()
           << " (timeout " << policy.verification_timeout_seconds << "s)\n";
        os << "Adversarial: " << join(policy.adversarial_runner) << " <generated tests> (timeout "
           << policy.adversarial_timeout_seconds << "s)\n";
        os << "Estimated Testing Agent cost: $" << estimate().to_string() << " (budget: "
           << (policy.max_cost ? "$" + policy.max_cost->to_string() : std::string{"none"}) << ")\n";
        os << "Files:\n";
        for (const auto& file : request_.files) {
            os << "  - " << file.path.string() << " (" << file.content.size() << " bytes)\n";
        }
        os << "Claims:\n";
        for (std::size_t i = 0; i < request_.claims.size(); ++i) {
            os << "  " << (i + 1) << ". " << request_.claims[i] << "\n";
        }
        os << "--- verification script: " << request_.verification_script.string() << " ---\n";
        os << script_text;
        if (!script_text.empty() && script_text.back() != '\n') {
            os << "\n";
        }
        os << "--- end of verification script ---\n";
        return os.str();
    }

    void dry_run() {
        Stopwatch watch;
        spdlog::info("[{}] stage: dry run", request_.run_id);
        const auto script_text = read_text(request_.verification_script);
        auto text = preview(script_text);
        const auto scan = owner_.scanner_.scan(request_.verification_script);
        text += scan.is_safe ? "Static scan: no blocking patterns\n" : "Static scan: BLOCKING patterns found\n";
        for (const auto& pattern : scan.patterns) {
            text += "  " + describe(pattern) + "\n";
        }
        if (owner_.policy_.max_cost && estimate() > *owner_.policy_.max_cost) {
            text += "Adversarial stage would be skipped: estimate exceeds budget\n";
        }
        result_.dry_run_preview = std::move(text);
        time_stage("dry_run", watch);
        finish(status::DryRun{}, "Dry run: nothing was executed");
    }

    // Returns false when the scan blocks the run.
    bool gate_scan(const ScanResult& scan, Stage stage) {
        for (const auto& recommendation : scan.recommendations) {
            spdlog::info("[{}] advisory: {}", request_.run_id, recommendation);
        }
        if (scan.is_safe) {
            return true;
        }
        const auto blocking = scan.blocking_patterns();
        if (request_.allow_dangerous) {
            for (const auto& pattern : blocking) {
                warn("allowed by --allow-dangerous (" + std::string{to_string(stage)} + "): " + describe(pattern));
            }
            return true;
        }
        result_.blocked_patterns = blocking;
        finish(status::BlockedDangerousScript{stage},
               std::to_string(blocking.size()) + " dangerous pattern(s) in the " +
                   (stage == Stage::Verification ? "verification script" : "generated adversarial tests") +
                   "; first: " + describe(blocking.front()));
        return false;
    }

    bool scan_verification() {
        Stopwatch watch;
        spdlog::info("[{}] stage: scan verification script {}", request_.run_id,
                     request_.verification_script.string());
        const auto scan = owner_.scanner_.scan(request_.verification_script);
        time_stage("scan_verification", watch);
        return gate_scan(scan, Stage::Verification);
    }

    bool confirm() {
        Stopwatch watch;
        spdlog::info("[{}] stage: confirmation", request_.run_id);
        const auto& gate = owner_.collaborators_.confirmation;
        const bool approved = gate && gate->confirm(preview(read_text(request_.verification_script)));
        time_stage("confirmation", watch);
        if (!approved) {
            finish(status::Cancelled{}, "Execution declined at confirmation");
            return false;
        }
        return true;
    }

    SandboxRun execute_in_sandbox(Stage stage, const fs::path& script, std::string stage_name) {
        if (!owner_.collaborators_.sandbox) {
            throw SandboxSetupError("No sandbox runner available");
        }
        const auto config = owner_.sandbox_config(stage, request_, script);
        Stopwatch watch;
        auto run = owner_.collaborators_.sandbox->run(script, config);
        time_stage(std::move(stage_name), watch);
        return run;
    }

    bool run_verification() {
        spdlog::info("[{}] stage: verification run", request_.run_id);
        const auto run = execute_in_sandbox(Stage::Verification, request_.verification_script, "verification");
        result_.captured_stderr = run.stderr_text;
        if (run.timed_out) {
            finish(status::FailedTimeout{Stage::Verification},
                   "Verification exceeded " + std::to_string(owner_.policy_.verification_timeout_seconds) +
                       "s and was killed");
            return false;
        }
        if (run.exit_code != 0) {
            auto module = find_import_failure(run.stderr_text);
            if (!module) {
                module = find_import_failure(run.stdout_text);
            }
            if (module) {
                finish(status::FailedImport{*module},
                       "Verification failed to import module '" + *module + "'");
            } else {
                if (result_.captured_stderr.empty()) {
                    result_.captured_stderr = run.stdout_text;
                }
                finish(status::FailedVerification{},
                       "Verification script exited with status " + std::to_string(run.exit_code));
            }
            return false;
        }
        return true;
    }

    bool check_budget() {
        Stopwatch watch;
        spdlog::info("[{}] stage: budget check", request_.run_id);
        const auto cost = estimate();
        time_stage("budget", watch);
        const auto& limit = owner_.policy_.max_cost;
        if (limit && cost > *limit) {
            warn("adversarial testing skipped: estimated cost $" + cost.to_string() + " exceeds budget $" +
                 limit->to_string());
            result_.cost = Usd{};
            finish(status::Pass{}, "Verification passed; adversarial testing skipped for budget");
            return false;
        }
        return true;
    }

    bool generate(std::string& test_code) {
        Stopwatch watch;
        const auto attempts = std::max(1U, owner_.policy_.generation_max_attempts);
        std::string last_error;
        for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
            spdlog::info("[{}] stage: adversarial generation (attempt {}/{})", request_.run_id, attempt, attempts);
            ++generation_calls_;
            try {
                test_code = owner_.generator_.generate(request_.files, request_.claims);
                result_.cost = spent();
                time_stage("generation", watch);
                return true;
            } catch (const GenerationError& ex) {
                last_error = ex.what();
                spdlog::warn("[{}] generation attempt {} failed: {}", request_.run_id, attempt, last_error);
            }
        }
        result_.cost = spent();
        time_stage("generation", watch);
        finish(status::FailedAdversarial{status::FailedAdversarial::Cause::Generation},
               "Adversarial test generation failed: " + last_error);
        return false;
    }

    Usd spent() {
        return Usd::from_micros(estimate().micros * static_cast<std::int64_t>(generation_calls_));
    }

    // Tests live outside the workspace, in a directory only the host writes.
    fs::path write_adversarial(const std::string& test_code) {
        private_dir_.emplace(request_.run_id);
        const auto path = private_dir_->path() / ("test_adversarial_" + sanitize_for_filename(request_.run_id) + ".py");
        write_exclusive(path, test_code);
        spdlog::debug("[{}] adversarial tests written to {}", request_.run_id, path.string());
        return path;
    }

    bool scan_adversarial(const fs::path& test_path) {
        Stopwatch watch;
        spdlog::info("[{}] stage: scan adversarial tests {}", request_.run_id, test_path.string());
        const auto scan = owner_.scanner_.scan(test_path, ScriptLanguage::Python);
        time_stage("scan_adversarial", watch);
        if (gate_scan(scan, Stage::Adversarial)) {
            return true;
        }
        std::error_code ec;
        fs::remove(test_path, ec);
        if (ec) {
            spdlog::error("[{}] failed to remove blocked tests {}: {}", request_.run_id, test_path.string(),
                          ec.message());
        }
        return false;
    }

    void run_adversarial(const fs::path& test_path, const std::string& test_code) {
        spdlog::info("[{}] stage: adversarial run", request_.run_id);
        if (read_text(test_path) != test_code) {
            throw std::runtime_error("Adversarial tests changed after scanning: " + test_path.string());
        }
        const auto run = execute_in_sandbox(Stage::Adversarial, test_path, "adversarial");
        result_.captured_stderr = run.stderr_text;
        if (run.timed_out) {
            finish(status::FailedTimeout{Stage::Adversarial},
                   "Adversarial tests exceeded " + std::to_string(owner_.policy_.adversarial_timeout_seconds) +
                       "s and were killed");
            return;
        }
        auto failures =
            parse_adversarial_output(run.stdout_text + "\n" + run.stderr_text, run.exit_code, test_code, request_.claims);
        if (!failures.empty()) {
            const auto count = failures.size();
            result_.failures = std::move(failures);
            finish(status::FailedAdversarial{status::FailedAdversarial::Cause::Tests},
                   std::to_string(count) + " adversarial test(s) failed");
            return;
        }
        finish(status::Pass{}, "Verification and adversarial tests passed");
    }

    void record(const std::string& status) {
        LedgerEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.run_id = request_.run_id;
        entry.estimated = estimate_.value_or(Usd{});
        entry.actual = generation_calls_ > 0 ? spent() : Usd{};
        entry.status = status;
        owner_.ledger_.record(entry);
    }

    Pipeline& owner_;
    const RunRequest& request_;
    WorkflowResult result_;
    std::optional<Usd> estimate_;
    unsigned generation_calls_{0};
    std::optional<PrivateDirectory> private_dir_;
};

Pipeline::Pipeline(Policy policy, Collaborators collaborators)
    : policy_(std::move(policy)),
      collaborators_(std::move(collaborators)),
      estimator_(policy_.prices),
      ledger_(collaborators_.ledger),
      generator_(collaborators_.agent) {}

SandboxConfig Pipeline::sandbox_config(Stage stage, const RunRequest& request, const fs::path& script) const {
    SandboxConfig config;
    config.memory_limit = policy_.memory_limit;
    config.cpu_limit = policy_.cpu_limit;
    config.network_enabled = policy_.network_enabled || (request.allow_network && request.allow_dangerous);
    config.workspace_path = request.workspace;
    config.isolation = policy_.isolation;
    config.max_output_bytes = policy_.max_output_bytes;
    if (stage == Stage::Verification) {
        config.timeout_seconds = policy_.verification_timeout_seconds;
        if (!policy_.verification_runner.empty()) {
            config.interpreter = policy_.verification_runner;
        } else {
            std::string head;
            if (std::ifstream input(script, std::ios::binary); input.is_open()) {
                std::getline(input, head);
            }
            const auto language = ScriptScanner::detect_language(script, head);
            config.interpreter = language == ScriptLanguage::Python ? std::vector<std::string>{"python3"}
                                                                    : std::vector<std::string>{"/bin/sh"};
        }
    } else {
        config.timeout_seconds = policy_.adversarial_timeout_seconds;
        config.interpreter = policy_.adversarial_runner;
    }
    return config;
}

WorkflowResult Pipeline::run(const RunRequest& request) {
    spdlog::info("[{}] starting adversarial verification of {}", request.run_id, request.verification_script.string());
    return Run{*this, request}.execute();
}

}  // namespace advgate::pipeline

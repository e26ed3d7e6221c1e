#include <unistd.h>

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "advgate/command_agent.hpp"
#include "advgate/confirmation.hpp"
#include "advgate/cost_ledger.hpp"
#include "advgate/linux_sandbox.hpp"
#include "advgate/pipeline.hpp"
#include "advgate/policy_loader.hpp"
#include "advgate/report_writer.hpp"

namespace fs = std::filesystem;

using advgate::pipeline::Isolation;
using advgate::pipeline::Pipeline;
using advgate::pipeline::Policy;
using advgate::pipeline::PolicyLoader;
using advgate::pipeline::ReportWriter;
using advgate::pipeline::RunRequest;
using advgate::pipeline::SandboxSetupError;
using advgate::pipeline::SourceFile;
using advgate::pipeline::Usd;
using advgate::pipeline::WorkflowResult;

namespace {

constexpr int kExitUsage = 4;
constexpr int kExitInternal = 5;

struct Args {
    fs::path script;
    std::vector<fs::path> files;
    std::vector<std::string> claims;
    std::vector<fs::path> claims_files;
    fs::path workspace;
    std::string run_id;
    fs::path config;
    fs::path output;
    fs::path html;
    fs::path ledger;
    std::optional<int> timeout_seconds;
    std::optional<Usd> max_cost;
    bool dry_run{false};
    bool auto_confirm{false};
    bool allow_network{false};
    bool allow_dangerous{false};
    bool no_namespaces{false};
    bool verbose{false};
    bool quiet{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Adversarial verification gate\n"
        << "Usage:\n"
        << "  " << argv0 << " --script <path> [--file <path> ...] [--claim <text> ...] [--claims-file <path>]\n"
        << "                 [--workspace <dir>] [--run-id <id>] [--config <path>] [--dry-run] [--auto-confirm]\n"
        << "                 [--timeout <seconds>] [--max-cost <usd>] [--allow-network] [--allow-dangerous]\n"
        << "                 [--output <path>] [--html <path>] [--ledger <path>] [--no-namespaces]\n"
        << "                 [--verbose | --quiet]\n"
        << "\n"
        << "Options:\n"
        << "  --script          Verification script to scan and run (required).\n"
        << "  --file            Implementation file given to the Testing Agent (repeatable).\n"
        << "  --claim           Claim about the implementation (repeatable).\n"
        << "  --claims-file     One claim per line; '#' starts a comment.\n"
        << "  --workspace       Directory mounted writable in the sandbox (default: script directory).\n"
        << "  --run-id          Identifier for reports and the cost ledger (default: run-<utc>-<pid>).\n"
        << "  --config          Policy file with key=value settings.\n"
        << "  --dry-run         Print what would run and exit without executing anything.\n"
        << "  --auto-confirm    Skip the confirmation prompt.\n"
        << "  --timeout         Timeout in seconds for both sandboxed stages.\n"
        << "  --max-cost        Skip adversarial testing when the estimate exceeds this many USD.\n"
        << "  --allow-network   Give the sandbox network access (requires --allow-dangerous).\n"
        << "  --allow-dangerous Run even when the scanner reports blocking patterns.\n"
        << "  --output          Write the result as JSON, or as HTML for a .html path.\n"
        << "  --html            Write an HTML report to this path.\n"
        << "  --ledger          Cost ledger file, outside the workspace\n"
        << "                    (default: $XDG_STATE_HOME/advgate/cost-ledger.tsv).\n"
        << "  --no-namespaces   Process-only isolation for hosts without user namespaces.\n"
        << "  --verbose         Debug logging.\n"
        << "  --quiet           Warnings and errors only.\n"
        << "  -h, --help        Show this help message.\n"
        << "\n"
        << "Exit codes: 0 pass or dry run, 1 failed, 2 blocked, 3 cancelled, 4 usage error, 5 internal error.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::string take_value(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string{flag} + " expects a value");
    }
    return argv[++i];
}

int parse_seconds(const std::string& text) {
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != text.size() || value <= 0) {
        throw std::runtime_error("--timeout expects a positive number of seconds, got '" + text + "'");
    }
    return value;
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            return args;
        } else if (arg_eq(tok, "--script")) {
            args.script = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--file")) {
            args.files.emplace_back(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--claim")) {
            args.claims.push_back(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--claims-file")) {
            args.claims_files.emplace_back(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--workspace")) {
            args.workspace = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--run-id")) {
            args.run_id = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--config")) {
            args.config = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--output")) {
            args.output = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--html")) {
            args.html = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--ledger")) {
            args.ledger = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--timeout")) {
            args.timeout_seconds = parse_seconds(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--max-cost")) {
            args.max_cost = Usd::parse(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--dry-run")) {
            args.dry_run = true;
        } else if (arg_eq(tok, "--auto-confirm")) {
            args.auto_confirm = true;
        } else if (arg_eq(tok, "--allow-network")) {
            args.allow_network = true;
        } else if (arg_eq(tok, "--allow-dangerous")) {
            args.allow_dangerous = true;
        } else if (arg_eq(tok, "--no-namespaces")) {
            args.no_namespaces = true;
        } else if (arg_eq(tok, "--verbose")) {
            args.verbose = true;
        } else if (arg_eq(tok, "--quiet")) {
            args.quiet = true;
        } else {
            throw std::runtime_error("Unknown argument: " + std::string{tok});
        }
    }

    if (args.script.empty()) {
        throw std::runtime_error("--script is required");
    }
    if (args.verbose && args.quiet) {
        throw std::runtime_error("--verbose and --quiet are mutually exclusive");
    }
    if (args.workspace.empty()) {
        args.workspace = fs::absolute(args.script).parent_path();
    }
    return args;
}

void configure_logging(const Args& args) {
    auto logger = spdlog::stderr_color_mt("advgate");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to read " + path.string());
    }
    std::ostringstream ss;
    ss << input.rdbuf();
    return ss.str();
}

std::vector<std::string> read_claims_file(const fs::path& path) {
    std::istringstream lines(read_file(path));
    std::vector<std::string> claims;
    std::string line;
    while (std::getline(lines, line)) {
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        const auto last = line.find_last_not_of(" \t\r");
        claims.push_back(line.substr(first, last - first + 1));
    }
    return claims;
}

std::string default_run_id() {
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    ::gmtime_r(&now, &utc);
    char stamp[32] = {};
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%SZ", &utc);
    return "run-" + std::string{stamp} + "-" + std::to_string(::getpid());
}

Policy build_policy(const Args& args) {
    Policy policy;
    if (!args.config.empty()) {
        policy = PolicyLoader{}.load(args.config, policy);
    }
    if (args.timeout_seconds) {
        policy.verification_timeout_seconds = *args.timeout_seconds;
        policy.adversarial_timeout_seconds = *args.timeout_seconds;
    }
    if (args.max_cost) {
        policy.max_cost = args.max_cost;
    }
    if (!args.ledger.empty()) {
        policy.ledger_path = args.ledger;
    }
    if (args.no_namespaces) {
        policy.isolation = Isolation::ProcessOnly;
    }
    if (policy.isolation == Isolation::Namespaces &&
        !advgate::pipeline::sandbox::LinuxSandbox::user_namespaces_available()) {
        spdlog::warn("This host does not allow unprivileged user namespaces; rerun with --no-namespaces "
                     "or sandbox.isolation=process if that is acceptable");
    }
    return policy;
}

RunRequest build_request(const Args& args) {
    RunRequest request;
    request.run_id = args.run_id.empty() ? default_run_id() : args.run_id;
    request.verification_script = fs::absolute(args.script);
    if (!fs::is_regular_file(request.verification_script)) {
        throw std::runtime_error("Verification script not found: " + request.verification_script.string());
    }
    request.workspace = fs::absolute(args.workspace);
    for (const auto& path : args.files) {
        request.files.push_back(SourceFile{path, read_file(path)});
    }
    request.claims = args.claims;
    for (const auto& path : args.claims_files) {
        const auto more = read_claims_file(path);
        request.claims.insert(request.claims.end(), more.begin(), more.end());
    }
    request.dry_run = args.dry_run;
    request.allow_network = args.allow_network;
    request.allow_dangerous = args.allow_dangerous;
    return request;
}

void print_summary(const WorkflowResult& result) {
    using advgate::pipeline::exit_code_for;
    using advgate::pipeline::status_name;
    using advgate::pipeline::to_string;

    if (!result.dry_run_preview.empty()) {
        std::cout << result.dry_run_preview << "\n";
    }
    std::cout << "Adversarial Verification\n"
              << "  Run: " << result.run_id << "\n"
              << "  Status: " << status_name(result.status) << " (exit " << exit_code_for(result.status) << ")\n"
              << "  Message: " << result.message << "\n"
              << "  Cost: $" << (result.cost ? result.cost->to_string() : std::string{"0.000000"});
    if (result.estimated_cost) {
        std::cout << " (estimated $" << result.estimated_cost->to_string() << ")";
    }
    std::cout << "\n";
    for (const auto& warning : result.warnings) {
        std::cout << "  Warning: " << warning << "\n";
    }
    for (const auto& pattern : result.blocked_patterns) {
        std::cout << "  Blocked: line " << pattern.line_number << " [" << to_string(pattern.severity) << " "
                  << to_string(pattern.pattern_type) << "] " << pattern.description << ": " << pattern.code_snippet
                  << "\n";
    }
    for (const auto& failure : result.failures) {
        std::cout << "  Failed: " << failure.test_name;
        if (!failure.claim_violated.empty()) {
            std::cout << " (claim: " << failure.claim_violated << ")";
        }
        std::cout << " - " << failure.error_type;
        if (!failure.error_message.empty()) {
            std::cout << ": " << failure.error_message;
        }
        std::cout << "\n";
    }
}

void write_reports(const Args& args, const WorkflowResult& result) {
    ReportWriter writer;
    if (!args.output.empty()) {
        if (args.output.extension() == ".html") {
            writer.write_html(args.output, result);
        } else {
            writer.write_json(args.output, result);
        }
        std::cout << "  Report: " << args.output.string() << "\n";
    }
    if (!args.html.empty()) {
        writer.write_html(args.html, result);
        std::cout << "  HTML: " << args.html.string() << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    Args args;
    std::unique_ptr<Pipeline> pipeline;
    RunRequest request;
    try {
        args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }
        configure_logging(args);

        const auto policy = build_policy(args);
        request = build_request(args);
        PolicyLoader::check_ledger_location(policy, request.workspace);

        Pipeline::Collaborators collaborators;
        collaborators.sandbox = std::make_shared<advgate::pipeline::sandbox::LinuxSandbox>();
        collaborators.confirmation = advgate::pipeline::make_confirmation_gate(
            policy.confirm, args.auto_confirm, ::isatty(STDIN_FILENO) == 1, std::cout, STDIN_FILENO);
        advgate::pipeline::agent::CommandAgentInvoker::Config agent_cfg;
        agent_cfg.command = policy.agent_command;
        collaborators.agent = std::make_shared<advgate::pipeline::agent::CommandAgentInvoker>(agent_cfg);
        collaborators.ledger = std::make_shared<advgate::pipeline::TsvLedgerSink>(policy.ledger_path);
        pipeline = std::make_unique<Pipeline>(policy, std::move(collaborators));
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return kExitUsage;
    }

    std::optional<WorkflowResult> result;
    try {
        result = pipeline->run(request);
    } catch (const SandboxSetupError& ex) {
        std::cerr << "ERROR: isolation setup failed: " << ex.what() << "\n";
        return kExitInternal;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return kExitInternal;
    }

    // The exit code always reflects the run; a report that cannot be written only warns.
    const int exit_code = advgate::pipeline::exit_code_for(result->status);
    print_summary(*result);
    try {
        write_reports(args, *result);
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: failed to write report: " << ex.what() << "\n";
    }
    return exit_code;
}

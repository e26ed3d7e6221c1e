#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cost_ledger.hpp"
#include "sandbox.hpp"
#include "usd.hpp"

namespace advgate::pipeline {

/// `$XDG_STATE_HOME/advgate/cost-ledger.tsv`, else under `~/.local/state`, else the temp directory.
[[nodiscard]] std::filesystem::path default_ledger_path();

enum class ConfirmMode { Prompt, Accept, Decline };

struct ConfirmPolicy {
    ConfirmMode mode{ConfirmMode::Prompt};
    int timeout_seconds{0};  ///< 0 waits forever (interactive terminals only)
    bool accept_on_timeout{false};
};

/**
 * \brief Everything a pipeline run is configured with.
 *
 * Defaults are the fixed policy: no network, 2 GiB, 2 CPUs, five minutes for
 * verification and ten for the adversarial stage, no retry, no budget.
 */
struct Policy {
    std::uint64_t memory_limit{2ULL * 1024 * 1024 * 1024};
    unsigned cpu_limit{2};
    bool network_enabled{false};
    Isolation isolation{Isolation::Namespaces};
    std::size_t max_output_bytes{1024 * 1024};

    int verification_timeout_seconds{300};
    int adversarial_timeout_seconds{600};
    std::vector<std::string> verification_runner;  ///< Empty: /bin/sh or python3 by script language
    std::vector<std::string> adversarial_runner{"python3", "-m", "pytest", "-q", "-rf", "--tb=short"};

    ConfirmPolicy confirm;
    unsigned generation_max_attempts{1};

    PriceTable prices;
    std::optional<Usd> max_cost;
    std::filesystem::path ledger_path{default_ledger_path()};  ///< Never inside a workspace
    std::vector<std::string> agent_command;
};

/**
 * \brief Loads a policy file on top of existing settings.
 *
 * Line-oriented `key=value` syntax; `#` starts a comment line and blank lines
 * are ignored. Unknown keys and malformed values are errors that name the file
 * and line. Booleans honour `true/false`, `yes/no` and `1/0` (case-insensitive);
 * sizes take an optional K/M/G suffix; command values are split on whitespace.
 *
 * Example:
 * \code{.txt}
 * sandbox.memory_limit=1G
 * verification.timeout_seconds=120
 * confirm.mode=decline
 * cost.max_usd=0.50
 * agent.command=python3 tools/testing_agent.py
 * \endcode
 */
class PolicyLoader {
public:
    PolicyLoader() = default;

    [[nodiscard]] Policy load(const std::filesystem::path& file, Policy base = {}) const;

    /// Applies one setting; `origin` is used in error messages.
    static void apply(Policy& policy, std::string_view key, std::string_view value, const std::string& origin);

    /// "2G", "512M", "64K" or plain bytes.
    [[nodiscard]] static std::uint64_t parse_size(std::string_view text, const std::string& origin);

    /// True when `path` resolves to `dir` or to something below it; symlinks are followed.
    [[nodiscard]] static bool is_inside(const std::filesystem::path& path, const std::filesystem::path& dir);

    /// Throws std::runtime_error when the ledger would be writable by scripts run in `workspace`.
    static void check_ledger_location(const Policy& policy, const std::filesystem::path& workspace);
};

}  // namespace advgate::pipeline

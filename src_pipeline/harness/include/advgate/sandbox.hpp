#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace advgate::pipeline {

enum class Isolation { Namespaces, ProcessOnly };

/**
 * \brief Limits and scope for one sandboxed script run.
 *
 * Built fresh for each stage from the policy; never shared between stages.
 */
struct SandboxConfig {
    std::uint64_t memory_limit{2ULL * 1024 * 1024 * 1024};  ///< Bytes of address space
    unsigned cpu_limit{2};
    bool network_enabled{false};
    int timeout_seconds{300};
    std::filesystem::path workspace_path;
    std::vector<std::string> interpreter{"/bin/sh"};  ///< argv prefix; the script path is appended
    Isolation isolation{Isolation::Namespaces};
    std::size_t max_output_bytes{1024 * 1024};  ///< Per stream
};

struct SandboxRun {
    int exit_code{0};  ///< Exit status, or 128 + signal number when killed
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out{false};
};

/// The isolation boundary could not be established; the run cannot continue safely.
class SandboxSetupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Executes a single script inside an isolation boundary.
 *
 * Blocks until the script exits or the configured timeout expires. Throws
 * SandboxSetupError when the boundary itself cannot be created.
 */
class SandboxRunner {
public:
    virtual ~SandboxRunner() = default;

    [[nodiscard]] virtual SandboxRun run(const std::filesystem::path& script, const SandboxConfig& config) = 0;
};

}  // namespace advgate::pipeline

#pragma once

#include <filesystem>

#include "advgate/sandbox.hpp"

namespace advgate::pipeline::sandbox {

/**
 * \brief Linux isolation backend built on fork/exec, rlimits and namespaces.
 *
 * The child runs in its own process group with a scrubbed environment, address
 * space and CPU time limits and pinned CPU affinity. In Namespaces mode it is
 * additionally placed in fresh user and mount namespaces (and a network
 * namespace unless networking is enabled) where `/` is remounted read-only and
 * only the workspace stays writable, and in a fresh pid namespace whose init
 * exits with the script so no descendant survives it.
 *
 * In both modes the host process is child subreaper for the duration of a run:
 * descendants that leave the process group are re-parented to it and killed
 * as soon as the script exits or times out. Every child of the host is treated
 * as a sandbox descendant while `run` executes, so one process runs one sandbox
 * at a time.
 *
 * Transport of setup failures from child to parent uses a close-on-exec pipe:
 * EOF means exec succeeded, a record means a setup step failed and the parent
 * throws SandboxSetupError.
 */
class LinuxSandbox final : public SandboxRunner {
public:
    LinuxSandbox() = default;

    [[nodiscard]] SandboxRun run(const std::filesystem::path& script, const SandboxConfig& config) override;

    /// Checks whether this host lets an unprivileged process create a user namespace.
    [[nodiscard]] static bool user_namespaces_available();
};

}  // namespace advgate::pipeline::sandbox

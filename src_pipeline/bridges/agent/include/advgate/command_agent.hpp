#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "advgate/agent.hpp"

namespace advgate::pipeline::agent {

/**
 * \brief Testing Agent reached through an external command.
 *
 * Transport is JSON over subprocess with temporary files: the request
 * `{"system_prompt", "content"}` is written to `request.json`, the command is
 * run with `<request.json> <response.json>` appended, and the reply
 * `{"success", "text", "error"}` is read back. Credentials are the command's
 * own concern.
 */
class CommandAgentInvoker final : public AgentInvoker {
public:
    struct Config {
        // argv of the bridge command, e.g. {"python3", "tools/testing_agent.py"}
        std::vector<std::string> command;

        // Optional directory for request/response files (system temp when empty).
        std::filesystem::path work_dir;

        // Keep the exchange files after the call for inspection.
        bool keep_files{false};
    };

    explicit CommandAgentInvoker(Config cfg);

    [[nodiscard]] AgentReply invoke(const std::string& system_prompt, const std::string& content) override;

    /// Wraps one argument in single quotes for /bin/sh.
    [[nodiscard]] static std::string shell_quote(const std::string& arg);

private:
    Config cfg_;
};

}  // namespace advgate::pipeline::agent

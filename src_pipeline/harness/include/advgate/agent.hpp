#pragma once

#include <string>

namespace advgate::pipeline {

struct AgentReply {
    bool success{false};
    std::string text;
    std::string error;
};

/**
 * \brief Boundary to an external reasoning agent.
 *
 * Implementations block for one request/response round trip and report
 * transport problems through `AgentReply::success` rather than exceptions.
 */
class AgentInvoker {
public:
    virtual ~AgentInvoker() = default;

    [[nodiscard]] virtual AgentReply invoke(const std::string& system_prompt, const std::string& content) = 0;
};

}  // namespace advgate::pipeline

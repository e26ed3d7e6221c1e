#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "agent.hpp"
#include "cost_ledger.hpp"

namespace advgate::pipeline {

class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Asks the Testing Agent for an adversarial pytest module.
 *
 * One request per call and no retries; retry policy belongs to the caller.
 */
class GenerationClient {
public:
    explicit GenerationClient(std::shared_ptr<AgentInvoker> agent);

    /// Throws GenerationError when the agent fails or returns unusable content.
    [[nodiscard]] std::string generate(const std::vector<SourceFile>& files, const std::vector<std::string>& claims);

    [[nodiscard]] static std::string_view system_prompt() noexcept;

    [[nodiscard]] static std::string build_content(const std::vector<SourceFile>& files,
                                                   const std::vector<std::string>& claims);

    /// First fenced code block, or the whole text when there is no fence.
    [[nodiscard]] static std::string extract_code(std::string_view reply);

private:
    std::shared_ptr<AgentInvoker> agent_;
};

}  // namespace advgate::pipeline

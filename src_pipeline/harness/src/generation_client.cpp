#include "advgate/generation_client.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "shell_rules.hpp"

namespace advgate::pipeline {

namespace {

constexpr std::string_view kSystemPrompt =
    "You are an independent adversarial tester. You did not write the implementation below and you do not "
    "trust its author. Write a single self-contained pytest module that tries to break each numbered claim. "
    "Exercise the real code: do not mock the implementation under test, do not use the network, and only "
    "write files under the current working directory. Tag every test function with the claim it attacks, "
    "either with a '# Claim: <n>' comment on the line above the def or with a docstring starting "
    "'Claim <n>:'. Reply with exactly one ```python fenced code block and nothing else.";

constexpr std::string_view kFence = "```";

std::string fence_for(std::string_view content) {
    // Longer fence than any run of backticks in the content.
    std::size_t longest = 0;
    std::size_t run = 0;
    for (char ch : content) {
        run = ch == '`' ? run + 1 : 0;
        longest = std::max(longest, run);
    }
    return std::string(std::max<std::size_t>(3, longest + 1), '`');
}

}  // namespace

GenerationClient::GenerationClient(std::shared_ptr<AgentInvoker> agent) : agent_(std::move(agent)) {}

std::string_view GenerationClient::system_prompt() noexcept {
    return kSystemPrompt;
}

std::string GenerationClient::build_content(const std::vector<SourceFile>& files,
                                            const std::vector<std::string>& claims) {
    std::string content = "## Implementation files\n\n";
    for (const auto& file : files) {
        const auto fence = fence_for(file.content);
        content += "### " + file.path.string() + "\n" + fence + "\n" + file.content;
        if (!file.content.empty() && file.content.back() != '\n') {
            content += '\n';
        }
        content += fence + "\n\n";
    }
    content += "## Claims\n\n";
    for (std::size_t i = 0; i < claims.size(); ++i) {
        content += std::to_string(i + 1) + ". " + claims[i] + "\n";
    }
    return content;
}

std::string GenerationClient::extract_code(std::string_view reply) {
    const auto open = reply.find(kFence);
    if (open == std::string_view::npos) {
        return std::string{reply};
    }
    std::size_t ticks = open;
    while (ticks < reply.size() && reply[ticks] == '`') {
        ++ticks;
    }
    const auto fence = reply.substr(open, ticks - open);
    const auto body_start = reply.find('\n', ticks);
    if (body_start == std::string_view::npos) {
        throw GenerationError("Agent reply has an unterminated code fence");
    }
    std::size_t search = body_start + 1;
    while (true) {
        const auto close = reply.find(fence, search);
        if (close == std::string_view::npos) {
            throw GenerationError("Agent reply has an unterminated code fence");
        }
        // closing fence must start a line
        if (reply[close - 1] == '\n') {
            return std::string{reply.substr(body_start + 1, close - body_start - 1)};
        }
        search = close + fence.size();
    }
}

std::string GenerationClient::generate(const std::vector<SourceFile>& files, const std::vector<std::string>& claims) {
    if (!agent_) {
        throw GenerationError("No testing agent configured");
    }
    const auto content = build_content(files, claims);
    spdlog::info("Requesting adversarial tests for {} file(s) and {} claim(s)", files.size(), claims.size());

    const auto reply = agent_->invoke(std::string{kSystemPrompt}, content);
    if (!reply.success) {
        throw GenerationError("Testing agent call failed: " + (reply.error.empty() ? "unknown error" : reply.error));
    }
    if (detail::trim_copy(reply.text).empty()) {
        throw GenerationError("Testing agent returned an empty response");
    }
    auto code = extract_code(reply.text);
    if (detail::trim_copy(code).empty()) {
        throw GenerationError("Testing agent returned an empty code block");
    }
    if (code.find("def test_") == std::string::npos) {
        throw GenerationError("Testing agent reply contains no test functions");
    }
    return code;
}

}  // namespace advgate::pipeline

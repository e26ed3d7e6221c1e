/**
 * @file test_generation_client.cpp
 * @brief Adversarial test generation: request content, reply extraction and rejection
 */

#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "advgate/agent.hpp"
#include "advgate/generation_client.hpp"

using advgate::pipeline::AgentInvoker;
using advgate::pipeline::AgentReply;
using advgate::pipeline::GenerationClient;
using advgate::pipeline::GenerationError;
using advgate::pipeline::SourceFile;

namespace {

class ScriptedAgent final : public AgentInvoker {
public:
    explicit ScriptedAgent(std::deque<AgentReply> replies) : replies_(std::move(replies)) {}

    AgentReply invoke(const std::string& system_prompt, const std::string& content) override {
        prompts.push_back(system_prompt);
        contents.push_back(content);
        if (replies_.empty()) {
            return AgentReply{false, {}, "no scripted reply"};
        }
        auto reply = std::move(replies_.front());
        replies_.pop_front();
        return reply;
    }

    std::vector<std::string> prompts;
    std::vector<std::string> contents;

private:
    std::deque<AgentReply> replies_;
};

AgentReply ok(std::string text) {
    return AgentReply{true, std::move(text), {}};
}

const std::vector<SourceFile> kFiles{{"pkg/sort.py", "def sort(xs):\n    return sorted(xs)\n"}};
const std::vector<std::string> kClaims{"returns a sorted list", "does not mutate its input"};

}  // namespace

TEST_CASE("Request content lists files and numbered claims", "[generation]")
{
    const auto content = GenerationClient::build_content(kFiles, kClaims);
    CHECK(content.find("### pkg/sort.py\n```\ndef sort(xs):") != std::string::npos);
    CHECK(content.find("1. returns a sorted list\n") != std::string::npos);
    CHECK(content.find("2. does not mutate its input\n") != std::string::npos);

    // a file that itself contains a fence gets a longer one
    const auto fenced = GenerationClient::build_content({{"README.md", "```\ncode\n```\n"}}, {});
    CHECK(fenced.find("### README.md\n````\n") != std::string::npos);
}

TEST_CASE("Code extraction takes the first fenced block", "[generation]")
{
    CHECK(GenerationClient::extract_code("Here you go:\n```python\ndef test_a():\n    assert True\n```\nBye") ==
          "def test_a():\n    assert True\n");
    CHECK(GenerationClient::extract_code("def test_plain():\n    pass\n") == "def test_plain():\n    pass\n");
    CHECK(GenerationClient::extract_code("```\nx = '```'\ndef test_b(): pass\n```") ==
          "x = '```'\ndef test_b(): pass\n");
    CHECK_THROWS_AS(GenerationClient::extract_code("```python\ndef test_a():\n    pass\n"), GenerationError);
}

TEST_CASE("generate returns the pytest module", "[generation]")
{
    auto agent = std::make_shared<ScriptedAgent>(std::deque<AgentReply>{
        ok("```python\nimport pkg.sort\n\n# Claim: 1\ndef test_sorted():\n    assert pkg.sort.sort([2, 1]) == [1, 2]\n```\n"),
    });
    GenerationClient client(agent);

    const auto code = client.generate(kFiles, kClaims);
    CHECK(code.find("def test_sorted") != std::string::npos);
    REQUIRE(agent->prompts.size() == 1);
    CHECK(agent->prompts.front() == std::string{GenerationClient::system_prompt()});
    CHECK(agent->contents.front() == GenerationClient::build_content(kFiles, kClaims));
}

TEST_CASE("generate rejects unusable replies", "[generation]")
{
    SECTION("transport failure")
    {
        GenerationClient client(std::make_shared<ScriptedAgent>(std::deque<AgentReply>{{false, {}, "timeout"}}));
        CHECK_THROWS_AS(client.generate(kFiles, kClaims), GenerationError);
    }
    SECTION("empty text")
    {
        GenerationClient client(std::make_shared<ScriptedAgent>(std::deque<AgentReply>{ok("  \n\t")}));
        CHECK_THROWS_AS(client.generate(kFiles, kClaims), GenerationError);
    }
    SECTION("empty code block")
    {
        GenerationClient client(std::make_shared<ScriptedAgent>(std::deque<AgentReply>{ok("```python\n\n```")}));
        CHECK_THROWS_AS(client.generate(kFiles, kClaims), GenerationError);
    }
    SECTION("no test functions")
    {
        GenerationClient client(
            std::make_shared<ScriptedAgent>(std::deque<AgentReply>{ok("```python\nprint('hello')\n```")}));
        CHECK_THROWS_AS(client.generate(kFiles, kClaims), GenerationError);
    }
    SECTION("no agent")
    {
        GenerationClient client(nullptr);
        CHECK_THROWS_AS(client.generate(kFiles, kClaims), GenerationError);
    }
}

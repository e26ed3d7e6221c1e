/**
 * @file test_confirmation.cpp
 * @brief Confirmation gates: fixed answers, console prompt and gate selection
 */

#include <catch2/catch_test_macros.hpp>

#include <unistd.h>

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

#include "advgate/confirmation.hpp"

using advgate::pipeline::ConfirmMode;
using advgate::pipeline::ConfirmPolicy;
using advgate::pipeline::ConsoleConfirmationGate;
using advgate::pipeline::FixedConfirmationGate;

namespace {

// Pipe whose read end stands in for stdin.
class InputPipe {
public:
    InputPipe() {
        if (::pipe(fds_) != 0) {
            throw std::runtime_error("pipe failed");
        }
    }
    ~InputPipe() {
        close_write();
        ::close(fds_[0]);
    }
    InputPipe(const InputPipe&) = delete;
    InputPipe& operator=(const InputPipe&) = delete;

    int read_fd() const { return fds_[0]; }

    void send(const std::string& text) {
        REQUIRE(::write(fds_[1], text.data(), text.size()) == static_cast<ssize_t>(text.size()));
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2]{-1, -1};
};

bool ask(InputPipe& input, int timeout_seconds, bool accept_on_timeout, std::ostringstream& out) {
    ConsoleConfirmationGate::Config cfg;
    cfg.input_fd = input.read_fd();
    cfg.timeout_seconds = timeout_seconds;
    cfg.accept_on_timeout = accept_on_timeout;
    ConsoleConfirmationGate gate(cfg, out);
    return gate.confirm("Run verify.sh in /work\n");
}

}  // namespace

TEST_CASE("Fixed gates answer without reading input", "[confirm]")
{
    FixedConfirmationGate yes(true);
    FixedConfirmationGate no(false);
    CHECK(yes.confirm("preview"));
    CHECK_FALSE(no.confirm("preview"));
}

TEST_CASE("Console gate reads y/N answers", "[confirm]")
{
    std::ostringstream out;

    SECTION("yes")
    {
        InputPipe input;
        input.send("  Yes \n");
        CHECK(ask(input, 0, false, out));
        CHECK(out.str().find("Run verify.sh in /work") != std::string::npos);
        CHECK(out.str().find("Proceed with execution? [y/N]") != std::string::npos);
    }
    SECTION("anything else declines")
    {
        InputPipe input;
        input.send("sure\n");
        CHECK_FALSE(ask(input, 0, false, out));
    }
    SECTION("empty answer declines")
    {
        InputPipe input;
        input.send("\n");
        CHECK_FALSE(ask(input, 0, false, out));
    }
    SECTION("end of input declines")
    {
        InputPipe input;
        input.close_write();
        CHECK_FALSE(ask(input, 0, false, out));
    }
}

TEST_CASE("Console gate applies the timeout action", "[confirm]")
{
    std::ostringstream out;

    SECTION("decline on timeout")
    {
        InputPipe input;
        const auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(ask(input, 1, false, out));
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
        CHECK(out.str().find("declining in 1s") != std::string::npos);
    }
    SECTION("accept on timeout")
    {
        InputPipe input;
        CHECK(ask(input, 1, true, out));
    }
    SECTION("an answer before the deadline wins")
    {
        InputPipe input;
        input.send("n\n");
        CHECK_FALSE(ask(input, 5, true, out));
    }
}

TEST_CASE("Gate selection honours flags, policy and terminal state", "[confirm]")
{
    std::ostringstream out;
    ConfirmPolicy policy;

    SECTION("--auto-confirm never prompts")
    {
        auto gate = advgate::pipeline::make_confirmation_gate(policy, true, false, out);
        CHECK(gate->confirm("preview"));
        CHECK(out.str().empty());
    }
    SECTION("decline mode")
    {
        policy.mode = ConfirmMode::Decline;
        auto gate = advgate::pipeline::make_confirmation_gate(policy, false, false, out);
        CHECK_FALSE(gate->confirm("preview"));
    }
    SECTION("accept mode")
    {
        policy.mode = ConfirmMode::Accept;
        auto gate = advgate::pipeline::make_confirmation_gate(policy, false, false, out);
        CHECK(gate->confirm("preview"));
    }
    SECTION("unattended prompt without a timeout is refused")
    {
        CHECK_THROWS_AS(advgate::pipeline::make_confirmation_gate(policy, false, false, out), std::runtime_error);
    }
    SECTION("unattended prompt with a timeout is allowed")
    {
        policy.timeout_seconds = 1;
        InputPipe input;
        auto gate = advgate::pipeline::make_confirmation_gate(policy, false, false, out, input.read_fd());
        CHECK_FALSE(gate->confirm("preview"));
    }
}

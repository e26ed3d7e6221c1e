#include "advgate/confirmation.hpp"

#include <poll.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <ostream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "shell_rules.hpp"

namespace advgate::pipeline {

namespace {

enum class ReadOutcome { Line, EndOfInput, TimedOut };

// Reads up to newline from `fd`, waiting at most `timeout_seconds` overall (0 = forever).
ReadOutcome read_answer(int fd, int timeout_seconds, std::string& line) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    char ch = 0;
    while (true) {
        if (timeout_seconds > 0) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                       deadline - std::chrono::steady_clock::now())
                                       .count();
            if (remaining <= 0) {
                return ReadOutcome::TimedOut;
            }
            pollfd pfd{fd, POLLIN, 0};
            const int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return ReadOutcome::EndOfInput;
            }
            if (ready == 0) {
                return ReadOutcome::TimedOut;
            }
        }
        const auto n = ::read(fd, &ch, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return line.empty() ? ReadOutcome::EndOfInput : ReadOutcome::Line;
        }
        if (ch == '\n') {
            return ReadOutcome::Line;
        }
        line.push_back(ch);
    }
}

}  // namespace

bool FixedConfirmationGate::confirm(const std::string& /*preview_text*/) {
    spdlog::info("Confirmation {} by policy", answer_ ? "granted" : "declined");
    return answer_;
}

ConsoleConfirmationGate::ConsoleConfirmationGate(Config cfg, std::ostream& out) : cfg_(cfg), out_(out) {}

bool ConsoleConfirmationGate::confirm(const std::string& preview_text) {
    out_ << preview_text;
    if (!preview_text.empty() && preview_text.back() != '\n') {
        out_ << '\n';
    }
    out_ << "Proceed with execution? [y/N]";
    if (cfg_.timeout_seconds > 0) {
        out_ << " (" << (cfg_.accept_on_timeout ? "accepting" : "declining") << " in " << cfg_.timeout_seconds
             << "s)";
    }
    out_ << ' ' << std::flush;

    std::string line;
    switch (read_answer(cfg_.input_fd, cfg_.timeout_seconds, line)) {
        case ReadOutcome::TimedOut:
            out_ << '\n';
            spdlog::warn("No answer within {}s; {}", cfg_.timeout_seconds,
                         cfg_.accept_on_timeout ? "accepting" : "declining");
            return cfg_.accept_on_timeout;
        case ReadOutcome::EndOfInput:
            out_ << '\n';
            spdlog::warn("Confirmation input closed; declining");
            return false;
        case ReadOutcome::Line:
            break;
    }
    auto answer = detail::trim_copy(line);
    for (auto& ch : answer) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return answer == "y" || answer == "yes";
}

std::unique_ptr<ConfirmationGate> make_confirmation_gate(const ConfirmPolicy& policy,
                                                         bool auto_confirm,
                                                         bool interactive,
                                                         std::ostream& out,
                                                         int input_fd) {
    if (auto_confirm || policy.mode == ConfirmMode::Accept) {
        return std::make_unique<FixedConfirmationGate>(true);
    }
    if (policy.mode == ConfirmMode::Decline) {
        return std::make_unique<FixedConfirmationGate>(false);
    }
    if (!interactive && policy.timeout_seconds <= 0) {
        throw std::runtime_error(
            "stdin is not a terminal: choose --auto-confirm, confirm.mode=accept|decline, "
            "or a positive confirm.timeout_seconds with confirm.on_timeout");
    }
    ConsoleConfirmationGate::Config cfg;
    cfg.input_fd = input_fd;
    cfg.timeout_seconds = policy.timeout_seconds;
    cfg.accept_on_timeout = policy.accept_on_timeout;
    return std::make_unique<ConsoleConfirmationGate>(cfg, out);
}

}  // namespace advgate::pipeline

#pragma once

#include <iosfwd>
#include <memory>
#include <string>

#include "policy_loader.hpp"

namespace advgate::pipeline {

/// Human (or policy) approval before anything executes.
class ConfirmationGate {
public:
    virtual ~ConfirmationGate() = default;

    [[nodiscard]] virtual bool confirm(const std::string& preview_text) = 0;
};

class FixedConfirmationGate final : public ConfirmationGate {
public:
    explicit FixedConfirmationGate(bool answer) : answer_(answer) {}

    [[nodiscard]] bool confirm(const std::string& preview_text) override;

private:
    bool answer_;
};

/**
 * \brief Prompts on a terminal and reads a y/N answer from a file descriptor.
 *
 * With a positive timeout the answer is awaited with poll(); on expiry the
 * configured timeout action applies. End of input declines.
 */
class ConsoleConfirmationGate final : public ConfirmationGate {
public:
    struct Config {
        int input_fd{0};
        int timeout_seconds{0};  ///< 0 waits forever
        bool accept_on_timeout{false};
    };

    ConsoleConfirmationGate(Config cfg, std::ostream& out);

    [[nodiscard]] bool confirm(const std::string& preview_text) override;

private:
    Config cfg_;
    std::ostream& out_;
};

/**
 * \brief Chooses the gate for a run.
 *
 * `--auto-confirm` and non-prompt modes never read input. Prompting without a
 * terminal is only allowed with a positive timeout; otherwise this throws
 * std::runtime_error because an unattended run would block forever.
 */
[[nodiscard]] std::unique_ptr<ConfirmationGate> make_confirmation_gate(const ConfirmPolicy& policy,
                                                                       bool auto_confirm,
                                                                       bool interactive,
                                                                       std::ostream& out,
                                                                       int input_fd = 0);

}  // namespace advgate::pipeline

#include "advgate/workflow.hpp"

#include <type_traits>

namespace advgate::pipeline {

std::string_view to_string(Stage stage) noexcept {
    return stage == Stage::Verification ? "Verification" : "Adversarial";
}

std::string_view status_name(const WorkflowStatus& status) noexcept {
    return std::visit(
        [](const auto& value) -> std::string_view {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, status::Pass>) {
                return "Pass";
            } else if constexpr (std::is_same_v<T, status::DryRun>) {
                return "DryRun";
            } else if constexpr (std::is_same_v<T, status::Cancelled>) {
                return "Cancelled";
            } else if constexpr (std::is_same_v<T, status::FailedVerification>) {
                return "FailedVerification";
            } else if constexpr (std::is_same_v<T, status::FailedImport>) {
                return "FailedImport";
            } else if constexpr (std::is_same_v<T, status::FailedAdversarial>) {
                return "FailedAdversarial";
            } else if constexpr (std::is_same_v<T, status::FailedTimeout>) {
                return "FailedTimeout";
            } else if constexpr (std::is_same_v<T, status::BlockedDangerousScript>) {
                return "BlockedDangerousScript";
            } else {
                return "BlockedDangerousOperation";
            }
        },
        status);
}

int exit_code_for(const WorkflowStatus& status) noexcept {
    return std::visit(
        [](const auto& value) -> int {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, status::Pass> || std::is_same_v<T, status::DryRun>) {
                return 0;
            } else if constexpr (std::is_same_v<T, status::Cancelled>) {
                return 3;
            } else if constexpr (std::is_same_v<T, status::BlockedDangerousScript> ||
                                 std::is_same_v<T, status::BlockedDangerousOperation>) {
                return 2;
            } else {
                return 1;
            }
        },
        status);
}

bool is_success(const WorkflowStatus& status) noexcept {
    return exit_code_for(status) == 0;
}

}  // namespace advgate::pipeline

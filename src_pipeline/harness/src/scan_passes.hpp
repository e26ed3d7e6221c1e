#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "shell_rules.hpp"

namespace advgate::pipeline::detail {

struct Finding {
    std::size_t line{0};  ///< 1-based physical line
    RuleHit hit;
};

/// Shell pass: logical lines (backslash continuations joined) through the shell families.
[[nodiscard]] std::vector<Finding> scan_shell(std::string_view content);

/// Python pass: imports and call sites, with shell families applied to commands
/// handed to shell-invoking calls.
[[nodiscard]] std::vector<Finding> scan_python(std::string_view content);

}  // namespace advgate::pipeline::detail

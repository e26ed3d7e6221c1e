#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "advgate/script_scanner.hpp"

// Internal to the scanner: shell pattern families shared by the shell pass and
// by the Python pass (command strings handed to os.system, subprocess, ...).
namespace advgate::pipeline::detail {

struct RuleHit {
    PatternType type;
    Severity severity;
    std::string description;
};

/// Classifies one logical shell line (may contain several commands).
[[nodiscard]] std::vector<RuleHit> classify_shell_text(std::string_view text);

/// Classifies a single command given as an argv vector (no shell parsing).
[[nodiscard]] std::vector<RuleHit> classify_argv(const std::vector<std::string>& argv);

/// Credential-bearing path or file name inside arbitrary text.
[[nodiscard]] std::optional<RuleHit> classify_sensitive_path(std::string_view text);

/// True for "/", "~", $HOME, ".." and top-level system directories.
[[nodiscard]] bool is_protected_path(std::string_view path);

[[nodiscard]] std::string trim_copy(std::string_view input);

}  // namespace advgate::pipeline::detail

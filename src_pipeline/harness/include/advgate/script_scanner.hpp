#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace advgate::pipeline {

enum class PatternType { NetworkAccess, Destructive, PrivilegeEscalation, Exfiltration };

enum class Severity { Critical, High, Medium };

enum class ScriptLanguage { Auto, Shell, Python };

[[nodiscard]] std::string_view to_string(PatternType type) noexcept;
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(ScriptLanguage language) noexcept;

struct DangerousPattern {
    std::size_t line_number{0};  ///< 1-based
    PatternType pattern_type{PatternType::Destructive};
    std::string code_snippet;    ///< Trimmed source line
    Severity severity{Severity::Medium};
    std::string description;     ///< Short rule description, e.g. "network client 'curl'"

    friend bool operator==(const DangerousPattern&, const DangerousPattern&) = default;
};

/**
 * \brief Verdict of one static scan.
 *
 * `is_safe` is true iff no Critical or High pattern was found. Medium findings
 * stay in `patterns` and each contributes one entry to `recommendations`.
 */
struct ScanResult {
    bool is_safe{true};
    std::vector<DangerousPattern> patterns;
    std::vector<std::string> recommendations;

    [[nodiscard]] std::vector<DangerousPattern> blocking_patterns() const;

    friend bool operator==(const ScanResult&, const ScanResult&) = default;
};

/**
 * \brief Static safety gate for verification and adversarial scripts.
 *
 * Pure and deterministic: the scanner reads the file once, never executes it and
 * never consults anything but the text. All matching is done by a hand-written
 * tokenizer and table lookups, so scan time is linear in the input size.
 *
 * Shell scripts are split into commands and each command word is classified
 * against the pattern families (network clients, destructive deletion,
 * privilege escalation, environment and credential exfiltration).
 *
 * Python scripts are tokenised into import statements and call sites; callees
 * are resolved through import aliases and matched against dangerous standard
 * library calls. String literals handed to shell-invoking calls are classified
 * with the shell families.
 */
class ScriptScanner {
public:
    static constexpr std::size_t kMaxScriptBytes = 4U * 1024U * 1024U;

    ScriptScanner() = default;

    /// Throws std::runtime_error if the file cannot be read.
    [[nodiscard]] ScanResult scan(const std::filesystem::path& script_path,
                                  ScriptLanguage language_hint = ScriptLanguage::Auto) const;

    [[nodiscard]] ScanResult scan_text(std::string_view content, ScriptLanguage language) const;

    /// Resolves Auto by extension and then by shebang; unknown text is Shell.
    [[nodiscard]] static ScriptLanguage detect_language(const std::filesystem::path& script_path,
                                                        std::string_view content);
};

}  // namespace advgate::pipeline

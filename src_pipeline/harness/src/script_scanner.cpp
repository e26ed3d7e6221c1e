#include "advgate/script_scanner.hpp"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "scan_passes.hpp"
#include "shell_rules.hpp"

namespace {

using advgate::pipeline::DangerousPattern;
using advgate::pipeline::PatternType;
using advgate::pipeline::ScanResult;
using advgate::pipeline::ScriptLanguage;
using advgate::pipeline::Severity;
using advgate::pipeline::detail::Finding;

std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos <= content.size()) {
        const auto eol = content.find('\n', pos);
        if (eol == std::string_view::npos) {
            lines.push_back(content.substr(pos));
            break;
        }
        lines.push_back(content.substr(pos, eol - pos));
        pos = eol + 1;
    }
    return lines;
}

// An exfiltration finding on a line that also reaches the network is a channel, not a read.
void escalate_exfiltration(std::vector<Finding>& findings) {
    for (auto& finding : findings) {
        if (finding.hit.type != PatternType::Exfiltration || finding.hit.severity != Severity::High) {
            continue;
        }
        const bool networked = std::any_of(findings.begin(), findings.end(), [&](const Finding& other) {
            return other.line == finding.line && other.hit.type == PatternType::NetworkAccess &&
                   other.hit.severity != Severity::Medium;
        });
        if (networked) {
            finding.hit.severity = Severity::Critical;
        }
    }
}

std::string recommendation_for(const DangerousPattern& pattern) {
    return "line " + std::to_string(pattern.line_number) + ": " + pattern.description + " (" +
           std::string{advgate::pipeline::to_string(pattern.pattern_type)} + "); review before running";
}

ScanResult build_result(std::vector<Finding> findings, std::string_view content) {
    escalate_exfiltration(findings);
    std::stable_sort(findings.begin(), findings.end(),
                     [](const Finding& a, const Finding& b) { return a.line < b.line; });

    const auto lines = split_lines(content);
    ScanResult result;
    for (auto& finding : findings) {
        DangerousPattern pattern;
        pattern.line_number = finding.line;
        pattern.pattern_type = finding.hit.type;
        pattern.severity = finding.hit.severity;
        pattern.description = std::move(finding.hit.description);
        if (finding.line >= 1 && finding.line <= lines.size()) {
            pattern.code_snippet = advgate::pipeline::detail::trim_copy(lines[finding.line - 1]);
        }
        const bool duplicate = std::any_of(result.patterns.begin(), result.patterns.end(), [&](const auto& seen) {
            return seen.line_number == pattern.line_number && seen.pattern_type == pattern.pattern_type &&
                   seen.description == pattern.description;
        });
        if (duplicate) {
            continue;
        }
        if (pattern.severity == Severity::Medium) {
            result.recommendations.push_back(recommendation_for(pattern));
        } else {
            result.is_safe = false;
        }
        result.patterns.push_back(std::move(pattern));
    }
    return result;
}

bool has_extension(const std::filesystem::path& path, std::initializer_list<std::string_view> extensions) {
    const auto ext = path.extension().string();
    return std::any_of(extensions.begin(), extensions.end(), [&](std::string_view e) { return ext == e; });
}

}  // namespace

namespace advgate::pipeline {

std::string_view to_string(PatternType type) noexcept {
    switch (type) {
        case PatternType::NetworkAccess: return "NetworkAccess";
        case PatternType::Destructive: return "Destructive";
        case PatternType::PrivilegeEscalation: return "PrivilegeEscalation";
        case PatternType::Exfiltration: return "Exfiltration";
    }
    return "Unknown";
}

std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Critical: return "Critical";
        case Severity::High: return "High";
        case Severity::Medium: return "Medium";
    }
    return "Unknown";
}

std::string_view to_string(ScriptLanguage language) noexcept {
    switch (language) {
        case ScriptLanguage::Auto: return "auto";
        case ScriptLanguage::Shell: return "shell";
        case ScriptLanguage::Python: return "python";
    }
    return "unknown";
}

std::vector<DangerousPattern> ScanResult::blocking_patterns() const {
    std::vector<DangerousPattern> blocking;
    std::copy_if(patterns.begin(), patterns.end(), std::back_inserter(blocking),
                 [](const DangerousPattern& pattern) { return pattern.severity != Severity::Medium; });
    return blocking;
}

ScanResult ScriptScanner::scan(const std::filesystem::path& script_path, ScriptLanguage language_hint) const {
    std::ifstream in(script_path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open script: " + script_path.string());
    }
    std::string content;
    content.resize(kMaxScriptBytes + 1);
    in.read(content.data(), static_cast<std::streamsize>(content.size()));
    if (in.bad()) {
        throw std::runtime_error("Failed to read script: " + script_path.string());
    }
    content.resize(static_cast<std::size_t>(in.gcount()));

    if (content.size() > kMaxScriptBytes) {
        ScanResult result;
        result.is_safe = false;
        DangerousPattern pattern;
        pattern.line_number = 1;
        pattern.pattern_type = PatternType::Destructive;
        pattern.severity = Severity::Critical;
        pattern.description = "script too large to scan";
        result.patterns.push_back(std::move(pattern));
        return result;
    }

    const auto language =
        language_hint == ScriptLanguage::Auto ? detect_language(script_path, content) : language_hint;
    return scan_text(content, language);
}

ScanResult ScriptScanner::scan_text(std::string_view content, ScriptLanguage language) const {
    if (language == ScriptLanguage::Auto) {
        language = detect_language({}, content);
    }
    auto findings = language == ScriptLanguage::Python ? detail::scan_python(content) : detail::scan_shell(content);
    return build_result(std::move(findings), content);
}

ScriptLanguage ScriptScanner::detect_language(const std::filesystem::path& script_path, std::string_view content) {
    if (has_extension(script_path, {".py", ".pyw"})) {
        return ScriptLanguage::Python;
    }
    if (has_extension(script_path, {".sh", ".bash", ".zsh", ".ksh"})) {
        return ScriptLanguage::Shell;
    }
    if (content.substr(0, 2) == "#!") {
        const auto shebang = content.substr(0, content.find('\n'));
        if (shebang.find("python") != std::string_view::npos) {
            return ScriptLanguage::Python;
        }
    }
    return ScriptLanguage::Shell;
}

}  // namespace advgate::pipeline

#include "advgate/failure_triage.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "shell_rules.hpp"

namespace advgate::pipeline {

namespace {

using detail::trim_copy;

constexpr std::size_t kTraceTailBytes = 4000;

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto eol = text.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = text.size();
        }
        auto line = text.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        pos = eol + 1;
    }
    return lines;
}

// Reads a 'quoted' or "quoted" token that starts at `pos` (leading spaces skipped).
std::optional<std::string> quoted_at(std::string_view text, std::size_t pos) {
    while (pos < text.size() && text[pos] == ' ') {
        ++pos;
    }
    if (pos >= text.size() || (text[pos] != '\'' && text[pos] != '"')) {
        return std::nullopt;
    }
    const char quote = text[pos];
    const auto end = text.find(quote, pos + 1);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string{text.substr(pos + 1, end - pos - 1)};
}

std::optional<std::string> quoted_after(std::string_view text, std::string_view marker) {
    const auto at = text.find(marker);
    if (at == std::string_view::npos) {
        return std::nullopt;
    }
    return quoted_at(text, at + marker.size());
}

bool is_identifier_like(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_' || ch == '.';
    });
}

std::string strip_parameters(std::string_view name) {
    return std::string{name.substr(0, name.find('['))};
}

std::optional<std::size_t> leading_number(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
        ++i;
    }
    if (i == 0 || i > 6) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::stoul(std::string{text.substr(0, i)}));
}

std::optional<std::size_t> claim_number(std::string_view text) {
    auto rest = std::string_view{text};
    if (!starts_with(rest, "Claim") && !starts_with(rest, "claim")) {
        return std::nullopt;
    }
    rest.remove_prefix(5);
    while (!rest.empty() && (rest.front() == ' ' || rest.front() == ':' || rest.front() == '#')) {
        rest.remove_prefix(1);
    }
    return leading_number(rest);
}

std::optional<std::string> test_function_name(std::string_view trimmed) {
    if (starts_with(trimmed, "async ")) {
        trimmed.remove_prefix(6);
    }
    if (!starts_with(trimmed, "def test")) {
        return std::nullopt;
    }
    trimmed.remove_prefix(4);
    const auto paren = trimmed.find('(');
    return std::string{trimmed.substr(0, paren)};
}

struct Section {
    std::string name;
    std::string body;
};

bool is_section_header(std::string_view trimmed) {
    return trimmed.size() > 6 && starts_with(trimmed, "___") && trimmed.back() == '_' &&
           trimmed.find(' ') != std::string_view::npos;
}

std::vector<Section> traceback_sections(const std::vector<std::string_view>& lines) {
    std::vector<Section> sections;
    bool open = false;
    for (const auto line : lines) {
        const auto trimmed = trim_copy(line);
        if (is_section_header(trimmed)) {
            auto name = trimmed;
            name.erase(0, name.find_first_not_of('_'));
            name.erase(name.find_last_not_of('_') + 1);
            sections.push_back(Section{trim_copy(name), {}});
            open = true;
            continue;
        }
        if (starts_with(trimmed, "===")) {
            open = false;
            continue;
        }
        if (open) {
            sections.back().body.append(line);
            sections.back().body.push_back('\n');
        }
    }
    return sections;
}

// Splits "TypeError: bad operand" into type and message.
std::pair<std::string, std::string> split_error(std::string_view message) {
    const auto trimmed = trim_copy(message);
    const auto colon = trimmed.find(": ");
    if (colon != std::string::npos && is_identifier_like(std::string_view{trimmed}.substr(0, colon))) {
        return {trimmed.substr(0, colon), trimmed.substr(colon + 2)};
    }
    if (starts_with(trimmed, "assert")) {
        return {"AssertionError", trimmed};
    }
    return {"Failed", trimmed};
}

// First "E   Type: message" line of a short traceback.
std::pair<std::string, std::string> error_from_trace(std::string_view trace) {
    for (const auto line : split_lines(trace)) {
        const auto trimmed = trim_copy(line);
        if (starts_with(trimmed, "E ")) {
            return split_error(std::string_view{trimmed}.substr(2));
        }
    }
    return {"Failed", {}};
}

const Section* find_section(const std::vector<Section>& sections, std::string_view qualified, std::string_view bare) {
    for (const auto& section : sections) {
        if (section.name == qualified) {
            return &section;
        }
    }
    for (const auto& section : sections) {
        if (section.name == bare) {
            return &section;
        }
    }
    return nullptr;
}

std::string claim_text(const std::map<std::string, std::size_t>& tags,
                       const std::string& function,
                       const std::vector<std::string>& claims) {
    const auto it = tags.find(strip_parameters(function));
    if (it == tags.end()) {
        return {};
    }
    if (it->second >= 1 && it->second <= claims.size()) {
        return claims[it->second - 1];
    }
    return "Claim " + std::to_string(it->second);
}

}  // namespace

std::optional<std::string> find_import_failure(std::string_view stderr_text) {
    if (auto name = quoted_after(stderr_text, "ModuleNotFoundError: No module named")) {
        return name;
    }
    if (const auto at = stderr_text.find("ImportError: cannot import name"); at != std::string_view::npos) {
        const auto rest = stderr_text.substr(at);
        const auto line = rest.substr(0, rest.find('\n'));
        auto symbol = quoted_after(line, "cannot import name");
        auto module = quoted_after(line, " from ");
        if (symbol && module) {
            return *module + "." + *symbol;
        }
        if (symbol) {
            return symbol;
        }
        return std::string{"<unknown>"};
    }
    if (auto name = quoted_after(stderr_text, "Error: Cannot find module")) {
        return name;
    }
    if (stderr_text.find("ImportError:") != std::string_view::npos) {
        if (auto name = quoted_after(stderr_text, "No module named")) {
            return name;
        }
        return std::string{"<unknown>"};
    }
    return std::nullopt;
}

std::map<std::string, std::size_t> claim_tags(std::string_view test_source) {
    std::map<std::string, std::size_t> tags;
    std::optional<std::size_t> pending;
    std::string awaiting_docstring;

    for (const auto line : split_lines(test_source)) {
        const auto trimmed = trim_copy(line);
        if (trimmed.empty()) {
            continue;
        }
        if (!awaiting_docstring.empty()) {
            auto body = std::string_view{trimmed};
            if (starts_with(body, "\"\"\"") || starts_with(body, "'''")) {
                body.remove_prefix(3);
            } else if (starts_with(body, "\"") || starts_with(body, "'")) {
                body.remove_prefix(1);
            } else {
                body = {};
            }
            if (auto n = claim_number(trim_copy(body))) {
                tags.emplace(awaiting_docstring, *n);
            }
            awaiting_docstring.clear();
        }
        if (trimmed.front() == '#') {
            auto comment = std::string_view{trimmed};
            comment.remove_prefix(1);
            if (auto n = claim_number(trim_copy(comment))) {
                pending = n;
            }
            continue;
        }
        if (trimmed.front() == '@') {
            continue;
        }
        if (auto name = test_function_name(trimmed)) {
            if (pending) {
                tags.emplace(*name, *pending);
            } else {
                awaiting_docstring = *name;
            }
        }
        pending.reset();
    }
    return tags;
}

std::vector<TestFailure> parse_adversarial_output(std::string_view output,
                                                  int exit_code,
                                                  std::string_view test_source,
                                                  const std::vector<std::string>& claims) {
    const auto lines = split_lines(output);
    const auto sections = traceback_sections(lines);
    const auto tags = claim_tags(test_source);

    std::vector<TestFailure> failures;
    auto already_listed = [&](const std::string& name) {
        return std::any_of(failures.begin(), failures.end(), [&](const TestFailure& f) { return f.test_name == name; });
    };

    for (const auto line : lines) {
        const auto trimmed = trim_copy(line);
        const bool failed = starts_with(trimmed, "FAILED ");
        const bool errored = starts_with(trimmed, "ERROR ");
        if (!failed && !errored) {
            continue;
        }
        auto rest = std::string_view{trimmed}.substr(failed ? 7 : 6);
        std::string_view message;
        if (const auto dash = rest.find(" - "); dash != std::string_view::npos) {
            message = rest.substr(dash + 3);
            rest = rest.substr(0, dash);
        }
        const auto node_id = trim_copy(rest);
        const auto sep = node_id.find("::");
        const auto last_sep = node_id.rfind("::");
        const auto function = last_sep == std::string::npos ? node_id : node_id.substr(last_sep + 2);
        auto qualified = sep == std::string::npos ? node_id : node_id.substr(sep + 2);
        for (auto pos = qualified.find("::"); pos != std::string::npos; pos = qualified.find("::")) {
            qualified.replace(pos, 2, ".");
        }
        if (already_listed(function)) {
            continue;
        }

        TestFailure failure;
        failure.test_name = function;
        failure.claim_violated = claim_text(tags, function, claims);
        if (errored) {
            failure.error_type = "CollectionError";
            failure.error_message = trim_copy(message);
            const auto* section = find_section(sections, "ERROR collecting " + node_id, function);
            if (section != nullptr) {
                failure.trace = section->body;
            }
        } else {
            const auto* section = find_section(sections, qualified, strip_parameters(function));
            if (section != nullptr) {
                failure.trace = section->body;
            }
            auto [type, text] = message.empty() && section != nullptr ? error_from_trace(section->body)
                                                                       : split_error(message);
            failure.error_type = std::move(type);
            failure.error_message = std::move(text);
        }
        failures.push_back(std::move(failure));
    }

    // No summary lines (e.g. -rf not passed): fall back to traceback sections.
    if (failures.empty()) {
        for (const auto& section : sections) {
            if (section.name.find(' ') != std::string::npos) {
                continue;
            }
            const auto dot = section.name.rfind('.');
            const auto function = dot == std::string::npos ? section.name : section.name.substr(dot + 1);
            if (already_listed(function)) {
                continue;
            }
            TestFailure failure;
            failure.test_name = function;
            failure.claim_violated = claim_text(tags, function, claims);
            auto [type, text] = error_from_trace(section.body);
            failure.error_type = std::move(type);
            failure.error_message = std::move(text);
            failure.trace = section.body;
            failures.push_back(std::move(failure));
        }
    }

    if (failures.empty() && exit_code != 0) {
        TestFailure failure;
        failure.test_name = "<adversarial run>";
        failure.error_type = "NonZeroExit";
        failure.error_message = "adversarial run exited with status " + std::to_string(exit_code);
        const auto tail = output.size() > kTraceTailBytes ? output.substr(output.size() - kTraceTailBytes) : output;
        if (!tail.empty()) {
            failure.trace = std::string{tail};
        }
        failures.push_back(std::move(failure));
    }
    return failures;
}

}  // namespace advgate::pipeline

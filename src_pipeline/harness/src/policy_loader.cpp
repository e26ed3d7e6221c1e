#include "advgate/policy_loader.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shell_rules.hpp"

namespace {

using advgate::pipeline::detail::trim_copy;

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

[[noreturn]] void invalid(std::string_view what, std::string_view value, const std::string& origin) {
    throw std::runtime_error("Invalid " + std::string{what} + " '" + std::string{value} + "' at " + origin);
}

bool parse_boolean(std::string_view raw, const std::string& origin) {
    const auto lowered = to_lower_copy(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        return false;
    }
    invalid("boolean value", raw, origin);
}

std::uint64_t parse_unsigned(std::string_view raw, const std::string& origin) {
    if (raw.empty()) {
        invalid("number", raw, origin);
    }
    std::uint64_t value = 0;
    for (char ch : raw) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            invalid("number", raw, origin);
        }
        if (value > (std::numeric_limits<std::uint64_t>::max() - 9) / 10) {
            invalid("number", raw, origin);
        }
        value = value * 10 + static_cast<std::uint64_t>(ch - '0');
    }
    return value;
}

int parse_seconds(std::string_view raw, const std::string& origin, bool allow_zero) {
    const auto value = parse_unsigned(raw, origin);
    if ((!allow_zero && value == 0) || value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        invalid("timeout", raw, origin);
    }
    return static_cast<int>(value);
}

std::vector<std::string> split_command(std::string_view raw) {
    std::vector<std::string> words;
    std::string current;
    for (char ch : raw) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

}  // namespace

namespace advgate::pipeline {

std::filesystem::path default_ledger_path() {
    const std::filesystem::path file = std::filesystem::path("advgate") / "cost-ledger.tsv";
    if (const char* state = std::getenv("XDG_STATE_HOME"); state != nullptr && *state == '/') {
        return std::filesystem::path(state) / file;
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home == '/') {
        return std::filesystem::path(home) / ".local" / "state" / file;
    }
    return std::filesystem::temp_directory_path() / file;
}

bool PolicyLoader::is_inside(const std::filesystem::path& path, const std::filesystem::path& dir) {
    const auto target = std::filesystem::weakly_canonical(std::filesystem::absolute(path));
    const auto root = std::filesystem::weakly_canonical(std::filesystem::absolute(dir));
    auto t = target.begin();
    for (auto r = root.begin(); r != root.end(); ++r, ++t) {
        if (r->empty() && std::next(r) == root.end()) {
            break;  // trailing separator
        }
        if (t == target.end() || *t != *r) {
            return false;
        }
    }
    return true;
}

void PolicyLoader::check_ledger_location(const Policy& policy, const std::filesystem::path& workspace) {
    if (is_inside(policy.ledger_path, workspace)) {
        throw std::runtime_error("Refusing a cost ledger inside the workspace: " + policy.ledger_path.string());
    }
}

std::uint64_t PolicyLoader::parse_size(std::string_view text, const std::string& origin) {
    if (text.empty()) {
        invalid("size", text, origin);
    }
    std::uint64_t multiplier = 1;
    auto digits = text;
    switch (std::toupper(static_cast<unsigned char>(text.back()))) {
        case 'K': multiplier = 1024ULL; break;
        case 'M': multiplier = 1024ULL * 1024; break;
        case 'G': multiplier = 1024ULL * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) {
        digits.remove_suffix(1);
    }
    const auto value = parse_unsigned(digits, origin);
    if (value == 0 || value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        invalid("size", text, origin);
    }
    return value * multiplier;
}

void PolicyLoader::apply(Policy& policy, std::string_view key, std::string_view value, const std::string& origin) {
    if (key == "sandbox.memory_limit") {
        policy.memory_limit = parse_size(value, origin);
    } else if (key == "sandbox.cpu_limit") {
        const auto cpus = parse_unsigned(value, origin);
        if (cpus == 0 || cpus > 1024) {
            invalid("CPU limit", value, origin);
        }
        policy.cpu_limit = static_cast<unsigned>(cpus);
    } else if (key == "sandbox.network") {
        policy.network_enabled = parse_boolean(value, origin);
    } else if (key == "sandbox.isolation") {
        const auto lowered = to_lower_copy(value);
        if (lowered == "namespaces") {
            policy.isolation = Isolation::Namespaces;
        } else if (lowered == "process") {
            policy.isolation = Isolation::ProcessOnly;
        } else {
            invalid("isolation mode", value, origin);
        }
    } else if (key == "sandbox.max_output_bytes") {
        policy.max_output_bytes = static_cast<std::size_t>(parse_size(value, origin));
    } else if (key == "verification.timeout_seconds") {
        policy.verification_timeout_seconds = parse_seconds(value, origin, false);
    } else if (key == "verification.runner") {
        policy.verification_runner = split_command(value);
    } else if (key == "adversarial.timeout_seconds") {
        policy.adversarial_timeout_seconds = parse_seconds(value, origin, false);
    } else if (key == "adversarial.runner") {
        auto runner = split_command(value);
        if (runner.empty()) {
            invalid("adversarial runner", value, origin);
        }
        policy.adversarial_runner = std::move(runner);
    } else if (key == "confirm.mode") {
        const auto lowered = to_lower_copy(value);
        if (lowered == "prompt") {
            policy.confirm.mode = ConfirmMode::Prompt;
        } else if (lowered == "accept") {
            policy.confirm.mode = ConfirmMode::Accept;
        } else if (lowered == "decline") {
            policy.confirm.mode = ConfirmMode::Decline;
        } else {
            invalid("confirmation mode", value, origin);
        }
    } else if (key == "confirm.timeout_seconds") {
        policy.confirm.timeout_seconds = parse_seconds(value, origin, true);
    } else if (key == "confirm.on_timeout") {
        const auto lowered = to_lower_copy(value);
        if (lowered != "accept" && lowered != "decline") {
            invalid("timeout action", value, origin);
        }
        policy.confirm.accept_on_timeout = lowered == "accept";
    } else if (key == "generation.max_attempts") {
        const auto attempts = parse_unsigned(value, origin);
        if (attempts == 0 || attempts > 10) {
            invalid("attempt count", value, origin);
        }
        policy.generation_max_attempts = static_cast<unsigned>(attempts);
    } else if (key == "cost.input_usd_per_mtok") {
        policy.prices.input_per_mtok = Usd::parse(value);
    } else if (key == "cost.output_usd_per_mtok") {
        policy.prices.output_per_mtok = Usd::parse(value);
    } else if (key == "cost.expected_output_tokens") {
        policy.prices.expected_output_tokens = parse_unsigned(value, origin);
    } else if (key == "cost.max_usd") {
        if (value.empty()) {
            policy.max_cost.reset();
        } else {
            policy.max_cost = Usd::parse(value);
        }
    } else if (key == "ledger.path") {
        if (value.empty()) {
            invalid("ledger path", value, origin);
        }
        policy.ledger_path = std::string{value};
    } else if (key == "agent.command") {
        policy.agent_command = split_command(value);
    } else {
        throw std::runtime_error("Unknown key '" + std::string{key} + "' at " + origin);
    }
}

Policy PolicyLoader::load(const std::filesystem::path& file, Policy base) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Policy file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Policy path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open policy file: " + file.string());
    }

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        const auto origin = file.string() + ":" + std::to_string(line_no);
        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw std::runtime_error("Expected 'key=value' entry at " + origin);
        }
        const auto key = trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        const auto value = trim_copy(std::string_view{trimmed}.substr(delimiter + 1));
        if (key.empty()) {
            throw std::runtime_error("Missing key at " + origin);
        }
        try {
            apply(base, key, value, origin);
        } catch (const std::runtime_error& ex) {
            const std::string what = ex.what();
            if (what.find(origin) != std::string::npos) {
                throw;
            }
            throw std::runtime_error(what + " at " + origin);
        }
    }
    return base;
}

}  // namespace advgate::pipeline

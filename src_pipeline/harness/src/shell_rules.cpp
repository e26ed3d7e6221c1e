#include "shell_rules.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using advgate::pipeline::PatternType;
using advgate::pipeline::Severity;
using advgate::pipeline::detail::RuleHit;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

// Lookup tables are kept sorted; membership uses binary search.
constexpr std::array<std::string_view, 14> kNetworkClients{{
    "aria2c", "curl", "ftp", "nc", "ncat", "netcat", "nmap", "scp", "sftp", "socat", "ssh",
    "telnet", "tftp", "wget",
}};

constexpr std::array<std::string_view, 11> kEscalationCommands{{
    "chroot", "doas", "insmod", "modprobe", "mount", "nsenter", "pkexec", "setcap", "su",
    "sudo", "unshare",
}};

constexpr std::array<std::string_view, 6> kDiskDestroyers{{
    "fdisk", "parted", "sfdisk", "shred", "wipefs", "zerofree",
}};

constexpr std::array<std::string_view, 19> kSystemDirs{{
    "bin", "boot", "dev", "etc", "home", "lib", "lib32", "lib64", "media", "mnt", "opt", "proc",
    "root", "run", "sbin", "srv", "sys", "usr", "var",
}};

constexpr std::array<std::string_view, 20> kPrefixWrappers{{
    "!", "builtin", "command", "do", "elif", "else", "env", "exec", "if", "nice", "nohup",
    "stdbuf", "then", "time", "timeout", "until", "while", "xargs", "{", "}",
}};

constexpr std::array<std::string_view, 8> kInterpreters{{
    "bash", "dash", "ksh", "perl", "python", "python3", "sh", "zsh",
}};

constexpr std::array<std::string_view, 5> kShells{{
    "bash", "dash", "ksh", "sh", "zsh",
}};

constexpr std::array<std::string_view, 13> kCredentialMarkers{{
    "/etc/gshadow", "/etc/passwd", "/etc/shadow", "/etc/sudoers", ".aws/credentials",
    ".docker/config.json", ".git-credentials", ".kube/config", ".netrc", ".pgpass",
    "id_ecdsa", "id_ed25519", "id_rsa",
}};

constexpr std::array<std::string_view, 6> kCredentialVarMarkers{{
    "ACCESS_KEY", "API_KEY", "PASSWD", "PASSWORD", "SECRET", "TOKEN",
}};

constexpr std::array<std::string_view, 6> kBlockDevicePrefixes{{
    "/dev/hd", "/dev/mmcblk", "/dev/nvme", "/dev/sd", "/dev/vd", "/dev/xvd",
}};

constexpr std::size_t kMaxNesting = 4;

template <std::size_t N>
bool in_table(const std::array<std::string_view, N>& table, std::string_view value) {
    return std::binary_search(table.begin(), table.end(), value);
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

bool contains(std::string_view text, std::string_view needle) {
    return text.find(needle) != std::string_view::npos;
}

bool all_digits(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::string_view basename_of(std::string_view word) {
    const auto slash = word.find_last_of('/');
    return slash == std::string_view::npos ? word : word.substr(slash + 1);
}

std::string to_upper_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

bool is_assignment(std::string_view word) {
    const auto eq = word.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return false;
    }
    const unsigned char first = static_cast<unsigned char>(word.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    return std::all_of(word.begin(), word.begin() + static_cast<std::ptrdiff_t>(eq), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_';
    });
}

// ---------------------------------------------------------------------------
// Tokenizer: words, separators, pipes and redirections of one shell line.
// Command substitutions ($(...), `...`, <(...)) are flattened into separate
// commands so that their command words are classified like any other.
// ---------------------------------------------------------------------------

enum class TokKind { Word, Separator, Pipe, RedirectOut, RedirectIn };

struct Tok {
    TokKind kind;
    std::string text;
};

enum class Quote { None, Single, Double };

std::vector<Tok> tokenize(std::string_view text) {
    std::vector<Tok> out;
    std::string word;
    bool have_word = false;
    Quote quote = Quote::None;
    std::vector<std::pair<Quote, char>> frames;  // quote state to restore, closing char

    auto flush = [&]() {
        if (have_word) {
            out.push_back(Tok{TokKind::Word, std::move(word)});
            word.clear();
            have_word = false;
        }
    };
    auto emit = [&](TokKind kind) {
        flush();
        out.push_back(Tok{kind, {}});
    };
    auto open_substitution = [&](char closer) {
        emit(TokKind::Separator);
        frames.emplace_back(quote, closer);
        quote = Quote::None;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        const char next = i + 1 < text.size() ? text[i + 1] : '\0';

        if (quote == Quote::Single) {
            if (ch == '\'') {
                quote = Quote::None;
            } else {
                word.push_back(ch);
            }
            continue;
        }
        if (quote == Quote::Double) {
            if (ch == '$' && next == '(') {
                ++i;
                open_substitution(')');
                continue;
            }
            if (ch == '`') {
                open_substitution('`');
                continue;
            }
            if (ch == '"') {
                quote = Quote::None;
            } else if (ch == '\\' && next != '\0') {
                word.push_back(next);
                ++i;
            } else {
                word.push_back(ch);
            }
            have_word = true;
            continue;
        }

        if (!frames.empty() && ch == frames.back().second) {
            emit(TokKind::Separator);
            quote = frames.back().first;
            frames.pop_back();
            continue;
        }

        switch (ch) {
            case '\'':
                quote = Quote::Single;
                have_word = true;
                break;
            case '"':
                quote = Quote::Double;
                have_word = true;
                break;
            case '\\':
                if (next != '\0') {
                    word.push_back(next);
                    have_word = true;
                    ++i;
                }
                break;
            case ' ':
            case '\t':
            case '\r':
                flush();
                break;
            case '\n':
                emit(TokKind::Separator);
                break;
            case '#':
                if (have_word) {
                    word.push_back(ch);
                } else {
                    while (i + 1 < text.size() && text[i + 1] != '\n') {
                        ++i;
                    }
                }
                break;
            case ';':
            case '(':
            case ')':
                emit(TokKind::Separator);
                break;
            case '&':
                if (next == '>') {
                    ++i;
                    if (i + 1 < text.size() && text[i + 1] == '>') {
                        ++i;
                    }
                    emit(TokKind::RedirectOut);
                } else {
                    if (next == '&') {
                        ++i;
                    }
                    emit(TokKind::Separator);
                }
                break;
            case '|':
                if (next == '|') {
                    ++i;
                    emit(TokKind::Separator);
                } else {
                    if (next == '&') {
                        ++i;
                    }
                    emit(TokKind::Pipe);
                }
                break;
            case '>':
                if (have_word && all_digits(word)) {
                    word.clear();
                    have_word = false;
                }
                if (next == '&') {
                    // fd duplication (2>&1): no file target
                    ++i;
                    while (i + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[i + 1])) != 0) {
                        ++i;
                    }
                    flush();
                    break;
                }
                if (next == '>' || next == '|') {
                    ++i;
                }
                emit(TokKind::RedirectOut);
                break;
            case '<':
                if (next == '(') {
                    ++i;
                    open_substitution(')');
                } else {
                    if (next == '<') {
                        ++i;
                    }
                    emit(TokKind::RedirectIn);
                }
                break;
            case '$':
                if (next == '(') {
                    ++i;
                    open_substitution(')');
                } else {
                    word.push_back(ch);
                    have_word = true;
                }
                break;
            case '`':
                open_substitution('`');
                break;
            default:
                word.push_back(ch);
                have_word = true;
                break;
        }
    }
    flush();
    return out;
}

struct Command {
    std::vector<std::string> words;
    std::vector<std::string> redirect_out;
    std::vector<std::string> redirect_in;
    bool piped_out{false};
};

std::vector<Command> split_commands(const std::vector<Tok>& toks) {
    std::vector<Command> commands(1);
    for (std::size_t i = 0; i < toks.size(); ++i) {
        const auto& tok = toks[i];
        switch (tok.kind) {
            case TokKind::Word:
                commands.back().words.push_back(tok.text);
                break;
            case TokKind::RedirectOut:
            case TokKind::RedirectIn:
                if (i + 1 < toks.size() && toks[i + 1].kind == TokKind::Word) {
                    auto& target = tok.kind == TokKind::RedirectOut ? commands.back().redirect_out
                                                                    : commands.back().redirect_in;
                    target.push_back(toks[i + 1].text);
                    ++i;
                }
                break;
            case TokKind::Pipe:
                commands.back().piped_out = true;
                commands.emplace_back();
                break;
            case TokKind::Separator:
                commands.emplace_back();
                break;
        }
    }
    commands.erase(std::remove_if(commands.begin(), commands.end(),
                                  [](const Command& cmd) {
                                      return cmd.words.empty() && cmd.redirect_out.empty() &&
                                             cmd.redirect_in.empty();
                                  }),
                   commands.end());
    return commands;
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

class HitList {
public:
    void add(PatternType type, Severity severity, std::string description) {
        for (const auto& hit : hits_) {
            if (hit.type == type && hit.description == description) {
                return;
            }
        }
        hits_.push_back(RuleHit{type, severity, std::move(description)});
    }

    void append(std::vector<RuleHit> other) {
        for (auto& hit : other) {
            add(hit.type, hit.severity, std::move(hit.description));
        }
    }

    // A credential read on the same line as a network client is an exfiltration channel.
    void escalate_exfiltration() {
        const bool has_network = std::any_of(hits_.begin(), hits_.end(), [](const RuleHit& hit) {
            return hit.type == PatternType::NetworkAccess && hit.severity != Severity::Medium;
        });
        if (!has_network) {
            return;
        }
        for (auto& hit : hits_) {
            if (hit.type == PatternType::Exfiltration && hit.severity == Severity::High) {
                hit.severity = Severity::Critical;
            }
        }
    }

    std::vector<RuleHit> take() { return std::move(hits_); }

private:
    std::vector<RuleHit> hits_;
};

void classify_words_common(const std::vector<std::string>& words, HitList& hits) {
    for (const auto& word : words) {
        if (contains(word, "/dev/tcp/") || contains(word, "/dev/udp/")) {
            hits.add(PatternType::NetworkAccess, Severity::Critical, "raw socket via /dev/tcp or /dev/udp");
        }
        if (auto hit = advgate::pipeline::detail::classify_sensitive_path(word)) {
            hits.add(hit->type, hit->severity, std::move(hit->description));
        }
        const auto dollar = word.find('$');
        if (dollar != std::string::npos) {
            std::size_t begin = dollar + 1;
            if (begin < word.size() && word[begin] == '{') {
                ++begin;
            }
            std::size_t end = begin;
            while (end < word.size() &&
                   (std::isalnum(static_cast<unsigned char>(word[end])) != 0 || word[end] == '_')) {
                ++end;
            }
            const auto name = to_upper_copy(std::string_view{word}.substr(begin, end - begin));
            for (const auto marker : kCredentialVarMarkers) {
                if (contains(name, marker)) {
                    hits.add(PatternType::Exfiltration, Severity::High,
                             "credential variable '$" + std::string{word.substr(begin, end - begin)} + "'");
                    break;
                }
            }
        }
    }
}

void classify_redirects(const Command& cmd, HitList& hits) {
    for (const auto& target : cmd.redirect_out) {
        if (target == "/dev/null" || target == "/dev/stdout" || target == "/dev/stderr" ||
            target == "/dev/tty" || starts_with(target, "/dev/fd/")) {
            continue;
        }
        const bool raw_device = std::any_of(kBlockDevicePrefixes.begin(), kBlockDevicePrefixes.end(),
                                            [&](std::string_view prefix) { return starts_with(target, prefix); });
        if (raw_device) {
            hits.add(PatternType::Destructive, Severity::Critical, "raw write to block device '" + target + "'");
        } else if (advgate::pipeline::detail::is_protected_path(target)) {
            hits.add(PatternType::Destructive, Severity::High, "overwrite outside workspace '" + target + "'");
        }
    }
    classify_words_common(cmd.redirect_out, hits);
    classify_words_common(cmd.redirect_in, hits);
}

bool is_flag(std::string_view word) {
    return word.size() > 1 && word.front() == '-';
}

void classify_rm(const std::vector<std::string>& args, HitList& hits) {
    bool recursive = false;
    bool force = false;
    std::vector<std::string_view> targets;
    for (const auto& arg : args) {
        if (arg == "--no-preserve-root") {
            hits.add(PatternType::Destructive, Severity::Critical, "rm with --no-preserve-root");
        } else if (arg == "--recursive") {
            recursive = true;
        } else if (arg == "--force") {
            force = true;
        } else if (is_flag(arg) && !starts_with(arg, "--")) {
            recursive = recursive || contains(arg, "r") || contains(arg, "R");
            force = force || contains(arg, "f");
        } else if (!is_flag(arg)) {
            targets.push_back(arg);
        }
    }

    for (const auto target : targets) {
        if (advgate::pipeline::detail::is_protected_path(target)) {
            const auto severity = (recursive || force) ? Severity::Critical : Severity::High;
            hits.add(PatternType::Destructive, severity,
                     std::string{recursive ? "recursive delete of '" : "delete of '"} + std::string{target} + "'");
        } else if (recursive && target.size() > 1 && target.front() == '$' &&
                   target.find('/') != std::string_view::npos) {
            hits.add(PatternType::Destructive, Severity::High,
                     "recursive delete through unchecked variable '" + std::string{target} + "'");
        } else if (recursive) {
            hits.add(PatternType::Destructive, Severity::Medium,
                     "recursive delete of '" + std::string{target} + "'");
        }
    }
}

bool is_setid_mode(std::string_view mode) {
    if (all_digits(mode)) {
        return mode.size() == 4 && mode.front() >= '2' && mode.front() <= '7';
    }
    const auto op = mode.find_first_of("+=");
    return op != std::string_view::npos && mode.find('s', op) != std::string_view::npos;
}

bool is_world_writable_mode(std::string_view mode) {
    if (all_digits(mode)) {
        const char last = mode.back();
        return last == '2' || last == '3' || last == '6' || last == '7';
    }
    return mode == "a+rwx" || mode == "ugo+rwx" || mode == "o+w" || mode == "a+w" || mode == "o+rwx";
}

void classify_permission_change(std::string_view name,
                                const std::vector<std::string>& args,
                                HitList& hits) {
    bool recursive = false;
    std::vector<std::string_view> operands;
    for (const auto& arg : args) {
        if (arg == "-R" || arg == "--recursive") {
            recursive = true;
        } else if (!is_flag(arg)) {
            operands.push_back(arg);
        }
    }
    if (operands.empty()) {
        return;
    }
    const auto spec = operands.front();
    for (std::size_t i = 1; i < operands.size(); ++i) {
        if (advgate::pipeline::detail::is_protected_path(operands[i])) {
            if (recursive) {
                hits.add(PatternType::Destructive, Severity::Critical,
                         "recursive " + std::string{name} + " on '" + std::string{operands[i]} + "'");
            } else {
                hits.add(PatternType::PrivilegeEscalation, Severity::High,
                         std::string{name} + " on '" + std::string{operands[i]} + "'");
            }
        }
    }

    if (name == "chmod") {
        if (is_setid_mode(spec)) {
            hits.add(PatternType::PrivilegeEscalation, Severity::High, "chmod sets setuid/setgid bit");
        } else if (is_world_writable_mode(spec)) {
            hits.add(PatternType::PrivilegeEscalation, Severity::High, "chmod makes file world-writable");
        } else if (contains(spec, "+x")) {
            for (std::size_t i = 1; i < operands.size(); ++i) {
                if (starts_with(operands[i], "/tmp/") || starts_with(operands[i], "/dev/shm/")) {
                    hits.add(PatternType::PrivilegeEscalation, Severity::Medium,
                             "chmod +x on staged file '" + std::string{operands[i]} + "'");
                    break;
                }
            }
        }
    } else {
        if (spec == "root" || starts_with(spec, "root:") || spec == "0" || starts_with(spec, "0:")) {
            hits.add(PatternType::PrivilegeEscalation, Severity::High, std::string{name} + " to root");
        }
    }
}

void classify_find(const std::vector<std::string>& args, HitList& hits) {
    bool deletes = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-delete") {
            deletes = true;
        } else if ((args[i] == "-exec" || args[i] == "-execdir") && i + 1 < args.size() &&
                   basename_of(args[i + 1]) == "rm") {
            deletes = true;
        }
    }
    if (!deletes) {
        return;
    }
    const bool protected_root = !args.empty() && !is_flag(args.front()) &&
                                advgate::pipeline::detail::is_protected_path(args.front());
    hits.add(PatternType::Destructive, protected_root ? Severity::Critical : Severity::High,
             protected_root ? "find -delete under '" + args.front() + "'" : std::string{"find with delete action"});
}

bool is_remote_rsync_operand(std::string_view arg) {
    if (starts_with(arg, "rsync://") || contains(arg, "::")) {
        return true;
    }
    const auto colon = arg.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    return arg.substr(0, colon).find('/') == std::string_view::npos;
}

std::vector<RuleHit> classify_text_nested(std::string_view text, std::size_t depth);

void classify_command(const Command& cmd,
                      const Command* next,
                      std::size_t depth,
                      HitList& hits) {
    classify_redirects(cmd, hits);
    classify_words_common(cmd.words, hits);

    std::size_t index = 0;
    std::string_view last_wrapper;
    const auto& words = cmd.words;
    while (index < words.size()) {
        const std::string_view word = words[index];
        const auto base = basename_of(word);
        if (is_assignment(word)) {
            ++index;
            continue;
        }
        if (base == "sudo" || base == "doas" || base == "pkexec") {
            hits.add(PatternType::PrivilegeEscalation, Severity::Critical,
                     "privilege escalation via '" + std::string{base} + "'");
            ++index;
            while (index < words.size() && is_flag(words[index])) {
                const auto& opt = words[index];
                ++index;
                if ((opt == "-u" || opt == "-g" || opt == "-U" || opt == "-C" || opt == "-p") &&
                    index < words.size()) {
                    ++index;
                }
            }
            last_wrapper = base;
            continue;
        }
        if (in_table(kPrefixWrappers, base)) {
            last_wrapper = base;
            ++index;
            while (index < words.size() && (is_flag(words[index]) || is_assignment(words[index]))) {
                ++index;
            }
            if (base == "timeout" && index < words.size() &&
                std::isdigit(static_cast<unsigned char>(words[index].front())) != 0) {
                ++index;
            }
            continue;
        }
        break;
    }

    std::string_view name;
    std::vector<std::string> args;
    if (index < words.size()) {
        name = basename_of(words[index]);
        args.assign(words.begin() + static_cast<std::ptrdiff_t>(index) + 1, words.end());
    } else if (last_wrapper == "env") {
        name = "env";
    } else {
        return;
    }

    const bool output_leaves = cmd.piped_out || !cmd.redirect_out.empty();

    if (in_table(kNetworkClients, name)) {
        hits.add(PatternType::NetworkAccess, Severity::Critical, "network client '" + std::string{name} + "'");
    } else if (name == "rsync") {
        if (std::any_of(args.begin(), args.end(), [](const std::string& a) { return is_remote_rsync_operand(a); })) {
            hits.add(PatternType::NetworkAccess, Severity::Critical, "rsync to remote host");
        }
    } else if (name == "rm") {
        classify_rm(args, hits);
    } else if (starts_with(name, "mkfs") || in_table(kDiskDestroyers, name)) {
        hits.add(PatternType::Destructive, Severity::Critical, "disk destroyer '" + std::string{name} + "'");
    } else if (name == "dd") {
        if (std::any_of(args.begin(), args.end(), [](const std::string& a) { return starts_with(a, "of=/dev/"); })) {
            hits.add(PatternType::Destructive, Severity::Critical, "dd onto a device");
        }
    } else if (name == "find") {
        classify_find(args, hits);
    } else if (name == "chmod" || name == "chown" || name == "chgrp") {
        classify_permission_change(name, args, hits);
    } else if (in_table(kEscalationCommands, name)) {
        hits.add(PatternType::PrivilegeEscalation, Severity::Critical,
                 "privilege escalation via '" + std::string{name} + "'");
    } else if (name == "env" || name == "printenv" || name == "compgen" ||
               (name == "set" && args.empty()) ||
               ((name == "export" || name == "declare" || name == "typeset") && !args.empty() &&
                (args.front() == "-p" || args.front() == "-x"))) {
        if (output_leaves && (name != "env" || args.empty())) {
            hits.add(PatternType::Exfiltration, Severity::High, "environment dump sent to another process or file");
        }
    } else if (name == "eval") {
        hits.add(PatternType::PrivilegeEscalation, Severity::Medium, "eval of dynamic shell code");
    } else if (name == "source" || name == ".") {
        if (!args.empty() && (starts_with(args.front(), "/tmp") || starts_with(args.front(), "http") ||
                              starts_with(args.front(), "/dev/"))) {
            hits.add(PatternType::PrivilegeEscalation, Severity::Medium,
                     "sourcing untrusted file '" + args.front() + "'");
        }
    } else if (name == "base64") {
        const bool decodes = std::any_of(args.begin(), args.end(), [](const std::string& a) {
            return a == "-d" || a == "--decode" || a == "-D";
        });
        if (decodes && cmd.piped_out && next != nullptr && !next->words.empty() &&
            in_table(kInterpreters, basename_of(next->words.front()))) {
            hits.add(PatternType::PrivilegeEscalation, Severity::Medium, "decoded payload piped into an interpreter");
        }
    } else if (name == "pip" || name == "pip3" || name == "npm" || name == "yarn" || name == "pnpm" ||
               name == "gem" || name == "cargo" || name == "go") {
        if (!args.empty() && (args.front() == "install" || args.front() == "add" || args.front() == "get")) {
            hits.add(PatternType::NetworkAccess, Severity::Medium,
                     std::string{name} + " " + args.front() + " needs network access");
        }
    } else if (name == "git") {
        if (!args.empty() && (args.front() == "clone" || args.front() == "fetch" || args.front() == "pull" ||
                              args.front() == "push" || args.front() == "ls-remote")) {
            hits.add(PatternType::NetworkAccess, Severity::Medium, "git " + args.front() + " needs network access");
        }
    } else if (name == "apt" || name == "apt-get" || name == "yum" || name == "dnf" || name == "apk" ||
               name == "zypper" || name == "pacman") {
        hits.add(PatternType::PrivilegeEscalation, Severity::High,
                 "system package manager '" + std::string{name} + "'");
    }

    // sh -c "..." and friends: classify the inline program as well.
    if (in_table(kShells, name) && depth < kMaxNesting) {
        for (std::size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "-c") {
                hits.append(classify_text_nested(args[i + 1], depth + 1));
                break;
            }
        }
    }
}

std::vector<RuleHit> classify_text_nested(std::string_view text, std::size_t depth) {
    HitList hits;

    std::string compact;
    compact.reserve(text.size());
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            compact.push_back(ch);
        }
    }
    if (contains(compact, ":(){")) {
        hits.add(PatternType::Destructive, Severity::Critical, "fork bomb");
    }

    const auto commands = split_commands(tokenize(text));
    for (std::size_t i = 0; i < commands.size(); ++i) {
        const Command* next = i + 1 < commands.size() ? &commands[i + 1] : nullptr;
        classify_command(commands[i], next, depth, hits);
    }
    hits.escalate_exfiltration();
    return hits.take();
}

}  // namespace

namespace advgate::pipeline::detail {

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

bool is_protected_path(std::string_view path) {
    if (path.empty()) {
        return false;
    }
    if (path == "/" || path == "/*" || path == "/." || path == "//") {
        return true;
    }
    if (path.front() == '~' || starts_with(path, "$HOME") || starts_with(path, "${HOME}")) {
        return true;
    }
    if (path == ".." || starts_with(path, "../")) {
        return true;
    }
    if (path.front() != '/') {
        return false;
    }
    auto component = path.substr(1);
    component = component.substr(0, component.find('/'));
    while (!component.empty() && component.back() == '*') {
        component.remove_suffix(1);
    }
    return in_table(kSystemDirs, component);
}

std::optional<RuleHit> classify_sensitive_path(std::string_view text) {
    for (const auto marker : kCredentialMarkers) {
        if (contains(text, marker)) {
            return RuleHit{PatternType::Exfiltration, Severity::High,
                           "read of credential file '" + std::string{marker} + "'"};
        }
    }
    // ~/.ssh, $HOME/.ssh, /root/.ssh: the directory itself, not just a key file
    const auto ssh = text.find(".ssh");
    if (ssh != std::string_view::npos && (ssh == 0 || text[ssh - 1] == '/') &&
        (ssh + 4 == text.size() || text[ssh + 4] == '/')) {
        return RuleHit{PatternType::Exfiltration, Severity::High, "read of credential file '.ssh'"};
    }
    return std::nullopt;
}

std::vector<RuleHit> classify_shell_text(std::string_view text) {
    return classify_text_nested(text, 0);
}

std::vector<RuleHit> classify_argv(const std::vector<std::string>& argv) {
    HitList hits;
    Command cmd;
    cmd.words = argv;
    classify_command(cmd, nullptr, 0, hits);
    hits.escalate_exfiltration();
    return hits.take();
}

}  // namespace advgate::pipeline::detail

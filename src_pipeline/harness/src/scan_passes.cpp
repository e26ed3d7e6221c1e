#include "scan_passes.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "python_syntax.hpp"

namespace {

using advgate::pipeline::PatternType;
using advgate::pipeline::Severity;
using advgate::pipeline::detail::Finding;
using advgate::pipeline::detail::RuleHit;
namespace py = advgate::pipeline::detail::py;

// Sorted tables; membership uses binary search.
constexpr std::array<std::string_view, 10> kShellEscapeCalls{{
    "commands.getoutput", "commands.getstatusoutput", "os.popen", "os.popen2", "os.popen3", "os.system",
    "platform.popen", "pty.spawn", "subprocess.getoutput", "subprocess.getstatusoutput",
}};

constexpr std::array<std::string_view, 5> kSubprocessCalls{{
    "subprocess.Popen", "subprocess.call", "subprocess.check_call", "subprocess.check_output", "subprocess.run",
}};

constexpr std::array<std::string_view, 18> kNetworkCalls{{
    "aiohttp.ClientSession", "ftplib.FTP", "ftplib.FTP_TLS", "http.client.HTTPConnection",
    "http.client.HTTPSConnection", "paramiko.SSHClient", "smtplib.SMTP", "smtplib.SMTP_SSL",
    "socket.create_connection", "socket.socket", "socket.socketpair", "telnetlib.Telnet", "urllib.request.Request",
    "urllib.request.build_opener", "urllib.request.urlopen", "urllib.request.urlretrieve", "urllib.urlopen",
    "urllib2.urlopen",
}};

constexpr std::array<std::string_view, 5> kNetworkPackages{{
    "httpx", "requests", "urllib3", "websocket", "websockets",
}};

constexpr std::array<std::string_view, 16> kNetworkModules{{
    "aiohttp", "ftplib", "http.client", "httpx", "paramiko", "poplib", "requests", "smtplib", "socket",
    "telnetlib", "urllib.request", "urllib2", "urllib3", "websocket", "websockets", "xmlrpc.client",
}};

constexpr std::array<std::string_view, 11> kPrivilegeCalls{{
    "ctypes.CDLL", "ctypes.cdll.LoadLibrary", "os.chmod", "os.chown", "os.lchown", "os.setegid", "os.seteuid",
    "os.setgid", "os.setregid", "os.setreuid", "os.setuid",
}};

constexpr std::array<std::string_view, 8> kDynamicCodeCalls{{
    "__import__", "compile", "eval", "exec", "importlib.import_module", "marshal.loads", "pickle.load",
    "pickle.loads",
}};

constexpr std::array<std::string_view, 5> kSensitiveNameMarkers{{
    "KEY", "PASSWD", "PASSWORD", "SECRET", "TOKEN",
}};

template <std::size_t N>
bool in_table(const std::array<std::string_view, N>& table, std::string_view value) {
    return std::binary_search(table.begin(), table.end(), value);
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

std::string_view first_component(std::string_view dotted) {
    return dotted.substr(0, dotted.find('.'));
}

bool is_sensitive_name(std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (unsigned char ch : name) {
        upper.push_back(static_cast<char>(std::toupper(ch)));
    }
    return std::any_of(kSensitiveNameMarkers.begin(), kSensitiveNameMarkers.end(),
                       [&](std::string_view marker) { return upper.find(marker) != std::string::npos; });
}

bool is_known_callee(std::string_view name) {
    return in_table(kShellEscapeCalls, name) || in_table(kSubprocessCalls, name) || in_table(kNetworkCalls, name) ||
           in_table(kPrivilegeCalls, name) || starts_with(name, "os.exec") || starts_with(name, "os.spawn") ||
           name == "shutil.rmtree" || name == "os.rmdir" || name == "os.removedirs" || name == "os.getenv" ||
           name == "os.environ";
}

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (char ch : text) {
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

bool is_true(const py::Argument& arg) {
    return arg.tokens.size() == 1 && arg.tokens.front().kind == py::TokenKind::Name &&
           arg.tokens.front().text == "True";
}

const py::Argument* positional(const py::CallSite& call, std::size_t index) {
    std::size_t seen = 0;
    for (const auto& arg : call.args) {
        if (!arg.keyword.empty()) {
            continue;
        }
        if (seen++ == index) {
            return &arg;
        }
    }
    return nullptr;
}

const py::Argument* keyword(const py::CallSite& call, std::string_view name) {
    for (const auto& arg : call.args) {
        if (arg.keyword == name) {
            return &arg;
        }
    }
    return nullptr;
}

class PythonPass {
public:
    explicit PythonPass(const py::Module& module) : module_(module) {
        for (const auto& binding : module.imports) {
            const bool plain = !binding.from_import && binding.local == first_component(binding.target);
            aliases_[binding.local] = plain ? binding.local : binding.target;
        }
    }

    std::vector<Finding> run() {
        for (const auto& binding : module_.imports) {
            check_import(binding.module, binding.line);
            if (binding.from_import) {
                check_import(binding.target, binding.line);
            }
        }
        for (const auto& call : module_.calls) {
            check_call(call);
        }
        for (const auto& sub : module_.subscripts) {
            if (resolve(sub.base) == "os.environ" && is_sensitive_name(sub.key)) {
                add(sub.line, PatternType::Exfiltration, Severity::High,
                    "read of sensitive environment variable '" + sub.key + "'");
            }
        }
        for (const auto& literal : module_.strings) {
            if (auto hit = advgate::pipeline::detail::classify_sensitive_path(literal.value)) {
                findings_.push_back(Finding{literal.line, std::move(*hit)});
            }
        }
        return std::move(findings_);
    }

private:
    std::string resolve(std::string_view dotted) const {
        const auto head = first_component(dotted);
        const auto it = aliases_.find(std::string{head});
        if (it != aliases_.end()) {
            return it->second + std::string{dotted.substr(head.size())};
        }
        if (dotted.find('.') == std::string_view::npos) {
            for (const auto& star : module_.star_modules) {
                auto candidate = star + "." + std::string{dotted};
                if (is_known_callee(candidate)) {
                    return candidate;
                }
            }
        }
        return std::string{dotted};
    }

    void add(std::size_t line, PatternType type, Severity severity, std::string description) {
        findings_.push_back(Finding{line, RuleHit{type, severity, std::move(description)}});
    }

    void add_all(std::size_t line, std::vector<RuleHit> hits) {
        for (auto& hit : hits) {
            findings_.push_back(Finding{line, std::move(hit)});
        }
    }

    void check_import(std::string_view name, std::size_t line) {
        if (in_table(kNetworkModules, name)) {
            add(line, PatternType::NetworkAccess, Severity::High, "import of network module '" + std::string{name} + "'");
        }
    }

    std::vector<std::string> literal_argv(const py::CallSite& call) const {
        std::vector<std::string> argv;
        for (const auto& arg : call.args) {
            if (!arg.keyword.empty() && arg.keyword != "*") {
                continue;
            }
            if (arg.literal) {
                argv.push_back(*arg.literal);
            } else if (arg.literal_list) {
                argv.insert(argv.end(), arg.literal_list->begin(), arg.literal_list->end());
            }
        }
        return argv;
    }

    void check_shell_escape(const py::CallSite& call, const std::string& fn) {
        std::vector<RuleHit> hits;
        const bool argv_form = starts_with(fn, "os.exec") || starts_with(fn, "os.spawn") || fn == "pty.spawn";
        if (argv_form) {
            auto argv = literal_argv(call);
            // os.spawn* carries the mode first and os.exec*/spawn* repeat the program path
            if (!argv.empty()) {
                hits = advgate::pipeline::detail::classify_argv(argv);
            }
        } else if (const auto* command = positional(call, 0)) {
            if (command->literal) {
                hits = advgate::pipeline::detail::classify_shell_text(*command->literal);
            } else if (command->literal_list) {
                hits = advgate::pipeline::detail::classify_argv(*command->literal_list);
            }
        }
        if (hits.empty()) {
            add(call.line, PatternType::PrivilegeEscalation, Severity::High, "shell escape via '" + fn + "'");
        } else {
            add_all(call.line, std::move(hits));
        }
    }

    void check_subprocess(const py::CallSite& call, const std::string& fn) {
        const auto* shell = keyword(call, "shell");
        if (shell != nullptr && is_true(*shell)) {
            check_shell_escape(call, fn);
            return;
        }
        std::vector<RuleHit> hits;
        const auto* args = positional(call, 0);
        if (args == nullptr) {
            args = keyword(call, "args");
        }
        if (args != nullptr) {
            if (args->literal_list) {
                hits = advgate::pipeline::detail::classify_argv(*args->literal_list);
            } else if (args->literal) {
                hits = advgate::pipeline::detail::classify_argv(split_words(*args->literal));
            }
        }
        if (hits.empty()) {
            add(call.line, PatternType::PrivilegeEscalation, Severity::Medium,
                "external process via '" + fn + "'; confirm the command is expected");
        } else {
            add_all(call.line, std::move(hits));
        }
    }

    void check_rmtree(const py::CallSite& call, const std::string& fn) {
        const auto* target = positional(call, 0);
        if (target == nullptr) {
            target = keyword(call, "path");
        }
        if (target == nullptr || !target->literal) {
            if (fn == "shutil.rmtree") {
                add(call.line, PatternType::Destructive, Severity::High, "recursive delete of a computed path");
            }
            return;
        }
        const auto& path = *target->literal;
        if (advgate::pipeline::detail::is_protected_path(path)) {
            add(call.line, PatternType::Destructive, Severity::Critical, fn + " of '" + path + "'");
        } else if (!path.empty() && path.front() == '/') {
            add(call.line, PatternType::Destructive, Severity::High, fn + " outside workspace '" + path + "'");
        } else if (fn == "shutil.rmtree") {
            add(call.line, PatternType::Destructive, Severity::Medium, "recursive delete of '" + path + "'");
        }
    }

    void check_environment(const py::CallSite& call, const std::string& fn) {
        if (fn == "os.environ.copy" || fn == "os.environ.items" || fn == "os.environ.values" ||
            fn == "os.environ.keys") {
            add(call.line, PatternType::Exfiltration, Severity::High, "enumeration of the whole environment");
            return;
        }
        if (fn == "os.getenv" || fn == "os.environ.get" || fn == "os.getenvb") {
            const auto* name = positional(call, 0);
            if (name != nullptr && name->literal && is_sensitive_name(*name->literal)) {
                add(call.line, PatternType::Exfiltration, Severity::High,
                    "read of sensitive environment variable '" + *name->literal + "'");
            }
            return;
        }
        for (const auto& arg : call.args) {
            if (arg.keyword == "env" || arg.dotted.empty()) {
                continue;
            }
            if (resolve(arg.dotted) == "os.environ") {
                add(call.line, PatternType::Exfiltration, Severity::High,
                    "whole environment passed to '" + fn + "'");
                return;
            }
        }
    }

    void check_call(const py::CallSite& call) {
        const auto fn = resolve(call.callee);
        if (in_table(kShellEscapeCalls, fn) || starts_with(fn, "os.exec") || starts_with(fn, "os.spawn")) {
            check_shell_escape(call, fn);
        } else if (in_table(kSubprocessCalls, fn)) {
            check_subprocess(call, fn);
        } else if (in_table(kNetworkCalls, fn) || in_table(kNetworkPackages, first_component(fn)) ||
                   starts_with(fn, "http.client.")) {
            add(call.line, PatternType::NetworkAccess, Severity::Critical, "network call '" + fn + "'");
        } else if (fn == "shutil.rmtree" || fn == "os.rmdir" || fn == "os.removedirs") {
            check_rmtree(call, fn);
        } else if (in_table(kPrivilegeCalls, fn)) {
            add(call.line, PatternType::PrivilegeEscalation, Severity::High, "privileged call '" + fn + "'");
        } else if (in_table(kDynamicCodeCalls, fn)) {
            add(call.line, PatternType::PrivilegeEscalation, Severity::Medium,
                "dynamic code execution via '" + fn + "'");
        }
        check_environment(call, fn);
    }

    const py::Module& module_;
    std::map<std::string, std::string> aliases_;
    std::vector<Finding> findings_;
};

}  // namespace

namespace advgate::pipeline::detail {

std::vector<Finding> scan_shell(std::string_view content) {
    std::vector<Finding> findings;
    std::size_t line_no = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        const std::size_t first_line = line_no + 1;
        std::string logical;
        // join physical lines ending in an unescaped backslash
        while (pos < content.size()) {
            const auto eol = content.find('\n', pos);
            auto physical = content.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
            pos = eol == std::string_view::npos ? content.size() : eol + 1;
            ++line_no;
            std::size_t backslashes = 0;
            while (backslashes < physical.size() && physical[physical.size() - 1 - backslashes] == '\\') {
                ++backslashes;
            }
            if (backslashes % 2 == 1) {
                logical.append(physical.substr(0, physical.size() - 1));
                logical.push_back(' ');
                continue;
            }
            logical.append(physical);
            break;
        }
        for (auto& hit : classify_shell_text(logical)) {
            findings.push_back(Finding{first_line, std::move(hit)});
        }
    }
    return findings;
}

std::vector<Finding> scan_python(std::string_view content) {
    const auto module = py::parse_module(content);
    return PythonPass{module}.run();
}

}  // namespace advgate::pipeline::detail

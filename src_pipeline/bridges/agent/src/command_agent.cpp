#include "advgate/command_agent.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace advgate::pipeline::agent {

namespace {

fs::path make_unique_dir(const fs::path& base, const std::string& prefix) {
    const auto now = std::chrono::system_clock::now();
    const auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    std::ostringstream os;
    os << prefix << ::getpid() << '_' << since_epoch;
    return base / os.str();
}

std::string read_text(const fs::path& p) {
    std::ifstream ifs(p);
    if (!ifs) {
        return {};
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

AgentReply failure(std::string error) {
    AgentReply reply;
    reply.error = std::move(error);
    return reply;
}

class ExchangeDir {
public:
    ExchangeDir(fs::path path, bool keep) : path_(std::move(path)), keep_(keep) {}
    ExchangeDir(const ExchangeDir&) = delete;
    ExchangeDir& operator=(const ExchangeDir&) = delete;
    ~ExchangeDir() {
        if (!keep_) {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
    }

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
    bool keep_;
};

}  // namespace

CommandAgentInvoker::CommandAgentInvoker(Config cfg) : cfg_(std::move(cfg)) {}

std::string CommandAgentInvoker::shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char ch : arg) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

AgentReply CommandAgentInvoker::invoke(const std::string& system_prompt, const std::string& content) {
    if (cfg_.command.empty()) {
        return failure("No agent command configured (agent.command)");
    }

    std::error_code ec;
    const fs::path base = cfg_.work_dir.empty() ? fs::temp_directory_path(ec) : cfg_.work_dir;
    if (ec) {
        return failure("No temporary directory available: " + ec.message());
    }
    ExchangeDir exchange(make_unique_dir(base, "advgate_agent_"), cfg_.keep_files);
    fs::create_directories(exchange.path(), ec);
    if (ec) {
        return failure("Failed to create " + exchange.path().string() + ": " + ec.message());
    }
    const auto request_path = exchange.path() / "request.json";
    const auto response_path = exchange.path() / "response.json";

    {
        std::ofstream ofs(request_path);
        if (!ofs) {
            return failure("Failed to open for write: " + request_path.string());
        }
        const nlohmann::json request{{"system_prompt", system_prompt}, {"content", content}};
        ofs << request.dump();
        if (!ofs) {
            return failure("Short write: " + request_path.string());
        }
    }

    std::string cmd;
    for (const auto& part : cfg_.command) {
        cmd += shell_quote(part);
        cmd += ' ';
    }
    cmd += shell_quote(request_path.string()) + " " + shell_quote(response_path.string());

    spdlog::debug("Invoking testing agent: {}", cmd);
    const int rc = std::system(cmd.c_str());
    if (rc == -1) {
        return failure("Failed to launch agent command");
    }
    if (!WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
        const int code = WIFEXITED(rc) ? WEXITSTATUS(rc) : 128 + WTERMSIG(rc);
        return failure("Agent command exited with status " + std::to_string(code));
    }

    const auto raw = read_text(response_path);
    if (raw.empty()) {
        return failure("Agent command produced no response at " + response_path.string());
    }
    try {
        const auto doc = nlohmann::json::parse(raw);
        AgentReply reply;
        reply.success = doc.value("success", false);
        reply.text = doc.value("text", std::string{});
        reply.error = doc.value("error", std::string{});
        return reply;
    } catch (const nlohmann::json::exception& ex) {
        return failure(std::string("Invalid agent response: ") + ex.what());
    }
}

}  // namespace advgate::pipeline::agent

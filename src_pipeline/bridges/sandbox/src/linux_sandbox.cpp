#include "advgate/linux_sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace advgate::pipeline::sandbox {

namespace {

constexpr const char* kSandboxPath = "/usr/local/bin:/usr/bin:/bin";
constexpr const char* kInheritedVariables[] = {"LANG", "LC_ALL", "TZ", "TERM"};
constexpr auto kKillGrace = std::chrono::seconds(2);
constexpr int kMaxSweepRounds = 64;

// Setup steps reported back from the child.
enum class Step : int { Redirect, ProcessGroup, Limits, Affinity, Unshare, IdMaps, Mounts, PidInit, Chdir, Exec };

const char* step_name(Step step) {
    switch (step) {
        case Step::Redirect: return "redirect stdio";
        case Step::ProcessGroup: return "create process group";
        case Step::Limits: return "apply resource limits";
        case Step::Affinity: return "pin CPU affinity";
        case Step::Unshare: return "create namespaces";
        case Step::IdMaps: return "write uid/gid maps";
        case Step::Mounts: return "prepare mounts";
        case Step::PidInit: return "start pid namespace init";
        case Step::Chdir: return "enter workspace";
        case Step::Exec: return "exec interpreter";
    }
    return "setup";
}

struct StatusRecord {
    int step;
    int error;
};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }
    ~UniqueFd() { reset(); }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw SandboxSetupError(std::string("pipe2 failed: ") + std::strerror(errno));
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

bool is_executable(const fs::path& path) {
    return ::access(path.c_str(), X_OK) == 0 && fs::is_regular_file(path);
}

fs::path resolve_interpreter(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        if (is_executable(program)) {
            return program;
        }
        throw SandboxSetupError("Interpreter is not executable: " + program);
    }
    std::string search = kSandboxPath;
    if (const char* host_path = std::getenv("PATH")) {
        search += ':';
        search += host_path;
    }
    std::size_t begin = 0;
    while (begin <= search.size()) {
        const auto end = std::min(search.find(':', begin), search.size());
        const auto dir = search.substr(begin, end - begin);
        if (!dir.empty()) {
            const fs::path candidate = fs::path(dir) / program;
            if (is_executable(candidate)) {
                return candidate;
            }
        }
        begin = end + 1;
    }
    throw SandboxSetupError("Interpreter not found: " + program);
}

std::vector<std::string> build_environment(const fs::path& workspace) {
    std::vector<std::string> env;
    for (const char* name : kInheritedVariables) {
        if (const char* value = std::getenv(name)) {
            env.push_back(std::string(name) + "=" + value);
        }
    }
    env.push_back(std::string("PATH=") + kSandboxPath);
    env.push_back("HOME=" + workspace.string());
    env.push_back("TMPDIR=" + (workspace / ".tmp").string());
    env.push_back("PYTHONDONTWRITEBYTECODE=1");
    env.push_back("ADVGATE_SANDBOX=1");
    return env;
}

std::vector<char*> as_argv(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& item : items) {
        out.push_back(item.data());
    }
    out.push_back(nullptr);
    return out;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Child-side helpers: async-signal-safe calls only.

[[noreturn]] void child_fail(int status_fd, Step step) {
    const StatusRecord record{static_cast<int>(step), errno};
    [[maybe_unused]] const auto written = ::write(status_fd, &record, sizeof(record));
    ::_exit(127);
}

bool write_proc_file(const char* path, const char* content, std::size_t length) {
    const int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    const auto written = ::write(fd, content, length);
    ::close(fd);
    return written == static_cast<ssize_t>(length);
}

unsigned long inherited_mount_flags(const char* path) {
    struct statvfs info {};
    if (::statvfs(path, &info) != 0) {
        return 0;
    }
    unsigned long flags = 0;
    if ((info.f_flag & ST_NOSUID) != 0) flags |= MS_NOSUID;
    if ((info.f_flag & ST_NODEV) != 0) flags |= MS_NODEV;
    if ((info.f_flag & ST_NOEXEC) != 0) flags |= MS_NOEXEC;
    if ((info.f_flag & ST_NOATIME) != 0) flags |= MS_NOATIME;
    if ((info.f_flag & ST_NODIRATIME) != 0) flags |= MS_NODIRATIME;
    if ((info.f_flag & ST_RELATIME) != 0) flags |= MS_RELATIME;
    return flags;
}

// Forks pid 1 of the fresh pid namespace, which in turn forks the process that
// execs the script. Both intermediates exit with the script's status; when
// pid 1 exits the kernel kills everything still left in the namespace.
void enter_pid_namespace(int status_fd) {
    const pid_t init = ::fork();
    if (init < 0) {
        child_fail(status_fd, Step::PidInit);
    }
    int status = 0;
    if (init > 0) {
        ::close(status_fd);
        while (::waitpid(init, &status, 0) < 0) {
            if (errno != EINTR) {
                ::_exit(127);
            }
        }
        ::_exit(decode_wait_status(status));
    }

    const pid_t script = ::fork();
    if (script < 0) {
        child_fail(status_fd, Step::PidInit);
    }
    if (script > 0) {
        ::close(status_fd);
        while (true) {
            const pid_t reaped = ::waitpid(-1, &status, 0);
            if (reaped == script) {
                ::_exit(decode_wait_status(status));
            }
            if (reaped < 0 && errno != EINTR) {
                ::_exit(127);
            }
        }
    }
}

struct ChildPlan {
    const char* executable;
    char* const* argv;
    char* const* envp;
    const char* workspace;
    const std::string* uid_map;
    const std::string* gid_map;
    const SandboxConfig* config;
    int stdout_fd;
    int stderr_fd;
    int status_fd;
};

[[noreturn]] void run_child(const ChildPlan& plan) {
    const auto& config = *plan.config;

    const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0 || ::dup2(plan.stdout_fd, STDOUT_FILENO) < 0 ||
        ::dup2(plan.stderr_fd, STDERR_FILENO) < 0) {
        child_fail(plan.status_fd, Step::Redirect);
    }

    if (::setpgid(0, 0) != 0) {
        child_fail(plan.status_fd, Step::ProcessGroup);
    }

    struct rlimit limit {};
    if (config.memory_limit > 0) {
        limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(config.memory_limit);
        if (::setrlimit(RLIMIT_AS, &limit) != 0) {
            child_fail(plan.status_fd, Step::Limits);
        }
    }
    const auto cpus = std::max(1U, config.cpu_limit);
    limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(config.timeout_seconds) * cpus + 1;
    if (::setrlimit(RLIMIT_CPU, &limit) != 0) {
        child_fail(plan.status_fd, Step::Limits);
    }
    limit.rlim_cur = limit.rlim_max = 0;
    if (::setrlimit(RLIMIT_CORE, &limit) != 0) {
        child_fail(plan.status_fd, Step::Limits);
    }

    cpu_set_t allowed;
    CPU_ZERO(&allowed);
    if (::sched_getaffinity(0, sizeof(allowed), &allowed) == 0) {
        cpu_set_t pinned;
        CPU_ZERO(&pinned);
        unsigned taken = 0;
        for (int cpu = 0; cpu < CPU_SETSIZE && taken < cpus; ++cpu) {
            if (CPU_ISSET(cpu, &allowed)) {
                CPU_SET(cpu, &pinned);
                ++taken;
            }
        }
        if (::sched_setaffinity(0, sizeof(pinned), &pinned) != 0) {
            child_fail(plan.status_fd, Step::Affinity);
        }
    }

    if (config.isolation == Isolation::Namespaces) {
        int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID;
        if (!config.network_enabled) {
            flags |= CLONE_NEWNET;
        }
        if (::unshare(flags) != 0) {
            child_fail(plan.status_fd, Step::Unshare);
        }
        static constexpr char kDeny[] = "deny";
        if (!write_proc_file("/proc/self/setgroups", kDeny, sizeof(kDeny) - 1) ||
            !write_proc_file("/proc/self/uid_map", plan.uid_map->data(), plan.uid_map->size()) ||
            !write_proc_file("/proc/self/gid_map", plan.gid_map->data(), plan.gid_map->size())) {
            child_fail(plan.status_fd, Step::IdMaps);
        }
        if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0 ||
            ::mount(plan.workspace, plan.workspace, nullptr, MS_BIND | MS_REC, nullptr) != 0 ||
            ::mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | inherited_mount_flags("/"),
                    nullptr) != 0) {
            child_fail(plan.status_fd, Step::Mounts);
        }
        enter_pid_namespace(plan.status_fd);
    }

    if (::chdir(plan.workspace) != 0) {
        child_fail(plan.status_fd, Step::Chdir);
    }
    ::execve(plan.executable, plan.argv, plan.envp);
    child_fail(plan.status_fd, Step::Exec);
}

void append_capped(std::string& sink, const char* data, std::size_t length, std::size_t cap, bool& truncated) {
    if (sink.size() < cap) {
        const auto room = cap - sink.size();
        sink.append(data, std::min(room, length));
        if (length > room) {
            truncated = true;
        }
    } else if (length > 0) {
        truncated = true;
    }
}

int wait_for(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decode_wait_status(status);
}

// True once `pid` has terminated; the zombie is left for wait_for.
bool has_exited(pid_t pid) {
    siginfo_t info{};
    return ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid;
}

// Children of this process other than `main`, read from /proc/<pid>/stat.
std::vector<pid_t> adopted_children(pid_t main) {
    std::vector<pid_t> children;
    const auto self = ::getpid();
    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
            continue;
        }
        std::ifstream stat(it->path() / "stat");
        std::string line;
        if (!std::getline(stat, line)) {
            continue;
        }
        const auto close = line.rfind(')');
        if (close == std::string::npos) {
            continue;
        }
        std::istringstream fields(line.substr(close + 1));
        char state = 0;
        long parent = 0;
        if (fields >> state >> parent && parent == self) {
            const auto child = static_cast<pid_t>(std::stol(name));
            if (child != main) {
                children.push_back(child);
            }
        }
    }
    return children;
}

// Kills descendants that left the sandbox process group and were re-parented
// to this subreaper. Each round picks up the children of the previous one.
void sweep_descendants(pid_t main) {
    for (int round = 0; round < kMaxSweepRounds; ++round) {
        const auto children = adopted_children(main);
        if (children.empty()) {
            return;
        }
        for (const pid_t child : children) {
            spdlog::debug("Killing sandbox descendant {} outside the process group", child);
            ::kill(child, SIGKILL);
            wait_for(child);
        }
    }
    spdlog::warn("Sandbox descendants still appearing after {} sweeps", kMaxSweepRounds);
}

// Makes this process the child subreaper for one run and restores the
// previous setting afterwards.
class SubreaperScope {
public:
    SubreaperScope() {
        int previous = 0;
        if (::prctl(PR_GET_CHILD_SUBREAPER, &previous, 0, 0, 0) != 0 ||
            ::prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0) {
            throw SandboxSetupError(std::string("Failed to become child subreaper: ") + std::strerror(errno));
        }
        previous_ = previous;
    }
    SubreaperScope(const SubreaperScope&) = delete;
    SubreaperScope& operator=(const SubreaperScope&) = delete;
    ~SubreaperScope() { ::prctl(PR_SET_CHILD_SUBREAPER, previous_, 0, 0, 0); }

private:
    int previous_{0};
};

}  // namespace

SandboxRun LinuxSandbox::run(const fs::path& script, const SandboxConfig& config) {
    std::error_code ec;
    const auto workspace = fs::canonical(config.workspace_path, ec);
    if (ec || !fs::is_directory(workspace)) {
        throw SandboxSetupError("Workspace is not a directory: " + config.workspace_path.string());
    }
    if (config.interpreter.empty()) {
        throw SandboxSetupError("No interpreter configured");
    }
    if (config.timeout_seconds <= 0) {
        throw SandboxSetupError("Sandbox timeout must be positive");
    }
    fs::create_directories(workspace / ".tmp", ec);
    if (ec) {
        throw SandboxSetupError("Failed to create " + (workspace / ".tmp").string() + ": " + ec.message());
    }

    const auto executable = resolve_interpreter(config.interpreter.front());
    std::vector<std::string> argv_storage = config.interpreter;
    argv_storage.front() = executable.string();
    argv_storage.push_back(fs::absolute(script).string());
    auto env_storage = build_environment(workspace);
    const auto argv = as_argv(argv_storage);
    const auto envp = as_argv(env_storage);
    const auto workspace_text = workspace.string();
    const auto uid_map = std::to_string(::getuid()) + " " + std::to_string(::getuid()) + " 1\n";
    const auto gid_map = std::to_string(::getgid()) + " " + std::to_string(::getgid()) + " 1\n";

    if (config.isolation == Isolation::ProcessOnly) {
        spdlog::warn("Sandbox running in process-only mode: no mount or network namespace for {}", script.string());
    }

    const SubreaperScope subreaper;
    auto out_pipe = make_pipe();
    auto err_pipe = make_pipe();
    auto status_pipe = make_pipe();

    const ChildPlan plan{executable.c_str(), argv.data(),     envp.data(),           workspace_text.c_str(),
                         &uid_map,           &gid_map,        &config,               out_pipe.write.get(),
                         err_pipe.write.get(), status_pipe.write.get()};

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw SandboxSetupError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        run_child(plan);
    }
    // Mirror the child's setpgid so a kill cannot race ahead of it.
    if (::setpgid(pid, pid) != 0 && errno != EACCES) {
        spdlog::debug("setpgid({}) in parent failed: {}", pid, std::strerror(errno));
    }
    out_pipe.write.reset();
    err_pipe.write.reset();
    status_pipe.write.reset();

    StatusRecord record{};
    ssize_t got = 0;
    do {
        got = ::read(status_pipe.read.get(), &record, sizeof(record));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(record))) {
        ::kill(-pid, SIGKILL);
        sweep_descendants(pid);
        wait_for(pid);
        const auto step = static_cast<Step>(record.step);
        throw SandboxSetupError(std::string("Sandbox setup failed to ") + step_name(step) + ": " +
                                std::strerror(record.error));
    }
    spdlog::debug("Sandbox pid {} running {} (timeout {}s)", pid, script.string(), config.timeout_seconds);

    SandboxRun result;
    bool out_truncated = false;
    bool err_truncated = false;
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + std::chrono::seconds(config.timeout_seconds);
    auto hard_stop = deadline + kKillGrace;

    pollfd fds[2] = {{out_pipe.read.get(), POLLIN, 0}, {err_pipe.read.get(), POLLIN, 0}};
    int open_streams = 2;
    bool main_exited = false;
    char buffer[8192];
    while (open_streams > 0 || !main_exited) {
        if (!main_exited && has_exited(pid)) {
            // Nothing may outlive the script: descendants would otherwise keep the pipes open.
            main_exited = true;
            ::kill(-pid, SIGKILL);
            sweep_descendants(pid);
        }
        const auto now = std::chrono::steady_clock::now();
        if (!main_exited && !result.timed_out && now >= deadline) {
            spdlog::warn("Sandbox pid {} exceeded {}s; killing process group", pid, config.timeout_seconds);
            ::kill(-pid, SIGKILL);
            result.timed_out = true;
            hard_stop = now + kKillGrace;
        }
        if (now >= hard_stop) {
            break;  // a killed descendant is stuck and still holds the pipe
        }
        const auto limit = result.timed_out || main_exited ? hard_stop : deadline;
        const auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now).count();
        const int ready = ::poll(fds, 2, static_cast<int>(std::clamp<long long>(wait_ms, 0, 100)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::kill(-pid, SIGKILL);
            sweep_descendants(pid);
            wait_for(pid);
            throw SandboxSetupError(std::string("poll failed: ") + std::strerror(errno));
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const auto n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                auto& sink = i == 0 ? result.stdout_text : result.stderr_text;
                append_capped(sink, buffer, static_cast<std::size_t>(n), config.max_output_bytes,
                              i == 0 ? out_truncated : err_truncated);
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    ::kill(-pid, SIGKILL);
    sweep_descendants(pid);
    result.exit_code = wait_for(pid);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    const auto marker = "\n[advgate: output truncated at " + std::to_string(config.max_output_bytes) + " bytes]\n";
    if (out_truncated) {
        result.stdout_text += marker;
    }
    if (err_truncated) {
        result.stderr_text += marker;
    }
    spdlog::debug("Sandbox pid {} finished: exit {} after {} ms{}", pid, result.exit_code,
                  std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(),
                  result.timed_out ? " (timed out)" : "");
    return result;
}

bool LinuxSandbox::user_namespaces_available() {
    const pid_t pid = ::fork();
    if (pid < 0) {
        return false;
    }
    if (pid == 0) {
        ::_exit(::unshare(CLONE_NEWUSER | CLONE_NEWNS) == 0 ? 0 : 1);
    }
    return wait_for(pid) == 0;
}

}  // namespace advgate::pipeline::sandbox

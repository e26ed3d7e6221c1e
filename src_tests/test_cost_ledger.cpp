/**
 * @file test_cost_ledger.cpp
 * @brief Cost estimation and the append-only cost ledger
 */

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "advgate/cost_ledger.hpp"
#include "test_support.hpp"

using advgate::pipeline::CostEstimator;
using advgate::pipeline::CostLedger;
using advgate::pipeline::LedgerEntry;
using advgate::pipeline::MemoryLedgerSink;
using advgate::pipeline::PriceTable;
using advgate::pipeline::SourceFile;
using advgate::pipeline::TsvLedgerSink;
using advgate::pipeline::Usd;

static LedgerEntry make_entry(const std::string& run_id, const std::string& status)
{
    LedgerEntry entry;
    entry.timestamp = std::chrono::system_clock::time_point{std::chrono::seconds{1'700'000'000}};
    entry.run_id = run_id;
    entry.estimated = Usd::parse("0.061740");
    entry.actual = Usd::parse("0.061740");
    entry.status = status;
    return entry;
}

static std::vector<std::string> lines_of(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

TEST_CASE("Token approximation rounds up", "[cost]")
{
    CHECK(CostEstimator::approximate_tokens(0) == 0);
    CHECK(CostEstimator::approximate_tokens(1) == 1);
    CHECK(CostEstimator::approximate_tokens(4) == 1);
    CHECK(CostEstimator::approximate_tokens(5) == 2);
}

TEST_CASE("Estimate prices input and expected output tokens", "[cost]")
{
    CostEstimator estimator;
    const std::vector<SourceFile> files{{"a.py", std::string(396, 'x')}};

    // 400 chars -> 100 input tokens at $3/Mtok plus 4096 output tokens at $15/Mtok
    const auto cost = estimator.estimate(files, {});
    CHECK(cost.micros == 300 + 61'440);
    CHECK(cost.to_string() == "0.061740");

    const auto with_claims = estimator.estimate(files, {"returns a sorted list"});
    CHECK(with_claims > cost);
    const auto with_prompt = estimator.estimate(files, {}, "system prompt");
    CHECK(with_prompt > cost);
}

TEST_CASE("Estimate uses the configured price table", "[cost]")
{
    PriceTable prices;
    prices.input_per_mtok = Usd::from_micros(1);
    prices.output_per_mtok = Usd{};
    prices.expected_output_tokens = 0;
    CostEstimator estimator(prices);

    // a partial micro-dollar is never rounded away
    CHECK(estimator.estimate({{"f", "abc"}}, {}).micros == 1);
    CHECK(estimator.estimate({}, {}).micros == 0);
}

TEST_CASE("Estimate refuses prices that overflow a dollar amount", "[cost]")
{
    PriceTable prices;
    prices.output_per_mtok = Usd::parse("1000000");

    SECTION("token count times price overflows")
    {
        prices.expected_output_tokens = std::numeric_limits<std::uint64_t>::max() / 1000;
        CHECK_THROWS_AS(CostEstimator(prices).estimate({}, {}), std::overflow_error);
    }
    SECTION("large but representable")
    {
        // 10^7 tokens at $10^6 per million: a 10^19 micro-dollar product, rounded to $10^7
        prices.expected_output_tokens = 10'000'000;
        prices.input_per_mtok = Usd{};
        CHECK(CostEstimator(prices).estimate({}, {}).micros == 10'000'000'000'000);
    }
}

TEST_CASE("TSV ledger writes a header once and appends rows", "[ledger]")
{
    advgate::test::TempDir dir("advgate_ledger");
    const auto path = dir.path() / "nested" / "cost-ledger.tsv";

    TsvLedgerSink sink(path);
    sink.append(make_entry("run-1", "Pass"));
    sink.append(make_entry("run\t2", "FailedImport"));

    const auto lines = lines_of(advgate::test::read_all(path));
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] + "\n" == std::string{TsvLedgerSink::kHeader});
    CHECK(lines[1] == "2023-11-14T22:13:20Z\trun-1\t0.061740\t0.061740\tPass");
    CHECK(lines[2] == "2023-11-14T22:13:20Z\trun 2\t0.061740\t0.061740\tFailedImport");
}

TEST_CASE("TSV ledger rows from concurrent writers never interleave", "[ledger]")
{
    advgate::test::TempDir dir("advgate_ledger");
    const auto path = dir.path() / "cost-ledger.tsv";
    TsvLedgerSink(path).append(make_entry("seed", "Pass"));

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&path, w]() {
            TsvLedgerSink sink(path);
            for (int i = 0; i < 25; ++i) {
                sink.append(make_entry("run-" + std::to_string(w) + "-" + std::to_string(i), "Pass"));
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }

    const auto lines = lines_of(advgate::test::read_all(path));
    REQUIRE(lines.size() == 1 + 1 + 100);
    for (std::size_t i = 1; i < lines.size(); ++i) {
        CHECK(lines[i].rfind("2023-11-14T22:13:20Z\t", 0) == 0);
        CHECK(lines[i].size() > 4);
        CHECK(lines[i].substr(lines[i].size() - 4) == "Pass");
    }
}

TEST_CASE("TSV ledger created by concurrent first writers has one header", "[ledger]")
{
    for (int round = 0; round < 10; ++round) {
        advgate::test::TempDir dir("advgate_ledger");
        const auto path = dir.path() / "cost-ledger.tsv";

        std::vector<std::thread> writers;
        for (int w = 0; w < 4; ++w) {
            writers.emplace_back([&path, w]() {
                TsvLedgerSink(path).append(make_entry("run-" + std::to_string(w), "Pass"));
            });
        }
        for (auto& t : writers) {
            t.join();
        }

        const auto lines = lines_of(advgate::test::read_all(path));
        REQUIRE(lines.size() == 1 + 4);
        CHECK(lines[0] + "\n" == std::string{TsvLedgerSink::kHeader});
        for (std::size_t i = 1; i < lines.size(); ++i) {
            CHECK(lines[i].rfind("2023-11-14T22:13:20Z\trun-", 0) == 0);
        }
        std::size_t entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
            (void)entry;
            ++entries;
        }
        CHECK(entries == 1);
    }
}

TEST_CASE("CostLedger swallows sink failures", "[ledger]")
{
    advgate::test::TempDir dir("advgate_ledger");
    const auto blocker = dir.write("not_a_dir", "x");

    CostLedger ledger(std::make_shared<TsvLedgerSink>(blocker / "cost-ledger.tsv"));
    CHECK_FALSE(ledger.record(make_entry("run-x", "Pass")));

    CostLedger detached(nullptr);
    CHECK_FALSE(detached.record(make_entry("run-y", "Pass")));
}

TEST_CASE("CostLedger forwards entries to the sink", "[ledger]")
{
    auto sink = std::make_shared<MemoryLedgerSink>();
    CostLedger ledger(sink);
    REQUIRE(ledger.record(make_entry("run-a", "DryRun")));
    REQUIRE(ledger.record(make_entry("run-b", "Cancelled")));

    const auto entries = sink->entries();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].run_id == "run-a");
    CHECK(entries[1].status == "Cancelled");
}

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "usd.hpp"

namespace advgate::pipeline {

struct SourceFile {
    std::filesystem::path path;
    std::string content;
};

struct PriceTable {
    Usd input_per_mtok{Usd::from_micros(3'000'000)};
    Usd output_per_mtok{Usd::from_micros(15'000'000)};
    std::uint64_t expected_output_tokens{4096};
};

/**
 * \brief Token-proportional cost heuristic for one Testing Agent call.
 *
 * No network access. Input tokens are ceil(chars / 4) over everything that is
 * sent; output tokens are the configured expectation.
 */
class CostEstimator {
public:
    explicit CostEstimator(PriceTable prices = {});

    [[nodiscard]] static std::uint64_t approximate_tokens(std::size_t characters) noexcept;

    [[nodiscard]] Usd estimate(const std::vector<SourceFile>& files,
                               const std::vector<std::string>& claims,
                               std::string_view system_prompt = {}) const;

    [[nodiscard]] const PriceTable& prices() const noexcept { return prices_; }

private:
    PriceTable prices_;
};

struct LedgerEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string run_id;
    Usd estimated;
    Usd actual;
    std::string status;
};

/// Append-only destination for ledger rows.
class LedgerSink {
public:
    virtual ~LedgerSink() = default;

    /// Throws std::runtime_error when the row cannot be stored.
    virtual void append(const LedgerEntry& entry) = 0;
};

/**
 * \brief Tab-separated ledger file.
 *
 * Each row is emitted with one write(2) on a descriptor opened with O_APPEND,
 * so concurrent runs sharing the file never interleave partial rows. A missing
 * file is created with its header by linking a fully written temporary into
 * place, so concurrent first writers produce one header.
 */
class TsvLedgerSink final : public LedgerSink {
public:
    explicit TsvLedgerSink(std::filesystem::path path);

    void append(const LedgerEntry& entry) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] static std::string format_row(const LedgerEntry& entry);

    static constexpr std::string_view kHeader = "timestamp_utc\trun_id\testimated_usd\tactual_usd\tstatus\n";

private:
    void create_with_header() const;

    std::filesystem::path path_;
};

class MemoryLedgerSink final : public LedgerSink {
public:
    void append(const LedgerEntry& entry) override;

    [[nodiscard]] std::vector<LedgerEntry> entries() const;

private:
    mutable std::mutex mutex_;
    std::vector<LedgerEntry> entries_;
};

/**
 * \brief Records exactly what the pipeline spent, never failing the run.
 *
 * `record` logs and swallows any sink error.
 */
class CostLedger {
public:
    explicit CostLedger(std::shared_ptr<LedgerSink> sink);

    /// Returns false when the row could not be stored (already logged).
    bool record(const LedgerEntry& entry) noexcept;

private:
    std::shared_ptr<LedgerSink> sink_;
};

}  // namespace advgate::pipeline

#include "advgate/cost_ledger.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace advgate::pipeline {

namespace {

constexpr std::uint64_t kCharsPerToken = 4;
constexpr std::uint64_t kTokensPerMillion = 1'000'000;

std::string sanitize_field(std::string_view value) {
    std::string out{value};
    for (auto& ch : out) {
        if (ch == '\t' || ch == '\n' || ch == '\r') {
            ch = ' ';
        }
    }
    return out;
}

std::string format_utc(std::chrono::system_clock::time_point when) {
    const auto seconds = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[32];
    const auto length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer, length);
}

// Rounds up so the estimate never undercounts a partial micro-dollar.
Usd price_tokens(std::uint64_t tokens, Usd per_million) {
    if (per_million.micros < 0) {
        throw std::invalid_argument("Negative token price: " + per_million.to_string());
    }
    const auto price = static_cast<std::uint64_t>(per_million.micros);
    if (price != 0 && tokens > std::numeric_limits<std::uint64_t>::max() / price) {
        throw std::overflow_error("Cost of " + std::to_string(tokens) + " tokens at $" + per_million.to_string() +
                                  "/Mtok does not fit in a dollar amount");
    }
    // the quotient stays below 2^64 / 10^6 and fits std::int64_t
    const auto product = tokens * price;
    const auto micros = product / kTokensPerMillion + (product % kTokensPerMillion != 0 ? 1 : 0);
    return Usd::from_micros(static_cast<std::int64_t>(micros));
}

}  // namespace

CostEstimator::CostEstimator(PriceTable prices) : prices_(prices) {}

std::uint64_t CostEstimator::approximate_tokens(std::size_t characters) noexcept {
    return (static_cast<std::uint64_t>(characters) + kCharsPerToken - 1) / kCharsPerToken;
}

Usd CostEstimator::estimate(const std::vector<SourceFile>& files,
                            const std::vector<std::string>& claims,
                            std::string_view system_prompt) const {
    std::size_t characters = system_prompt.size();
    for (const auto& file : files) {
        characters += file.path.string().size() + file.content.size();
    }
    for (const auto& claim : claims) {
        characters += claim.size();
    }
    const auto input = price_tokens(approximate_tokens(characters), prices_.input_per_mtok);
    const auto output = price_tokens(prices_.expected_output_tokens, prices_.output_per_mtok);
    return input + output;
}

TsvLedgerSink::TsvLedgerSink(fs::path path) : path_(std::move(path)) {}

std::string TsvLedgerSink::format_row(const LedgerEntry& entry) {
    std::string row = format_utc(entry.timestamp);
    row += '\t';
    row += sanitize_field(entry.run_id);
    row += '\t';
    row += entry.estimated.to_string();
    row += '\t';
    row += entry.actual.to_string();
    row += '\t';
    row += sanitize_field(entry.status);
    row += '\n';
    return row;
}

// A new ledger appears under its final name only with the header already in it,
// so exactly one of several first writers creates it.
void TsvLedgerSink::create_with_header() const {
    const auto parent = path_.parent_path().empty() ? fs::path{"."} : path_.parent_path();
    auto pattern = (parent / (path_.filename().string() + ".XXXXXX")).string();
    const int fd = ::mkstemp(pattern.data());
    if (fd < 0) {
        throw std::runtime_error("Failed to create ledger " + path_.string() + ": " + std::strerror(errno));
    }
    const auto header = kHeader;
    ssize_t written = 0;
    do {
        written = ::write(fd, header.data(), header.size());
    } while (written < 0 && errno == EINTR);
    const int write_errno = errno;
    const bool ok = written == static_cast<ssize_t>(header.size()) && ::fchmod(fd, 0644) == 0;
    ::close(fd);
    if (!ok) {
        ::unlink(pattern.c_str());
        throw std::runtime_error("Failed to write ledger header " + pattern + ": " +
                                 (written < 0 ? std::strerror(write_errno) : "short write"));
    }
    const bool linked = ::link(pattern.c_str(), path_.c_str()) == 0;
    const int link_errno = errno;
    ::unlink(pattern.c_str());
    if (!linked && link_errno != EEXIST) {
        throw std::runtime_error("Failed to create ledger " + path_.string() + ": " + std::strerror(link_errno));
    }
}

void TsvLedgerSink::append(const LedgerEntry& entry) {
    if (auto parent = path_.parent_path(); !parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create ledger directory " + parent.string() + ": " + ec.message());
        }
    }
    int fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0 && errno == ENOENT) {
        create_with_header();
        fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    }
    if (fd < 0) {
        throw std::runtime_error("Failed to open ledger " + path_.string() + ": " + std::strerror(errno));
    }

    const std::string payload = format_row(entry);

    ssize_t written = 0;
    do {
        written = ::write(fd, payload.data(), payload.size());
    } while (written < 0 && errno == EINTR);
    const int write_errno = errno;
    ::close(fd);
    if (written != static_cast<ssize_t>(payload.size())) {
        throw std::runtime_error("Failed to append to ledger " + path_.string() + ": " +
                                 (written < 0 ? std::strerror(write_errno) : "short write"));
    }
}

void MemoryLedgerSink::append(const LedgerEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
}

std::vector<LedgerEntry> MemoryLedgerSink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

CostLedger::CostLedger(std::shared_ptr<LedgerSink> sink) : sink_(std::move(sink)) {}

bool CostLedger::record(const LedgerEntry& entry) noexcept {
    if (!sink_) {
        return false;
    }
    try {
        sink_->append(entry);
        spdlog::debug("Ledger: {} {} estimated={} actual={}", entry.run_id, entry.status,
                      entry.estimated.to_string(), entry.actual.to_string());
        return true;
    } catch (const std::exception& ex) {
        spdlog::error("Cost ledger write failed for run {}: {}", entry.run_id, ex.what());
    }
    return false;
}

}  // namespace advgate::pipeline

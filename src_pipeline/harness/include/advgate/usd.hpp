#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace advgate::pipeline {

/**
 * \brief Monetary amount in US dollars, held as integer micro-dollars.
 *
 * Parsing and printing are exact to six decimal places so that ledger rows and
 * budget comparisons never drift through floating point.
 */
struct Usd {
    std::int64_t micros{0};

    static constexpr Usd from_micros(std::int64_t value) noexcept { return Usd{value}; }

    /// Parses "12", "0.5", "3.000125". Throws std::runtime_error on malformed input
    /// or more than six fractional digits.
    [[nodiscard]] static Usd parse(std::string_view text);

    /// Fixed six-decimal rendering, e.g. "0.012000".
    [[nodiscard]] std::string to_string() const;

    friend constexpr Usd operator+(Usd a, Usd b) noexcept { return Usd{a.micros + b.micros}; }
    friend constexpr auto operator<=>(const Usd&, const Usd&) = default;
};

}  // namespace advgate::pipeline

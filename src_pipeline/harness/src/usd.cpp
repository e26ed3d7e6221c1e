#include "advgate/usd.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>

namespace advgate::pipeline {

namespace {

constexpr std::int64_t kMicrosPerDollar = 1'000'000;
constexpr std::size_t kFractionDigits = 6;

[[noreturn]] void malformed(std::string_view text) {
    throw std::runtime_error("Invalid dollar amount: '" + std::string{text} + "'");
}

}  // namespace

Usd Usd::parse(std::string_view text) {
    std::string_view body = text;
    if (!body.empty() && body.front() == '$') {
        body.remove_prefix(1);
    }
    if (body.empty()) {
        malformed(text);
    }

    const auto dot = body.find('.');
    const auto whole = body.substr(0, dot);
    const auto fraction = dot == std::string_view::npos ? std::string_view{} : body.substr(dot + 1);
    if ((whole.empty() && fraction.empty()) || fraction.size() > kFractionDigits) {
        malformed(text);
    }

    constexpr auto kMaxDollars = std::numeric_limits<std::int64_t>::max() / kMicrosPerDollar;
    std::int64_t dollars = 0;
    for (char ch : whole) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            malformed(text);
        }
        const int digit = ch - '0';
        if (dollars > (kMaxDollars - digit) / 10) {
            malformed(text);
        }
        dollars = dollars * 10 + digit;
    }

    std::int64_t micros = 0;
    for (std::size_t i = 0; i < kFractionDigits; ++i) {
        micros *= 10;
        if (i < fraction.size()) {
            const char ch = fraction[i];
            if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
                malformed(text);
            }
            micros += ch - '0';
        }
    }
    if (dollars == kMaxDollars && micros > std::numeric_limits<std::int64_t>::max() % kMicrosPerDollar) {
        malformed(text);
    }
    return Usd{dollars * kMicrosPerDollar + micros};
}

std::string Usd::to_string() const {
    const bool negative = micros < 0;
    const auto magnitude = negative ? -micros : micros;
    auto fraction = std::to_string(magnitude % kMicrosPerDollar);
    fraction.insert(0, kFractionDigits - fraction.size(), '0');
    return (negative ? "-" : "") + std::to_string(magnitude / kMicrosPerDollar) + "." + fraction;
}

}  // namespace advgate::pipeline

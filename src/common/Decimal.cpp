#include "common/Decimal.h"

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace quantscan {

namespace {
int64_t roundScaled(long double scaled) {
    if (!std::isfinite(static_cast<double>(scaled))) {
        return 0;
    }
    if (scaled > static_cast<long double>(std::numeric_limits<int64_t>::max())) {
        return std::numeric_limits<int64_t>::max();
    }
    if (scaled < static_cast<long double>(std::numeric_limits<int64_t>::min())) {
        return std::numeric_limits<int64_t>::min();
    }
    return static_cast<int64_t>(std::llround(scaled));
}
}

Decimal Decimal::fromDouble(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("non-finite value cannot become a Decimal");
    }
    // fmt's default presentation is the shortest text that round-trips.
    return fromString(fmt::format("{}", value));
}

Decimal Decimal::fromString(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;

    bool negative = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        negative = (text[i] == '-');
        ++i;
    }

    std::string digits;
    int point_pos = -1;
    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        } else if (c == '.' && point_pos < 0) {
            point_pos = static_cast<int>(digits.size());
        } else {
            break;
        }
    }
    if (digits.empty()) {
        throw std::invalid_argument("not a decimal: '" + text + "'");
    }
    if (point_pos < 0) {
        point_pos = static_cast<int>(digits.size());
    }

    int exponent = 0;
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        size_t consumed = 0;
        try {
            exponent = std::stoi(text.substr(i), &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument("bad exponent in decimal: '" + text + "'");
        }
        i += consumed;
    }
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    if (i != text.size()) {
        throw std::invalid_argument("trailing characters in decimal: '" + text + "'");
    }

    // Position of the decimal point after applying the exponent.
    const int shifted_point = point_pos + exponent;

    int64_t units = 0;
    bool round_up = false;
    const int last_kept = shifted_point + kDigits;  // exclusive index into digits
    for (int k = 0; k < last_kept; ++k) {
        const int digit = (k >= 0 && k < static_cast<int>(digits.size())) ? (digits[k] - '0') : 0;
        if (units > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            throw std::out_of_range("decimal out of range: '" + text + "'");
        }
        units = units * 10 + digit;
    }
    if (last_kept >= 0 && last_kept < static_cast<int>(digits.size())) {
        round_up = (digits[last_kept] >= '5');
    }
    if (round_up) {
        ++units;
    }
    return fromUnits(negative ? -units : units);
}

std::string Decimal::toString() const {
    const bool negative = units_ < 0;
    const uint64_t magnitude = negative ? static_cast<uint64_t>(-(units_ + 1)) + 1u
                                        : static_cast<uint64_t>(units_);
    const uint64_t whole = magnitude / static_cast<uint64_t>(kScale);
    uint64_t frac = magnitude % static_cast<uint64_t>(kScale);

    std::string out = (negative ? "-" : "") + std::to_string(whole);
    if (frac == 0) {
        return out;
    }
    std::string frac_text = fmt::format("{:0{}}", frac, kDigits);
    while (!frac_text.empty() && frac_text.back() == '0') {
        frac_text.pop_back();
    }
    return out + "." + frac_text;
}

Decimal operator*(const Decimal& a, const Decimal& b) {
    const long double product = static_cast<long double>(a.units_) * static_cast<long double>(b.units_);
    return Decimal::fromUnits(roundScaled(product / static_cast<long double>(Decimal::kScale)));
}

Decimal operator/(const Decimal& a, const Decimal& b) {
    if (b.units_ == 0) {
        return Decimal();
    }
    const long double quotient =
        static_cast<long double>(a.units_) * static_cast<long double>(Decimal::kScale) /
        static_cast<long double>(b.units_);
    return Decimal::fromUnits(roundScaled(quotient));
}

} // namespace quantscan

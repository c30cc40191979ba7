#pragma once

#include <cstdint>
#include <string>

namespace quantscan {

// Fixed-point decimal with 8 fractional digits. Money and price arithmetic in
// the backtest runs on this type so results are reproducible run to run.
class Decimal {
public:
    static constexpr int kDigits = 8;
    static constexpr int64_t kScale = 100'000'000;

    constexpr Decimal() : units_(0) {}

    static constexpr Decimal fromUnits(int64_t units) {
        Decimal d;
        d.units_ = units;
        return d;
    }

    static Decimal fromInt(long long value) { return fromUnits(static_cast<int64_t>(value) * kScale); }

    // Goes through the shortest round-trip decimal text, then rounds to 8 digits.
    static Decimal fromDouble(double value);

    // Accepts "-12.345", "7", "0.00000001". Throws std::invalid_argument.
    static Decimal fromString(const std::string& text);

    int64_t units() const { return units_; }
    double toDouble() const { return static_cast<double>(units_) / static_cast<double>(kScale); }
    std::string toString() const;

    bool isZero() const { return units_ == 0; }
    Decimal abs() const { return fromUnits(units_ < 0 ? -units_ : units_); }

    Decimal operator-() const { return fromUnits(-units_); }
    Decimal& operator+=(const Decimal& o) { units_ += o.units_; return *this; }
    Decimal& operator-=(const Decimal& o) { units_ -= o.units_; return *this; }

    friend Decimal operator+(Decimal a, const Decimal& b) { return a += b; }
    friend Decimal operator-(Decimal a, const Decimal& b) { return a -= b; }
    friend Decimal operator*(const Decimal& a, const Decimal& b);
    // Division by zero yields zero; callers guard where it matters.
    friend Decimal operator/(const Decimal& a, const Decimal& b);

    friend bool operator==(const Decimal& a, const Decimal& b) { return a.units_ == b.units_; }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return a.units_ != b.units_; }
    friend bool operator<(const Decimal& a, const Decimal& b) { return a.units_ < b.units_; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return a.units_ <= b.units_; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return a.units_ > b.units_; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return a.units_ >= b.units_; }

private:
    int64_t units_;
};

} // namespace quantscan

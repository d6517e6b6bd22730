#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

// Arbitrary-precision base-10 number: value = (-1)^negative * digits * 10^exponent.
// Used for every JSON number literal with a fraction or exponent so that
// amounts like 0.00000001 BTC survive a round trip exactly.
class Decimal {
public:
    Decimal() = default;
    explicit Decimal(int64_t v);

    // Accepts the JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    // Throws std::invalid_argument on anything else.
    [[nodiscard]] static Decimal parse(std::string_view literal);

    // Round half-even to exactly `places` fractional digits.
    [[nodiscard]] Decimal round(int places) const;

    // Plain notation, never exponent form.
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] double      to_double() const;

    [[nodiscard]] bool is_zero() const noexcept { return digits_ == "0"; }
    [[nodiscard]] bool is_negative() const noexcept { return negative_; }
    [[nodiscard]] int  exponent() const noexcept { return exponent_; }

    [[nodiscard]] int compare(const Decimal& other) const;

    friend bool operator==(const Decimal& a, const Decimal& b) { return a.compare(b) == 0; }
    friend std::strong_ordering operator<=>(const Decimal& a, const Decimal& b) {
        return a.compare(b) <=> 0;
    }

private:
    bool        negative_ = false;
    std::string digits_   = "0"; // coefficient, no leading zeros
    int         exponent_ = 0;

    void normalize_zero();
};

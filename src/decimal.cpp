#include "decimal.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>

namespace {

// Literals beyond this are rejected rather than expanded into huge digit strings.
constexpr long long kMaxExponent = 100000;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

void strip_leading_zeros(std::string& digits) {
    const auto nz = digits.find_first_not_of('0');
    if (nz == std::string::npos)
        digits = "0";
    else
        digits.erase(0, nz);
}

} // namespace

Decimal::Decimal(int64_t v) : negative_(v < 0) {
    // Magnitude via unsigned arithmetic so INT64_MIN does not overflow.
    uint64_t mag = negative_ ? ~static_cast<uint64_t>(v) + 1 : static_cast<uint64_t>(v);
    digits_      = std::to_string(mag);
}

void Decimal::normalize_zero() {
    if (digits_ == "0")
        negative_ = false;
}

Decimal Decimal::parse(std::string_view s) {
    auto fail = [&]() -> Decimal {
        throw std::invalid_argument("invalid number literal: '" + std::string(s) + "'");
    };

    Decimal d;
    size_t  pos = 0;
    if (pos < s.size() && s[pos] == '-') {
        d.negative_ = true;
        ++pos;
    }

    const size_t int_start = pos;
    while (pos < s.size() && is_digit(s[pos]))
        ++pos;
    const std::string_view int_part = s.substr(int_start, pos - int_start);
    if (int_part.empty() || (int_part.size() > 1 && int_part[0] == '0'))
        return fail();

    std::string_view frac;
    if (pos < s.size() && s[pos] == '.') {
        const size_t frac_start = ++pos;
        while (pos < s.size() && is_digit(s[pos]))
            ++pos;
        frac = s.substr(frac_start, pos - frac_start);
        if (frac.empty())
            return fail();
    }

    long long exp = 0;
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        ++pos;
        bool exp_negative = false;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-'))
            exp_negative = s[pos++] == '-';
        const size_t exp_start = pos;
        while (pos < s.size() && is_digit(s[pos])) {
            if (exp <= kMaxExponent)
                exp = exp * 10 + (s[pos] - '0');
            ++pos;
        }
        if (pos == exp_start)
            return fail();
        if (exp > kMaxExponent)
            throw std::invalid_argument("number literal exponent out of range: '" +
                                        std::string(s) + "'");
        if (exp_negative)
            exp = -exp;
    }
    if (pos != s.size())
        return fail();

    d.digits_   = std::string(int_part) + std::string(frac);
    d.exponent_ = static_cast<int>(exp - static_cast<long long>(frac.size()));
    strip_leading_zeros(d.digits_);
    d.normalize_zero();
    return d;
}

Decimal Decimal::round(int places) const {
    Decimal   r      = *this;
    const int target = -places;

    if (exponent_ >= target) {
        if (!is_zero())
            r.digits_.append(static_cast<size_t>(exponent_ - target), '0');
        r.exponent_ = target;
        return r;
    }

    const size_t drop   = static_cast<size_t>(target - exponent_);
    std::string  digits = digits_;
    if (digits.size() <= drop)
        digits.insert(0, drop - digits.size() + 1, '0');

    std::string       kept = digits.substr(0, digits.size() - drop);
    const std::string rest = digits.substr(digits.size() - drop);

    bool round_up = false;
    if (rest[0] > '5') {
        round_up = true;
    } else if (rest[0] == '5') {
        const bool tail_nonzero = rest.find_first_not_of('0', 1) != std::string::npos;
        round_up                = tail_nonzero || ((kept.back() - '0') % 2 == 1);
    }

    if (round_up) {
        auto i = static_cast<std::ptrdiff_t>(kept.size()) - 1;
        while (i >= 0 && kept[static_cast<size_t>(i)] == '9') {
            kept[static_cast<size_t>(i)] = '0';
            --i;
        }
        if (i < 0)
            kept.insert(kept.begin(), '1');
        else
            ++kept[static_cast<size_t>(i)];
    }

    strip_leading_zeros(kept);
    r.digits_   = std::move(kept);
    r.exponent_ = target;
    r.normalize_zero();
    return r;
}

std::string Decimal::to_string() const {
    std::string out = negative_ ? "-" : "";
    if (exponent_ >= 0) {
        out += digits_;
        if (!is_zero())
            out.append(static_cast<size_t>(exponent_), '0');
        return out;
    }

    const auto  frac   = static_cast<size_t>(-exponent_);
    std::string digits = digits_;
    if (digits.size() <= frac)
        digits.insert(0, frac - digits.size() + 1, '0');
    out += digits.substr(0, digits.size() - frac);
    out += '.';
    out += digits.substr(digits.size() - frac);
    return out;
}

double Decimal::to_double() const {
    const std::string sci = (negative_ ? "-" : "") + digits_ + "e" + std::to_string(exponent_);
    return std::strtod(sci.c_str(), nullptr);
}

int Decimal::compare(const Decimal& other) const {
    if (is_zero() || other.is_zero()) {
        if (is_zero() && other.is_zero())
            return 0;
        if (is_zero())
            return other.negative_ ? 1 : -1;
        return negative_ ? -1 : 1;
    }
    if (negative_ != other.negative_)
        return negative_ ? -1 : 1;

    // Without leading zeros the position of the most significant digit orders magnitudes.
    int        mag = 0;
    const auto msd = static_cast<long long>(digits_.size()) + exponent_;
    const auto other_msd = static_cast<long long>(other.digits_.size()) + other.exponent_;
    if (msd != other_msd) {
        mag = msd < other_msd ? -1 : 1;
    } else {
        const size_t n = std::max(digits_.size(), other.digits_.size());
        for (size_t i = 0; i < n && mag == 0; ++i) {
            const char a = i < digits_.size() ? digits_[i] : '0';
            const char b = i < other.digits_.size() ? other.digits_[i] : '0';
            if (a != b)
                mag = a < b ? -1 : 1;
        }
    }
    return negative_ ? -mag : mag;
}

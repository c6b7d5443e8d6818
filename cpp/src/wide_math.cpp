#include "wide_math.hpp"
#include "curve_error.hpp"
#include <limits>

namespace bondcurve {

Wide WideMath::wide_multiply(const Wide& a, const Wide& b) {
    uint512 product = uint512(a) * uint512(b);
    if ((product >> 256) != 0) {
        throw CurveError(CurveErrc::InvalidConfig, "wide multiply overflow");
    }
    return static_cast<Wide>(product);
}

Amount WideMath::narrow(const Wide& value) {
    if ((value >> 128) != 0) {
        throw CurveError(CurveErrc::InvalidConfig, "value does not fit in 128 bits");
    }
    return static_cast<Amount>(value);
}

Amount WideMath::checked_add(const Amount& a, const Amount& b) {
    Amount sum = a + b;
    if (sum < a) {
        throw CurveError(CurveErrc::InvalidConfig, "addition overflow");
    }
    return sum;
}

Amount WideMath::saturating_add(const Amount& a, const Amount& b) {
    Amount sum = a + b;
    return sum < a ? max_amount() : sum;
}

Amount WideMath::saturating_sub(const Amount& a, const Amount& b) {
    return a > b ? Amount(a - b) : Amount(0);
}

Amount WideMath::saturating_mul(const Amount& a, const Amount& b) {
    Wide product = Wide(a) * Wide(b);
    if ((product >> 128) != 0) {
        return max_amount();
    }
    return static_cast<Amount>(product);
}

const Amount& WideMath::max_amount() {
    static const Amount v = (std::numeric_limits<Amount>::max)();
    return v;
}

// ------------------------------ decimal I/O ----------------------------------

Amount parse_amount(const std::string& s) {
    if (s.empty()) {
        throw std::invalid_argument("empty amount");
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("amount is not a base-10 unsigned integer: " + s);
        }
    }

    size_t first = s.find_first_not_of('0');
    if (first == std::string::npos) {
        return Amount(0);
    }
    std::string digits = s.substr(first);
    // 2^128 has 39 digits; anything longer cannot fit
    if (digits.size() > 39) {
        throw std::invalid_argument("amount exceeds 128 bits: " + s);
    }

    Wide value(digits);
    if ((value >> 128) != 0) {
        throw std::invalid_argument("amount exceeds 128 bits: " + s);
    }
    return static_cast<Amount>(value);
}

std::string to_string(const Amount& value) {
    return value.str();
}

} // namespace bondcurve

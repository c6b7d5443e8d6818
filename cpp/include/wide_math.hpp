#ifndef BONDCURVE_WIDE_MATH_HPP
#define BONDCURVE_WIDE_MATH_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <string>

namespace bondcurve {

// Token and sats quantities. Intermediate products are computed in uint256.
using uint128 = boost::multiprecision::uint128_t;
using uint256 = boost::multiprecision::uint256_t;
using uint512 = boost::multiprecision::uint512_t;

using Amount = uint128;
using Wide = uint256;

class WideMath {
public:
    // Exact a * b. Throws CurveError(InvalidConfig) if the product does not fit in Wide.
    static Wide wide_multiply(const Wide& a, const Wide& b);

    // Throws CurveError(InvalidConfig) if any of the high 128 bits is set.
    static Amount narrow(const Wide& value);

    // Throws CurveError(InvalidConfig) on overflow.
    static Amount checked_add(const Amount& a, const Amount& b);

    static Amount saturating_add(const Amount& a, const Amount& b);
    static Amount saturating_sub(const Amount& a, const Amount& b);
    static Amount saturating_mul(const Amount& a, const Amount& b);

    static const Amount& max_amount();
};

// Base-10 conversions used at the host boundaries. parse_amount accepts
// digits only and throws std::invalid_argument otherwise or above 2^128-1.
Amount parse_amount(const std::string& s);
std::string to_string(const Amount& value);

} // namespace bondcurve

#endif // BONDCURVE_WIDE_MATH_HPP

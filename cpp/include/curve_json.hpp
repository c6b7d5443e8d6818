// JSON conversions for curve inputs and reports. Amounts are written as
// decimal strings so values above 2^53 survive any JSON consumer.
#ifndef BONDCURVE_CURVE_JSON_HPP
#define BONDCURVE_CURVE_JSON_HPP

#include <boost/json.hpp>
#include <string>
#include <vector>
#include "curve.hpp"

namespace bondcurve {

namespace json = boost::json;

// Accepts a decimal string or a non-negative JSON integer.
Amount amount_from_json(const json::value& v);
std::vector<Amount> amounts_from_json(const json::value& v);
CurveConfig config_from_json(const json::object& o);

// Parses text as JSON; throws std::invalid_argument on malformed input.
json::value parse_json(const std::string& text);

struct Report {
    static json::object params(const Curve& c);
    static json::object state(const Curve& c, const Amount& step);
    static json::array simulated(const std::vector<SimulatedMint>& mints);
};

} // namespace bondcurve

#endif // BONDCURVE_CURVE_JSON_HPP

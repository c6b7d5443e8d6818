#include "curve_json.hpp"
#include <boost/json/src.hpp>
#include <cstdint>
#include <stdexcept>

namespace bondcurve {

Amount amount_from_json(const json::value& v) {
    if (v.is_string()) return parse_amount(std::string(v.as_string().data(), v.as_string().size()));
    if (v.is_uint64()) return Amount(v.as_uint64());
    if (v.is_int64()) {
        if (v.as_int64() < 0) throw std::invalid_argument("negative amount");
        return Amount(static_cast<uint64_t>(v.as_int64()));
    }
    throw std::invalid_argument("amount must be a decimal string or an unsigned integer");
}

std::vector<Amount> amounts_from_json(const json::value& v) {
    if (!v.is_array()) {
        throw std::invalid_argument("expected an array of amounts");
    }
    const auto& arr = v.as_array();
    std::vector<Amount> out;
    out.reserve(arr.size());
    for (const auto& e : arr) out.push_back(amount_from_json(e));
    return out;
}

CurveConfig config_from_json(const json::object& o) {
    auto field = [&](const char* key) {
        const json::value* v = o.if_contains(key);
        if (!v) throw std::invalid_argument(std::string("curve config missing '") + key + "'");
        return amount_from_json(*v);
    };
    CurveConfig cfg;
    cfg.total_supply = field("total_supply");
    cfg.sell_amount = field("sell_amount");
    cfg.vt = field("vt");
    cfg.mc_target_sats = field("mc_target_sats");
    return cfg;
}

json::value parse_json(const std::string& text) {
    boost::system::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec) {
        throw std::invalid_argument("malformed JSON: " + ec.message());
    }
    return v;
}

// -------------------------------- reports ------------------------------------

json::object Report::params(const Curve& c) {
    json::object o;
    o["total_supply"] = to_string(c.total_supply());
    o["sell_amount"] = to_string(c.sell_amount());
    o["vt"] = to_string(c.vt());
    o["y0"] = to_string(c.y0());
    o["x0"] = to_string(c.x0());
    o["k"] = to_string(c.k());
    return o;
}

json::object Report::state(const Curve& c, const Amount& step) {
    CurveSnapshot snap = c.snapshot(step);
    json::object o;
    o["step"] = to_string(snap.step);
    o["x"] = to_string(snap.x);
    o["y"] = to_string(snap.y);
    o["mc_sats"] = to_string(c.mc_sats_at_step(step));
    o["cumulative_quote"] = to_string(c.cumulative_quote_to_step(step));
    o["progress"] = to_string(c.progress_at_step(step));
    return o;
}

json::array Report::simulated(const std::vector<SimulatedMint>& mints) {
    json::array arr;
    for (const auto& m : mints) {
        arr.push_back(json::object{{"step", to_string(m.step)}, {"asset_out", to_string(m.asset_out)}});
    }
    return arr;
}

} // namespace bondcurve

#include "curve.hpp"
#include <algorithm>

namespace bondcurve {

const char* errc_name(CurveErrc code) {
    switch (code) {
        case CurveErrc::InvalidConfig: return "InvalidConfig";
        case CurveErrc::OutOfRange:    return "OutOfRange";
        case CurveErrc::ZeroInput:     return "ZeroInput";
        case CurveErrc::ExceedsPool:   return "ExceedsPool";
    }
    return "Unknown";
}

// ------------------------------ construction ---------------------------------

Curve::Curve(const CurveConfig& cfg)
    : total_supply_(cfg.total_supply),
      sell_amount_(cfg.sell_amount),
      vt_(cfg.vt) {
    if (cfg.total_supply == 0 || cfg.sell_amount == 0 || cfg.vt == 0 || cfg.mc_target_sats == 0) {
        throw CurveError(CurveErrc::InvalidConfig, "config values must be non-zero");
    }

    y0_ = WideMath::checked_add(vt_, sell_amount_);

    // X0 = mc_target_sats * vt^2 / (Y0 * total_supply)
    Wide vt_sq = WideMath::wide_multiply(Wide(vt_), Wide(vt_));
    Wide num = WideMath::wide_multiply(Wide(cfg.mc_target_sats), vt_sq);
    Wide den = WideMath::wide_multiply(Wide(y0_), Wide(total_supply_));
    if (den == 0) {
        throw CurveError(CurveErrc::InvalidConfig, "zero x0 denominator");
    }

    x0_ = WideMath::narrow(num / den);
    if (x0_ == 0) {
        throw CurveError(CurveErrc::InvalidConfig, "x0 rounds to zero");
    }

    k_ = WideMath::narrow(WideMath::wide_multiply(Wide(x0_), Wide(y0_)));
}

// ---------------------------- reserve function -------------------------------

Amount Curve::y_at(const Amount& step) const {
    if (step > sell_amount_) {
        throw CurveError(CurveErrc::OutOfRange, "step " + step.str() + " past sell amount " + sell_amount_.str());
    }
    Amount remaining = sell_amount_ - step;
    return WideMath::checked_add(vt_, remaining);
}

Amount Curve::x_from_y(const Amount& y) const {
    return k_ / y;
}

CurveSnapshot Curve::snapshot(const Amount& step) const {
    Amount y = y_at(step);
    Amount x = x_from_y(y);
    return {step, x, y};
}

// --------------------------------- fills -------------------------------------

MintResult Curve::mint(const Amount& step, const Amount& quote_in) const {
    if (quote_in == 0) {
        throw CurveError(CurveErrc::ZeroInput, "zero quote in");
    }

    Amount y = y_at(step);
    Amount x = x_from_y(y);

    Amount x_new = WideMath::checked_add(x, quote_in);

    // Y' = floor(k / X'), never below vt
    Amount y_raw = k_ / x_new;
    Amount y_new = std::max(y_raw, vt_);

    Amount dy = WideMath::saturating_sub(y, y_new);
    Amount new_step = std::min(WideMath::saturating_add(step, dy), sell_amount_);
    return {new_step, dy};
}

Amount Curve::asset_out_given_quote_in(const Amount& step, const Amount& quote_in) const {
    return mint(step, quote_in).asset_out;
}

Amount Curve::quote_in_given_asset_out(const Amount& step, const Amount& asset_out) const {
    if (asset_out == 0) {
        return 0;
    }

    Amount y = y_at(step);
    Amount max_tokens = WideMath::saturating_sub(y, vt_);
    if (asset_out > max_tokens) {
        throw CurveError(CurveErrc::ExceedsPool, "asset out above remaining tokens " + max_tokens.str());
    }

    Amount x = x_from_y(y);
    Amount x_final = k_ / vt_;
    if (x_final < x) {
        throw CurveError(CurveErrc::InvalidConfig, "final reserve below current reserve");
    }
    Amount max_quote = x_final - x;
    if (max_quote == 0) {
        throw CurveError(CurveErrc::ExceedsPool, "no quote capacity left");
    }

    // Lower bound: asset_out is non-decreasing in quote_in
    Amount lo = 1;
    Amount hi = max_quote;
    while (lo < hi) {
        Amount mid = lo + (hi - lo) / 2;
        if (asset_out_given_quote_in(step, mid) >= asset_out) {
            hi = mid;
        } else {
            lo = mid + 1;
        }
    }
    return lo;
}

std::vector<SimulatedMint> Curve::simulate_mints(const std::vector<Amount>& mints) const {
    Amount current_step = 0;
    std::vector<SimulatedMint> results;
    results.reserve(mints.size());

    for (const auto& quote_in : mints) {
        MintResult r = mint(current_step, quote_in);
        results.push_back({current_step, r.asset_out});
        current_step = r.new_step;
    }
    return results;
}

// --------------------------------- views -------------------------------------

Amount Curve::cumulative_quote_to_step(const Amount& step) const {
    return WideMath::saturating_sub(snapshot(step).x, x0_);
}

Amount Curve::total_raise_sats() const {
    return WideMath::saturating_sub(k_ / vt_, x0_);
}

Amount Curve::mc_sats_at_step(const Amount& step) const {
    CurveSnapshot snap = snapshot(step);
    if (snap.y == 0) {
        throw CurveError(CurveErrc::InvalidConfig, "zero token reserve");
    }
    Wide num = WideMath::wide_multiply(Wide(snap.x), Wide(total_supply_));
    return WideMath::narrow(num / Wide(snap.y));
}

Amount Curve::final_mc_sats() const {
    return mc_sats_at_step(sell_amount_);
}

Amount Curve::progress_at_step(const Amount& step) const {
    return WideMath::saturating_mul(step, 100) / total_supply_;
}

Amount Curve::avg_progess(const std::vector<Amount>& steps) const {
    Amount product = 1;
    Amount sum = 0;
    for (const auto& s : steps) {
        product = WideMath::narrow(WideMath::wide_multiply(Wide(product), Wide(s)));
        sum = WideMath::checked_add(sum, s);
    }
    if (sum == 0) {
        throw CurveError(CurveErrc::InvalidConfig, "zero step sum");
    }
    return product / sum;
}

} // namespace bondcurve

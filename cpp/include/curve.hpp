// Constant-product bonding curve with virtual token reserves.
//
//   X * Y = k
//   Y(step) = vt + (sell_amount - step)     token side, real + virtual
//   X(step) = floor(k / Y(step))            sats side (conceptual)
//
// X0 is solved from the desired final fully diluted market cap:
//   mc_final ~ (X0 * Y0 / vt^2) * total_supply
//   => X0 ~ mc_target_sats * vt^2 / (Y0 * total_supply)
//
// A Curve is immutable once constructed. Callers track `step` themselves and
// pass it into every operation; all operations throw CurveError on failure.
#ifndef BONDCURVE_CURVE_HPP
#define BONDCURVE_CURVE_HPP

#include <vector>
#include "curve_error.hpp"
#include "wide_math.hpp"

namespace bondcurve {

struct CurveConfig {
    Amount total_supply;    // total token supply
    Amount sell_amount;     // tokens sold over the curve
    Amount vt;              // virtual token reserve
    Amount mc_target_sats;  // final FDV target in sats
};

struct CurveSnapshot {
    Amount step;  // tokens sold so far
    Amount x;     // sats-side reserve
    Amount y;     // token-side reserve (vt + remaining real)

    // Spot price as the fraction x / y (sats per token base unit)
    const Amount& price_num() const { return x; }
    const Amount& price_den() const { return y; }
};

struct MintResult {
    Amount new_step;
    Amount asset_out;
};

struct SimulatedMint {
    Amount step;       // step before this mint
    Amount asset_out;
};

class Curve {
public:
    explicit Curve(const CurveConfig& cfg);

    const Amount& total_supply() const { return total_supply_; }
    const Amount& sell_amount() const { return sell_amount_; }
    const Amount& vt() const { return vt_; }
    const Amount& y0() const { return y0_; }
    const Amount& x0() const { return x0_; }
    const Amount& k() const { return k_; }

    const Amount& max_step() const { return sell_amount_; }

    // Y(step); throws OutOfRange past sell_amount
    Amount y_at(const Amount& step) const;
    Amount x_from_y(const Amount& y) const;
    CurveSnapshot snapshot(const Amount& step) const;

    // ------------------------ Fills ------------------------

    // Buy tokens with quote_in sats at `step`. The virtual reserve is never
    // touched: Y' is floored at vt and new_step is clamped to sell_amount.
    MintResult mint(const Amount& step, const Amount& quote_in) const;
    Amount asset_out_given_quote_in(const Amount& step, const Amount& quote_in) const;

    // Smallest quote_in whose mint yields at least asset_out tokens.
    Amount quote_in_given_asset_out(const Amount& step, const Amount& asset_out) const;

    // Runs mints back to back from step 0; all or nothing.
    std::vector<SimulatedMint> simulate_mints(const std::vector<Amount>& mints) const;

    // ------------------------ Views ------------------------

    // Sats raised between step 0 and `step`
    Amount cumulative_quote_to_step(const Amount& step) const;
    // Sats raised over the full window [0, sell_amount]: floor(k / vt) - x0
    Amount total_raise_sats() const;
    // FDV in sats at `step`: x * total_supply / y
    Amount mc_sats_at_step(const Amount& step) const;
    Amount final_mc_sats() const;
    // Percent of total_supply (not sell_amount) sold at `step`
    Amount progress_at_step(const Amount& step) const;
    // product(steps) / sum(steps)
    Amount avg_progess(const std::vector<Amount>& steps) const;

private:
    Amount total_supply_;
    Amount sell_amount_;
    Amount vt_;

    Amount y0_;
    Amount x0_;
    Amount k_;
};

} // namespace bondcurve

#endif // BONDCURVE_CURVE_HPP

#include "curve.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <vector>

namespace bondcurve {
namespace {

// 1B supply, 800M sold over the curve, 200M virtual, 1B sats final FDV.
// Derives y0 = 1e9, x0 = 4e7, k = 4e16, final reserve k / vt = 2e8.
CurveConfig default_config() {
    CurveConfig cfg;
    cfg.total_supply = 1000000000;
    cfg.sell_amount = 800000000;
    cfg.vt = 200000000;
    cfg.mc_target_sats = 1000000000;
    return cfg;
}

CurveErrc code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const CurveError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected CurveError";
    return CurveErrc::InvalidConfig;
}

class CurveTest : public testing::Test {
protected:
    Curve curve{default_config()};
};

// ------------------------------ construction ---------------------------------

TEST_F(CurveTest, DerivedInvariants) {
    EXPECT_EQ(curve.y0(), Amount(1000000000));
    EXPECT_EQ(curve.x0(), Amount(40000000));
    EXPECT_EQ(curve.k(), Amount("40000000000000000"));
    EXPECT_EQ(curve.max_step(), curve.sell_amount());
    EXPECT_EQ(Wide(curve.x0()) * Wide(curve.y0()), Wide(curve.k()));
}

TEST(CurveConstructionTest, ZeroFieldsAreInvalid) {
    for (int field = 0; field < 4; ++field) {
        CurveConfig cfg = default_config();
        switch (field) {
            case 0: cfg.total_supply = 0; break;
            case 1: cfg.sell_amount = 0; break;
            case 2: cfg.vt = 0; break;
            case 3: cfg.mc_target_sats = 0; break;
        }
        EXPECT_EQ(code_of([&] { Curve c(cfg); }), CurveErrc::InvalidConfig) << "field " << field;
    }
}

TEST(CurveConstructionTest, ReserveSumOverflow) {
    CurveConfig cfg = default_config();
    cfg.vt = WideMath::max_amount();
    cfg.sell_amount = 1;
    EXPECT_EQ(code_of([&] { Curve c(cfg); }), CurveErrc::InvalidConfig);
}

TEST(CurveConstructionTest, X0RoundsToZero) {
    CurveConfig cfg = default_config();
    cfg.vt = 1;
    cfg.mc_target_sats = 1;
    EXPECT_EQ(code_of([&] { Curve c(cfg); }), CurveErrc::InvalidConfig);
}

TEST(CurveConstructionTest, InvariantTooWide) {
    CurveConfig cfg;
    cfg.total_supply = 1;
    cfg.sell_amount = 1;
    cfg.vt = Amount(1) << 64;
    cfg.mc_target_sats = Amount(1) << 64;
    // x0 = 2^192 / (2^64 + 1) fits, k = x0 * y0 ~ 2^192 does not
    EXPECT_EQ(code_of([&] { Curve c(cfg); }), CurveErrc::InvalidConfig);

    // mc * vt^2 = 2^300 overflows the wide type itself
    cfg.vt = Amount(1) << 100;
    cfg.mc_target_sats = Amount(1) << 100;
    EXPECT_EQ(code_of([&] { Curve c(cfg); }), CurveErrc::InvalidConfig);
}

TEST(CurveConstructionTest, LargeSupplyFits) {
    CurveConfig cfg;
    cfg.total_supply = Amount(1) << 64;
    cfg.sell_amount = 1;
    cfg.vt = Amount(1) << 32;
    cfg.mc_target_sats = Amount(1) << 64;
    Curve c(cfg);
    // x0 = 2^64 / (2^32 + 1) = 2^32 - 1, k = 2^64 - 1
    EXPECT_EQ(c.x0(), (Amount(1) << 32) - 1);
    EXPECT_EQ(c.k(), (Amount(1) << 64) - 1);
}

// --------------------------- reserve function --------------------------------

TEST_F(CurveTest, ReserveFunction) {
    EXPECT_EQ(curve.y_at(0), curve.y0());
    EXPECT_EQ(curve.y_at(curve.sell_amount()), curve.vt());
    EXPECT_EQ(curve.x_from_y(curve.y0()), curve.x0());
    EXPECT_EQ(code_of([&] { curve.y_at(curve.sell_amount() + 1); }), CurveErrc::OutOfRange);

    Amount prev = curve.y_at(0);
    for (Amount step = 0; step <= curve.sell_amount(); step += 40000000) {
        Amount y = curve.y_at(step);
        EXPECT_LE(y, prev);
        EXPECT_LE(Wide(curve.x_from_y(y)) * Wide(y), Wide(curve.k()));
        prev = y;
    }
}

TEST_F(CurveTest, Snapshot) {
    CurveSnapshot snap = curve.snapshot(400000000);
    EXPECT_EQ(snap.step, Amount(400000000));
    EXPECT_EQ(snap.y, Amount(600000000));
    EXPECT_EQ(snap.x, Amount(66666666));
    EXPECT_EQ(snap.price_num(), snap.x);
    EXPECT_EQ(snap.price_den(), snap.y);

    EXPECT_EQ(code_of([&] { curve.snapshot(curve.sell_amount() + 1); }), CurveErrc::OutOfRange);
}

// --------------------------------- mint --------------------------------------

TEST_F(CurveTest, MintFromStart) {
    MintResult r = curve.mint(0, 1000000);
    EXPECT_EQ(r.asset_out, Amount(24390244));
    EXPECT_EQ(r.new_step, Amount(24390244));
    EXPECT_EQ(curve.asset_out_given_quote_in(0, 1000000), r.asset_out);
}

TEST_F(CurveTest, MintErrors) {
    EXPECT_EQ(code_of([&] { curve.mint(0, 0); }), CurveErrc::ZeroInput);
    EXPECT_EQ(code_of([&] { curve.mint(curve.sell_amount() + 1, 1); }), CurveErrc::OutOfRange);
    EXPECT_EQ(code_of([&] { curve.mint(0, WideMath::max_amount()); }), CurveErrc::InvalidConfig);
}

TEST_F(CurveTest, MintAtEndSellsNothing) {
    for (Amount q : {Amount(1), Amount(1000000), Amount("1000000000000000000000")}) {
        MintResult r = curve.mint(curve.sell_amount(), q);
        EXPECT_EQ(r.new_step, curve.sell_amount());
        EXPECT_EQ(r.asset_out, Amount(0));
    }
}

TEST_F(CurveTest, MintClampsAtVirtualFloor) {
    // More than total_raise_sats: every remaining token is sold, never more
    MintResult r = curve.mint(0, Amount(1000000000));
    EXPECT_EQ(r.asset_out, curve.sell_amount());
    EXPECT_EQ(r.new_step, curve.sell_amount());
}

TEST_F(CurveTest, MintMatchesSnapshots) {
    Amount step = 0;
    for (int i = 0; i < 50; ++i) {
        MintResult r = curve.mint(step, 1234567);
        if (r.new_step == curve.sell_amount()) break;
        EXPECT_EQ(r.asset_out, curve.snapshot(step).y - curve.snapshot(r.new_step).y);
        step = r.new_step;
    }
}

TEST_F(CurveTest, AssetOutMonotoneInQuote) {
    for (Amount step : {Amount(0), Amount(300000000), Amount(799999999)}) {
        Amount prev = 0;
        for (Amount q = 1; q < Amount(1000000000); q = q * 3 + 1) {
            Amount out = curve.asset_out_given_quote_in(step, q);
            EXPECT_GE(out, prev) << "step " << step << " quote " << q;
            prev = out;
        }
    }
}

TEST_F(CurveTest, SellOutInSteps) {
    Amount step = 0;
    Amount total = 0;
    int mints = 0;
    while (step < curve.sell_amount()) {
        MintResult r = curve.mint(step, 10000000);
        ASSERT_GE(r.new_step, step);
        total += r.asset_out;
        step = r.new_step;
        ASSERT_LT(++mints, 1000);
    }
    EXPECT_EQ(mints, 16);
    EXPECT_LE(total, curve.sell_amount());
    EXPECT_EQ(total, Amount(800000000));
}

// ---------------------------- inverse search ---------------------------------

TEST_F(CurveTest, QuoteForKnownFill) {
    EXPECT_EQ(curve.quote_in_given_asset_out(0, 24390244), Amount(1000000));
    EXPECT_EQ(curve.quote_in_given_asset_out(0, 1), Amount(1));
    EXPECT_EQ(curve.quote_in_given_asset_out(0, 100000000), Amount(4444445));
    EXPECT_EQ(curve.quote_in_given_asset_out(curve.sell_amount() - 1, 1), Amount(1));
}

TEST_F(CurveTest, QuoteZeroTarget) {
    EXPECT_EQ(curve.quote_in_given_asset_out(0, 0), Amount(0));
    EXPECT_EQ(curve.quote_in_given_asset_out(curve.sell_amount() + 5, 0), Amount(0));
}

TEST_F(CurveTest, QuoteRoundTrip) {
    for (Amount target : {Amount(1), Amount(999), Amount(1000000), Amount(123456789), Amount(799999999), Amount(800000000)}) {
        Amount q = curve.quote_in_given_asset_out(0, target);
        EXPECT_GE(curve.asset_out_given_quote_in(0, q), target) << target;
        if (q > 1) {
            EXPECT_LT(curve.asset_out_given_quote_in(0, q - 1), target) << target;
        }
    }
}

TEST_F(CurveTest, QuoteErrors) {
    Amount max_tokens = curve.y_at(100) - curve.vt();
    EXPECT_EQ(code_of([&] { curve.quote_in_given_asset_out(100, max_tokens + 1); }), CurveErrc::ExceedsPool);
    EXPECT_EQ(code_of([&] { curve.quote_in_given_asset_out(curve.sell_amount(), 1); }), CurveErrc::ExceedsPool);
    EXPECT_EQ(code_of([&] { curve.quote_in_given_asset_out(curve.sell_amount() + 1, 1); }), CurveErrc::OutOfRange);
}

// ------------------------------- simulation ----------------------------------

TEST_F(CurveTest, SimulateMints) {
    auto results = curve.simulate_mints({1000000, 2000000, 3000000});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].step, Amount(0));
    EXPECT_EQ(results[0].asset_out, Amount(24390244));
    EXPECT_EQ(results[1].step, Amount(24390244));
    EXPECT_EQ(results[1].asset_out, Amount(45377198));
    EXPECT_EQ(results[2].step, Amount(69767442));
    EXPECT_EQ(results[2].asset_out, Amount(60667341));

    EXPECT_TRUE(curve.simulate_mints({}).empty());
}

TEST_F(CurveTest, SimulateFailsOnFirstError) {
    EXPECT_EQ(code_of([&] { curve.simulate_mints({1000000, 0, 1000000}); }), CurveErrc::ZeroInput);
}

// -------------------------------- analytics ----------------------------------

TEST_F(CurveTest, RaiseAndMarketCap) {
    EXPECT_EQ(curve.total_raise_sats(), Amount(160000000));
    EXPECT_EQ(curve.cumulative_quote_to_step(0), Amount(0));
    EXPECT_EQ(curve.cumulative_quote_to_step(400000000), Amount(26666666));
    EXPECT_EQ(curve.cumulative_quote_to_step(curve.sell_amount()), curve.total_raise_sats());

    EXPECT_EQ(curve.mc_sats_at_step(0), Amount(40000000));
    EXPECT_EQ(curve.mc_sats_at_step(400000000), Amount(111111110));
    EXPECT_EQ(curve.final_mc_sats(), Amount(1000000000));

    EXPECT_EQ(code_of([&] { curve.cumulative_quote_to_step(curve.sell_amount() + 1); }), CurveErrc::OutOfRange);
    EXPECT_EQ(code_of([&] { curve.mc_sats_at_step(curve.sell_amount() + 1); }), CurveErrc::OutOfRange);
}

TEST_F(CurveTest, Progress) {
    EXPECT_EQ(curve.progress_at_step(0), Amount(0));
    EXPECT_EQ(curve.progress_at_step(400000000), Amount(40));
    // Divides by total_supply, so a full sale of 80% reports 80
    EXPECT_EQ(curve.progress_at_step(curve.sell_amount()), Amount(80));
}

TEST_F(CurveTest, AvgProgess) {
    EXPECT_EQ(curve.avg_progess({2, 3, 4}), Amount(2));
    EXPECT_EQ(curve.avg_progess({10}), Amount(1));
    EXPECT_EQ(code_of([&] { curve.avg_progess({}); }), CurveErrc::InvalidConfig);
    EXPECT_EQ(code_of([&] { curve.avg_progess({0, 0}); }), CurveErrc::InvalidConfig);
    Amount big = Amount(1) << 64;
    EXPECT_EQ(code_of([&] { curve.avg_progess({big, big, 2}); }), CurveErrc::InvalidConfig);
}

} // namespace
} // namespace bondcurve

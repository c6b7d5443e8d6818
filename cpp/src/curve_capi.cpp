// C API wrapper exposing the bonding curve (decimal-string amounts) to scripting hosts
#include "curve_capi.h"
#include "curve.hpp"
#include "curve_json.hpp"
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <new>
#include <string>
#include <utility>
#include <vector>

using bondcurve::Amount;
using bondcurve::Curve;
using bondcurve::CurveErrc;
using bondcurve::CurveError;

struct bondcurve_curve {
    Curve curve;
};

namespace {

char* alloc_cstr(const std::string& s) {
    char* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

Amount to_amount(const char* s) {
    if (!s) throw std::invalid_argument("null amount");
    return bondcurve::parse_amount(s);
}

std::string str(const Amount& v) {
    return bondcurve::to_string(v);
}

int status_of(CurveErrc code) {
    switch (code) {
        case CurveErrc::InvalidConfig: return BONDCURVE_ERR_INVALID_CONFIG;
        case CurveErrc::OutOfRange:    return BONDCURVE_ERR_OUT_OF_RANGE;
        case CurveErrc::ZeroInput:     return BONDCURVE_ERR_ZERO_INPUT;
        case CurveErrc::ExceedsPool:   return BONDCURVE_ERR_EXCEEDS_POOL;
    }
    return BONDCURVE_ERR_INTERNAL;
}

// Every buffer is allocated before any out-parameter is written.
int write_outs(std::initializer_list<std::pair<char**, std::string>> outs) {
    std::vector<char*> bufs;
    bufs.reserve(outs.size());
    for (const auto& o : outs) {
        char* buf = o.first ? alloc_cstr(o.second) : nullptr;
        if (!buf) {
            for (char* b : bufs) std::free(b);
            return o.first ? BONDCURVE_ERR_INTERNAL : BONDCURVE_ERR_BAD_ARGUMENT;
        }
        bufs.push_back(buf);
    }
    size_t i = 0;
    for (const auto& o : outs) *o.first = bufs[i++];
    return BONDCURVE_OK;
}

template <typename F>
int guarded(const bondcurve_curve* handle, F&& body) {
    if (!handle) return BONDCURVE_ERR_BAD_ARGUMENT;
    try {
        return body(handle->curve);
    } catch (const CurveError& e) {
        return status_of(e.code());
    } catch (const std::invalid_argument&) {
        return BONDCURVE_ERR_BAD_ARGUMENT;
    } catch (const std::exception&) {
        return BONDCURVE_ERR_INTERNAL;
    }
}

} // namespace

extern "C" {

int bondcurve_new(const char* total_supply, const char* sell_amount,
                  const char* vt, const char* mc_target_sats,
                  bondcurve_curve** out) {
    if (!out) return BONDCURVE_ERR_BAD_ARGUMENT;
    try {
        bondcurve::CurveConfig cfg;
        cfg.total_supply = to_amount(total_supply);
        cfg.sell_amount = to_amount(sell_amount);
        cfg.vt = to_amount(vt);
        cfg.mc_target_sats = to_amount(mc_target_sats);
        *out = new bondcurve_curve{Curve(cfg)};
        return BONDCURVE_OK;
    } catch (const CurveError& e) {
        return status_of(e.code());
    } catch (const std::invalid_argument&) {
        return BONDCURVE_ERR_BAD_ARGUMENT;
    } catch (const std::exception&) {
        return BONDCURVE_ERR_INTERNAL;
    }
}

void bondcurve_free(bondcurve_curve* curve) {
    delete curve;
}

int bondcurve_params(const bondcurve_curve* curve, char** y0, char** x0, char** k) {
    return guarded(curve, [&](const Curve& c) {
        return write_outs({{y0, str(c.y0())}, {x0, str(c.x0())}, {k, str(c.k())}});
    });
}

int bondcurve_max_step(const bondcurve_curve* curve, char** out) {
    return guarded(curve, [&](const Curve& c) {
        return write_outs({{out, str(c.max_step())}});
    });
}

int bondcurve_snapshot(const bondcurve_curve* curve, const char* step, char** x, char** y) {
    return guarded(curve, [&](const Curve& c) {
        auto snap = c.snapshot(to_amount(step));
        return write_outs({{x, str(snap.x)}, {y, str(snap.y)}});
    });
}

int bondcurve_mint(const bondcurve_curve* curve, const char* step, const char* quote_in,
                   char** new_step, char** asset_out) {
    return guarded(curve, [&](const Curve& c) {
        auto r = c.mint(to_amount(step), to_amount(quote_in));
        return write_outs({{new_step, str(r.new_step)}, {asset_out, str(r.asset_out)}});
    });
}

int bondcurve_asset_out_given_quote_in(const bondcurve_curve* curve, const char* step,
                                       const char* quote_in, char** out) {
    return guarded(curve, [&](const Curve& c) {
        return write_outs({{out, str(c.asset_out_given_quote_in(to_amount(step), to_amount(quote_in)))}});
    });
}

int bondcurve_quote_in_given_asset_out(const bondcurve_curve* curve, const char* step,
                                       const char* asset_out, char** out) {
    return guarded(curve, [&](const Curve& c) {
        return write_outs({{out, str(c.quote_in_given_asset_out(to_amount(step), to_amount(asset_out)))}});
    });
}

int bondcurve_simulate_mints(const bondcurve_curve* curve, const char* mints_json,
                             char** results_json) {
    return guarded(curve, [&](const Curve& c) {
        if (!mints_json) return BONDCURVE_ERR_BAD_ARGUMENT;
        auto mints = bondcurve::amounts_from_json(bondcurve::parse_json(mints_json));
        auto results = c.simulate_mints(mints);
        return write_outs({{results_json, bondcurve::json::serialize(bondcurve::Report::simulated(results))}});
    });
}

int bondcurve_cumulative_quote_to_step(const bondcurve_curve* curve, const char* step, char** out) {
    return guarded(curve, [&](const Curve& c) {
        return write_outs({{out, str(c.cumulative_quote_to_step(to_amount(step)))}});
    });
}

int bondcurve_total_raise_sats(const bondcurve_curve* curve, char** out) {
    return guarded(curve, [&](const Curve& c) {
        return write_outs({{out, str(c.total_raise_sats())}});
    });
}

int bondcurve_mc_sats_at_step(const bondcurve_curve* curve, const char* step, char** out) {
    return guarded(curve, [&](const Curve& c) {
        return write_outs({{out, str(c.mc_sats_at_step(to_amount(step)))}});
    });
}

int bondcurve_final_mc_sats(const bondcurve_curve* curve, char** out) {
    return guarded(curve, [&](const Curve& c) {
        return write_outs({{out, str(c.final_mc_sats())}});
    });
}

int bondcurve_progress_at_step(const bondcurve_curve* curve, const char* step, char** out) {
    return guarded(curve, [&](const Curve& c) {
        return write_outs({{out, str(c.progress_at_step(to_amount(step)))}});
    });
}

int bondcurve_avg_progess(const bondcurve_curve* curve, const char* steps_json, char** out) {
    return guarded(curve, [&](const Curve& c) {
        if (!steps_json) return BONDCURVE_ERR_BAD_ARGUMENT;
        auto steps = bondcurve::amounts_from_json(bondcurve::parse_json(steps_json));
        return write_outs({{out, str(c.avg_progess(steps))}});
    });
}

void bondcurve_free_string(char* s) {
    if (s) std::free(s);
}

} // extern "C"

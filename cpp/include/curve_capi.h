/* C API over the bonding curve engine for scripting hosts.
 *
 * Amounts cross the boundary as NUL-terminated base-10 strings. Every call
 * returns a status code; on failure no out-parameter is written. Strings
 * handed back through out-parameters are released with
 * bondcurve_free_string.
 */
#ifndef BONDCURVE_CURVE_CAPI_H
#define BONDCURVE_CURVE_CAPI_H

#ifdef __cplusplus
extern "C" {
#endif

#define BONDCURVE_OK                    0
#define BONDCURVE_ERR_INVALID_CONFIG    1
#define BONDCURVE_ERR_OUT_OF_RANGE      2
#define BONDCURVE_ERR_ZERO_INPUT        3
#define BONDCURVE_ERR_EXCEEDS_POOL      4
#define BONDCURVE_ERR_BAD_ARGUMENT     -1
#define BONDCURVE_ERR_INTERNAL         -2

typedef struct bondcurve_curve bondcurve_curve;

int bondcurve_new(const char* total_supply, const char* sell_amount,
                  const char* vt, const char* mc_target_sats,
                  bondcurve_curve** out);
void bondcurve_free(bondcurve_curve* curve);

int bondcurve_params(const bondcurve_curve* curve, char** y0, char** x0, char** k);
int bondcurve_max_step(const bondcurve_curve* curve, char** out);
int bondcurve_snapshot(const bondcurve_curve* curve, const char* step, char** x, char** y);

int bondcurve_mint(const bondcurve_curve* curve, const char* step, const char* quote_in,
                   char** new_step, char** asset_out);
int bondcurve_asset_out_given_quote_in(const bondcurve_curve* curve, const char* step,
                                       const char* quote_in, char** out);
int bondcurve_quote_in_given_asset_out(const bondcurve_curve* curve, const char* step,
                                       const char* asset_out, char** out);

/* mints_json: JSON array of amounts.
 * results_json: JSON array of {"step": ..., "asset_out": ...}. */
int bondcurve_simulate_mints(const bondcurve_curve* curve, const char* mints_json,
                             char** results_json);

int bondcurve_cumulative_quote_to_step(const bondcurve_curve* curve, const char* step, char** out);
int bondcurve_total_raise_sats(const bondcurve_curve* curve, char** out);
int bondcurve_mc_sats_at_step(const bondcurve_curve* curve, const char* step, char** out);
int bondcurve_final_mc_sats(const bondcurve_curve* curve, char** out);
int bondcurve_progress_at_step(const bondcurve_curve* curve, const char* step, char** out);
int bondcurve_avg_progess(const bondcurve_curve* curve, const char* steps_json, char** out);

void bondcurve_free_string(char* s);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* BONDCURVE_CURVE_CAPI_H */

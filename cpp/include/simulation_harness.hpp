// Batch simulation over (curve, mint sequence) pairs, reported as JSON.
#ifndef BONDCURVE_SIMULATION_HARNESS_HPP
#define BONDCURVE_SIMULATION_HARNESS_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include "curve_json.hpp"

namespace bondcurve {

struct HarnessOptions {
    size_t threads = 1;
    size_t snapshot_every = 1;  // 0 = final state only
    bool trace = false;
};

// Reads CPP_THREADS, SNAPSHOT_EVERY, SAVE_LAST_ONLY and TRACE.
// Unparsable values keep the defaults.
HarnessOptions options_from_env();

// Loads `key` from a JSON file holding {"<key>": [...]}.
json::array load_array(const std::string& path, const char* key);

// Runs one pair. Throws on a malformed entry, a bad config or a failing batch.
json::object run_task(const json::value& curve_entry, const json::value& seq_entry,
                      const HarnessOptions& opt, std::mutex& io_mu);

// Runs every pair on opt.threads workers, in curve-major order. A task that
// throws is recorded as {"success": false, "error": ...}.
json::array run_tasks(const json::array& curves, const json::array& seqs,
                      const HarnessOptions& opt);

} // namespace bondcurve

#endif // BONDCURVE_SIMULATION_HARNESS_HPP

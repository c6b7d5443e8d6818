#include "simulation_harness.hpp"
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace bondcurve {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open file: " + path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::string name_of(const json::value& entry) {
    if (!entry.is_object()) return "unnamed";
    if (auto* v = entry.as_object().if_contains("name")) {
        if (v->is_string()) return std::string(v->as_string().data(), v->as_string().size());
    }
    return "unnamed";
}

const json::object& entry_object(const json::value& entry, const char* what) {
    if (!entry.is_object()) {
        throw std::invalid_argument(std::string(what) + " entry must be a JSON object");
    }
    return entry.as_object();
}

} // namespace

HarnessOptions options_from_env() {
    HarnessOptions opt;
    opt.threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    if (const char* thr = std::getenv("CPP_THREADS")) {
        try { opt.threads = std::max<size_t>(1, std::stoul(thr)); } catch (const std::exception&) { /* keep default */ }
    }

    bool save_last_only = false;
    if (const char* slo = std::getenv("SAVE_LAST_ONLY")) {
        if (std::string(slo) == "1") save_last_only = true;
    }
    if (const char* se = std::getenv("SNAPSHOT_EVERY")) {
        try {
            long v = std::stol(se);
            opt.snapshot_every = v <= 0 ? 0 : static_cast<size_t>(v);
        } catch (const std::exception&) { /* keep default */ }
    }
    if (save_last_only) opt.snapshot_every = 0;

    opt.trace = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");
    return opt;
}

json::array load_array(const std::string& path, const char* key) {
    json::value doc = parse_json(read_file(path));
    if (!doc.is_object() || !doc.as_object().if_contains(key) || !doc.as_object().at(key).is_array()) {
        throw std::runtime_error(path + ": expected an object with a '" + key + "' array");
    }
    return doc.as_object().at(key).as_array();
}

json::object run_task(const json::value& curve_entry, const json::value& seq_entry,
                      const HarnessOptions& opt, std::mutex& io_mu) {
    const json::object& curve_obj = entry_object(curve_entry, "curve");
    const json::object& seq_obj = entry_object(seq_entry, "sequence");

    Curve curve(config_from_json(curve_obj));
    const json::value* mints_v = seq_obj.if_contains("mints");
    if (!mints_v) throw std::invalid_argument("sequence missing 'mints'");
    std::vector<Amount> mints = amounts_from_json(*mints_v);

    // All or nothing: a failing mint fails the whole sequence
    std::vector<SimulatedMint> sim = curve.simulate_mints(mints);

    json::array states;
    json::object last_state;
    Amount step = 0;
    for (size_t i = 0; i < sim.size(); ++i) {
        step = std::min(WideMath::saturating_add(sim[i].step, sim[i].asset_out), curve.max_step());

        if (opt.trace) {
            CurveSnapshot snap = curve.snapshot(step);
            std::lock_guard<std::mutex> lk(io_mu);
            std::cout << "TRACE mint step=" << sim[i].step
                      << " quote_in=" << mints[i]
                      << " asset_out=" << sim[i].asset_out
                      << " new_step=" << step
                      << " x=" << snap.x
                      << " y=" << snap.y << std::endl;
        }

        bool is_last = (i + 1 == sim.size());
        if (opt.snapshot_every == 0 && !is_last) continue;
        if (opt.snapshot_every > 1 && ((i + 1) % opt.snapshot_every) != 0 && !is_last) continue;

        json::object st = Report::state(curve, step);
        st["step_before"] = to_string(sim[i].step);
        st["quote_in"] = to_string(mints[i]);
        st["asset_out"] = to_string(sim[i].asset_out);
        if (opt.snapshot_every == 0) {
            last_state = st;
        } else {
            states.push_back(st);
        }
    }

    json::object res;
    res["success"] = true;
    res["params"] = Report::params(curve);
    res["total_raise_sats"] = to_string(curve.total_raise_sats());
    res["final_mc_sats"] = to_string(curve.final_mc_sats());
    if (opt.snapshot_every == 0) {
        res["final_state"] = last_state.empty() ? Report::state(curve, step) : last_state;
    } else {
        res["states"] = states;
    }

    // Inverse quotes are solved at the step the sequence ended on
    if (auto* q = seq_obj.if_contains("quotes")) {
        json::array quotes;
        for (const auto& target : amounts_from_json(*q)) {
            json::object qo;
            qo["asset_out"] = to_string(target);
            try {
                qo["quote_in"] = to_string(curve.quote_in_given_asset_out(step, target));
            } catch (const CurveError& e) {
                qo["error"] = e.what();
            }
            quotes.push_back(qo);
        }
        res["quotes"] = quotes;
    }
    return res;
}

json::array run_tasks(const json::array& curves, const json::array& seqs,
                      const HarnessOptions& opt) {
    struct Task { size_t ci; size_t si; };
    std::vector<Task> tasks;
    tasks.reserve(curves.size() * seqs.size());
    for (size_t c = 0; c < curves.size(); ++c)
        for (size_t s = 0; s < seqs.size(); ++s) tasks.push_back({c, s});

    std::vector<json::object> results(tasks.size());
    std::atomic<size_t> next{0};
    std::mutex io_mu;

    auto worker = [&]() {
        for (;;) {
            size_t idx = next.fetch_add(1);
            if (idx >= tasks.size()) break;
            const json::value& curve_entry = curves[tasks[idx].ci];
            const json::value& seq_entry = seqs[tasks[idx].si];
            json::object tr;
            try {
                std::string curve_name = name_of(curve_entry);
                std::string seq_name = name_of(seq_entry);
                {
                    std::lock_guard<std::mutex> lk(io_mu);
                    std::cout << "Processing " << curve_name << "/" << seq_name << "..." << std::endl;
                }
                tr["curve"] = curve_name;
                tr["sequence"] = seq_name;
                tr["result"] = run_task(curve_entry, seq_entry, opt, io_mu);
            } catch (const std::exception& e) {
                // Per-task failure should not bring down the whole harness
                json::object res;
                res["success"] = false;
                res["error"] = e.what();
                tr["result"] = res;
            }
            results[idx] = std::move(tr);
        }
    };
    std::vector<std::thread> ws;
    ws.reserve(opt.threads);
    for (size_t t = 0; t < opt.threads; ++t) ws.emplace_back(worker);
    for (auto& th : ws) th.join();

    json::array out;
    for (auto& r : results) out.push_back(std::move(r));
    return out;
}

} // namespace bondcurve

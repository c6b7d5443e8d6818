// Bonding curve simulation harness: runs every (curve, mint sequence) pair
// and writes per-mint reserve states as JSON.
#include "simulation_harness.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace bondcurve;

namespace {

int run_harness(const std::string& curves_file, const std::string& sequences_file, const std::string& output_file) {
    try {
        using clk = std::chrono::high_resolution_clock;
        HarnessOptions opt = options_from_env();

        json::array curves = load_array(curves_file, "curves");
        json::array seqs = load_array(sequences_file, "sequences");
        if (seqs.empty()) throw std::runtime_error("No sequences found");

        auto t0 = clk::now();
        json::array out = run_tasks(curves, seqs, opt);
        auto t1 = clk::now();

        json::object O;
        O["results"] = out;
        O["metadata"] = json::object{
            {"curves_file", curves_file},
            {"sequences_file", sequences_file},
            {"total_tests", out.size()},
            {"exec_ms", std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count() / 1e6}};

        std::ofstream of(output_file);
        if (!of) throw std::runtime_error("Cannot open output file: " + output_file);
        of << json::serialize(O) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <curves.json> <sequences.json> <output.json>" << std::endl;
        return 1;
    }
    return run_harness(argv[1], argv[2], argv[3]);
}

// verify_residues.cpp
// Independent check of a file written by graham_mod.
// Never uses the sieve or the fast evaluators: small moduli are
// checked against tower_mod_by_cycles(), a random sample against
// reference_residue() (trial-division totients + GMP modexp).
// Each thread checks different moduli independently.
//
// Usage:
//   ./verify_residues                          (graham_mod_n, 10000 samples)
//   ./verify_residues small.bin 50000          (any file, any sample size)

#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <cstdint>
#include <atomic>
#include <random>
#include <stdexcept>
#include <omp.h>
#include "residue_file.hpp"
#include "tower_oracle.hpp"

using namespace graham;

// Moduli up to this are checked against the cycle-walking oracle
static const uint64_t kBruteLimit = 2'000;

// Fixed seed so two runs check the same sample
static const uint64_t kSampleSeed = 20'260'101;

int main(int argc, char* argv[]) {
    std::string path    = "graham_mod_n";
    uint64_t    samples = 10'000;

    if (argc > 1) path = argv[1];
    if (argc > 2) {
        try {
            samples = std::stoull(argv[2]);
        } catch (const std::exception&) {
            std::cerr << "Error: invalid sample count '" << argv[2] << "'\n";
            return 1;
        }
    }

    ResidueTable r;
    try {
        r = read_residue_file(path);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    const uint64_t n = r.size() - 1;
    std::cout << "Verifying " << path << " (" << n << " residues) using "
              << omp_get_max_threads() << " threads...\n";

    auto t_start = std::chrono::high_resolution_clock::now();

    // -------------------------------------------------------
    // Collect the moduli to check: every m <= kBruteLimit
    // against the cycle oracle, plus the random sample.
    // -------------------------------------------------------
    std::vector<uint64_t> brute;
    for (uint64_t m = 1; m <= n && m <= kBruteLimit; m++)
        brute.push_back(m);

    std::vector<uint64_t> sample;
    if (n > 0) {
        std::mt19937_64 rng(kSampleSeed);
        std::uniform_int_distribution<uint64_t> pick(1, n);
        sample.reserve(samples);
        for (uint64_t i = 0; i < samples; i++)
            sample.push_back(pick(rng));
    }

    // -------------------------------------------------------
    // Step 1: Range invariant over the whole file.
    // -------------------------------------------------------
    std::atomic<uint64_t> range_failures(0);

    #pragma omp parallel for schedule(static)
    for (int64_t m = 1; m <= (int64_t)n; m++) {
        bool ok = (m == 1) ? r[m] == 0 : r[m] < (uint64_t)m;
        if (!ok) range_failures.fetch_add(1, std::memory_order_relaxed);
    }

    // -------------------------------------------------------
    // Step 2: Oracle checks. Each oracle call owns its GMP
    // state, so threads share nothing but the read-only table.
    // Only the first few mismatches are printed.
    // -------------------------------------------------------
    std::atomic<uint64_t> mismatches(0);

    auto report = [&](const char* oracle, uint64_t m, uint64_t expected) {
        if (mismatches.fetch_add(1) < 10) {
            #pragma omp critical
            std::cout << "MISMATCH (" << oracle << "): G mod " << m
                      << " = " << r[m] << " in file, expected " << expected << "\n";
        }
    };

    #pragma omp parallel for schedule(dynamic, 16)
    for (int64_t i = 0; i < (int64_t)brute.size(); i++) {
        uint64_t m = brute[i];
        // Tall enough that the tower has stabilized mod m
        unsigned height = chain_length_by_trial_division(m) + 4;
        uint32_t expected = tower_mod_by_cycles(height, (uint32_t)m);
        if (r[m] != expected) report("cycles", m, expected);
    }

    #pragma omp parallel for schedule(dynamic, 64)
    for (int64_t i = 0; i < (int64_t)sample.size(); i++) {
        uint64_t m = sample[i];
        uint32_t expected = reference_residue(m);
        if (r[m] != expected) report("trial division", m, expected);
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    // -------------------------------------------------------
    // Results
    // -------------------------------------------------------
    std::cout << "\n--- Result ---\n";
    std::cout << "Range violations  : " << range_failures.load() << "\n";
    std::cout << "Brute-force checks: " << brute.size() << "\n";
    std::cout << "Sampled checks    : " << sample.size() << "\n";
    std::cout << "Mismatches        : " << mismatches.load() << "\n";
    std::cout << "Total time        : " << ms << " ms\n";

    bool ok = range_failures.load() == 0 && mismatches.load() == 0;
    std::cout << "\n" << (ok ? "All residues verified." : "VERIFICATION FAILED.") << "\n";
    return ok ? 0 : 1;
}

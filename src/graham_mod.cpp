// graham_mod.cpp
// Writes G mod m for every m in [1, N] to a flat binary file,
// where G is Graham's number.
//
// Usage:
//   ./graham_mod                              (N = 10^9, file graham_mod_n)
//   ./graham_mod 1000000 small.bin            (custom N and file)
//   ./graham_mod --in-place                   (half the memory, one thread)

#include <cstdint>
#include <cstring>
#include <iostream>
#include <chrono>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>
#include <omp.h>
#include "totient_table.hpp"
#include "tower_residue.hpp"
#include "residue_file.hpp"

using namespace graham;

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--in-place] [N] [output]\n"
              << "  N       upper modulus, 1 <= N <= " << kMaxLimit << " (default 10^9)\n"
              << "  output  result file (default graham_mod_n)\n"
              << "  --in-place  reuse the totient buffer: 4N bytes, single threaded\n";
}

static double ms_since(std::chrono::high_resolution_clock::time_point t) {
    auto now = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(now - t).count();
}

int main(int argc, char* argv[]) {
    // -------------------------------------------------------
    // Configuration — defaults, overridden by arguments
    // -------------------------------------------------------
    uint64_t    limit    = 1'000'000'000;
    std::string out_path = "graham_mod_n";
    bool        in_place = false;

    int positional = 0;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--in-place") == 0) {
            in_place = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else if (positional == 0) {
            std::string s = argv[i];
            size_t used = 0;
            try {
                limit = std::stoull(s, &used);
            } catch (const std::exception&) {
                used = 0;
            }
            if (s.empty() || used != s.size() || s[0] == '-' || limit < 1 || limit > kMaxLimit) {
                std::cerr << "Error: invalid N '" << s << "'\n";
                usage(argv[0]);
                return 1;
            }
            positional++;
        } else if (positional == 1) {
            out_path = argv[i];
            positional++;
        } else {
            std::cerr << "Error: unexpected argument '" << argv[i] << "'\n";
            usage(argv[0]);
            return 1;
        }
    }

    std::cout << "Computing Graham's number mod m for m in [1, " << limit << "]\n";
    std::cout << "Mode: " << (in_place ? "in-place, 1 thread"
                                       : std::to_string(omp_get_max_threads()) + " threads")
              << "\n";

    double sieve_ms = 0, eval_ms = 0, write_ms = 0;

    try {
        // -------------------------------------------------------
        // Totient sieve
        // -------------------------------------------------------
        std::cout << "Building totient table up to " << limit << "...\n";
        auto t0 = std::chrono::high_resolution_clock::now();

        auto phi = build_totient_table(limit);

        sieve_ms = ms_since(t0);
        std::cout << "Sieve done in " << sieve_ms << " ms ("
                  << phi.memory_bytes() / 1024 / 1024 << " MB)\n";

        // -------------------------------------------------------
        // Residues
        // -------------------------------------------------------
        std::cout << "Evaluating G mod m...\n";
        auto t1 = std::chrono::high_resolution_clock::now();

        ResidueTable residues = in_place ? build_residue_table_in_place(std::move(phi))
                                         : build_residue_table(phi);

        eval_ms = ms_since(t1);
        std::cout << "Residues done in " << eval_ms << " ms\n";

        // -------------------------------------------------------
        // Output
        // -------------------------------------------------------
        std::cout << "Writing " << limit << " values to " << out_path << "...\n";
        auto t2 = std::chrono::high_resolution_clock::now();

        write_residue_file(out_path, residues);

        write_ms = ms_since(t2);

        if (limit >= 10)
            std::cout << "G mod 10 = " << residues[10] << "\n";
    } catch (const std::bad_alloc&) {
        std::cerr << "Fatal: out of memory for N = " << limit << " (needs about "
                  << (in_place ? 4 : 8) * (limit + 1) / 1024 / 1024 << " MB)\n";
        return 2;
    } catch (const std::runtime_error& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 3;
    }

    // -------------------------------------------------------
    // Summary
    // -------------------------------------------------------
    std::cout << "\n--- Summary ---\n";
    std::cout << "Moduli computed : " << limit << "\n";
    std::cout << "Output file     : " << out_path << "\n";
    std::cout << "Sieve time      : " << sieve_ms << " ms\n";
    std::cout << "Residue time    : " << eval_ms << " ms\n";
    std::cout << "Write time      : " << write_ms << " ms\n";
    std::cout << "Total time      : " << sieve_ms + eval_ms + write_ms << " ms\n";

    return 0;
}

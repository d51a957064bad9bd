// test_tower.cpp
// Validates the G mod m evaluators against brute-force towers,
// the known trailing digits of Graham's number, and each other.

#include <iostream>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include "totient_table.hpp"
#include "tower_residue.hpp"
#include "tower_oracle.hpp"

using namespace graham;

int main() {
    bool all_passed = true;

    auto phi = build_totient_table(600'000);

    // -------------------------------------------------------
    // Test 1: pow_mod
    // -------------------------------------------------------
    {
        bool pass = pow_mod(3, 0, 7) == 1
                 && pow_mod(3, 5, 1) == 0
                 && pow_mod(2, 10, 1'000) == 24
                 && pow_mod(3, 0, 1) == 0
                 // products near 2^64
                 && pow_mod(4'294'967'291u, 4'294'967'295ULL, 4'294'967'295u) == 3'221'225'471u
                 && pow_mod(123'456'789u, 1'000'000'000'007ULL, 4'294'967'291u) == 3'278'950'633u;
        std::cout << "Test 1 (pow_mod): " << (pass ? "PASS" : "FAIL") << "\n";
        all_passed &= pass;
    }

    // -------------------------------------------------------
    // Test 2: Trailing digits of Graham's number (...4195387)
    // -------------------------------------------------------
    {
        struct Case { uint64_t m; uint32_t expected; };
        Case cases[] = {
            {1, 0}, {2, 1}, {7, 6}, {10, 7}, {100, 87},
            {1'000, 387}, {100'000, 95'387},
        };
        bool pass = true;
        for (auto& [m, expected] : cases) {
            uint32_t got = graham_residue(phi, m);
            std::cout << "G mod " << m << " = " << got
                      << " expected " << expected
                      << (got == expected ? "  PASS" : "  FAIL") << "\n";
            pass &= (got == expected);
        }
        all_passed &= pass;
    }

    // -------------------------------------------------------
    // Test 3: Every m <= 1000 matches a brute-force tower that
    // is tall enough to have stabilized, and one level taller.
    // -------------------------------------------------------
    {
        uint64_t bad = 0;
        for (uint64_t m = 1; m <= 1'000; m++) {
            unsigned h = chain_length(phi, m) + 4;
            uint32_t tower   = tower_mod_by_cycles(h, (uint32_t)m);
            uint32_t taller  = tower_mod_by_cycles(h + 1, (uint32_t)m);
            uint32_t got     = graham_residue(phi, m);
            if (tower != taller || got != tower) {
                if (bad < 5)
                    std::cout << "  m = " << m << ": tower " << tower
                              << ", taller " << taller << ", got " << got << "\n";
                bad++;
            }
        }
        bool pass = (bad == 0);
        std::cout << "Test 3 (brute-force towers, m <= 1000): "
                  << (pass ? "PASS" : "FAIL") << "\n";
        all_passed &= pass;
    }

    // -------------------------------------------------------
    // Test 4: Moduli sharing factors with the base, 3^a * b.
    // Here the coprime-only Euler step would be wrong.
    // -------------------------------------------------------
    {
        uint64_t bad = 0, checked = 0;
        for (uint64_t b = 1; b <= 20; b++) {
            for (uint64_t m = 3 * b; m <= phi.limit(); m *= 3) {
                unsigned h = chain_length(phi, m) + 4;
                if (graham_residue(phi, m) != tower_mod_by_cycles(h, (uint32_t)m)) bad++;
                checked++;
            }
        }
        // G is a power of 3 far above 3^12
        bool pass = (bad == 0 && graham_residue(phi, 9) == 0
                     && graham_residue(phi, 81) == 0
                     && graham_residue(phi, 531'441) == 0);
        std::cout << "Test 4 (multiples of powers of 3, " << checked << " moduli): "
                  << (pass ? "PASS" : "FAIL") << "\n";
        all_passed &= pass;
    }

    // -------------------------------------------------------
    // Test 5: Batch, in-place and single evaluators agree,
    // and every residue is in range. 600000 spans the serial
    // prefix and several parallel blocks.
    // -------------------------------------------------------
    {
        auto batch = build_residue_table(phi);

        auto phi_copy = build_totient_table(phi.limit());
        auto in_place = build_residue_table_in_place(std::move(phi_copy));

        bool pass = (batch.size() == phi.limit() + 1 && batch == in_place && batch[1] == 0);
        for (uint64_t m = 2; m <= phi.limit(); m++)
            if (batch[m] >= m) pass = false;
        for (uint64_t m = 1; m <= phi.limit(); m += 997)
            if (batch[m] != graham_residue(phi, m)) pass = false;
        for (uint64_t m = 65'530; m <= 65'545; m++)
            if (batch[m] != graham_residue(phi, m)) pass = false;

        std::cout << "Test 5 (batch == in-place == single, range): "
                  << (pass ? "PASS" : "FAIL") << "\n";
        all_passed &= pass;
    }

    // -------------------------------------------------------
    // Test 6: Trial-division reference agrees with the table
    // -------------------------------------------------------
    {
        bool pass = true;
        for (uint64_t m = 1; m <= phi.limit(); m += 7'919)
            if (reference_residue(m) != graham_residue(phi, m)) pass = false;
        pass &= (reference_residue(10'000'000) == 4'195'387);
        std::cout << "Test 6 (trial-division reference): "
                  << (pass ? "PASS" : "FAIL") << "\n";
        all_passed &= pass;
    }

    // -------------------------------------------------------
    // Test 7: Invalid moduli are rejected
    // -------------------------------------------------------
    {
        bool pass = true;
        try { graham_residue(phi, 0); pass = false; } catch (const std::invalid_argument&) {}
        try { graham_residue(phi, phi.limit() + 1); pass = false; } catch (const std::out_of_range&) {}
        try { chain_length(phi, 0); pass = false; } catch (const std::invalid_argument&) {}
        try { tower_mod_by_cycles(5, 0); pass = false; } catch (const std::invalid_argument&) {}
        try { reference_residue(0); pass = false; } catch (const std::invalid_argument&) {}

        auto tiny = build_totient_table(1);
        pass &= (build_residue_table(tiny) == ResidueTable{0, 0});

        std::cout << "Test 7 (invalid moduli): " << (pass ? "PASS" : "FAIL") << "\n";
        all_passed &= pass;
    }

    std::cout << "\n" << (all_passed ? "All tests passed." : "SOME TESTS FAILED.") << "\n";
    return all_passed ? 0 : 1;
}

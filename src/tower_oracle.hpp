// tower_oracle.hpp
// Slow, independent ways to compute tower-of-3 residues.
// Nothing here touches TotientTable or pow_mod(): these exist to
// cross-check the fast evaluators. Uses GMP for exponentiation.

#pragma once
#include <cstdint>

namespace graham {

// phi(n) by trial division. n must be >= 1.
uint64_t totient_by_trial_division(uint64_t n);

// Number of phi steps from n down to 1, via trial division.
unsigned chain_length_by_trial_division(uint64_t n);

// -------------------------------------------------------
// Exact residue of 3^3^...^3 (`height` threes) modulo m.
// No totients: towers up to height 4 are evaluated directly
// (height 4 as 3^(3^27) mod m with GMP), taller ones by finding
// the pre-period and period of 3^k mod m and recursing on the period.
// O(m) memory per level, so keep m small (a few million at most).
// height 0 is the empty tower, 1.
// Throws std::invalid_argument for m == 0.
// -------------------------------------------------------
uint32_t tower_mod_by_cycles(unsigned height, uint32_t m);

// G mod m from a trial-division totient chain and GMP modexp.
// Throws std::invalid_argument for m == 0,
// std::out_of_range for m >= 2^32.
uint32_t reference_residue(uint64_t m);

} // namespace graham

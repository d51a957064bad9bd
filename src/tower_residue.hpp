// tower_residue.hpp
// G mod m for Graham's number G, via the totient chain of m.
//
// G is a power tower of 3s far taller than the totient chain of any
// 32-bit modulus. For such a tower, with phi = phi(m):
//
//   F(1) = 0
//   F(m) = 3^(F(phi) + phi) mod m
//
// This is the generalized (exponent-threshold) Euler theorem. It holds
// even when 3 | m, where the coprime-only form 3^(F(phi)) is wrong.

#pragma once
#include <cstdint>
#include <vector>
#include "totient_table.hpp"

namespace graham {

// R[m] = G mod m for m in [1, limit]; R[0] is unused and 0.
using ResidueTable = std::vector<uint32_t>;

// Upper bound on the number of phi steps from any 32-bit m down to 1
inline constexpr unsigned kMaxChainLength = 64;

// base^exponent mod modulus by repeated squaring.
// Products are widened to 64 bits; modulus 1 gives 0.
uint32_t pow_mod(uint32_t base, uint64_t exponent, uint32_t modulus);

// One step up the chain: given e = F(phi(m)), return F(m).
inline uint32_t lift_residue(uint32_t m, uint32_t phi_m, uint32_t e) {
    return pow_mod(3, (uint64_t)e + phi_m, m);
}

// Number of phi applications that take m down to 1 (0 for m = 1).
// Throws std::invalid_argument for m == 0, std::out_of_range past the table.
unsigned chain_length(const TotientTable& phi, uint64_t m);

// -------------------------------------------------------
// G mod m for a single modulus, computed from scratch.
// Walks m, phi(m), phi(phi(m)), ... down to 1, then back up.
// Throws std::invalid_argument for m == 0,
// std::out_of_range if m > phi.limit().
// -------------------------------------------------------
uint32_t graham_residue(const TotientTable& phi, uint64_t m);

// -------------------------------------------------------
// G mod m for every m in [1, phi.limit()], parallelized with OpenMP.
// Needs the totient table plus a second array of the same size.
// -------------------------------------------------------
ResidueTable build_residue_table(const TotientTable& phi);

// -------------------------------------------------------
// Same result using only the totient buffer: T[m] is overwritten
// with R[m] in increasing m. Single threaded; halves peak memory.
// -------------------------------------------------------
ResidueTable build_residue_table_in_place(TotientTable&& phi);

} // namespace graham

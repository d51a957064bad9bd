// tower_residue.cpp
// Residue evaluators for G mod m.
// Parallelization strategy: process m in doubling blocks [lo, 2*lo).
// Every R[c] with c < lo is final before the block starts, so each
// thread only walks its chain until it drops below lo, then climbs
// back up. Threads write disjoint R[m]; no atomics, no locks.

#include "tower_residue.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <omp.h>

namespace graham {

// Below this, blocks are too small to be worth a parallel region
static constexpr uint64_t kSerialPrefix = 1 << 16;

uint32_t pow_mod(uint32_t base, uint64_t exponent, uint32_t modulus) {
    uint64_t mod = modulus;
    uint64_t b   = base % mod;
    uint64_t out = 1 % mod;

    // Both factors < 2^32, so every product fits in 64 bits
    while (exponent > 0) {
        if (exponent & 1)
            out = out * b % mod;
        b = b * b % mod;
        exponent >>= 1;
    }
    return (uint32_t)out;
}

static void check_modulus(const TotientTable& phi, uint64_t m) {
    if (m == 0)
        throw std::invalid_argument("modulus must be >= 1");
    if (m > phi.limit())
        throw std::out_of_range("modulus " + std::to_string(m)
                                + " exceeds totient table limit "
                                + std::to_string(phi.limit()));
}

unsigned chain_length(const TotientTable& phi, uint64_t m) {
    check_modulus(phi, m);

    unsigned steps = 0;
    for (uint64_t c = m; c > 1; c = phi[c]) {
        if (++steps > kMaxChainLength)
            throw std::logic_error("totient chain of " + std::to_string(m)
                                   + " longer than " + std::to_string(kMaxChainLength));
    }
    return steps;
}

uint32_t graham_residue(const TotientTable& phi, uint64_t m) {
    check_modulus(phi, m);

    // Walk down: chain[0] = m, chain[k] = phi(chain[k-1]), stop at 1
    uint32_t chain[kMaxChainLength + 1];
    unsigned len = 0;
    for (uint64_t c = m; c > 1; c = phi[c]) {
        if (len == kMaxChainLength)
            throw std::logic_error("totient chain of " + std::to_string(m)
                                   + " longer than " + std::to_string(kMaxChainLength));
        chain[len++] = (uint32_t)c;
    }

    // Walk up from F(1) = 0
    uint32_t e = 0;
    while (len > 0) {
        uint32_t c = chain[--len];
        e = lift_residue(c, phi[c], e);
    }
    return e;
}

// -------------------------------------------------------
// R[m] for one m, given that R[c] is final for every c < lo.
// -------------------------------------------------------
static inline uint32_t residue_above(const TotientTable& phi,
                                     const uint32_t* r,
                                     uint64_t m, uint64_t lo) {
    uint32_t chain[kMaxChainLength + 1];
    unsigned len = 0;

    uint64_t c = m;
    while (c >= lo) {
        chain[len++] = (uint32_t)c;
        c = phi[c];
    }

    uint32_t e = r[c];
    while (len > 0) {
        uint32_t k = chain[--len];
        e = lift_residue(k, phi[k], e);
    }
    return e;
}

ResidueTable build_residue_table(const TotientTable& phi) {
    const uint64_t limit = phi.limit();
    ResidueTable r(limit + 1, 0);
    if (limit < 2) return r;

    // -------------------------------------------------------
    // Step 1: Small prefix, single threaded.
    // phi(m) < m for m >= 2, so increasing order means R[phi(m)]
    // is always ready. R[1] = 0 from the initializer.
    // -------------------------------------------------------
    uint64_t prefix_end = std::min(limit, kSerialPrefix - 1);
    for (uint64_t m = 2; m <= prefix_end; m++)
        r[m] = lift_residue((uint32_t)m, phi[m], r[phi[m]]);

    // -------------------------------------------------------
    // Step 2: Doubling blocks [lo, hi], hi = min(2*lo - 1, limit).
    //
    // Inside a block phi(m) can still be >= lo (m prime gives
    // phi(m) = m - 1), so residue_above() follows the chain until
    // it leaves the block. Even m halve at least, so that is a
    // couple of steps in practice.
    //
    // The implicit barrier at the end of each parallel loop
    // publishes the block before the next one reads it.
    // -------------------------------------------------------
    uint32_t* out = r.data();
    for (uint64_t lo = prefix_end + 1; lo <= limit; lo = 2 * lo) {
        uint64_t hi = std::min(2 * lo - 1, limit);
        int64_t count = (int64_t)(hi - lo + 1);

        #pragma omp parallel for schedule(dynamic, 4096)
        for (int64_t i = 0; i < count; i++) {
            uint64_t m = lo + (uint64_t)i;
            out[m] = residue_above(phi, out, m, lo);  // only this thread writes out[m]
        }
    }

    return r;
}

ResidueTable build_residue_table_in_place(TotientTable&& phi) {
    ResidueTable buf = phi.release();
    const uint64_t limit = buf.empty() ? 0 : buf.size() - 1;
    if (limit == 0) return buf;

    // Index i holds R[i] for i < m and phi(i) for i >= m.
    // phi(m) < m, so buf[phi(m)] is already the residue we need.
    buf[1] = 0;
    for (uint64_t m = 2; m <= limit; m++) {
        uint32_t phi_m = buf[m];
        buf[m] = lift_residue((uint32_t)m, phi_m, buf[phi_m]);
    }
    return buf;
}

} // namespace graham

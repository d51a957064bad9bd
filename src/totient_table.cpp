// totient_table.cpp
// Builds a TotientTable with a single sequential sieve pass.
// The pass runs left to right because deciding whether p is prime
// reads T[p], which every smaller prime may already have touched.

#include "totient_table.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace graham {

TotientTable::TotientTable(uint64_t limit)
    : limit_(limit)
{
    if (limit > kMaxLimit)
        throw std::invalid_argument("TotientTable: limit " + std::to_string(limit)
                                    + " does not fit in 32 bits");

    values_.resize(limit + 1);
    for (uint64_t m = 0; m <= limit; m++)
        values_[m] = (uint32_t)m;
}

uint32_t TotientTable::phi(uint64_t m) const {
    if (m == 0 || m > limit_)
        throw std::out_of_range("phi: m = " + std::to_string(m)
                                + " outside [1, " + std::to_string(limit_) + "]");
    return values_[m];
}

std::vector<uint32_t> TotientTable::release() {
    limit_ = 0;
    return std::move(values_);
}

TotientTable build_totient_table(uint64_t limit) {
    TotientTable table(limit);
    uint32_t* t = table.data();

    // -------------------------------------------------------
    // T[p] == p exactly when no smaller prime divides p,
    // i.e. p is prime. Composites were lowered by their
    // smallest prime factor before we reach them.
    //
    // When prime p reaches multiple i, T[i] holds
    //   i * prod_{q | i, q < p} (1 - 1/q)
    // which is still divisible by p, so T[i] / p is exact.
    // -------------------------------------------------------
    for (uint64_t p = 2; p <= limit; p++) {
        if (t[p] != p) continue;

        // Starting at i = p sets T[p] = p - 1.
        // Inner loop is O(limit / p); summed over primes, O(limit log log limit).
        for (uint64_t i = p; i <= limit; i += p)
            t[i] -= t[i] / (uint32_t)p;
    }

    return table;
}

} // namespace graham

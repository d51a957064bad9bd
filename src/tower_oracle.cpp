// tower_oracle.cpp
// Reference implementations used by verify_residues and the tests.
// GMP objects are local to each call, so every function here is
// safe to call from several OpenMP threads at once.

#include "tower_oracle.hpp"
#include <gmp.h>
#include <stdexcept>
#include <vector>

namespace graham {

// Towers of height 0..3; height 4 already has 3.6e12 digits
static const uint64_t kExactTower[] = {1, 3, 27, 7'625'597'484'987ULL};

uint64_t totient_by_trial_division(uint64_t n) {
    if (n == 0) throw std::invalid_argument("totient of 0 is undefined");

    uint64_t result = n;
    for (uint64_t p = 2; p * p <= n; p++) {
        if (n % p) continue;
        while (n % p == 0) n /= p;
        result -= result / p;
    }
    if (n > 1) result -= result / n;  // leftover prime factor
    return result;
}

unsigned chain_length_by_trial_division(uint64_t n) {
    unsigned steps = 0;
    for (uint64_t c = n; c > 1; c = totient_by_trial_division(c))
        steps++;
    return steps;
}

// 3^k mod m with GMP
static uint32_t gmp_pow3(uint64_t k, uint32_t m) {
    mpz_t base, mod, res;
    mpz_init_set_ui(base, 3);
    mpz_init_set_ui(mod, m);
    mpz_init(res);

    mpz_powm_ui(res, base, k, mod);
    uint32_t out = (uint32_t)mpz_get_ui(res);

    mpz_clear(base);
    mpz_clear(mod);
    mpz_clear(res);
    return out;
}

uint32_t tower_mod_by_cycles(unsigned height, uint32_t m) {
    if (m == 0) throw std::invalid_argument("modulus must be >= 1");
    if (m == 1) return 0;

    if (height <= 3)
        return (uint32_t)(kExactTower[height] % m);

    if (height == 4) {
        // 3^(3^27) mod m, exponent held exactly
        mpz_t base, exp, mod, res;
        mpz_init_set_ui(base, 3);
        mpz_init_set_ui(exp, kExactTower[3]);
        mpz_init_set_ui(mod, m);
        mpz_init(res);

        mpz_powm(res, base, exp, mod);
        uint32_t out = (uint32_t)mpz_get_ui(res);

        mpz_clear(base);
        mpz_clear(exp);
        mpz_clear(mod);
        mpz_clear(res);
        return out;
    }

    // -------------------------------------------------------
    // Walk 1, 3, 9, ... mod m until a value repeats.
    // first_seen[x] = k for the first k with 3^k = x (mod m).
    // The orbit is mu values of tail followed by a cycle of
    // length lambda, and lambda < m (a full cycle would have to
    // contain 0, which is a fixed point).
    // -------------------------------------------------------
    std::vector<int64_t> first_seen(m, -1);
    uint64_t x = 1;
    int64_t k = 0;
    while (first_seen[x] < 0) {
        first_seen[x] = k++;
        x = x * 3 % m;
    }
    uint64_t mu     = (uint64_t)first_seen[x];
    uint64_t lambda = (uint64_t)k - mu;

    // The exponent E is a tower of height >= 4, so E >= 3^27 > mu
    // and 3^E = 3^(mu + ((E - mu) mod lambda)) (mod m).
    uint64_t e_mod  = tower_mod_by_cycles(height - 1, (uint32_t)lambda);
    uint64_t offset = (e_mod + lambda - mu % lambda) % lambda;
    return gmp_pow3(mu + offset, m);
}

uint32_t reference_residue(uint64_t m) {
    if (m == 0) throw std::invalid_argument("modulus must be >= 1");
    if (m > 0xFFFFFFFFULL) throw std::out_of_range("modulus does not fit in 32 bits");

    std::vector<uint64_t> chain;
    for (uint64_t c = m; c > 1; c = totient_by_trial_division(c))
        chain.push_back(c);

    // Climb from G mod 1 = 0: G mod c = 3^(G mod phi(c) + phi(c)) mod c
    uint64_t e = 0;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        uint64_t c = *it;
        e = gmp_pow3(e + totient_by_trial_division(c), (uint32_t)c);
    }
    return (uint32_t)e;
}

} // namespace graham

// totient_table.hpp
// Euler's totient phi(m) for every m in [1, limit], stored as one
// flat array of uint32_t so any phi lookup is a single load.
//
// Layout:
//   index m  →  phi(m)
//   index 0  →  unused sentinel, always 0
//
// Memory usage: 4 * (limit + 1) bytes
//   10^8  →  ~381 MB
//   10^9  →  ~3.7 GB

#pragma once
#include <cstdint>
#include <vector>
#include <cassert>

namespace graham {

// Largest limit whose values and indices fit in uint32_t
inline constexpr uint64_t kMaxLimit = 0xFFFFFFFFULL;

// -------------------------------------------------------
// TotientTable: phi(m) for m in [1, limit].
// Built once by build_totient_table(), then only read.
// Pass it around by const reference.
// -------------------------------------------------------
class TotientTable {
public:
    // Allocate the table with T[m] = m (the sieve's starting state).
    // Throws std::invalid_argument if limit > kMaxLimit,
    // std::bad_alloc if the buffer cannot be allocated.
    explicit TotientTable(uint64_t limit);

    // Unchecked lookup for hot loops. Only valid for m <= limit.
    uint32_t operator[](uint64_t m) const {
        assert(m <= limit_ && "operator[]: m out of range");
        return values_[m];
    }

    // Checked lookup. Throws std::out_of_range unless 1 <= m <= limit.
    uint32_t phi(uint64_t m) const;

    // -------------------------------------------------------
    // Accessors
    // -------------------------------------------------------
    uint64_t limit()       const { return limit_; }
    const uint32_t* data() const { return values_.data(); }
    uint32_t* data()             { return values_.data(); }

    // Memory usage in bytes
    uint64_t memory_bytes() const {
        return values_.size() * sizeof(uint32_t);
    }

    // Hand the buffer over to a caller that rewrites it in place.
    // The table is empty (limit 0) afterwards.
    std::vector<uint32_t> release();

private:
    uint64_t limit_;
    std::vector<uint32_t> values_;
};

// -------------------------------------------------------
// Build the totient table up to `limit` with one
// Eratosthenes-style pass: every prime p scales each of its
// multiples by (1 - 1/p). O(limit log log limit) time.
// -------------------------------------------------------
TotientTable build_totient_table(uint64_t limit);

} // namespace graham

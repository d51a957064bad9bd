// residue_file.hpp
// Flat binary dump of a ResidueTable.
//
// Format: N consecutive uint32_t in host byte order, no header.
//   position i (zero based)  →  G mod (i + 1)
// Readers must know the producer's endianness out of band.

#pragma once
#include <string>
#include "tower_residue.hpp"

namespace graham {

// Write R[1..N] to `path`, replacing any existing file.
// Throws std::runtime_error on any I/O failure.
void write_residue_file(const std::string& path, const ResidueTable& r);

// Read a file produced by write_residue_file(). N = file size / 4.
// The returned table has R[0] = 0 prepended so R[m] = G mod m.
// Throws std::runtime_error on I/O failure or a truncated file.
ResidueTable read_residue_file(const std::string& path);

} // namespace graham

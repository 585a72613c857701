#ifndef SEQIO_TYPES_H
#define SEQIO_TYPES_H

#include <cstdint>

namespace seqio {

/** Represents genomic coordinates (0-based). */
typedef
unsigned long
TCoord;

/** Set of nucleotides, one bit per base. */
typedef
std::uint8_t
TBaseMask;

/** Base bits used in TBaseMask. */
const TBaseMask BASE_A = 1;
const TBaseMask BASE_C = 2;
const TBaseMask BASE_G = 4;
const TBaseMask BASE_T = 8;
const TBaseMask BASE_ANY = BASE_A | BASE_C | BASE_G | BASE_T;

/** DNA strand. */
enum Strand {
  FORWARD, REVERSE
};

} // namespace seqio

#endif // SEQIO_TYPES_H

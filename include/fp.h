#ifndef BN256_FP_H
#define BN256_FP_H

#include "bn256_platform.h"

#include <cstdint>

#if BN256_PLATFORM_64BIT
/*
 * Element of F_p, p = 36u^4 + 36u^3 + 24u^2 + 6u + 1 with u = 1868033^3.
 * Four little-endian 64-bit limbs holding a*R mod p (R = 2^256), always < p.
 */
typedef uint64_t fp_fe[4];
#else
#error "bn256 requires a 64-bit target"
#endif

#endif // BN256_FP_H

#ifndef BN256_FP_UTILS_H
#define BN256_FP_UTILS_H

#include "fp.h"
#include "fp_ops.h"

/*
 * Elements are kept fully reduced, so the Montgomery limbs are a canonical
 * encoding and can be compared directly.
 */

/*
 * Returns 1 if h is nonzero, 0 if zero.
 */
static inline int fp_isnonzero(const fp_fe h)
{
    uint64_t d = h[0] | h[1] | h[2] | h[3];
    return (int)((d | (0 - d)) >> 63);
}

/*
 * Returns 1 if f == g, 0 otherwise.
 */
static inline int fp_eq(const fp_fe f, const fp_fe g)
{
    uint64_t d = (f[0] ^ g[0]) | (f[1] ^ g[1]) | (f[2] ^ g[2]) | (f[3] ^ g[3]);
    return 1 - (int)((d | (0 - d)) >> 63);
}

/*
 * Returns 1 if h is the multiplicative identity.
 */
static inline int fp_isone(const fp_fe h)
{
    fp_fe one;
    fp_1(one);
    return fp_eq(h, one);
}

#endif // BN256_FP_UTILS_H

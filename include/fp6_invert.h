#ifndef BN256_FP6_INVERT_H
#define BN256_FP6_INVERT_H

#include "fp6.h"

/*
 * out = 1/z using the norm to F_p^2 (Scott, "Implementing cryptographic
 * pairings", section 3.2). Zero maps to zero.
 */
void fp6_invert(fp6_fe *out, const fp6_fe *z);

#endif // BN256_FP6_INVERT_H

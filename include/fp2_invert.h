#ifndef BN256_FP2_INVERT_H
#define BN256_FP2_INVERT_H

#include "fp2.h"

/*
 * out = 1/z = (-x*i + y) / (x^2 + y^2). Zero maps to zero; callers that must
 * reject zero check fp2_iszero first.
 */
void fp2_invert(fp2_fe *out, const fp2_fe *z);

#endif // BN256_FP2_INVERT_H

#ifndef BN256_FP12_INVERT_H
#define BN256_FP12_INVERT_H

#include "fp12.h"

/*
 * out = 1/z = (-x*w + y) / (y^2 - t*x^2).
 *
 * Precondition: z != 0. Zero is not detected here and maps to zero.
 */
void fp12_invert(fp12_fe *out, const fp12_fe *z);

#endif // BN256_FP12_INVERT_H

#ifndef BN256_FP2_MUL_H
#define BN256_FP2_MUL_H

#include "fp2.h"

/* h = f * g. h may alias either input. */
void fp2_mul(fp2_fe *h, const fp2_fe *f, const fp2_fe *g);

/* h = f^2 */
void fp2_sq(fp2_fe *h, const fp2_fe *f);

#endif // BN256_FP2_MUL_H

#ifndef BN256_FP6_FROBENIUS_H
#define BN256_FP6_FROBENIUS_H

#include "fp6.h"

/* h = f^p */
void fp6_frobenius(fp6_fe *h, const fp6_fe *f);

/* h = f^(p^2) */
void fp6_frobenius_p2(fp6_fe *h, const fp6_fe *f);

/* h = f^(p^4) */
void fp6_frobenius_p4(fp6_fe *h, const fp6_fe *f);

#endif // BN256_FP6_FROBENIUS_H

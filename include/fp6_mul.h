#ifndef BN256_FP6_MUL_H
#define BN256_FP6_MUL_H

#include "fp6.h"

/*
 * h = f * g, Karatsuba over the three F_p^2 coefficients (Devegili et al.,
 * "Multiplication and Squaring on Pairing-Friendly Fields", algorithm 13).
 */
void fp6_mul(fp6_fe *h, const fp6_fe *f, const fp6_fe *g);

/*
 * h = f^2, Chung-Hasan SQR2 (algorithm 16 of the same paper).
 */
void fp6_sq(fp6_fe *h, const fp6_fe *f);

#endif // BN256_FP6_MUL_H

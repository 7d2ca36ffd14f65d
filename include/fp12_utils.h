#ifndef BN256_FP12_UTILS_H
#define BN256_FP12_UTILS_H

#include "fp12.h"

/*
 * Returns 1 if conj(f) * f == 1, i.e. f^(p^6 + 1) = 1.
 */
int fp12_is_norm_one(const fp12_fe *f);

/*
 * Returns 1 if f is in the cyclotomic subgroup: f^(p^6 + 1) = 1 and
 * f^(p^4) * f == f^(p^2). Norm one alone does not make cyclotomic squaring
 * correct. Not constant time, and much slower than a squaring.
 */
int fp12_is_cyclotomic(const fp12_fe *f);

#endif // BN256_FP12_UTILS_H

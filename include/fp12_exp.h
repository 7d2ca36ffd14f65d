#ifndef BN256_FP12_EXP_H
#define BN256_FP12_EXP_H

#include "fp12.h"

#include <cstddef>

/*
 * h = f^e, e given as len little-endian bytes. Left-to-right square and
 * multiply; an empty or all-zero exponent gives one.
 *
 * Variable time in e. Do not use with secret exponents.
 */
void fp12_exp_vartime(fp12_fe *h, const fp12_fe *f, const unsigned char *e, size_t len);

/*
 * h = f^v, v = 1868033, by a fixed chain of cyclotomic squarings.
 * Precondition: f is in the cyclotomic subgroup.
 */
void fp12_pow_to_v(fp12_fe *h, const fp12_fe *f);

/*
 * h = f^u, u = v^3 = 6518589491078791937, the BN parameter.
 * Precondition: f is in the cyclotomic subgroup.
 */
void fp12_pow_to_u(fp12_fe *h, const fp12_fe *f);

#endif // BN256_FP12_EXP_H

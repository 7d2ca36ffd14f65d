#ifndef BN256_FP12_SQ_H
#define BN256_FP12_SQ_H

#include "fp12.h"

/*
 * h = f^2 by complex squaring. Valid for every element.
 */
void fp12_sq(fp12_fe *h, const fp12_fe *f);

/*
 * h = f^2 by Granger-Scott compressed squaring (PKC 2010).
 *
 * Precondition: f lies in the cyclotomic subgroup, i.e. f^(p^4 - p^2 + 1) = 1.
 * Outside it the result is NOT f^2; see fp12_is_cyclotomic.
 */
void fp12_cyclotomic_sq(fp12_fe *h, const fp12_fe *f);

#endif // BN256_FP12_SQ_H

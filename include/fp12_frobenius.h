#ifndef BN256_FP12_FROBENIUS_H
#define BN256_FP12_FROBENIUS_H

#include "fp12.h"

/* h = f^p. Twelve applications are the identity, six give fp12_conj. */
void fp12_frobenius(fp12_fe *h, const fp12_fe *f);

/* h = f^(p^2) */
void fp12_frobenius_p2(fp12_fe *h, const fp12_fe *f);

/* h = f^(p^4) */
void fp12_frobenius_p4(fp12_fe *h, const fp12_fe *f);

#endif // BN256_FP12_FROBENIUS_H

#ifndef BN256_FP12_MUL_H
#define BN256_FP12_MUL_H

#include "fp12.h"

/*
 * h = f * g:
 *   x = f.x*g.y + g.x*f.y
 *   y = f.y*g.y + t*(f.x*g.x)
 */
void fp12_mul(fp12_fe *h, const fp12_fe *f, const fp12_fe *g);

/* h = (f.x*s)*w + f.y*s */
void fp12_mul_fp6(fp12_fe *h, const fp12_fe *f, const fp6_fe *s);

#endif // BN256_FP12_MUL_H

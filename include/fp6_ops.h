#ifndef BN256_FP6_OPS_H
#define BN256_FP6_OPS_H

#include "fp2_mul.h"
#include "fp2_ops.h"
#include "fp6.h"

static inline void fp6_copy(fp6_fe *h, const fp6_fe *f)
{
    fp2_copy(&h->x, &f->x);
    fp2_copy(&h->y, &f->y);
    fp2_copy(&h->z, &f->z);
}

static inline void fp6_0(fp6_fe *h)
{
    fp2_0(&h->x);
    fp2_0(&h->y);
    fp2_0(&h->z);
}

static inline void fp6_1(fp6_fe *h)
{
    fp2_0(&h->x);
    fp2_0(&h->y);
    fp2_1(&h->z);
}

static inline int fp6_iszero(const fp6_fe *f)
{
    return fp2_iszero(&f->x) & fp2_iszero(&f->y) & fp2_iszero(&f->z);
}

static inline int fp6_isone(const fp6_fe *f)
{
    return fp2_iszero(&f->x) & fp2_iszero(&f->y) & fp2_isone(&f->z);
}

static inline int fp6_eq(const fp6_fe *f, const fp6_fe *g)
{
    return fp2_eq(&f->x, &g->x) & fp2_eq(&f->y, &g->y) & fp2_eq(&f->z, &g->z);
}

static inline void fp6_neg(fp6_fe *h, const fp6_fe *f)
{
    fp2_neg(&h->x, &f->x);
    fp2_neg(&h->y, &f->y);
    fp2_neg(&h->z, &f->z);
}

static inline void fp6_add(fp6_fe *h, const fp6_fe *f, const fp6_fe *g)
{
    fp2_add(&h->x, &f->x, &g->x);
    fp2_add(&h->y, &f->y, &g->y);
    fp2_add(&h->z, &f->z, &g->z);
}

static inline void fp6_sub(fp6_fe *h, const fp6_fe *f, const fp6_fe *g)
{
    fp2_sub(&h->x, &f->x, &g->x);
    fp2_sub(&h->y, &f->y, &g->y);
    fp2_sub(&h->z, &f->z, &g->z);
}

static inline void fp6_dbl(fp6_fe *h, const fp6_fe *f)
{
    fp2_dbl(&h->x, &f->x);
    fp2_dbl(&h->y, &f->y);
    fp2_dbl(&h->z, &f->z);
}

/*
 * h = t * f. t(x*t^2 + y*t + z) = y*t^2 + z*t + xi*x
 */
static inline void fp6_mul_tau(fp6_fe *h, const fp6_fe *f)
{
    fp2_fe tz;
    fp2_mul_xi(&tz, &f->x);
    fp2_copy(&h->x, &f->y);
    fp2_copy(&h->y, &f->z);
    fp2_copy(&h->z, &tz);
}

static inline void fp6_mul_fp2(fp6_fe *h, const fp6_fe *f, const fp2_fe *s)
{
    fp2_mul(&h->x, &f->x, s);
    fp2_mul(&h->y, &f->y, s);
    fp2_mul(&h->z, &f->z, s);
}

static inline void fp6_mul_fp(fp6_fe *h, const fp6_fe *f, const fp_fe s)
{
    fp2_mul_fp(&h->x, &f->x, s);
    fp2_mul_fp(&h->y, &f->y, s);
    fp2_mul_fp(&h->z, &f->z, s);
}

#endif // BN256_FP6_OPS_H

#ifndef BN256_FP12_OPS_H
#define BN256_FP12_OPS_H

#include "fp12.h"
#include "fp6_ops.h"

static inline void fp12_copy(fp12_fe *h, const fp12_fe *f)
{
    fp6_copy(&h->x, &f->x);
    fp6_copy(&h->y, &f->y);
}

static inline void fp12_0(fp12_fe *h)
{
    fp6_0(&h->x);
    fp6_0(&h->y);
}

static inline void fp12_1(fp12_fe *h)
{
    fp6_0(&h->x);
    fp6_1(&h->y);
}

static inline int fp12_iszero(const fp12_fe *f)
{
    return fp6_iszero(&f->x) & fp6_iszero(&f->y);
}

static inline int fp12_isone(const fp12_fe *f)
{
    return fp6_iszero(&f->x) & fp6_isone(&f->y);
}

static inline int fp12_eq(const fp12_fe *f, const fp12_fe *g)
{
    return fp6_eq(&f->x, &g->x) & fp6_eq(&f->y, &g->y);
}

static inline void fp12_neg(fp12_fe *h, const fp12_fe *f)
{
    fp6_neg(&h->x, &f->x);
    fp6_neg(&h->y, &f->y);
}

/*
 * h = conj(f) = f^(p^6). On the cyclotomic subgroup this is the inverse.
 */
static inline void fp12_conj(fp12_fe *h, const fp12_fe *f)
{
    fp6_neg(&h->x, &f->x);
    fp6_copy(&h->y, &f->y);
}

static inline void fp12_add(fp12_fe *h, const fp12_fe *f, const fp12_fe *g)
{
    fp6_add(&h->x, &f->x, &g->x);
    fp6_add(&h->y, &f->y, &g->y);
}

static inline void fp12_sub(fp12_fe *h, const fp12_fe *f, const fp12_fe *g)
{
    fp6_sub(&h->x, &f->x, &g->x);
    fp6_sub(&h->y, &f->y, &g->y);
}

#endif // BN256_FP12_OPS_H

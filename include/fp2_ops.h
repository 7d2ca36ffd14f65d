#ifndef BN256_FP2_OPS_H
#define BN256_FP2_OPS_H

#include "fp2.h"
#include "fp_mul.h"
#include "fp_ops.h"
#include "fp_utils.h"

static inline void fp2_copy(fp2_fe *h, const fp2_fe *f)
{
    fp_copy(h->x, f->x);
    fp_copy(h->y, f->y);
}

static inline void fp2_0(fp2_fe *h)
{
    fp_0(h->x);
    fp_0(h->y);
}

static inline void fp2_1(fp2_fe *h)
{
    fp_0(h->x);
    fp_1(h->y);
}

static inline int fp2_iszero(const fp2_fe *f)
{
    return 1 - (fp_isnonzero(f->x) | fp_isnonzero(f->y));
}

static inline int fp2_isone(const fp2_fe *f)
{
    return (1 - fp_isnonzero(f->x)) & fp_isone(f->y);
}

static inline int fp2_eq(const fp2_fe *f, const fp2_fe *g)
{
    return fp_eq(f->x, g->x) & fp_eq(f->y, g->y);
}

static inline void fp2_neg(fp2_fe *h, const fp2_fe *f)
{
    fp_neg(h->x, f->x);
    fp_neg(h->y, f->y);
}

/* x*i + y -> -x*i + y */
static inline void fp2_conj(fp2_fe *h, const fp2_fe *f)
{
    fp_neg(h->x, f->x);
    fp_copy(h->y, f->y);
}

static inline void fp2_add(fp2_fe *h, const fp2_fe *f, const fp2_fe *g)
{
    fp_add(h->x, f->x, g->x);
    fp_add(h->y, f->y, g->y);
}

static inline void fp2_sub(fp2_fe *h, const fp2_fe *f, const fp2_fe *g)
{
    fp_sub(h->x, f->x, g->x);
    fp_sub(h->y, f->y, g->y);
}

static inline void fp2_dbl(fp2_fe *h, const fp2_fe *f)
{
    fp_dbl(h->x, f->x);
    fp_dbl(h->y, f->y);
}

static inline void fp2_mul_fp(fp2_fe *h, const fp2_fe *f, const fp_fe s)
{
    fp_mul(h->x, f->x, s);
    fp_mul(h->y, f->y, s);
}

/*
 * h = f * xi with xi = i + 3:
 * (x*i + y)(i + 3) = (3x + y)*i + (3y - x)
 */
static inline void fp2_mul_xi(fp2_fe *h, const fp2_fe *f)
{
    fp_fe tx, ty;

    fp_dbl(tx, f->x);
    fp_add(tx, tx, f->x);
    fp_add(tx, tx, f->y);

    fp_dbl(ty, f->y);
    fp_add(ty, ty, f->y);
    fp_sub(ty, ty, f->x);

    fp_copy(h->x, tx);
    fp_copy(h->y, ty);
}

#endif // BN256_FP2_OPS_H

#ifndef BN256_X64_FP64_INLINE_H
#define BN256_X64_FP64_INLINE_H

#include "bn256_platform.h"
#include "fp.h"
#include "x64/fp64.h"
#include "x64/mul128.h"

/*
 * Montgomery multiplication, coarsely integrated operand scanning (CIOS).
 * h = f * g * R^-1 mod p. Inputs < p, output < p. h may alias f or g.
 */
static BN256_FORCE_INLINE void fp64_mul_inline(fp_fe h, const fp_fe f, const fp_fe g)
{
    uint64_t t0 = 0, t1 = 0, t2 = 0, t3 = 0, t4 = 0, t5;
    uint64_t c, m, k;

    for (int i = 0; i < 4; i++)
    {
        const uint64_t gi = g[i];

        c = 0;
        t0 = mac64(f[0], gi, t0, &c);
        t1 = mac64(f[1], gi, t1, &c);
        t2 = mac64(f[2], gi, t2, &c);
        t3 = mac64(f[3], gi, t3, &c);
        k = 0;
        t4 = adc64(t4, c, &k);
        t5 = k;

        m = t0 * FP64_NP0;

        c = 0;
        (void)mac64(m, FP64_P[0], t0, &c);
        t0 = mac64(m, FP64_P[1], t1, &c);
        t1 = mac64(m, FP64_P[2], t2, &c);
        t2 = mac64(m, FP64_P[3], t3, &c);
        k = 0;
        t3 = adc64(t4, c, &k);
        t4 = t5 + k;
    }

    const uint64_t t[4] = {t0, t1, t2, t3};
    fp64_reduce_once(h, t, t4);
}

static BN256_FORCE_INLINE void fp64_sq_inline(fp_fe h, const fp_fe f)
{
    fp64_mul_inline(h, f, f);
}

#endif // BN256_X64_FP64_INLINE_H

#ifndef BN256_FP_OPS_H
#define BN256_FP_OPS_H

#include "fp.h"

#include <cstring>

#if BN256_PLATFORM_64BIT
#include "x64/fp64.h"

static inline void fp_add(fp_fe h, const fp_fe f, const fp_fe g)
{
    uint64_t t[4];
    uint64_t carry = 0;
    t[0] = adc64(f[0], g[0], &carry);
    t[1] = adc64(f[1], g[1], &carry);
    t[2] = adc64(f[2], g[2], &carry);
    t[3] = adc64(f[3], g[3], &carry);
    fp64_reduce_once(h, t, carry);
}

static inline void fp_sub(fp_fe h, const fp_fe f, const fp_fe g)
{
    uint64_t t[4];
    uint64_t borrow = 0;
    t[0] = sbb64(f[0], g[0], &borrow);
    t[1] = sbb64(f[1], g[1], &borrow);
    t[2] = sbb64(f[2], g[2], &borrow);
    t[3] = sbb64(f[3], g[3], &borrow);

    /* add p back if f < g */
    const uint64_t mask = ct_mask_u64(borrow);
    uint64_t carry = 0;
    h[0] = adc64(t[0], FP64_P[0] & mask, &carry);
    h[1] = adc64(t[1], FP64_P[1] & mask, &carry);
    h[2] = adc64(t[2], FP64_P[2] & mask, &carry);
    h[3] = adc64(t[3], FP64_P[3] & mask, &carry);
}

static inline void fp_neg(fp_fe h, const fp_fe f)
{
    const fp_fe zero = {0, 0, 0, 0};
    fp_sub(h, zero, f);
}

static inline void fp_dbl(fp_fe h, const fp_fe f)
{
    fp_add(h, f, f);
}

#endif // BN256_PLATFORM_64BIT

static inline void fp_copy(fp_fe h, const fp_fe f)
{
    std::memcpy(h, f, sizeof(fp_fe));
}

static inline void fp_0(fp_fe h)
{
    std::memset(h, 0, sizeof(fp_fe));
}

/* Montgomery form of 1, i.e. R mod p */
static inline void fp_1(fp_fe h)
{
    h[0] = FP64_ONE[0];
    h[1] = FP64_ONE[1];
    h[2] = FP64_ONE[2];
    h[3] = FP64_ONE[3];
}

#endif // BN256_FP_OPS_H

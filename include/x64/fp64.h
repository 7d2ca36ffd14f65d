#ifndef BN256_X64_FP64_H
#define BN256_X64_FP64_H

#include "ct_barrier.h"
#include "fp.h"
#include "x64/mul128.h"

#include <cstdint>

/*
 * p = 65000549695646603732796438742359905742825358107623003571877145026864184071783
 *   = 0x8fb501e34aa387f9aa6fecb86184dc21ee5b88d120b5b59e185cac6c5e089667
 *
 * p > 2^255, so the sum of two reduced elements can carry out of the top limb.
 */
static const uint64_t FP64_P[4] = {0x185cac6c5e089667ULL, 0xee5b88d120b5b59eULL, 0xaa6fecb86184dc21ULL,
                                   0x8fb501e34aa387f9ULL};

/* -p^-1 mod 2^64 */
static const uint64_t FP64_NP0 = 0x2387f9007f17daa9ULL;

/* R mod p, the Montgomery form of 1 */
static const uint64_t FP64_ONE[4] = {0xe7a35393a1f76999ULL, 0x11a4772edf4a4a61ULL, 0x559013479e7b23deULL,
                                     0x704afe1cb55c7806ULL};

/* R^2 mod p, used to enter Montgomery form */
static const uint64_t FP64_R2[4] = {0x9c21c3ff7e444f56ULL, 0x409ed151b2efb0c2ULL, 0x0c6dc37b80fb1651ULL,
                                    0x7c36e0e62c2380b7ULL};

/*
 * h = t - p if (hi:t) >= p, else t. Requires (hi:t) < 2p; hi is the bit above limb 3.
 */
static inline void fp64_reduce_once(fp_fe h, const uint64_t t[4], uint64_t hi)
{
    uint64_t r[4];
    uint64_t borrow = 0;
    r[0] = sbb64(t[0], FP64_P[0], &borrow);
    r[1] = sbb64(t[1], FP64_P[1], &borrow);
    r[2] = sbb64(t[2], FP64_P[2], &borrow);
    r[3] = sbb64(t[3], FP64_P[3], &borrow);

    /* keep t only when the subtraction borrowed and nothing carried above limb 3 */
    const uint64_t keep = ct_mask_u64(borrow & (hi ^ 1));
    h[0] = ct_select_u64(keep, t[0], r[0]);
    h[1] = ct_select_u64(keep, t[1], r[1]);
    h[2] = ct_select_u64(keep, t[2], r[2]);
    h[3] = ct_select_u64(keep, t[3], r[3]);
}

#endif // BN256_X64_FP64_H

#ifndef BN256_CT_BARRIER_H
#define BN256_CT_BARRIER_H

#include <cstdint>

/*
 * Hide a value from the optimiser so that mask arithmetic on carries and
 * borrows is not turned back into a branch.
 */
#if defined(__GNUC__) || defined(__clang__)

static inline uint64_t ct_barrier_u64(uint64_t x)
{
    __asm__ __volatile__("" : "+r"(x));
    return x;
}

#else

static inline uint64_t ct_barrier_u64(uint64_t x)
{
    volatile uint64_t v = x;
    return v;
}

#endif

/* all-ones if bit == 1, zero if bit == 0 */
static inline uint64_t ct_mask_u64(uint64_t bit)
{
    return 0 - ct_barrier_u64(bit);
}

/* a if mask is all-ones, b if zero */
static inline uint64_t ct_select_u64(uint64_t mask, uint64_t a, uint64_t b)
{
    return (a & mask) | (b & ~mask);
}

#endif // BN256_CT_BARRIER_H

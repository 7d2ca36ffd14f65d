#ifndef BN256_X64_MUL128_H
#define BN256_X64_MUL128_H

#include "bn256_platform.h"

#include <cstdint>

#if BN256_HAVE_INT128

static inline bn256_uint128 mul64(uint64_t a, uint64_t b)
{
    return (bn256_uint128)a * b;
}

/* Returns the low word of a*b + c + *carry and leaves the high word in *carry. */
static inline uint64_t mac64(uint64_t a, uint64_t b, uint64_t c, uint64_t *carry)
{
    bn256_uint128 t = mul64(a, b) + c + *carry;
    *carry = (uint64_t)(t >> 64);
    return (uint64_t)t;
}

#elif BN256_HAVE_UMUL128

struct bn256_uint128_emu
{
    uint64_t lo;
    uint64_t hi;
};

static inline bn256_uint128_emu mul64(uint64_t a, uint64_t b)
{
    bn256_uint128_emu r;
    r.lo = _umul128(a, b, &r.hi);
    return r;
}

static inline bn256_uint128_emu operator+(bn256_uint128_emu a, uint64_t b)
{
    bn256_uint128_emu r;
    r.lo = a.lo + b;
    r.hi = a.hi + (r.lo < a.lo ? 1 : 0);
    return r;
}

static inline bn256_uint128_emu &operator+=(bn256_uint128_emu &a, uint64_t b)
{
    a = a + b;
    return a;
}

static inline uint64_t mac64(uint64_t a, uint64_t b, uint64_t c, uint64_t *carry)
{
    bn256_uint128_emu t = mul64(a, b);
    t += c;
    t += *carry;
    *carry = t.hi;
    return t.lo;
}

#endif

/* a + b + *carry, with *carry in {0, 1} on entry and exit */
static inline uint64_t adc64(uint64_t a, uint64_t b, uint64_t *carry)
{
    uint64_t s = a + b;
    uint64_t c1 = (uint64_t)(s < a);
    uint64_t r = s + *carry;
    uint64_t c2 = (uint64_t)(r < s);
    *carry = c1 | c2;
    return r;
}

/* a - b - *borrow, with *borrow in {0, 1} on entry and exit */
static inline uint64_t sbb64(uint64_t a, uint64_t b, uint64_t *borrow)
{
    uint64_t d = a - b;
    uint64_t b1 = (uint64_t)(a < b);
    uint64_t r = d - *borrow;
    uint64_t b2 = (uint64_t)(d < *borrow);
    *borrow = b1 | b2;
    return r;
}

#endif // BN256_X64_MUL128_H

#ifndef BN256_FP_TOBYTES_H
#define BN256_FP_TOBYTES_H

#include "fp.h"

#if BN256_PLATFORM_64BIT
void fp_tobytes_x64(unsigned char *s, const fp_fe h);
static inline void fp_tobytes(unsigned char *s, const fp_fe h)
{
    fp_tobytes_x64(s, h);
}
#endif

#endif // BN256_FP_TOBYTES_H

#ifndef BN256_FP_SQ_H
#define BN256_FP_SQ_H

#include "fp.h"

#if BN256_PLATFORM_64BIT
void fp_sq_x64(fp_fe h, const fp_fe f);
static inline void fp_sq(fp_fe h, const fp_fe f)
{
    fp_sq_x64(h, f);
}
#endif

#endif // BN256_FP_SQ_H

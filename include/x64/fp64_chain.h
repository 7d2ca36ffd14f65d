#ifndef BN256_X64_FP64_CHAIN_H
#define BN256_X64_FP64_CHAIN_H

#if defined(_MSC_VER)

#include "fp.h"

void fp_mul_x64(fp_fe h, const fp_fe f, const fp_fe g);
void fp_sq_x64(fp_fe h, const fp_fe f);

#define fp64_chain_mul fp_mul_x64
#define fp64_chain_sq fp_sq_x64

#else

#include "x64/fp64_inline.h"

#define fp64_chain_mul fp64_mul_inline
#define fp64_chain_sq fp64_sq_inline

#endif

#endif // BN256_X64_FP64_CHAIN_H

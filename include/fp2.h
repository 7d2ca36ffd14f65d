#ifndef BN256_FP2_H
#define BN256_FP2_H

#include "fp.h"

/*
 * Element of F_p^2 = F_p[i]/(i^2 + 1), stored as x*i + y.
 */
typedef struct
{
    fp_fe x;
    fp_fe y;
} fp2_fe;

#endif // BN256_FP2_H

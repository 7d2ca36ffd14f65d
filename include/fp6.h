#ifndef BN256_FP6_H
#define BN256_FP6_H

#include "fp2.h"

/*
 * Element of F_p^6 = F_p^2[t]/(t^3 - xi), xi = i + 3, stored as x*t^2 + y*t + z.
 */
typedef struct
{
    fp2_fe x;
    fp2_fe y;
    fp2_fe z;
} fp6_fe;

#endif // BN256_FP6_H

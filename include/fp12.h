#ifndef BN256_FP12_H
#define BN256_FP12_H

#include "fp6.h"

/*
 * Element of F_p^12 = F_p^6[w]/(w^2 - t), stored as x*w + y. This is the
 * pairing target field; GT is the order-n subgroup of its cyclotomic subgroup.
 */
typedef struct
{
    fp6_fe x;
    fp6_fe y;
} fp12_fe;

#endif // BN256_FP12_H

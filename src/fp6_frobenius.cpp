// Copyright (c) 2025-2026, Brandon Lehmann
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "fp6_frobenius.h"

#include "bn256_constants.h"
#include "fp6_ops.h"

void fp6_frobenius(fp6_fe *h, const fp6_fe *f)
{
    fp2_conj(&h->x, &f->x);
    fp2_conj(&h->y, &f->y);
    fp2_conj(&h->z, &f->z);

    fp2_mul(&h->x, &h->x, &BN256_XI_TO_2P_MINUS_2_OVER_3);
    fp2_mul(&h->y, &h->y, &BN256_XI_TO_P_MINUS_1_OVER_3);
}

void fp6_frobenius_p2(fp6_fe *h, const fp6_fe *f)
{
    fp2_mul_fp(&h->x, &f->x, BN256_XI_TO_2P_SQUARED_MINUS_2_OVER_3);
    fp2_mul_fp(&h->y, &f->y, BN256_XI_TO_P_SQUARED_MINUS_1_OVER_3);
    fp2_copy(&h->z, &f->z);
}

void fp6_frobenius_p4(fp6_fe *h, const fp6_fe *f)
{
    fp2_mul_fp(&h->x, &f->x, BN256_XI_TO_P_SQUARED_MINUS_1_OVER_3);
    fp2_mul_fp(&h->y, &f->y, BN256_XI_TO_2P_SQUARED_MINUS_2_OVER_3);
    fp2_copy(&h->z, &f->z);
}

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

#include "fp6_invert.h"

#include "bn256_secure_erase.h"
#include "fp2_invert.h"
#include "fp6_ops.h"

void fp6_invert(fp6_fe *out, const fp6_fe *z)
{
    fp2_fe a, b, c, f, t;

    /* a = z^2 - xi*x*y */
    fp2_mul(&t, &z->x, &z->y);
    fp2_mul_xi(&t, &t);
    fp2_sq(&a, &z->z);
    fp2_sub(&a, &a, &t);

    /* b = xi*x^2 - y*z */
    fp2_sq(&b, &z->x);
    fp2_mul_xi(&b, &b);
    fp2_mul(&t, &z->y, &z->z);
    fp2_sub(&b, &b, &t);

    /* c = y^2 - x*z */
    fp2_sq(&c, &z->y);
    fp2_mul(&t, &z->x, &z->z);
    fp2_sub(&c, &c, &t);

    /* f = xi*c*y + a*z + xi*b*x */
    fp2_mul(&f, &c, &z->y);
    fp2_mul_xi(&f, &f);
    fp2_mul(&t, &a, &z->z);
    fp2_add(&f, &f, &t);
    fp2_mul(&t, &b, &z->x);
    fp2_mul_xi(&t, &t);
    fp2_add(&f, &f, &t);

    fp2_invert(&f, &f);

    fp2_mul(&out->x, &c, &f);
    fp2_mul(&out->y, &b, &f);
    fp2_mul(&out->z, &a, &f);

    bn256_secure_erase(&a, sizeof(fp2_fe));
    bn256_secure_erase(&b, sizeof(fp2_fe));
    bn256_secure_erase(&c, sizeof(fp2_fe));
    bn256_secure_erase(&f, sizeof(fp2_fe));
    bn256_secure_erase(&t, sizeof(fp2_fe));
}

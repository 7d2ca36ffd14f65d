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

#include "fp6_mul.h"

#include "fp6_ops.h"

void fp6_mul(fp6_fe *h, const fp6_fe *f, const fp6_fe *g)
{
    fp2_fe t0, t1, t2, tx, ty, tz, s0, s1;

    fp2_mul(&t0, &f->z, &g->z);
    fp2_mul(&t1, &f->y, &g->y);
    fp2_mul(&t2, &f->x, &g->x);

    /* tz = xi((x + y)(x' + y') - t1 - t2) + t0 */
    fp2_add(&s0, &f->x, &f->y);
    fp2_add(&s1, &g->x, &g->y);
    fp2_mul(&tz, &s0, &s1);
    fp2_sub(&tz, &tz, &t1);
    fp2_sub(&tz, &tz, &t2);
    fp2_mul_xi(&tz, &tz);
    fp2_add(&tz, &tz, &t0);

    /* ty = (y + z)(y' + z') - t0 - t1 + xi*t2 */
    fp2_add(&s0, &f->y, &f->z);
    fp2_add(&s1, &g->y, &g->z);
    fp2_mul(&ty, &s0, &s1);
    fp2_sub(&ty, &ty, &t0);
    fp2_sub(&ty, &ty, &t1);
    fp2_mul_xi(&s0, &t2);
    fp2_add(&ty, &ty, &s0);

    /* tx = (x + z)(x' + z') - t0 + t1 - t2 */
    fp2_add(&s0, &f->x, &f->z);
    fp2_add(&s1, &g->x, &g->z);
    fp2_mul(&tx, &s0, &s1);
    fp2_sub(&tx, &tx, &t0);
    fp2_add(&tx, &tx, &t1);
    fp2_sub(&tx, &tx, &t2);

    fp2_copy(&h->x, &tx);
    fp2_copy(&h->y, &ty);
    fp2_copy(&h->z, &tz);
}

void fp6_sq(fp6_fe *h, const fp6_fe *f)
{
    fp2_fe c0, c1, c2, c3, c4, c5, y2;

    fp2_dbl(&y2, &f->y);
    fp2_mul(&c4, &f->z, &y2);
    fp2_sq(&c5, &f->x);

    fp2_mul_xi(&c1, &c5);
    fp2_add(&c1, &c1, &c4);
    fp2_sub(&c2, &c4, &c5);
    fp2_sq(&c3, &f->z);

    fp2_add(&c4, &f->x, &f->z);
    fp2_sub(&c4, &c4, &f->y);
    fp2_sq(&c4, &c4);
    fp2_mul(&c5, &y2, &f->x);

    fp2_mul_xi(&c0, &c5);
    fp2_add(&c0, &c0, &c3);

    fp2_add(&c2, &c2, &c4);
    fp2_add(&c2, &c2, &c5);
    fp2_sub(&c2, &c2, &c3);

    fp2_copy(&h->x, &c2);
    fp2_copy(&h->y, &c1);
    fp2_copy(&h->z, &c0);
}

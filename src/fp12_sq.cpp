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

#include "fp12_sq.h"

#include "fp12_ops.h"
#include "fp6_mul.h"

void fp12_sq(fp12_fe *h, const fp12_fe *f)
{
    fp6_fe v0, t, ty;

    fp6_mul(&v0, &f->x, &f->y);

    fp6_mul_tau(&t, &f->x);
    fp6_add(&t, &f->y, &t);
    fp6_add(&ty, &f->x, &f->y);
    fp6_mul(&ty, &ty, &t);
    fp6_sub(&ty, &ty, &v0);
    fp6_mul_tau(&t, &v0);
    fp6_sub(&ty, &ty, &t);

    fp6_dbl(&h->x, &v0);
    fp6_copy(&h->y, &ty);
}

/*
 * Squaring in F_p^4 = F_p^2[s]/(s^2 - xi) of a*s + b:
 *   u = 2ab = (a + b)^2 - a^2 - b^2
 *   v = xi*a^2 + b^2
 */
static inline void fp4_sq(fp2_fe *u, fp2_fe *v, const fp2_fe *a, const fp2_fe *b)
{
    fp2_fe t1, t2;

    fp2_sq(&t1, a);
    fp2_sq(&t2, b);

    fp2_add(u, a, b);
    fp2_sq(u, u);
    fp2_sub(u, u, &t1);
    fp2_sub(u, u, &t2);

    fp2_mul_xi(v, &t1);
    fp2_add(v, v, &t2);
}

/* h = 3f - 2g, the Granger-Scott recombination for the y half */
static inline void fp2_gs_sub(fp2_fe *h, const fp2_fe *t, const fp2_fe *g)
{
    fp2_fe s;
    fp2_dbl(&s, t);
    fp2_add(&s, &s, t);
    fp2_dbl(h, g);
    fp2_sub(h, &s, h);
}

/* h = 3t + 2g, the recombination for the x half */
static inline void fp2_gs_add(fp2_fe *h, const fp2_fe *t, const fp2_fe *g)
{
    fp2_fe s;
    fp2_dbl(&s, t);
    fp2_add(&s, &s, t);
    fp2_dbl(h, g);
    fp2_add(h, h, &s);
}

void fp12_cyclotomic_sq(fp12_fe *h, const fp12_fe *f)
{
    fp2_fe t00, t01, t02, t10, t11, t12, xi_t02;
    fp12_fe r;

    fp4_sq(&t11, &t00, &f->x.y, &f->y.z);
    fp4_sq(&t12, &t01, &f->y.x, &f->x.z);
    fp4_sq(&t02, &t10, &f->x.x, &f->y.y);

    fp2_mul_xi(&xi_t02, &t02);
    fp2_copy(&t02, &t10);
    fp2_copy(&t10, &xi_t02);

    fp2_gs_sub(&r.y.x, &t02, &f->y.x);
    fp2_gs_sub(&r.y.y, &t01, &f->y.y);
    fp2_gs_sub(&r.y.z, &t00, &f->y.z);

    fp2_gs_add(&r.x.x, &t12, &f->x.x);
    fp2_gs_add(&r.x.y, &t11, &f->x.y);
    fp2_gs_add(&r.x.z, &t10, &f->x.z);

    fp12_copy(h, &r);
}

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

#include "fp12_mul.h"

#include "fp12_ops.h"
#include "fp6_mul.h"

void fp12_mul(fp12_fe *h, const fp12_fe *f, const fp12_fe *g)
{
    fp6_fe tx, ty, t;

    fp6_mul(&tx, &f->x, &g->y);
    fp6_mul(&t, &g->x, &f->y);
    fp6_add(&tx, &tx, &t);

    fp6_mul(&ty, &f->y, &g->y);
    fp6_mul(&t, &f->x, &g->x);
    fp6_mul_tau(&t, &t);

    fp6_copy(&h->x, &tx);
    fp6_add(&h->y, &ty, &t);
}

void fp12_mul_fp6(fp12_fe *h, const fp12_fe *f, const fp6_fe *s)
{
    fp6_mul(&h->x, &f->x, s);
    fp6_mul(&h->y, &f->y, s);
}

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

#include "fp2_mul.h"

#include "fp2_ops.h"
#include "fp_sq.h"

void fp2_mul(fp2_fe *h, const fp2_fe *f, const fp2_fe *g)
{
    fp_fe tx, ty, t;

    /* (a*i + b)(c*i + d) = (ad + bc)*i + (bd - ac) */
    fp_mul(tx, f->x, g->y);
    fp_mul(t, f->y, g->x);
    fp_add(tx, tx, t);

    fp_mul(ty, f->y, g->y);
    fp_mul(t, f->x, g->x);
    fp_sub(ty, ty, t);

    fp_copy(h->x, tx);
    fp_copy(h->y, ty);
}

void fp2_sq(fp2_fe *h, const fp2_fe *f)
{
    fp_fe tx, ty, t;

    /* (x*i + y)^2 = 2xy*i + (y - x)(y + x) */
    fp_sub(tx, f->y, f->x);
    fp_add(ty, f->x, f->y);
    fp_mul(ty, tx, ty);

    fp_mul(t, f->x, f->y);
    fp_dbl(tx, t);

    fp_copy(h->x, tx);
    fp_copy(h->y, ty);
}

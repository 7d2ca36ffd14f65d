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

#include "fp12_exp.h"

#include "bn256_secure_erase.h"
#include "fp12_mul.h"
#include "fp12_ops.h"
#include "fp12_sq.h"

void fp12_exp_vartime(fp12_fe *h, const fp12_fe *f, const unsigned char *e, size_t len)
{
    fp12_fe base, acc;

    /* f may alias h */
    fp12_copy(&base, f);
    fp12_1(&acc);

    size_t top = len;
    while (top > 0 && e[top - 1] == 0)
        top--;

    for (size_t i = top; i-- > 0;)
    {
        for (int bit = 7; bit >= 0; bit--)
        {
            fp12_sq(&acc, &acc);
            if ((e[i] >> bit) & 1)
                fp12_mul(&acc, &acc, &base);
        }
    }

    fp12_copy(h, &acc);

    bn256_secure_erase(&base, sizeof(fp12_fe));
    bn256_secure_erase(&acc, sizeof(fp12_fe));
}

static inline void fp12_cyclotomic_sqn(fp12_fe *h, const fp12_fe *f, int n)
{
    fp12_cyclotomic_sq(h, f);
    for (int i = 1; i < n; i++)
        fp12_cyclotomic_sq(h, h);
}

void fp12_pow_to_v(fp12_fe *h, const fp12_fe *f)
{
    fp12_fe a, t0, t1, t2;

    fp12_copy(&a, f);

    fp12_cyclotomic_sqn(&t0, &a, 3); /* a^8 */
    fp12_cyclotomic_sqn(&t1, &t0, 3); /* a^64 */
    fp12_conj(&t2, &t0); /* a^-8 */
    fp12_mul(&t2, &t2, &a); /* a^-7 */
    fp12_mul(&t2, &t2, &t1); /* a^57 */
    fp12_cyclotomic_sqn(&t2, &t2, 7); /* a^7296 */
    fp12_mul(&t2, &t2, &a); /* a^7297 */
    fp12_cyclotomic_sqn(&t2, &t2, 8); /* a^1868032 */
    fp12_mul(h, &t2, &a);

    bn256_secure_erase(&a, sizeof(fp12_fe));
    bn256_secure_erase(&t0, sizeof(fp12_fe));
    bn256_secure_erase(&t1, sizeof(fp12_fe));
    bn256_secure_erase(&t2, sizeof(fp12_fe));
}

void fp12_pow_to_u(fp12_fe *h, const fp12_fe *f)
{
    fp12_pow_to_v(h, f);
    fp12_pow_to_v(h, h);
    fp12_pow_to_v(h, h);
}

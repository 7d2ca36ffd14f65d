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

#include "fp_tobytes.h"

#include "bn256_secure_erase.h"
#include "x64/fp64_inline.h"

/*
 * Leaves Montgomery form and writes the canonical value as 32 little-endian bytes.
 */
void fp_tobytes_x64(unsigned char *s, const fp_fe h)
{
    static const fp_fe raw_one = {1, 0, 0, 0};
    fp_fe t;
    fp64_mul_inline(t, h, raw_one);

    for (int i = 0; i < 4; i++)
    {
        s[8 * i + 0] = (unsigned char)(t[i]);
        s[8 * i + 1] = (unsigned char)(t[i] >> 8);
        s[8 * i + 2] = (unsigned char)(t[i] >> 16);
        s[8 * i + 3] = (unsigned char)(t[i] >> 24);
        s[8 * i + 4] = (unsigned char)(t[i] >> 32);
        s[8 * i + 5] = (unsigned char)(t[i] >> 40);
        s[8 * i + 6] = (unsigned char)(t[i] >> 48);
        s[8 * i + 7] = (unsigned char)(t[i] >> 56);
    }

    bn256_secure_erase(t, sizeof(fp_fe));
}

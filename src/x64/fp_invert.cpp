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

#include "fp_invert.h"

#include "bn256_secure_erase.h"
#include "fp_ops.h"
#include "x64/fp64_chain.h"

/* p - 2, little-endian */
static const unsigned char FP_P_MINUS_2[32] = {
    0x65, 0x96, 0x08, 0x5e, 0x6c, 0xac, 0x5c, 0x18, 0x9e, 0xb5, 0xb5, 0x20, 0xd1, 0x88, 0x5b, 0xee,
    0x21, 0xdc, 0x84, 0x61, 0xb8, 0xec, 0x6f, 0xaa, 0xf9, 0x87, 0xa3, 0x4a, 0xe3, 0x01, 0xb5, 0x8f};

/*
 * out = z^(p-2). The exponent is public, so the square-and-multiply schedule
 * is fixed. Zero maps to zero.
 */
void fp_invert_x64(fp_fe out, const fp_fe z)
{
    fp_fe acc;

    /* bit 255 of p-2 is set */
    fp_copy(acc, z);

    for (int i = 254; i >= 0; i--)
    {
        fp64_chain_sq(acc, acc);
        if ((FP_P_MINUS_2[i >> 3] >> (i & 7)) & 1)
            fp64_chain_mul(acc, acc, z);
    }

    fp_copy(out, acc);

    bn256_secure_erase(acc, sizeof(fp_fe));
}

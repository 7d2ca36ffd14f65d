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

// api_fp12.cpp — Fp12 C++ API methods (generator, checked inversion and
// cyclotomic routines, exponentiation overloads, serialization).

#include "bn256_constants.h"
#include "bn256_fp12.h"

namespace bn256
{

    namespace
    {
        /* Leaves in serialization order: x.x.x, x.x.y, x.y.x, ..., y.z.y */
        template<typename Fe, typename Leaf> std::array<Leaf *, 12> leaves(Fe &fe)
        {
            return {fe.x.x.x, fe.x.x.y, fe.x.y.x, fe.x.y.y, fe.x.z.x, fe.x.z.y,
                    fe.y.x.x, fe.y.x.y, fe.y.y.x, fe.y.y.y, fe.y.z.x, fe.y.z.y};
        }
    } // namespace

    Fp12 Fp12::generator()
    {
        return Fp12(BN256_GT_GENERATOR);
    }

    std::optional<Fp12> Fp12::invert() const
    {
        if (is_zero())
            return std::nullopt;

        Fp12 r;
        fp12_invert(&r.fe_, &fe_);
        return r;
    }

    Fp12 Fp12::exp(uint64_t e) const
    {
        uint8_t bytes[8];
        for (size_t i = 0; i < 8; i++)
            bytes[i] = static_cast<uint8_t>(e >> (8 * i));

        return exp(bytes, sizeof(bytes));
    }

    Fp12 Fp12::exp(const uint8_t *e, size_t len) const
    {
        Fp12 r;
        fp12_exp_vartime(&r.fe_, &fe_, e, len);
        return r;
    }

    std::optional<Fp12> Fp12::cyclotomic_sq_checked() const
    {
        if (!is_cyclotomic())
            return std::nullopt;

        return cyclotomic_sq();
    }

    std::optional<Fp12> Fp12::pow_to_u_checked() const
    {
        if (!is_cyclotomic())
            return std::nullopt;

        return pow_to_u();
    }

    std::array<uint8_t, Fp12::BYTES> Fp12::to_bytes() const
    {
        std::array<uint8_t, BYTES> out;
        const auto src = leaves<const fp12_fe, const uint64_t>(fe_);
        for (size_t i = 0; i < 12; i++)
            fp_tobytes(out.data() + 32 * i, src[i]);
        return out;
    }

    std::optional<Fp12> Fp12::from_bytes(const uint8_t bytes[BYTES])
    {
        Fp12 r;
        const auto dst = leaves<fp12_fe, uint64_t>(r.fe_);
        for (size_t i = 0; i < 12; i++)
        {
            const auto leaf = Fp::from_bytes(bytes + 32 * i);
            if (!leaf)
                return std::nullopt;

            fp_copy(dst[i], leaf->raw());
        }

        return r;
    }

    std::string Fp12::to_string() const
    {
        return "(" + x().to_string() + "," + y().to_string() + ")";
    }

} // namespace bn256

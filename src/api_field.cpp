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

// api_field.cpp — Fp/Fp2/Fp6 C++ API methods (serialization with canonicality
// checks, zero-rejecting inversion, textual rendering).

#include "bn256_field.h"

#include <iomanip>
#include <sstream>

namespace bn256
{

    /* ---- Fp ---- */

    Fp Fp::from_u64(uint64_t v)
    {
        uint8_t bytes[32] = {0};
        for (size_t i = 0; i < 8; i++)
            bytes[i] = static_cast<uint8_t>(v >> (8 * i));

        Fp r;
        fp_frombytes(r.fe_, bytes);
        return r;
    }

    std::array<uint8_t, 32> Fp::to_bytes() const
    {
        std::array<uint8_t, 32> out;
        fp_tobytes(out.data(), fe_);
        return out;
    }

    std::optional<Fp> Fp::from_bytes(const uint8_t bytes[32])
    {
        Fp r;
        fp_frombytes(r.fe_, bytes);

        /* fp_frombytes reduces mod p; anything >= p fails the round trip */
        uint8_t check[32];
        fp_tobytes(check, r.fe_);

        uint8_t diff = 0;
        for (int i = 0; i < 32; i++)
            diff |= check[i] ^ bytes[i];

        if (diff != 0)
            return std::nullopt;

        return r;
    }

    std::optional<Fp> Fp::invert() const
    {
        if (is_zero())
            return std::nullopt;

        Fp r;
        fp_invert(r.fe_, fe_);
        return r;
    }

    std::string Fp::to_string() const
    {
        const auto bytes = to_bytes();
        std::ostringstream os;
        for (size_t i = 32; i-- > 0;)
            os << std::hex << std::setfill('0') << std::setw(2) << static_cast<unsigned>(bytes[i]);
        return os.str();
    }

    /* ---- Fp2 ---- */

    std::optional<Fp2> Fp2::invert() const
    {
        if (is_zero())
            return std::nullopt;

        Fp2 r;
        fp2_invert(&r.fe_, &fe_);
        return r;
    }

    std::string Fp2::to_string() const
    {
        return "(" + x().to_string() + "," + y().to_string() + ")";
    }

    /* ---- Fp6 ---- */

    std::optional<Fp6> Fp6::invert() const
    {
        if (is_zero())
            return std::nullopt;

        Fp6 r;
        fp6_invert(&r.fe_, &fe_);
        return r;
    }

    std::string Fp6::to_string() const
    {
        return "(" + x().to_string() + "," + y().to_string() + "," + z().to_string() + ")";
    }

} // namespace bn256

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

/**
 * @file bn256_fp12.h
 * @brief C++ wrapper for F_p^12, the BN256 pairing target field.
 *
 * Fp12 wraps fp12_fe (x*w + y with w^2 = t). Cyclotomic squaring and the
 * fixed-exponent power to u are only defined on the cyclotomic subgroup; the
 * unchecked methods trust the caller, the *_checked variants verify
 * membership first and return nullopt otherwise.
 */

#ifndef BN256_API_FP12_H
#define BN256_API_FP12_H

#include "bn256_field.h"
#include "fp12_exp.h"
#include "fp12_frobenius.h"
#include "fp12_invert.h"
#include "fp12_mul.h"
#include "fp12_ops.h"
#include "fp12_sq.h"
#include "fp12_utils.h"

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace bn256
{

    /**
     * @brief Element of F_p^12.
     */
    class Fp12
    {
      public:
        /// Serialized size: twelve F_p elements, x.x.x first.
        static constexpr size_t BYTES = 12 * 32;

        Fp12()
        {
            fp12_0(&fe_);
        }

        Fp12(const Fp6 &x, const Fp6 &y)
        {
            fp6_copy(&fe_.x, &x.raw());
            fp6_copy(&fe_.y, &y.raw());
        }

        explicit Fp12(const fp12_fe &fe)
        {
            fp12_copy(&fe_, &fe);
        }

        static Fp12 zero()
        {
            return Fp12();
        }

        static Fp12 one()
        {
            Fp12 r;
            fp12_1(&r.fe_);
            return r;
        }

        /// The published generator of GT.
        static Fp12 generator();

        Fp6 x() const
        {
            return Fp6(fe_.x);
        }

        Fp6 y() const
        {
            return Fp6(fe_.y);
        }

        bool is_zero() const
        {
            return fp12_iszero(&fe_) != 0;
        }

        bool is_one() const
        {
            return fp12_isone(&fe_) != 0;
        }

        bool operator==(const Fp12 &other) const
        {
            return fp12_eq(&fe_, &other.fe_) != 0;
        }

        bool operator!=(const Fp12 &other) const
        {
            return !(*this == other);
        }

        Fp12 operator+(const Fp12 &other) const
        {
            Fp12 r;
            fp12_add(&r.fe_, &fe_, &other.fe_);
            return r;
        }

        Fp12 operator-(const Fp12 &other) const
        {
            Fp12 r;
            fp12_sub(&r.fe_, &fe_, &other.fe_);
            return r;
        }

        Fp12 operator*(const Fp12 &other) const
        {
            Fp12 r;
            fp12_mul(&r.fe_, &fe_, &other.fe_);
            return r;
        }

        Fp12 operator*(const Fp6 &s) const
        {
            Fp12 r;
            fp12_mul_fp6(&r.fe_, &fe_, &s.raw());
            return r;
        }

        Fp12 &operator*=(const Fp12 &other)
        {
            fp12_mul(&fe_, &fe_, &other.fe_);
            return *this;
        }

        Fp12 operator-() const
        {
            Fp12 r;
            fp12_neg(&r.fe_, &fe_);
            return r;
        }

        /// Negates x only. Equals frobenius applied six times.
        Fp12 conj() const
        {
            Fp12 r;
            fp12_conj(&r.fe_, &fe_);
            return r;
        }

        Fp12 sq() const
        {
            Fp12 r;
            fp12_sq(&r.fe_, &fe_);
            return r;
        }

        /// Granger-Scott squaring. Caller guarantees cyclotomic membership.
        Fp12 cyclotomic_sq() const
        {
            Fp12 r;
            fp12_cyclotomic_sq(&r.fe_, &fe_);
            return r;
        }

        Fp12 frobenius() const
        {
            Fp12 r;
            fp12_frobenius(&r.fe_, &fe_);
            return r;
        }

        Fp12 frobenius_p2() const
        {
            Fp12 r;
            fp12_frobenius_p2(&r.fe_, &fe_);
            return r;
        }

        Fp12 frobenius_p4() const
        {
            Fp12 r;
            fp12_frobenius_p4(&r.fe_, &fe_);
            return r;
        }

        /// Returns nullopt for zero.
        std::optional<Fp12> invert() const;

        /// this^e, variable time in e.
        Fp12 exp(uint64_t e) const;

        /// this^e with e given as len little-endian bytes, variable time in e.
        Fp12 exp(const uint8_t *e, size_t len) const;

        /// this^1868033. Caller guarantees cyclotomic membership.
        Fp12 pow_to_v() const
        {
            Fp12 r;
            fp12_pow_to_v(&r.fe_, &fe_);
            return r;
        }

        /// this^u, u = 1868033^3. Caller guarantees cyclotomic membership.
        Fp12 pow_to_u() const
        {
            Fp12 r;
            fp12_pow_to_u(&r.fe_, &fe_);
            return r;
        }

        bool is_norm_one() const
        {
            return fp12_is_norm_one(&fe_) != 0;
        }

        bool is_cyclotomic() const
        {
            return fp12_is_cyclotomic(&fe_) != 0;
        }

        /// cyclotomic_sq(), or nullopt if this is not in the cyclotomic subgroup.
        std::optional<Fp12> cyclotomic_sq_checked() const;

        /// pow_to_u(), or nullopt if this is not in the cyclotomic subgroup.
        std::optional<Fp12> pow_to_u_checked() const;

        /// Twelve canonical 32-byte LE coordinates, x.x.x first and y.z.y last.
        std::array<uint8_t, BYTES> to_bytes() const;

        /// Inverse of to_bytes. Returns nullopt if any coordinate is >= p.
        static std::optional<Fp12> from_bytes(const uint8_t bytes[BYTES]);

        /// "(x,y)" with nested "(x,y,z)" and "(x,y)" for the lower towers.
        std::string to_string() const;

        const fp12_fe &raw() const
        {
            return fe_;
        }

        fp12_fe &raw()
        {
            return fe_;
        }

      private:
        fp12_fe fe_;
    };

    inline std::ostream &operator<<(std::ostream &os, const Fp12 &a)
    {
        return os << a.to_string();
    }

} // namespace bn256

#endif // BN256_API_FP12_H

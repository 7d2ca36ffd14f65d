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
 * @file bn256_field.h
 * @brief C++ wrappers for the lower towers F_p, F_p^2 and F_p^6.
 *
 * Fp wraps fp_fe (Montgomery form mod p), Fp2 wraps fp2_fe (x*i + y) and
 * Fp6 wraps fp6_fe (x*t^2 + y*t + z). Values are plain copies of the
 * underlying limbs. Fallible operations return std::optional.
 */

#ifndef BN256_API_FIELD_H
#define BN256_API_FIELD_H

#include "fp2_invert.h"
#include "fp2_mul.h"
#include "fp2_ops.h"
#include "fp6_frobenius.h"
#include "fp6_invert.h"
#include "fp6_mul.h"
#include "fp6_ops.h"
#include "fp_frombytes.h"
#include "fp_invert.h"
#include "fp_mul.h"
#include "fp_ops.h"
#include "fp_sq.h"
#include "fp_tobytes.h"
#include "fp_utils.h"

#include <array>
#include <cstring>
#include <optional>
#include <ostream>
#include <string>

namespace bn256
{

    /**
     * @brief Element of the base field F_p.
     */
    class Fp
    {
      public:
        Fp()
        {
            fp_0(fe_);
        }

        Fp(const Fp &other)
        {
            std::memcpy(fe_, other.fe_, sizeof(fp_fe));
        }

        explicit Fp(const fp_fe fe)
        {
            std::memcpy(fe_, fe, sizeof(fp_fe));
        }

        Fp &operator=(const Fp &other)
        {
            std::memcpy(fe_, other.fe_, sizeof(fp_fe));
            return *this;
        }

        static Fp zero()
        {
            return Fp();
        }

        static Fp one()
        {
            Fp r;
            fp_1(r.fe_);
            return r;
        }

        /// Small integer constant, mostly for tests.
        static Fp from_u64(uint64_t v);

        bool is_zero() const
        {
            return fp_isnonzero(fe_) == 0;
        }

        bool is_one() const
        {
            return fp_isone(fe_) != 0;
        }

        bool operator==(const Fp &other) const
        {
            return fp_eq(fe_, other.fe_) != 0;
        }

        bool operator!=(const Fp &other) const
        {
            return !(*this == other);
        }

        Fp operator+(const Fp &other) const
        {
            Fp r;
            fp_add(r.fe_, fe_, other.fe_);
            return r;
        }

        Fp operator-(const Fp &other) const
        {
            Fp r;
            fp_sub(r.fe_, fe_, other.fe_);
            return r;
        }

        Fp operator*(const Fp &other) const
        {
            Fp r;
            fp_mul(r.fe_, fe_, other.fe_);
            return r;
        }

        Fp operator-() const
        {
            Fp r;
            fp_neg(r.fe_, fe_);
            return r;
        }

        Fp dbl() const
        {
            Fp r;
            fp_dbl(r.fe_, fe_);
            return r;
        }

        Fp sq() const
        {
            Fp r;
            fp_sq(r.fe_, fe_);
            return r;
        }

        /// Serialize to 32-byte little-endian canonical form.
        std::array<uint8_t, 32> to_bytes() const;

        /// Deserialize from 32-byte LE. Returns nullopt if value >= p.
        static std::optional<Fp> from_bytes(const uint8_t bytes[32]);

        /// a^(p-2). Returns nullopt for zero.
        std::optional<Fp> invert() const;

        /// 64 lower-case hex digits, most significant first.
        std::string to_string() const;

        const fp_fe &raw() const
        {
            return fe_;
        }

        fp_fe &raw()
        {
            return fe_;
        }

      private:
        fp_fe fe_;
    };

    /**
     * @brief Element of F_p^2 = F_p[i]/(i^2 + 1), x*i + y.
     */
    class Fp2
    {
      public:
        Fp2()
        {
            fp2_0(&fe_);
        }

        Fp2(const Fp &x, const Fp &y)
        {
            fp_copy(fe_.x, x.raw());
            fp_copy(fe_.y, y.raw());
        }

        explicit Fp2(const fp2_fe &fe)
        {
            fp2_copy(&fe_, &fe);
        }

        static Fp2 zero()
        {
            return Fp2();
        }

        static Fp2 one()
        {
            Fp2 r;
            fp2_1(&r.fe_);
            return r;
        }

        Fp x() const
        {
            return Fp(fe_.x);
        }

        Fp y() const
        {
            return Fp(fe_.y);
        }

        bool is_zero() const
        {
            return fp2_iszero(&fe_) != 0;
        }

        bool is_one() const
        {
            return fp2_isone(&fe_) != 0;
        }

        bool operator==(const Fp2 &other) const
        {
            return fp2_eq(&fe_, &other.fe_) != 0;
        }

        bool operator!=(const Fp2 &other) const
        {
            return !(*this == other);
        }

        Fp2 operator+(const Fp2 &other) const
        {
            Fp2 r;
            fp2_add(&r.fe_, &fe_, &other.fe_);
            return r;
        }

        Fp2 operator-(const Fp2 &other) const
        {
            Fp2 r;
            fp2_sub(&r.fe_, &fe_, &other.fe_);
            return r;
        }

        Fp2 operator*(const Fp2 &other) const
        {
            Fp2 r;
            fp2_mul(&r.fe_, &fe_, &other.fe_);
            return r;
        }

        Fp2 operator*(const Fp &s) const
        {
            Fp2 r;
            fp2_mul_fp(&r.fe_, &fe_, s.raw());
            return r;
        }

        Fp2 operator-() const
        {
            Fp2 r;
            fp2_neg(&r.fe_, &fe_);
            return r;
        }

        Fp2 dbl() const
        {
            Fp2 r;
            fp2_dbl(&r.fe_, &fe_);
            return r;
        }

        Fp2 sq() const
        {
            Fp2 r;
            fp2_sq(&r.fe_, &fe_);
            return r;
        }

        Fp2 conj() const
        {
            Fp2 r;
            fp2_conj(&r.fe_, &fe_);
            return r;
        }

        /// Multiply by xi = i + 3.
        Fp2 mul_xi() const
        {
            Fp2 r;
            fp2_mul_xi(&r.fe_, &fe_);
            return r;
        }

        /// Returns nullopt for zero.
        std::optional<Fp2> invert() const;

        /// "(x,y)"
        std::string to_string() const;

        const fp2_fe &raw() const
        {
            return fe_;
        }

        fp2_fe &raw()
        {
            return fe_;
        }

      private:
        fp2_fe fe_;
    };

    /**
     * @brief Element of F_p^6 = F_p^2[t]/(t^3 - xi), x*t^2 + y*t + z.
     */
    class Fp6
    {
      public:
        Fp6()
        {
            fp6_0(&fe_);
        }

        Fp6(const Fp2 &x, const Fp2 &y, const Fp2 &z)
        {
            fp2_copy(&fe_.x, &x.raw());
            fp2_copy(&fe_.y, &y.raw());
            fp2_copy(&fe_.z, &z.raw());
        }

        explicit Fp6(const fp6_fe &fe)
        {
            fp6_copy(&fe_, &fe);
        }

        static Fp6 zero()
        {
            return Fp6();
        }

        static Fp6 one()
        {
            Fp6 r;
            fp6_1(&r.fe_);
            return r;
        }

        Fp2 x() const
        {
            return Fp2(fe_.x);
        }

        Fp2 y() const
        {
            return Fp2(fe_.y);
        }

        Fp2 z() const
        {
            return Fp2(fe_.z);
        }

        bool is_zero() const
        {
            return fp6_iszero(&fe_) != 0;
        }

        bool is_one() const
        {
            return fp6_isone(&fe_) != 0;
        }

        bool operator==(const Fp6 &other) const
        {
            return fp6_eq(&fe_, &other.fe_) != 0;
        }

        bool operator!=(const Fp6 &other) const
        {
            return !(*this == other);
        }

        Fp6 operator+(const Fp6 &other) const
        {
            Fp6 r;
            fp6_add(&r.fe_, &fe_, &other.fe_);
            return r;
        }

        Fp6 operator-(const Fp6 &other) const
        {
            Fp6 r;
            fp6_sub(&r.fe_, &fe_, &other.fe_);
            return r;
        }

        Fp6 operator*(const Fp6 &other) const
        {
            Fp6 r;
            fp6_mul(&r.fe_, &fe_, &other.fe_);
            return r;
        }

        Fp6 operator*(const Fp2 &s) const
        {
            Fp6 r;
            fp6_mul_fp2(&r.fe_, &fe_, &s.raw());
            return r;
        }

        Fp6 operator*(const Fp &s) const
        {
            Fp6 r;
            fp6_mul_fp(&r.fe_, &fe_, s.raw());
            return r;
        }

        Fp6 operator-() const
        {
            Fp6 r;
            fp6_neg(&r.fe_, &fe_);
            return r;
        }

        Fp6 dbl() const
        {
            Fp6 r;
            fp6_dbl(&r.fe_, &fe_);
            return r;
        }

        Fp6 sq() const
        {
            Fp6 r;
            fp6_sq(&r.fe_, &fe_);
            return r;
        }

        /// Multiply by t.
        Fp6 mul_tau() const
        {
            Fp6 r;
            fp6_mul_tau(&r.fe_, &fe_);
            return r;
        }

        Fp6 frobenius() const
        {
            Fp6 r;
            fp6_frobenius(&r.fe_, &fe_);
            return r;
        }

        Fp6 frobenius_p2() const
        {
            Fp6 r;
            fp6_frobenius_p2(&r.fe_, &fe_);
            return r;
        }

        Fp6 frobenius_p4() const
        {
            Fp6 r;
            fp6_frobenius_p4(&r.fe_, &fe_);
            return r;
        }

        /// Returns nullopt for zero.
        std::optional<Fp6> invert() const;

        /// "(x,y,z)"
        std::string to_string() const;

        const fp6_fe &raw() const
        {
            return fe_;
        }

        fp6_fe &raw()
        {
            return fe_;
        }

      private:
        fp6_fe fe_;
    };

    inline std::ostream &operator<<(std::ostream &os, const Fp &a)
    {
        return os << a.to_string();
    }

    inline std::ostream &operator<<(std::ostream &os, const Fp2 &a)
    {
        return os << a.to_string();
    }

    inline std::ostream &operator<<(std::ostream &os, const Fp6 &a)
    {
        return os << a.to_string();
    }

} // namespace bn256

#endif // BN256_API_FIELD_H

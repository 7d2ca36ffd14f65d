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

#include "bn256.h"

#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace bn256;

/* ======================================================================
 * Test framework
 * ====================================================================== */

static int tests_run = 0;
static int tests_passed = 0;
static int tests_failed = 0;
static bool quiet_mode = false;
static uint64_t global_seed = 0ULL;

static std::string hex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << (int)data[i];
    return oss.str();
}

static bool check_bytes(const char *test_name, const unsigned char *expected, const unsigned char *actual, size_t len)
{
    ++tests_run;
    if (std::memcmp(expected, actual, len) == 0)
    {
        ++tests_passed;
        if (!quiet_mode)
            std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        std::cout << "    expected: " << hex(expected, len) << std::endl;
        std::cout << "    actual:   " << hex(actual, len) << std::endl;
        return false;
    }
}

static bool check_true(const char *test_name, bool condition)
{
    ++tests_run;
    if (condition)
    {
        ++tests_passed;
        if (!quiet_mode)
            std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        return false;
    }
}

/* ======================================================================
 * PRNG: xoshiro256** with splitmix64 seeding
 * ====================================================================== */

struct xoshiro256ss
{
    uint64_t s[4];

    static uint64_t splitmix64(uint64_t &state)
    {
        uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    void seed(uint64_t seed_val)
    {
        uint64_t sm = seed_val;
        s[0] = splitmix64(sm);
        s[1] = splitmix64(sm);
        s[2] = splitmix64(sm);
        s[3] = splitmix64(sm);
    }

    static uint64_t rotl(uint64_t x, int k)
    {
        return (x << k) | (x >> (64 - k));
    }

    uint64_t next()
    {
        const uint64_t result = rotl(s[1] * 5, 7) * 9;
        const uint64_t t = s[1] << 17;
        s[2] ^= s[0];
        s[3] ^= s[1];
        s[1] ^= s[2];
        s[0] ^= s[3];
        s[2] ^= t;
        s[3] = rotl(s[3], 45);
        return result;
    }

    void fill_bytes(uint8_t *buf, size_t len)
    {
        size_t i = 0;
        while (i + 8 <= len)
        {
            uint64_t v = next();
            std::memcpy(buf + i, &v, 8);
            i += 8;
        }
        if (i < len)
        {
            uint64_t v = next();
            std::memcpy(buf + i, &v, len - i);
        }
    }
};

/* ======================================================================
 * Random generation helpers
 * ====================================================================== */

/* p, little-endian; used as an exponent for the Frobenius cross-check */
static const uint8_t p_bytes[32] = {0x67, 0x96, 0x08, 0x5e, 0x6c, 0xac, 0x5c, 0x18, 0x9e, 0xb5, 0xb5, 0x20, 0xd1,
    0x88, 0x5b, 0xee, 0x21, 0xdc, 0x84, 0x61, 0xb8, 0xec, 0x6f, 0xaa, 0xf9, 0x87, 0xa3, 0x4a, 0xe3, 0x01, 0xb5, 0x8f};

static const uint64_t BN256_V = 1868033ULL;
static const uint64_t BN256_U = 6518589491078791937ULL;

static Fp random_fp(xoshiro256ss &rng)
{
    uint8_t buf[32];
    rng.fill_bytes(buf, 32);
    Fp r;
    fp_frombytes(r.raw(), buf);
    return r;
}

static Fp2 random_fp2(xoshiro256ss &rng)
{
    const auto x = random_fp(rng);
    const auto y = random_fp(rng);
    return Fp2(x, y);
}

static Fp6 random_fp6(xoshiro256ss &rng)
{
    const auto x = random_fp2(rng);
    const auto y = random_fp2(rng);
    const auto z = random_fp2(rng);
    return Fp6(x, y, z);
}

static Fp12 random_fp12(xoshiro256ss &rng)
{
    const auto x = random_fp6(rng);
    const auto y = random_fp6(rng);
    return Fp12(x, y);
}

/* conj(a)/a has norm one; multiplying by its p^2-Frobenius lands in the cyclotomic subgroup */
static Fp12 random_norm_one(xoshiro256ss &rng)
{
    for (;;)
    {
        const auto a = random_fp12(rng);
        const auto inv = a.invert();
        if (inv)
            return a.conj() * *inv;
    }
}

static Fp12 random_cyclotomic(xoshiro256ss &rng)
{
    const auto m = random_norm_one(rng);
    return m.frobenius_p2() * m;
}

/* ======================================================================
 * Fuzz tests
 * ====================================================================== */

static void fuzz_fp_arithmetic()
{
    std::cout << std::endl << "=== Fuzz: F_p Arithmetic ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 1);

    for (int i = 0; i < 1000; i++)
    {
        std::string label = "fp_arith[" + std::to_string(i) + "]";

        auto a = random_fp(rng);
        auto b = random_fp(rng);
        auto c = random_fp(rng);

        check_true((label + " a+b==b+a").c_str(), a + b == b + a);
        check_true((label + " a*b==b*a").c_str(), a * b == b * a);
        check_true((label + " (a+b)+c==a+(b+c)").c_str(), (a + b) + c == a + (b + c));
        check_true((label + " (a*b)*c==a*(b*c)").c_str(), (a * b) * c == a * (b * c));
        check_true((label + " a*(b+c)==a*b+a*c").c_str(), a * (b + c) == a * b + a * c);
        check_true((label + " (a-b)+b==a").c_str(), (a - b) + b == a);
        check_true((label + " a+0==a").c_str(), a + Fp::zero() == a);
        check_true((label + " a*1==a").c_str(), a * Fp::one() == a);
        check_true((label + " a+(-a)==0").c_str(), (a + (-a)).is_zero());
        check_true((label + " dbl==a+a").c_str(), a.dbl() == a + a);
        check_true((label + " sq==a*a").c_str(), a.sq() == a * a);

        if (!a.is_zero())
        {
            auto inv = a.invert();
            check_true((label + " a*inv==1").c_str(), inv.has_value() && (a * inv.value()).is_one());
        }

        const auto bytes = a.to_bytes();
        const auto back = Fp::from_bytes(bytes.data());
        check_true((label + " from_bytes(to_bytes(a))==a").c_str(), back.has_value() && back.value() == a);
    }
}

static void fuzz_fp2_arithmetic()
{
    std::cout << std::endl << "=== Fuzz: F_p^2 Arithmetic ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 2);

    const Fp2 xi(Fp::one(), Fp::from_u64(3));

    for (int i = 0; i < 500; i++)
    {
        std::string label = "fp2_arith[" + std::to_string(i) + "]";

        auto a = random_fp2(rng);
        auto b = random_fp2(rng);
        auto c = random_fp2(rng);
        auto s = random_fp(rng);

        check_true((label + " a*b==b*a").c_str(), a * b == b * a);
        check_true((label + " (a*b)*c==a*(b*c)").c_str(), (a * b) * c == a * (b * c));
        check_true((label + " a*(b+c)==a*b+a*c").c_str(), a * (b + c) == a * b + a * c);
        check_true((label + " sq==a*a").c_str(), a.sq() == a * a);
        check_true((label + " mul_xi==a*xi").c_str(), a.mul_xi() == a * xi);
        check_true((label + " mul_fp==a*(0i+s)").c_str(), a * s == a * Fp2(Fp::zero(), s));
        check_true((label + " conj(conj(a))==a").c_str(), a.conj().conj() == a);
        check_true((label + " (a-b)+b==a").c_str(), (a - b) + b == a);

        if (!a.is_zero())
        {
            auto inv = a.invert();
            check_true((label + " a*inv==1").c_str(), inv.has_value() && (a * inv.value()).is_one());
        }
    }
}

static void fuzz_fp6_arithmetic()
{
    std::cout << std::endl << "=== Fuzz: F_p^6 Arithmetic ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 3);

    for (int i = 0; i < 200; i++)
    {
        std::string label = "fp6_arith[" + std::to_string(i) + "]";

        auto a = random_fp6(rng);
        auto b = random_fp6(rng);
        auto c = random_fp6(rng);
        auto s = random_fp2(rng);

        check_true((label + " a*b==b*a").c_str(), a * b == b * a);
        check_true((label + " (a*b)*c==a*(b*c)").c_str(), (a * b) * c == a * (b * c));
        check_true((label + " a*(b+c)==a*b+a*c").c_str(), a * (b + c) == a * b + a * c);
        check_true((label + " sq==a*a").c_str(), a.sq() == a * a);
        check_true((label + " mul_fp2==a*(0,0,s)").c_str(), a * s == a * Fp6(Fp2::zero(), Fp2::zero(), s));
        check_true((label + " mul_tau==a*(0,1,0)").c_str(), a.mul_tau() == a * Fp6(Fp2::zero(), Fp2::one(), Fp2::zero()));
        check_true((label + " frob(a*b)==frob(a)*frob(b)").c_str(), (a * b).frobenius() == a.frobenius() * b.frobenius());
        check_true((label + " frob(frob(a))==frob_p2(a)").c_str(), a.frobenius().frobenius() == a.frobenius_p2());
        check_true((label + " frob_p2(frob_p2(a))==frob_p4(a)").c_str(),
                   a.frobenius_p2().frobenius_p2() == a.frobenius_p4());

        if (!a.is_zero())
        {
            auto inv = a.invert();
            check_true((label + " a*inv==1").c_str(), inv.has_value() && (a * inv.value()).is_one());
        }
    }
}

static void fuzz_fp12_arithmetic()
{
    std::cout << std::endl << "=== Fuzz: F_p^12 Arithmetic ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 4);

    for (int i = 0; i < 100; i++)
    {
        std::string label = "fp12_arith[" + std::to_string(i) + "]";

        auto a = random_fp12(rng);
        auto b = random_fp12(rng);
        auto c = random_fp12(rng);

        check_true((label + " (a+b)+c==a+(b+c)").c_str(), (a + b) + c == a + (b + c));
        check_true((label + " a+b==b+a").c_str(), a + b == b + a);
        check_true((label + " a+0==a").c_str(), a + Fp12::zero() == a);
        check_true((label + " (a-b)+b==a").c_str(), (a - b) + b == a);
        check_true((label + " a*b==b*a").c_str(), a * b == b * a);
        check_true((label + " (a*b)*c==a*(b*c)").c_str(), (a * b) * c == a * (b * c));
        check_true((label + " a*(b+c)==a*b+a*c").c_str(), a * (b + c) == a * b + a * c);
        check_true((label + " sq==a*a").c_str(), a.sq() == a * a);
        check_true((label + " a*1==a").c_str(), a * Fp12::one() == a);
        check_true((label + " conj(conj(a))==a").c_str(), a.conj().conj() == a);
        check_true((label + " -(-a)==a").c_str(), -(-a) == a);
        check_true((label + " mul_fp6==a*(0,s)").c_str(), a * b.y() == a * Fp12(Fp6::zero(), b.y()));

        auto inv = a.invert();
        check_true((label + " a*inv==1").c_str(), inv.has_value() && (a * inv.value()).is_one());

        check_true((label + " frob_p4(frob_p2(a))==frob_p2(frob_p4(a))").c_str(),
                   a.frobenius_p2().frobenius_p4() == a.frobenius_p4().frobenius_p2());
        check_true((label + " frob(frob(a))==frob_p2(a)").c_str(), a.frobenius().frobenius() == a.frobenius_p2());
        check_true((label + " frob(a*b)==frob(a)*frob(b)").c_str(), (a * b).frobenius() == a.frobenius() * b.frobenius());

        auto f = a;
        for (int k = 0; k < 6; k++)
            f = f.frobenius();
        check_true((label + " frob^6==conj").c_str(), f == a.conj());
        for (int k = 0; k < 6; k++)
            f = f.frobenius();
        check_true((label + " frob^12==a").c_str(), f == a);

        /* destination aliasing a source */
        fp12_fe h;
        fp12_copy(&h, &a.raw());
        fp12_mul(&h, &h, &b.raw());
        check_true((label + " mul aliased").c_str(), Fp12(h) == a * b);
        fp12_copy(&h, &a.raw());
        fp12_sq(&h, &h);
        check_true((label + " sq aliased").c_str(), Fp12(h) == a.sq());
        fp12_copy(&h, &a.raw());
        fp12_invert(&h, &h);
        check_true((label + " invert aliased").c_str(), inv.has_value() && Fp12(h) == inv.value());
        fp12_copy(&h, &a.raw());
        fp12_frobenius(&h, &h);
        check_true((label + " frobenius aliased").c_str(), Fp12(h) == a.frobenius());
    }

    /* frobenius is the p-th power map */
    for (int i = 0; i < 5; i++)
    {
        std::string label = "fp12_frob_is_pow_p[" + std::to_string(i) + "]";
        auto a = random_fp12(rng);
        check_true(label.c_str(), a.frobenius() == a.exp(p_bytes, sizeof(p_bytes)));
    }
}

static void fuzz_exp()
{
    std::cout << std::endl << "=== Fuzz: F_p^12 Exponentiation ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 5);

    for (int i = 0; i < 50; i++)
    {
        std::string label = "fp12_exp[" + std::to_string(i) + "]";

        auto a = random_fp12(rng);
        const uint64_t m = rng.next() >> 33;
        const uint64_t n = rng.next() >> 33;

        check_true((label + " a^(m+n)==a^m*a^n").c_str(), a.exp(m + n) == a.exp(m) * a.exp(n));
        check_true((label + " a^0==1").c_str(), a.exp(uint64_t(0)).is_one());
        check_true((label + " a^1==a").c_str(), a.exp(uint64_t(1)) == a);

        /* wide exponent: a^(2^64 * m) == (a^(2^64))^m */
        uint8_t wide[16] = {0};
        for (size_t k = 0; k < 8; k++)
            wide[8 + k] = static_cast<uint8_t>(m >> (8 * k));
        uint8_t two64[9] = {0, 0, 0, 0, 0, 0, 0, 0, 1};
        check_true((label + " wide exponent").c_str(), a.exp(wide, sizeof(wide)) == a.exp(two64, sizeof(two64)).exp(m));
    }
}

static void fuzz_cyclotomic()
{
    std::cout << std::endl << "=== Fuzz: Cyclotomic Subgroup ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 6);

    for (int i = 0; i < 50; i++)
    {
        std::string label = "cyclotomic[" + std::to_string(i) + "]";

        auto a = random_cyclotomic(rng);

        check_true((label + " norm one").c_str(), (a.conj() * a).is_one());
        check_true((label + " is_cyclotomic").c_str(), a.is_cyclotomic());
        check_true((label + " cyclosq==sq").c_str(), a.cyclotomic_sq() == a.sq());
        check_true((label + " cyclosq_checked==sq").c_str(),
                   a.cyclotomic_sq_checked().has_value() && a.cyclotomic_sq_checked().value() == a.sq());
        check_true((label + " invert==conj").c_str(), a.invert().has_value() && a.invert().value() == a.conj());
        check_true((label + " pow_to_v==a^v").c_str(), a.pow_to_v() == a.exp(BN256_V));

        auto b = random_cyclotomic(rng);
        check_true((label + " closed under mul").c_str(), (a * b).is_cyclotomic());
        check_true((label + " closed under frobenius").c_str(), a.frobenius().is_cyclotomic());
    }

    /* norm one alone is not enough for Granger-Scott squaring */
    for (int i = 0; i < 20; i++)
    {
        std::string label = "norm_one_only[" + std::to_string(i) + "]";

        auto m = random_norm_one(rng);

        check_true((label + " norm one").c_str(), m.is_norm_one());
        check_true((label + " not cyclotomic").c_str(), !m.is_cyclotomic());
        check_true((label + " cyclosq!=sq").c_str(), !(m.cyclotomic_sq() == m.sq()));
        check_true((label + " checked rejects").c_str(), !m.pow_to_u_checked().has_value());
    }

    for (int i = 0; i < 20; i++)
    {
        std::string label = "generic[" + std::to_string(i) + "]";
        auto a = random_fp12(rng);
        check_true((label + " not norm one").c_str(), !a.is_norm_one());
        check_true((label + " cyclosq_checked rejects").c_str(), !a.cyclotomic_sq_checked().has_value());
    }
}

static void fuzz_pow_to_u()
{
    std::cout << std::endl << "=== Fuzz: pow_to_u ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 7);

    uint8_t u_bytes[8];
    for (size_t k = 0; k < 8; k++)
        u_bytes[k] = static_cast<uint8_t>(BN256_U >> (8 * k));

    for (int i = 0; i < 8; i++)
    {
        std::string label = "pow_to_u[" + std::to_string(i) + "]";

        auto a = random_cyclotomic(rng);
        const auto expected = a.exp(BN256_U);
        const auto actual = a.pow_to_u();

        const auto eb = expected.to_bytes();
        const auto ab = actual.to_bytes();
        check_bytes((label + " pow_to_u(a)==a^u").c_str(), eb.data(), ab.data(), Fp12::BYTES);
        check_true((label + " byte exponent agrees").c_str(), a.exp(u_bytes, sizeof(u_bytes)) == expected);
        check_true((label + " pow_to_u==pow_to_v^3").c_str(), actual == a.pow_to_v().pow_to_v().pow_to_v());
    }

    auto g = Fp12::generator();
    check_true("pow_to_u(g)==g^u", g.pow_to_u() == g.exp(BN256_U));
}

static void fuzz_serialization_roundtrip()
{
    std::cout << std::endl << "=== Fuzz: Serialization Roundtrip ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 8);

    for (int i = 0; i < 200; i++)
    {
        std::string label = "fp12_roundtrip[" + std::to_string(i) + "]";

        auto a = random_fp12(rng);
        const auto bytes = a.to_bytes();
        const auto back = Fp12::from_bytes(bytes.data());
        check_true((label + " from_bytes(to_bytes(a))==a").c_str(), back.has_value() && back.value() == a);
    }

    /* random 32-byte strings: accepted exactly when canonical */
    for (int i = 0; i < 1000; i++)
    {
        std::string label = "fp_from_bytes[" + std::to_string(i) + "]";

        uint8_t buf[32];
        rng.fill_bytes(buf, 32);
        const auto v = Fp::from_bytes(buf);
        if (v)
        {
            const auto out = v->to_bytes();
            check_bytes((label + " canonical roundtrip").c_str(), buf, out.data(), 32);
        }
        else
        {
            /* rejected values are >= p */
            uint8_t reduced[32];
            fp_fe t;
            fp_frombytes(t, buf);
            fp_tobytes(reduced, t);
            check_true((label + " non-canonical rejected").c_str(), std::memcmp(reduced, buf, 32) != 0);
        }
    }
}

int main(int argc, char *argv[])
{
    uint64_t seed = 0ULL;

    for (int i = 1; i < argc; i++)
    {
        if (std::strcmp(argv[i], "--quiet") == 0)
        {
            quiet_mode = true;
        }
        else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc)
        {
            seed = std::strtoull(argv[++i], nullptr, 0);
        }
        else
        {
            std::cerr << "Usage: " << argv[0] << " [--quiet] [--seed <N>]" << std::endl;
            return 1;
        }
    }

    std::cout << "bn256 Fuzz Tests" << std::endl;
    std::cout << "================" << std::endl;
    std::cout << "PRNG seed: 0x" << std::hex << seed << std::dec << std::endl;

    global_seed = seed;

    fuzz_fp_arithmetic();
    fuzz_fp2_arithmetic();
    fuzz_fp6_arithmetic();
    fuzz_fp12_arithmetic();
    fuzz_exp();
    fuzz_cyclotomic();
    fuzz_pow_to_u();
    fuzz_serialization_roundtrip();

    std::cout << std::endl << "================" << std::endl;
    std::cout << "Total:  " << tests_run << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}

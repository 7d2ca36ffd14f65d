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
#include "bn256_benchmark.h"

#include <cstring>
#include <iostream>

static const unsigned char test_a_bytes[32] = {0xef, 0xcd, 0xab, 0x90, 0x78, 0x56, 0x34, 0x12, 0xbe, 0xba, 0xfe,
                                               0xca, 0xef, 0xbe, 0xad, 0xde, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                               0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
static const unsigned char test_b_bytes[32] = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01, 0x0d, 0xf0, 0xad,
                                               0xba, 0xce, 0xfa, 0xed, 0xfe, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                               0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

/* little-endian u = 1868033^3 */
static const unsigned char test_u[8] = {0x01, 0x83, 0x58, 0xec, 0x9a, 0xae, 0x76, 0x5a};

int main(int argc, char *argv[])
{
    bool bench_all = false;
    for (int i = 1; i < argc; i++)
    {
        if (std::strcmp(argv[i], "--all") == 0)
            bench_all = true;
        else
        {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            std::cerr << "Usage: bn256-benchmark [--all]" << std::endl;
            return 1;
        }
    }

    auto state = benchmark_setup();

    fp_fe fp_a, fp_b, fp_c;
    fp_frombytes(fp_a, test_a_bytes);
    fp_frombytes(fp_b, test_b_bytes);

    fp2_fe fp2_a, fp2_b, fp2_c;
    fp_copy(fp2_a.x, fp_a);
    fp_copy(fp2_a.y, fp_b);
    fp_copy(fp2_b.x, fp_b);
    fp_copy(fp2_b.y, fp_a);

    /* generator coefficients give non-trivial F_p^6 operands */
    fp6_fe fp6_a, fp6_b, fp6_c;
    fp6_copy(&fp6_a, &BN256_GT_GENERATOR.x);
    fp6_copy(&fp6_b, &BN256_GT_GENERATOR.y);

    fp12_fe g, h, fp12_c;
    fp12_copy(&g, &BN256_GT_GENERATOR);
    fp12_sq(&h, &g);

    unsigned char bytes[32];

    std::cout << std::endl;
    benchmark_header();

    benchmark_section("F_p");

    benchmark_long(
        [&]()
        {
            fp_add(fp_c, fp_a, fp_b);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_add");

    benchmark_long(
        [&]()
        {
            fp_sub(fp_c, fp_a, fp_b);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_sub");

    benchmark_long(
        [&]()
        {
            fp_mul(fp_c, fp_a, fp_b);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_mul");

    benchmark_long(
        [&]()
        {
            fp_sq(fp_c, fp_a);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_sq");

    benchmark(
        [&]()
        {
            fp_invert(fp_c, fp_a);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_invert");

    benchmark_long(
        [&]()
        {
            fp_tobytes(bytes, fp_a);
            benchmark_do_not_optimize(bytes);
        },
        "fp_tobytes");

    benchmark_long(
        [&]()
        {
            fp_frombytes(fp_c, test_a_bytes);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_frombytes");

    benchmark_section("F_p^2");

    benchmark_long(
        [&]()
        {
            fp2_mul(&fp2_c, &fp2_a, &fp2_b);
            benchmark_do_not_optimize(fp2_c);
        },
        "fp2_mul");

    benchmark_long(
        [&]()
        {
            fp2_sq(&fp2_c, &fp2_a);
            benchmark_do_not_optimize(fp2_c);
        },
        "fp2_sq");

    benchmark_long(
        [&]()
        {
            fp2_mul_xi(&fp2_c, &fp2_a);
            benchmark_do_not_optimize(fp2_c);
        },
        "fp2_mul_xi");

    benchmark(
        [&]()
        {
            fp2_invert(&fp2_c, &fp2_a);
            benchmark_do_not_optimize(fp2_c);
        },
        "fp2_invert");

    benchmark_section("F_p^6");

    benchmark(
        [&]()
        {
            fp6_mul(&fp6_c, &fp6_a, &fp6_b);
            benchmark_do_not_optimize(fp6_c);
        },
        "fp6_mul");

    benchmark(
        [&]()
        {
            fp6_sq(&fp6_c, &fp6_a);
            benchmark_do_not_optimize(fp6_c);
        },
        "fp6_sq");

    benchmark(
        [&]()
        {
            fp6_mul_tau(&fp6_c, &fp6_a);
            benchmark_do_not_optimize(fp6_c);
        },
        "fp6_mul_tau");

    benchmark(
        [&]()
        {
            fp6_frobenius(&fp6_c, &fp6_a);
            benchmark_do_not_optimize(fp6_c);
        },
        "fp6_frobenius");

    benchmark(
        [&]()
        {
            fp6_invert(&fp6_c, &fp6_a);
            benchmark_do_not_optimize(fp6_c);
        },
        "fp6_invert");

    benchmark_section("F_p^12");

    benchmark(
        [&]()
        {
            fp12_mul(&fp12_c, &g, &h);
            benchmark_do_not_optimize(fp12_c);
        },
        "fp12_mul");

    benchmark(
        [&]()
        {
            fp12_sq(&fp12_c, &g);
            benchmark_do_not_optimize(fp12_c);
        },
        "fp12_sq");

    benchmark(
        [&]()
        {
            fp12_cyclotomic_sq(&fp12_c, &g);
            benchmark_do_not_optimize(fp12_c);
        },
        "fp12_cyclotomic_sq");

    benchmark(
        [&]()
        {
            fp12_frobenius(&fp12_c, &g);
            benchmark_do_not_optimize(fp12_c);
        },
        "fp12_frobenius");

    benchmark(
        [&]()
        {
            fp12_frobenius_p2(&fp12_c, &g);
            benchmark_do_not_optimize(fp12_c);
        },
        "fp12_frobenius_p2");

    benchmark(
        [&]()
        {
            fp12_frobenius_p4(&fp12_c, &g);
            benchmark_do_not_optimize(fp12_c);
        },
        "fp12_frobenius_p4");

    benchmark(
        [&]()
        {
            fp12_invert(&fp12_c, &g);
            benchmark_do_not_optimize(fp12_c);
        },
        "fp12_invert");

    benchmark_short(
        [&]()
        {
            fp12_pow_to_u(&fp12_c, &g);
            benchmark_do_not_optimize(fp12_c);
        },
        "fp12_pow_to_u");

    benchmark_short(
        [&]()
        {
            fp12_exp_vartime(&fp12_c, &g, test_u, sizeof(test_u));
            benchmark_do_not_optimize(fp12_c);
        },
        "fp12_exp_vartime (u)");

    if (bench_all)
    {
        benchmark_section("C++ API");

        const auto G = bn256::Fp12::generator();

        benchmark(
            [&]()
            {
                auto r = G * G;
                benchmark_do_not_optimize(r);
            },
            "Fp12::operator*");

        benchmark(
            [&]()
            {
                const auto r = G.invert();
                benchmark_do_not_optimize(r);
            },
            "Fp12::invert");

        benchmark(
            [&]()
            {
                const auto r = G.is_cyclotomic();
                benchmark_do_not_optimize(r);
            },
            "Fp12::is_cyclotomic");

        benchmark(
            [&]()
            {
                const auto r = G.to_bytes();
                benchmark_do_not_optimize(r);
            },
            "Fp12::to_bytes");

        benchmark_short(
            [&]()
            {
                const auto r = G.pow_to_u_checked();
                benchmark_do_not_optimize(r);
            },
            "Fp12::pow_to_u_checked");
    }

    std::cout << std::endl;

    benchmark_teardown(state);

    return 0;
}

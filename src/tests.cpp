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

#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

static int tests_run = 0;
static int tests_passed = 0;
static int tests_failed = 0;

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

static bool check_int(const char *test_name, int expected, int actual)
{
    ++tests_run;
    if (expected == actual)
    {
        ++tests_passed;
        std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        std::cout << "    expected: " << expected << std::endl;
        std::cout << "    actual:   " << actual << std::endl;
        return false;
    }
}

static bool check_nonzero(const char *test_name, int actual)
{
    ++tests_run;
    if (actual != 0)
    {
        ++tests_passed;
        std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << " (expected non-zero, got 0)" << std::endl;
        return false;
    }
}

static bool check_string(const char *test_name, const std::string &expected, const std::string &actual)
{
    ++tests_run;
    if (expected == actual)
    {
        ++tests_passed;
        std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        std::cout << "    expected: " << expected << std::endl;
        std::cout << "    actual:   " << actual << std::endl;
        return false;
    }
}

static bool check_fp12(const char *test_name, const unsigned char expected[12][32], const bn256::Fp12 &actual)
{
    const auto bytes = actual.to_bytes();
    return check_bytes(test_name, &expected[0][0], bytes.data(), bn256::Fp12::BYTES);
}

static const unsigned char test_a_bytes[32] = {0xef, 0xcd, 0xab, 0x90, 0x78, 0x56, 0x34, 0x12, 0xbe, 0xba, 0xfe,
    0xca, 0xef, 0xbe, 0xad, 0xde, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00};
static const unsigned char test_b_bytes[32] = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01, 0x0d, 0xf0, 0xad,
    0xba, 0xce, 0xfa, 0xed, 0xfe, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00};
static const unsigned char one_bytes[32] = {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00};
static const unsigned char zero_bytes[32] = {0};
static const unsigned char all_ones_bytes[32] = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff};

/* F_p known-answer vectors */
static const unsigned char fp_ab_bytes[32] = {0x11, 0x62, 0x91, 0x58, 0x15, 0x17, 0x41, 0x1a, 0x99, 0xdb, 0xcd, 0x8a,
    0x92, 0x56, 0x88, 0x4b, 0x38, 0xdf, 0xdd, 0x6d, 0x49, 0xee, 0x2b, 0x5d, 0x46, 0x7d, 0x6b, 0xe3, 0x91, 0x62, 0x0a,
    0x4e};
static const unsigned char fp_asq_bytes[32] = {0xba, 0x0e, 0xea, 0x44, 0x9d, 0xb2, 0xea, 0x8d, 0xe2, 0x6d, 0x5b, 0x4a,
    0x67, 0xe9, 0x54, 0x01, 0xff, 0x88, 0x8c, 0x54, 0x14, 0x42, 0xd1, 0x27, 0x1f, 0x72, 0xef, 0x37, 0x30, 0xcb, 0xfc,
    0x31};
static const unsigned char fp_ainv_bytes[32] = {0x1c, 0xde, 0xee, 0xb9, 0x73, 0x6e, 0x2b, 0x1d, 0xb1, 0x52, 0x17, 0xa3,
    0xa3, 0x23, 0x06, 0xb5, 0x4c, 0xf0, 0x2b, 0xe5, 0x09, 0x8b, 0xdf, 0x9a, 0x53, 0xc4, 0x55, 0x23, 0x47, 0x7b, 0x9c,
    0x00};
static const unsigned char fp_a_minus_b_bytes[32] = {0x4e, 0x5d, 0xae, 0xe9, 0xe0, 0xff, 0x8e, 0x29, 0x4f, 0x80, 0x06,
    0x31, 0xf2, 0x4c, 0x1b, 0xce, 0x21, 0xdc, 0x84, 0x61, 0xb8, 0xec, 0x6f, 0xaa, 0xf9, 0x87, 0xa3, 0x4a, 0xe3, 0x01,
    0xb5, 0x8f};
static const unsigned char fp_p_minus_1_bytes[32] = {0x66, 0x96, 0x08, 0x5e, 0x6c, 0xac, 0x5c, 0x18, 0x9e, 0xb5, 0xb5,
    0x20, 0xd1, 0x88, 0x5b, 0xee, 0x21, 0xdc, 0x84, 0x61, 0xb8, 0xec, 0x6f, 0xaa, 0xf9, 0x87, 0xa3, 0x4a, 0xe3, 0x01,
    0xb5, 0x8f};
static const unsigned char fp_p_bytes[32] = {0x67, 0x96, 0x08, 0x5e, 0x6c, 0xac, 0x5c, 0x18, 0x9e, 0xb5, 0xb5, 0x20,
    0xd1, 0x88, 0x5b, 0xee, 0x21, 0xdc, 0x84, 0x61, 0xb8, 0xec, 0x6f, 0xaa, 0xf9, 0x87, 0xa3, 0x4a, 0xe3, 0x01, 0xb5,
    0x8f};
static const unsigned char fp_all_ones_reduced_bytes[32] = {0x98, 0x69, 0xf7, 0xa1, 0x93, 0x53, 0xa3, 0xe7, 0x61, 0x4a, 0x4a,
    0xdf, 0x2e, 0x77, 0xa4, 0x11, 0xde, 0x23, 0x7b, 0x9e, 0x47, 0x13, 0x90, 0x55, 0x06, 0x78, 0x5c, 0xb5, 0x1c, 0xfe,
    0x4a, 0x70};

/* F_p^2 known-answer vectors, z = a*i + b */
static const unsigned char fp2_zsq_x_bytes[32] = {0xbb, 0x2d, 0x1a, 0x53, 0xbe, 0x81, 0x25, 0x1c, 0x94, 0x01, 0xe6,
    0xf4, 0x53, 0x24, 0xb5, 0xa8, 0x4e, 0xe2, 0x36, 0x7a, 0xda, 0xef, 0xe7, 0x0f, 0x93, 0x72, 0x33, 0x7c, 0x40, 0xc3,
    0x5f, 0x0c};
static const unsigned char fp2_zsq_y_bytes[32] = {0x1f, 0xcb, 0x9e, 0x01, 0xa1, 0x45, 0x4c, 0xd2, 0xa3, 0xcb, 0xad,
    0x99, 0xe2, 0xe6, 0x26, 0x9b, 0xea, 0x3d, 0x9b, 0x9e, 0xcf, 0x9e, 0xbb, 0x24, 0xdc, 0x3f, 0x5c, 0x10, 0xd9, 0x4d,
    0x2b, 0x3c};
static const unsigned char fp2_zxi_x_bytes[32] = {0xd5, 0x70, 0x09, 0xb7, 0x6d, 0x06, 0x9f, 0x37, 0x47, 0x20, 0xaa,
    0x1b, 0x9e, 0x37, 0xf7, 0x9a, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00};
static const unsigned char fp2_zxi_y_bytes[32] = {0x29, 0x47, 0x66, 0x7e, 0x93, 0xb2, 0xd1, 0xf0, 0x68, 0x15, 0x0b,
    0x65, 0x7c, 0x31, 0x1c, 0x1e, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00};
static const unsigned char fp2_zinv_x_bytes[32] = {0xec, 0x2e, 0x4f, 0x26, 0xd3, 0xa3, 0x1e, 0x5c, 0x0e, 0xe3, 0x7c,
    0xc1, 0x71, 0xb6, 0x07, 0x7d, 0xb4, 0xfb, 0xd3, 0x34, 0x57, 0xf2, 0x65, 0x2e, 0xb6, 0x56, 0x6e, 0x91, 0xc3, 0x2f,
    0x1f, 0x42};
static const unsigned char fp2_zinv_y_bytes[32] = {0xf2, 0xd2, 0xc9, 0x6f, 0xa2, 0xa6, 0x12, 0xdd, 0x06, 0x8a, 0x02,
    0x3b, 0x3a, 0x31, 0xef, 0xf3, 0xfa, 0x94, 0x25, 0x6a, 0xd3, 0xe3, 0x22, 0x49, 0x45, 0xbe, 0xaf, 0x03, 0xe3, 0x5b,
    0x3c, 0x16};

/* F_p^12 known-answer vectors for the GT generator g, serialization order */
static const unsigned char gt_g_bytes[12][32] = {
    {0x92, 0xba, 0xf8, 0x39, 0x57, 0x4d, 0xa8, 0x73, 0xd4, 0x1b, 0x2f, 0x10, 0x53, 0x28, 0xfd, 0x39, 0x47, 0x75, 0x51,
        0x2e, 0xa7, 0xed, 0xc4, 0x38, 0x56, 0xd2, 0xa8, 0xb4, 0xe5, 0xeb, 0xdc, 0x2e},
    {0x88, 0x3a, 0x37, 0x16, 0x42, 0x0f, 0x32, 0xe5, 0xa5, 0xe8, 0xe6, 0x7b, 0x5d, 0x49, 0x8c, 0x29, 0x83, 0x5c, 0x99,
        0x09, 0x60, 0x62, 0x02, 0xc4, 0x39, 0xc6, 0x55, 0x16, 0x8d, 0xac, 0xe6, 0x5f},
    {0x72, 0x12, 0xf9, 0xcf, 0xac, 0xcf, 0x87, 0xad, 0x5e, 0xbf, 0x6f, 0x9a, 0xea, 0x25, 0x34, 0xd9, 0x40, 0x7e, 0xfd,
        0x11, 0x35, 0x2d, 0xae, 0xef, 0x31, 0x02, 0x24, 0x18, 0xb8, 0xfc, 0x69, 0x0e},
    {0x9e, 0x8f, 0xde, 0x2f, 0x73, 0x78, 0x84, 0x21, 0x73, 0x20, 0x1e, 0x5b, 0x91, 0x2c, 0x93, 0x4c, 0x3e, 0x6c, 0x77,
        0x34, 0xd1, 0x3a, 0x32, 0xa0, 0xb1, 0x42, 0xda, 0x5e, 0x4d, 0xc7, 0xb3, 0x6c},
    {0x87, 0x74, 0xb8, 0xff, 0x70, 0xe5, 0xcb, 0x3a, 0x8a, 0xca, 0x6e, 0xa7, 0x82, 0x75, 0x6f, 0x0f, 0xc4, 0x8c, 0x5f,
        0x85, 0xf7, 0x3b, 0x0c, 0x81, 0x61, 0xb3, 0xbf, 0xc0, 0xde, 0xdc, 0x1d, 0x2e},
    {0x65, 0x8a, 0x80, 0x21, 0x4b, 0x0b, 0x8e, 0xa8, 0x79, 0x25, 0x5a, 0x19, 0xb1, 0x49, 0x5f, 0x99, 0x6c, 0x6d, 0x7d,
        0x3c, 0xd7, 0x19, 0x05, 0xc2, 0xba, 0x7f, 0x9b, 0x8d, 0xf0, 0xe4, 0x76, 0x78},
    {0x86, 0xfc, 0x40, 0x3e, 0xe7, 0xb0, 0x4c, 0x57, 0x60, 0x5a, 0x58, 0xdd, 0xf6, 0x0e, 0xa6, 0xdb, 0x9c, 0x81, 0xcd,
        0x4b, 0x28, 0x97, 0xda, 0xcf, 0xf1, 0x5e, 0xaa, 0x84, 0xa3, 0x3a, 0xf5, 0x56},
    {0xeb, 0x42, 0x19, 0xa0, 0x1c, 0x88, 0x01, 0x0c, 0x29, 0xc7, 0x89, 0xab, 0x38, 0xda, 0x74, 0x10, 0x8a, 0x44, 0x59,
        0xc5, 0xee, 0xa4, 0x01, 0x50, 0x72, 0xfd, 0xec, 0xba, 0xba, 0x26, 0x62, 0x75},
    {0xbb, 0xa5, 0x7b, 0xe4, 0x14, 0x12, 0x99, 0xe3, 0xfb, 0x9a, 0x3f, 0x9e, 0x3a, 0x9d, 0xa5, 0x7b, 0xe7, 0x14, 0xa9,
        0x27, 0xfd, 0x2f, 0x4d, 0x35, 0x7d, 0x68, 0xf7, 0xbc, 0x0e, 0x4c, 0xf2, 0x43},
    {0x3d, 0xcf, 0x62, 0xcf, 0x3a, 0xa9, 0x16, 0x02, 0xf1, 0x2d, 0x42, 0x64, 0x5a, 0x90, 0x98, 0xcf, 0xfc, 0x6d, 0x91,
        0x98, 0xa7, 0xb0, 0x01, 0x56, 0xaf, 0x14, 0x42, 0xea, 0xe7, 0x25, 0xfb, 0x1d},
    {0x43, 0xbf, 0x1d, 0x3b, 0x3c, 0x8f, 0x0c, 0x93, 0x67, 0x56, 0x1d, 0x47, 0xcc, 0xf0, 0x90, 0x1a, 0xa7, 0x5d, 0xe7,
        0x6d, 0x2b, 0xe8, 0xb7, 0xa9, 0xd8, 0x19, 0xa3, 0x55, 0x01, 0x5c, 0x32, 0x7e},
    {0xeb, 0x14, 0x1e, 0x85, 0x8c, 0xe1, 0xc2, 0xd2, 0x40, 0x9c, 0x28, 0xb1, 0x68, 0xe7, 0x19, 0xd3, 0xda, 0x13, 0xa0,
        0x8b, 0xcd, 0xb3, 0x9a, 0x01, 0xcf, 0xef, 0xc0, 0xd5, 0x0f, 0x16, 0xba, 0x84},
};
static const unsigned char gt_gsq_bytes[12][32] = {
    {0x7d, 0x30, 0x09, 0x90, 0xdc, 0x3e, 0xa1, 0x6c, 0x7e, 0x8e, 0xbb, 0xbd, 0xe5, 0x5d, 0xa2, 0x56, 0x18, 0xe6, 0x72,
        0x25, 0x09, 0x3e, 0xa2, 0xed, 0x44, 0x71, 0x54, 0xd8, 0xec, 0xfd, 0x28, 0x75},
    {0x55, 0xcc, 0x02, 0xd0, 0x98, 0xc0, 0xbb, 0x2c, 0x28, 0x99, 0x3e, 0xc8, 0x7f, 0x65, 0x43, 0xdb, 0x93, 0xd9, 0xc3,
        0x1b, 0xbd, 0xe9, 0xb9, 0xe5, 0xcf, 0x90, 0x1f, 0x49, 0x60, 0xd4, 0xd0, 0x82},
    {0x60, 0x61, 0xba, 0x3b, 0x37, 0xc6, 0x3d, 0x37, 0xb0, 0x92, 0x44, 0xb5, 0x78, 0x9c, 0x1c, 0x53, 0xca, 0x7a, 0x3f,
        0x1a, 0x45, 0x56, 0xb8, 0x54, 0x6d, 0x45, 0xf5, 0xda, 0x31, 0xb9, 0x1e, 0x38},
    {0x63, 0xd1, 0x06, 0x7a, 0xce, 0x19, 0x45, 0x13, 0xa3, 0xe6, 0x68, 0xce, 0x9f, 0x96, 0x0a, 0xbc, 0xef, 0x95, 0x8a,
        0x68, 0xb5, 0xe7, 0x75, 0x1a, 0xd5, 0x9d, 0x74, 0xde, 0x44, 0x6e, 0xbc, 0x08},
    {0x69, 0xe6, 0x91, 0xe8, 0x23, 0x4c, 0xdd, 0xbf, 0xe8, 0x9e, 0x99, 0x35, 0xb7, 0x3b, 0xe2, 0x62, 0x4f, 0xf4, 0x5d,
        0x0c, 0x9f, 0xab, 0x2d, 0xf8, 0xbb, 0xa0, 0x00, 0x73, 0x92, 0x30, 0x8e, 0x3a},
    {0x28, 0x24, 0x99, 0x32, 0x66, 0x82, 0x2a, 0x26, 0xf4, 0x5b, 0xa4, 0xcf, 0x55, 0x4f, 0xf6, 0xc4, 0x34, 0x1f, 0x92,
        0xc9, 0x44, 0x46, 0x73, 0xf6, 0x37, 0x0a, 0x23, 0xda, 0x85, 0x78, 0x44, 0x48},
    {0xe4, 0xde, 0x68, 0x11, 0x0b, 0xc3, 0x9f, 0xb1, 0x91, 0xe8, 0x79, 0x49, 0x8b, 0xad, 0xca, 0xce, 0x23, 0x22, 0x5f,
        0xf6, 0x6c, 0x7e, 0xbb, 0x3f, 0xdf, 0x3f, 0x8a, 0x59, 0xfe, 0xa2, 0x7a, 0x46},
    {0x1e, 0x7b, 0x4a, 0xa3, 0xc9, 0x04, 0x7d, 0xaf, 0x4d, 0x34, 0x55, 0xa3, 0x03, 0x50, 0xcc, 0x35, 0x35, 0x5d, 0x7f,
        0x9a, 0x1e, 0xf1, 0xf7, 0xcf, 0x70, 0xce, 0xce, 0x86, 0x91, 0xe7, 0x50, 0x37},
    {0x61, 0x78, 0xea, 0x8c, 0x41, 0x33, 0x9c, 0x84, 0x17, 0x99, 0x2f, 0x0a, 0x64, 0x0c, 0x05, 0xf0, 0x9b, 0x6d, 0x6e,
        0xc1, 0xeb, 0xfd, 0xf0, 0x32, 0xa3, 0xae, 0xad, 0xec, 0xbb, 0xfa, 0x3a, 0x4f},
    {0x7b, 0xcf, 0x7a, 0x43, 0x02, 0x11, 0xed, 0x86, 0x3b, 0x26, 0xd9, 0x22, 0x83, 0xd2, 0x1c, 0x93, 0x60, 0x1e, 0x92,
        0xb5, 0xd0, 0x7e, 0x8e, 0x0e, 0x15, 0xd9, 0x6f, 0x70, 0xa0, 0xcc, 0xd5, 0x8a},
    {0x78, 0x2e, 0xac, 0x1e, 0x6d, 0xf3, 0xb3, 0x63, 0xde, 0xa9, 0x4c, 0xe6, 0x6b, 0xd8, 0x05, 0x10, 0xb5, 0x76, 0xad,
        0xb1, 0x97, 0xf6, 0x78, 0x5f, 0xe7, 0x6a, 0x89, 0xb8, 0x9c, 0x9b, 0xbe, 0x87},
    {0x9a, 0xac, 0x32, 0x92, 0xc8, 0x11, 0xe1, 0x46, 0xa3, 0x47, 0x5b, 0x92, 0x7d, 0xa4, 0x6d, 0x99, 0x90, 0x8c, 0x65,
        0xd5, 0xe7, 0x52, 0x16, 0x70, 0x03, 0x0e, 0xf1, 0x6f, 0xd5, 0xf7, 0x12, 0x03},
};
static const unsigned char gt_gfrob_bytes[12][32] = {
    {0x4d, 0x55, 0x98, 0xf3, 0x93, 0xa4, 0xe5, 0x96, 0xf8, 0x8a, 0xf1, 0xb7, 0x0a, 0xbe, 0x63, 0x48, 0x55, 0x35, 0x0b,
        0x70, 0xc2, 0xb2, 0x61, 0x44, 0xc6, 0xbe, 0x79, 0x30, 0x17, 0x8b, 0xea, 0x1d},
    {0x36, 0x61, 0xb0, 0x4a, 0xc6, 0x9d, 0x75, 0xf6, 0x05, 0x8e, 0x7d, 0x5d, 0x2c, 0x87, 0x3b, 0x29, 0x68, 0x67, 0xac,
        0xe3, 0x05, 0xb4, 0x95, 0xf0, 0xa1, 0xce, 0xcb, 0xa8, 0xfc, 0xcf, 0x8e, 0x4f},
    {0xb8, 0x65, 0x20, 0x37, 0xeb, 0x23, 0xa2, 0xc5, 0x5f, 0x08, 0xfc, 0x85, 0xb3, 0x5a, 0x50, 0xf1, 0x40, 0x10, 0x2a,
        0xd8, 0xdf, 0x5d, 0xc0, 0x50, 0xe7, 0x10, 0x3a, 0x81, 0xd8, 0x76, 0xdd, 0x7b},
    {0x67, 0x7a, 0xd8, 0x7f, 0x4e, 0x95, 0x35, 0xec, 0x03, 0xd4, 0x4a, 0x6a, 0xf4, 0xe4, 0x3d, 0xe1, 0x6a, 0x4e, 0x16,
        0xfd, 0x59, 0x52, 0xa5, 0x09, 0xc5, 0xc8, 0xcd, 0x58, 0x35, 0x92, 0x16, 0x6c},
    {0x13, 0x76, 0x75, 0x93, 0xa8, 0x06, 0xcc, 0xfa, 0xe1, 0xb8, 0x92, 0xc5, 0x2f, 0x89, 0xc5, 0x9f, 0xcd, 0x8e, 0xfd,
        0x25, 0x22, 0x0a, 0x0b, 0x36, 0xbf, 0x6e, 0x01, 0x64, 0x6a, 0xcf, 0xc2, 0x61},
    {0x15, 0x22, 0x00, 0x8b, 0x14, 0x24, 0x30, 0x7b, 0x92, 0x32, 0x67, 0xec, 0x7e, 0x13, 0x7d, 0xba, 0x60, 0xb1, 0xab,
        0xff, 0x73, 0x4a, 0x18, 0x92, 0xec, 0x71, 0x4a, 0xe6, 0xd1, 0xfe, 0x55, 0x67},
    {0x7a, 0x5b, 0x66, 0x0b, 0x71, 0xfd, 0xda, 0x09, 0xc9, 0x54, 0x43, 0x98, 0x82, 0x02, 0x67, 0x71, 0x73, 0x88, 0x1f,
        0x35, 0x04, 0xa1, 0x92, 0xee, 0x3e, 0x33, 0x82, 0x5d, 0xa5, 0xa6, 0xf5, 0x3d},
    {0x0a, 0x97, 0xa3, 0xdb, 0xf9, 0x77, 0x76, 0x96, 0xe8, 0xe0, 0x91, 0xc7, 0x2a, 0xca, 0xbe, 0x88, 0xb6, 0xb4, 0x16,
        0xd7, 0xcb, 0x50, 0x10, 0x04, 0x7b, 0x99, 0xb9, 0x79, 0x88, 0xb3, 0x5c, 0x7a},
    {0x14, 0xa9, 0xa2, 0x44, 0xed, 0x96, 0x0d, 0xa0, 0x39, 0x4a, 0x24, 0x3d, 0x41, 0x73, 0xdc, 0x66, 0xdb, 0xe9, 0x72,
        0xd7, 0xcf, 0x04, 0x67, 0xc7, 0x9e, 0x51, 0x4c, 0xaa, 0xbd, 0x78, 0xf0, 0x28},
    {0x11, 0x27, 0x05, 0x4e, 0xe1, 0xd2, 0x3f, 0xe4, 0x32, 0xa5, 0x83, 0x1f, 0xa0, 0x93, 0x96, 0x3c, 0xe7, 0x11, 0xa8,
        0xe7, 0xfb, 0x5d, 0xae, 0x99, 0xd5, 0xc8, 0xfb, 0x49, 0xf5, 0x01, 0x14, 0x3a},
    {0x24, 0xd7, 0xea, 0x22, 0x30, 0x1d, 0x50, 0x85, 0x36, 0x5f, 0x98, 0xd9, 0x04, 0x98, 0xca, 0xd3, 0x7a, 0x7e, 0x9d,
        0xf3, 0x8c, 0x04, 0xb8, 0x00, 0x21, 0x6e, 0x00, 0xf5, 0xe1, 0xa5, 0x82, 0x11},
    {0xeb, 0x14, 0x1e, 0x85, 0x8c, 0xe1, 0xc2, 0xd2, 0x40, 0x9c, 0x28, 0xb1, 0x68, 0xe7, 0x19, 0xd3, 0xda, 0x13, 0xa0,
        0x8b, 0xcd, 0xb3, 0x9a, 0x01, 0xcf, 0xef, 0xc0, 0xd5, 0x0f, 0x16, 0xba, 0x84},
};
static const unsigned char gt_gfrob2_bytes[12][32] = {
    {0x43, 0x99, 0xd8, 0x17, 0x3f, 0xa3, 0x53, 0xe8, 0xb4, 0xa0, 0x85, 0xee, 0xac, 0x77, 0x70, 0x79, 0x09, 0x02, 0xd9,
        0x3e, 0x4b, 0xd7, 0x50, 0x73, 0x44, 0x73, 0x1e, 0xe1, 0x98, 0x00, 0x1f, 0x8f},
    {0xd7, 0x47, 0x4e, 0x25, 0xc4, 0x93, 0x81, 0xed, 0x8d, 0xa6, 0xaf, 0x95, 0xdf, 0xdd, 0x09, 0x06, 0x46, 0x06, 0x2d,
        0x73, 0x14, 0xd9, 0x27, 0x31, 0x7f, 0x70, 0x3d, 0x89, 0xc9, 0x6d, 0x39, 0x26},
    {0xf5, 0x83, 0x0f, 0x8e, 0xbf, 0xdc, 0xd4, 0x6a, 0x3f, 0xf6, 0x45, 0x86, 0xe6, 0x62, 0x27, 0x15, 0xe1, 0x5d, 0x87,
        0x4f, 0x83, 0xbf, 0xc1, 0xba, 0xc7, 0x85, 0x7f, 0x32, 0x2b, 0x05, 0x4b, 0x81},
    {0xc9, 0x06, 0x2a, 0x2e, 0xf9, 0x33, 0xd8, 0xf6, 0x2a, 0x95, 0x97, 0xc5, 0x3f, 0x5c, 0xc8, 0xa1, 0xe3, 0x6f, 0x0d,
        0x2d, 0xe7, 0xb1, 0x3d, 0x0a, 0x48, 0x45, 0xc9, 0xeb, 0x95, 0x3a, 0x01, 0x23},
    {0x21, 0x8a, 0xaf, 0xea, 0x6c, 0x17, 0x53, 0x16, 0x6d, 0x94, 0xe5, 0xaf, 0x99, 0xf9, 0x27, 0xf7, 0xdb, 0x04, 0x51,
        0x96, 0x3e, 0x34, 0xd3, 0xb5, 0x32, 0xa5, 0x56, 0xe7, 0x21, 0x4b, 0x20, 0x49},
    {0x1b, 0xfa, 0x7b, 0x5e, 0x52, 0xe7, 0xda, 0x4e, 0x2c, 0x2f, 0x35, 0xe3, 0x3a, 0x29, 0x5c, 0x9d, 0x04, 0xfe, 0x31,
        0xd8, 0x06, 0xf2, 0xc1, 0x42, 0x89, 0xb2, 0x23, 0x7c, 0x02, 0x56, 0x4a, 0x11},
    {0x95, 0x5a, 0xd7, 0x0f, 0x26, 0x15, 0x2b, 0xf3, 0x42, 0xe5, 0x16, 0x07, 0xf0, 0xc8, 0xfc, 0x50, 0x93, 0x7a, 0x9f,
        0x59, 0x65, 0x7a, 0xb6, 0x95, 0xef, 0x02, 0x0c, 0x59, 0x3b, 0x8e, 0xc5, 0x2e},
    {0x80, 0x53, 0xfa, 0x23, 0xdb, 0xb0, 0xef, 0x0d, 0x3e, 0x55, 0x97, 0x96, 0xba, 0xad, 0x21, 0x10, 0xe9, 0x54, 0x39,
        0x29, 0x9a, 0xb8, 0xee, 0xd7, 0x3e, 0x27, 0xe3, 0xd2, 0x37, 0x65, 0x33, 0x3f},
    {0xc1, 0x2c, 0xdb, 0x05, 0xe2, 0x6d, 0xb6, 0x97, 0x7d, 0x60, 0x81, 0x0a, 0xd0, 0x5f, 0xc2, 0xc1, 0xa9, 0x84, 0x22,
        0x24, 0x98, 0x55, 0xd9, 0x09, 0xfe, 0xe5, 0x1d, 0x4e, 0xdd, 0xf7, 0xbd, 0x4c},
    {0x7c, 0xd2, 0xfd, 0x82, 0x4f, 0xed, 0x69, 0x3d, 0x2c, 0x35, 0x02, 0xf0, 0xeb, 0x6c, 0xb8, 0x8f, 0xd8, 0x74, 0x4a,
        0x12, 0x70, 0x0a, 0x57, 0xb6, 0x17, 0x03, 0x92, 0xf8, 0x12, 0x3d, 0x77, 0x79},
    {0x43, 0xbf, 0x1d, 0x3b, 0x3c, 0x8f, 0x0c, 0x93, 0x67, 0x56, 0x1d, 0x47, 0xcc, 0xf0, 0x90, 0x1a, 0xa7, 0x5d, 0xe7,
        0x6d, 0x2b, 0xe8, 0xb7, 0xa9, 0xd8, 0x19, 0xa3, 0x55, 0x01, 0x5c, 0x32, 0x7e},
    {0xeb, 0x14, 0x1e, 0x85, 0x8c, 0xe1, 0xc2, 0xd2, 0x40, 0x9c, 0x28, 0xb1, 0x68, 0xe7, 0x19, 0xd3, 0xda, 0x13, 0xa0,
        0x8b, 0xcd, 0xb3, 0x9a, 0x01, 0xcf, 0xef, 0xc0, 0xd5, 0x0f, 0x16, 0xba, 0x84},
};
static const unsigned char gt_gfrob4_bytes[12][32] = {
    {0xb1, 0xde, 0xdf, 0xdd, 0xe7, 0x55, 0xab, 0x74, 0xe0, 0x84, 0x56, 0xde, 0x59, 0x4f, 0x73, 0x3f, 0xc2, 0x8c, 0x87,
        0x10, 0xa4, 0xe9, 0x8b, 0x3a, 0xee, 0xa0, 0x75, 0x2c, 0xb3, 0x14, 0x42, 0x60},
    {0xb6, 0xa3, 0x1f, 0x6d, 0xee, 0x30, 0xac, 0x20, 0x86, 0x73, 0x7e, 0x3a, 0x53, 0x1d, 0xd9, 0xca, 0xe4, 0x85, 0x18,
        0xcb, 0x6c, 0x63, 0x95, 0x17, 0x3f, 0x32, 0x8b, 0xbd, 0x1f, 0xc3, 0x07, 0x56},
    {0x72, 0x12, 0xf9, 0xcf, 0xac, 0xcf, 0x87, 0xad, 0x5e, 0xbf, 0x6f, 0x9a, 0xea, 0x25, 0x34, 0xd9, 0x40, 0x7e, 0xfd,
        0x11, 0x35, 0x2d, 0xae, 0xef, 0x31, 0x02, 0x24, 0x18, 0xb8, 0xfc, 0x69, 0x0e},
    {0x9e, 0x8f, 0xde, 0x2f, 0x73, 0x78, 0x84, 0x21, 0x73, 0x20, 0x1e, 0x5b, 0x91, 0x2c, 0x93, 0x4c, 0x3e, 0x6c, 0x77,
        0x34, 0xd1, 0x3a, 0x32, 0xa0, 0xb1, 0x42, 0xda, 0x5e, 0x4d, 0xc7, 0xb3, 0x6c},
    {0x9a, 0x15, 0xf7, 0xea, 0xfb, 0x31, 0x87, 0xdb, 0xe2, 0xc9, 0x76, 0x08, 0x17, 0x84, 0xb8, 0xe7, 0x17, 0x78, 0xf1,
        0x10, 0x47, 0xf8, 0xc6, 0x34, 0xd1, 0xf1, 0x96, 0x26, 0x43, 0x6e, 0x02, 0x1b},
    {0x1d, 0x06, 0x04, 0x9b, 0x73, 0x88, 0xa9, 0xbe, 0x50, 0xbf, 0x90, 0xea, 0x5a, 0x68, 0x58, 0xf2, 0xb9, 0x6c, 0x39,
        0xfd, 0xe7, 0xc4, 0x2c, 0x2b, 0xc8, 0xba, 0x2b, 0x39, 0xf5, 0x72, 0x88, 0x28},
    {0x4c, 0x3f, 0xf0, 0x0f, 0x5f, 0xe6, 0xe4, 0xcd, 0xfa, 0x75, 0x46, 0x3c, 0xea, 0xb0, 0xb8, 0xc1, 0xf1, 0xdf, 0x17,
        0xbc, 0x2a, 0xdb, 0xde, 0x44, 0x18, 0x26, 0xed, 0x6c, 0x04, 0x39, 0xfa, 0x09},
    {0x63, 0x96, 0xfd, 0xf7, 0xe0, 0x1f, 0xc8, 0x16, 0xd5, 0x4e, 0x4a, 0xff, 0xae, 0x89, 0x20, 0xbc, 0xd0, 0x1e, 0x77,
        0xd4, 0xe7, 0x7b, 0xef, 0x2c, 0x42, 0xeb, 0x76, 0x07, 0xd4, 0x77, 0xd4, 0x6a},
    {0x52, 0x5a, 0xba, 0xd1, 0xe1, 0xd8, 0x69, 0xb5, 0xc2, 0x6f, 0xaa, 0x98, 0x97, 0x14, 0x4f, 0x9f, 0xb2, 0x1e, 0x3e,
        0x77, 0xdb, 0x53, 0xb9, 0x15, 0x78, 0xc1, 0x31, 0x8a, 0xda, 0xbf, 0xb9, 0x8e},
    {0x15, 0x8b, 0xb0, 0x69, 0x4e, 0xc2, 0x38, 0xf1, 0x1e, 0x08, 0x27, 0xed, 0x5b, 0x14, 0x66, 0x7d, 0x6e, 0xd5, 0x2d,
        0x18, 0x59, 0x1e, 0x87, 0x48, 0x2c, 0xf8, 0x72, 0xb2, 0xcb, 0xa0, 0xf7, 0x87},
    {0x43, 0xbf, 0x1d, 0x3b, 0x3c, 0x8f, 0x0c, 0x93, 0x67, 0x56, 0x1d, 0x47, 0xcc, 0xf0, 0x90, 0x1a, 0xa7, 0x5d, 0xe7,
        0x6d, 0x2b, 0xe8, 0xb7, 0xa9, 0xd8, 0x19, 0xa3, 0x55, 0x01, 0x5c, 0x32, 0x7e},
    {0xeb, 0x14, 0x1e, 0x85, 0x8c, 0xe1, 0xc2, 0xd2, 0x40, 0x9c, 0x28, 0xb1, 0x68, 0xe7, 0x19, 0xd3, 0xda, 0x13, 0xa0,
        0x8b, 0xcd, 0xb3, 0x9a, 0x01, 0xcf, 0xef, 0xc0, 0xd5, 0x0f, 0x16, 0xba, 0x84},
};
static const unsigned char gt_ginv_bytes[12][32] = {
    {0xd5, 0xdb, 0x0f, 0x24, 0x15, 0x5f, 0xb4, 0xa4, 0xc9, 0x99, 0x86, 0x10, 0x7e, 0x60, 0x5e, 0xb4, 0xda, 0x66, 0x33,
        0x33, 0x11, 0xff, 0xaa, 0x71, 0xa3, 0xb5, 0xfa, 0x95, 0xfd, 0x15, 0xd8, 0x60},
    {0xdf, 0x5b, 0xd1, 0x47, 0x2a, 0x9d, 0x2a, 0x33, 0xf8, 0xcc, 0xce, 0xa4, 0x73, 0x3f, 0xcf, 0xc4, 0x9e, 0x7f, 0xeb,
        0x57, 0x58, 0x8a, 0x6d, 0xe6, 0xbf, 0xc1, 0x4d, 0x34, 0x56, 0x55, 0xce, 0x2f},
    {0xf5, 0x83, 0x0f, 0x8e, 0xbf, 0xdc, 0xd4, 0x6a, 0x3f, 0xf6, 0x45, 0x86, 0xe6, 0x62, 0x27, 0x15, 0xe1, 0x5d, 0x87,
        0x4f, 0x83, 0xbf, 0xc1, 0xba, 0xc7, 0x85, 0x7f, 0x32, 0x2b, 0x05, 0x4b, 0x81},
    {0xc9, 0x06, 0x2a, 0x2e, 0xf9, 0x33, 0xd8, 0xf6, 0x2a, 0x95, 0x97, 0xc5, 0x3f, 0x5c, 0xc8, 0xa1, 0xe3, 0x6f, 0x0d,
        0x2d, 0xe7, 0xb1, 0x3d, 0x0a, 0x48, 0x45, 0xc9, 0xeb, 0x95, 0x3a, 0x01, 0x23},
    {0xe0, 0x21, 0x50, 0x5e, 0xfb, 0xc6, 0x90, 0xdd, 0x13, 0xeb, 0x46, 0x79, 0x4e, 0x13, 0xec, 0xde, 0x5d, 0x4f, 0x25,
        0xdc, 0xc0, 0xb0, 0x63, 0x29, 0x98, 0xd4, 0xe3, 0x89, 0x04, 0x25, 0x97, 0x61},
    {0x02, 0x0c, 0x88, 0x3c, 0x21, 0xa1, 0xce, 0x6f, 0x24, 0x90, 0x5b, 0x07, 0x20, 0x3f, 0xfc, 0x54, 0xb5, 0x6e, 0x07,
        0x25, 0xe1, 0xd2, 0x6a, 0xe8, 0x3e, 0x08, 0x08, 0xbd, 0xf2, 0x1c, 0x3e, 0x17},
    {0x86, 0xfc, 0x40, 0x3e, 0xe7, 0xb0, 0x4c, 0x57, 0x60, 0x5a, 0x58, 0xdd, 0xf6, 0x0e, 0xa6, 0xdb, 0x9c, 0x81, 0xcd,
        0x4b, 0x28, 0x97, 0xda, 0xcf, 0xf1, 0x5e, 0xaa, 0x84, 0xa3, 0x3a, 0xf5, 0x56},
    {0xeb, 0x42, 0x19, 0xa0, 0x1c, 0x88, 0x01, 0x0c, 0x29, 0xc7, 0x89, 0xab, 0x38, 0xda, 0x74, 0x10, 0x8a, 0x44, 0x59,
        0xc5, 0xee, 0xa4, 0x01, 0x50, 0x72, 0xfd, 0xec, 0xba, 0xba, 0x26, 0x62, 0x75},
    {0xbb, 0xa5, 0x7b, 0xe4, 0x14, 0x12, 0x99, 0xe3, 0xfb, 0x9a, 0x3f, 0x9e, 0x3a, 0x9d, 0xa5, 0x7b, 0xe7, 0x14, 0xa9,
        0x27, 0xfd, 0x2f, 0x4d, 0x35, 0x7d, 0x68, 0xf7, 0xbc, 0x0e, 0x4c, 0xf2, 0x43},
    {0x3d, 0xcf, 0x62, 0xcf, 0x3a, 0xa9, 0x16, 0x02, 0xf1, 0x2d, 0x42, 0x64, 0x5a, 0x90, 0x98, 0xcf, 0xfc, 0x6d, 0x91,
        0x98, 0xa7, 0xb0, 0x01, 0x56, 0xaf, 0x14, 0x42, 0xea, 0xe7, 0x25, 0xfb, 0x1d},
    {0x43, 0xbf, 0x1d, 0x3b, 0x3c, 0x8f, 0x0c, 0x93, 0x67, 0x56, 0x1d, 0x47, 0xcc, 0xf0, 0x90, 0x1a, 0xa7, 0x5d, 0xe7,
        0x6d, 0x2b, 0xe8, 0xb7, 0xa9, 0xd8, 0x19, 0xa3, 0x55, 0x01, 0x5c, 0x32, 0x7e},
    {0xeb, 0x14, 0x1e, 0x85, 0x8c, 0xe1, 0xc2, 0xd2, 0x40, 0x9c, 0x28, 0xb1, 0x68, 0xe7, 0x19, 0xd3, 0xda, 0x13, 0xa0,
        0x8b, 0xcd, 0xb3, 0x9a, 0x01, 0xcf, 0xef, 0xc0, 0xd5, 0x0f, 0x16, 0xba, 0x84},
};
static const unsigned char gt_gpowv_bytes[12][32] = {
    {0xc5, 0x45, 0xcc, 0xe1, 0x5c, 0xc1, 0x5e, 0xe8, 0x52, 0xe6, 0xc4, 0xc3, 0xd0, 0xc3, 0xe0, 0x5c, 0x1d, 0x0c, 0xa9,
        0xfc, 0xe2, 0xd3, 0x7f, 0x44, 0xeb, 0xf2, 0x3a, 0xf1, 0x52, 0xb0, 0xb0, 0x62},
    {0xf5, 0x36, 0x85, 0xa2, 0x5e, 0x82, 0x47, 0x97, 0xba, 0x47, 0x09, 0x48, 0x3c, 0x1c, 0xf5, 0x9e, 0xde, 0xf0, 0xfa,
        0x1f, 0x36, 0xe4, 0x77, 0x1c, 0xbc, 0x27, 0x13, 0x93, 0xb5, 0xe5, 0x8e, 0x55},
    {0x45, 0xff, 0xae, 0xc2, 0x76, 0xe0, 0xcf, 0xbe, 0x18, 0xd2, 0x46, 0x31, 0x46, 0x2c, 0x12, 0x6f, 0x68, 0xdf, 0x7b,
        0xa7, 0x5a, 0xe7, 0x00, 0xeb, 0xfb, 0x42, 0x46, 0xc3, 0xa6, 0x09, 0x14, 0x4e},
    {0x87, 0xb3, 0xe4, 0x0f, 0x2a, 0xf0, 0x1f, 0x17, 0xa1, 0xfb, 0xfe, 0xf3, 0xfa, 0x06, 0x54, 0xa9, 0xa2, 0x49, 0x9a,
        0x87, 0x81, 0xc6, 0x49, 0x2c, 0x48, 0x25, 0x1f, 0x4e, 0xdd, 0x9c, 0xf1, 0x0b},
    {0x41, 0x86, 0x10, 0xd5, 0x00, 0x01, 0xa9, 0xbf, 0x0b, 0xc5, 0x18, 0x13, 0xc4, 0xc9, 0x29, 0x1a, 0x97, 0x84, 0x6c,
        0x08, 0x25, 0xd1, 0xd8, 0x89, 0x00, 0xf3, 0xac, 0x5b, 0xba, 0xcf, 0xf0, 0x5f},
    {0x69, 0xeb, 0x60, 0xa8, 0xf8, 0xc4, 0x5d, 0x6c, 0xfc, 0xfd, 0xeb, 0x8e, 0x22, 0x64, 0x0e, 0x84, 0x0b, 0xf7, 0x23,
        0x5b, 0xdb, 0xcc, 0x86, 0xb7, 0x67, 0x52, 0x73, 0xf7, 0x3f, 0xa5, 0x94, 0x5f},
    {0xfc, 0x48, 0x61, 0xa7, 0x36, 0xab, 0x01, 0x0e, 0xe8, 0x18, 0xde, 0x02, 0xd1, 0xf8, 0xd1, 0x56, 0xfd, 0x11, 0xf8,
        0x24, 0x5d, 0x7b, 0x00, 0xb7, 0xa5, 0xc7, 0x51, 0xcf, 0x23, 0x83, 0xee, 0x26},
    {0x04, 0x00, 0xd7, 0x62, 0xe3, 0xfd, 0x47, 0x8f, 0x5c, 0x90, 0x8e, 0x77, 0xcc, 0x4e, 0x96, 0x11, 0x21, 0x11, 0x82,
        0x30, 0x97, 0xe2, 0x03, 0xd2, 0x64, 0x0f, 0xcd, 0x63, 0x63, 0xd9, 0x37, 0x8a},
    {0xa4, 0x67, 0xfa, 0xf9, 0x29, 0x37, 0x42, 0xb0, 0x6d, 0x43, 0xfd, 0x94, 0xfe, 0x0a, 0x70, 0x4c, 0x58, 0xb6, 0xba,
        0xcb, 0x07, 0x07, 0xa8, 0x34, 0x92, 0xe6, 0x46, 0xdf, 0x5c, 0xd0, 0xa6, 0x4c},
    {0x4c, 0xcd, 0xbc, 0x74, 0x08, 0x81, 0x07, 0xf9, 0xe7, 0x59, 0xe3, 0x3b, 0xd7, 0x8f, 0x8d, 0x10, 0x30, 0x8e, 0x9b,
        0xd3, 0xbc, 0xb8, 0x59, 0xfd, 0x71, 0xfc, 0x1f, 0x54, 0x1c, 0x54, 0xc3, 0x07},
    {0xd7, 0xc3, 0xc8, 0x3a, 0x46, 0xba, 0x7d, 0x3a, 0x2a, 0xed, 0x3f, 0x33, 0x47, 0xb6, 0xfa, 0xd7, 0x73, 0x65, 0x66,
        0x16, 0xda, 0x38, 0xcb, 0x3a, 0x5f, 0x78, 0x7a, 0x3b, 0x1c, 0x95, 0x18, 0x31},
    {0xeb, 0x5d, 0x29, 0xdf, 0x5a, 0x0b, 0x5c, 0xf9, 0x84, 0xc0, 0x4f, 0xc8, 0x1d, 0xdb, 0x37, 0x4f, 0xc5, 0x72, 0x7c,
        0xc5, 0x54, 0x2b, 0xe8, 0x86, 0x91, 0xb9, 0x68, 0xb0, 0xb3, 0x0d, 0xad, 0x24},
};
static const unsigned char gt_gpowu_bytes[12][32] = {
    {0xaa, 0x4b, 0x90, 0xa4, 0x6d, 0xb1, 0x31, 0x26, 0xf7, 0xcd, 0xfd, 0xe3, 0xbf, 0x2f, 0x18, 0xf3, 0x0b, 0x14, 0xf2,
        0x47, 0x75, 0xcd, 0xaa, 0xee, 0x7b, 0xac, 0xb8, 0xff, 0x61, 0x83, 0xf4, 0x33},
    {0xdc, 0x42, 0x6f, 0xa9, 0x90, 0x12, 0x1a, 0x03, 0xf6, 0xb6, 0x2f, 0x29, 0xaf, 0x8a, 0x34, 0x3e, 0x88, 0xc2, 0xfc,
        0x7f, 0xf5, 0x29, 0x3a, 0xf6, 0x97, 0x27, 0xdc, 0x02, 0x34, 0xed, 0xd7, 0x8c},
    {0x3c, 0x3c, 0x01, 0x1e, 0x9b, 0xe0, 0x19, 0x28, 0xf2, 0x2e, 0x86, 0xb7, 0x68, 0x61, 0xff, 0x09, 0xea, 0xfd, 0xca,
        0x7a, 0xe8, 0x08, 0x76, 0x3b, 0x59, 0xc8, 0xa3, 0x81, 0xb5, 0x0c, 0x39, 0x8a},
    {0xd9, 0x57, 0x3f, 0x4c, 0x57, 0x71, 0x52, 0x95, 0x0b, 0x2d, 0x79, 0x44, 0xca, 0x20, 0xdf, 0xfe, 0x07, 0x4f, 0x4c,
        0x8c, 0x48, 0x2d, 0x35, 0x53, 0xd6, 0x32, 0x0d, 0x7c, 0x5a, 0xe6, 0x3b, 0x02},
    {0x71, 0x3e, 0xd3, 0x74, 0xea, 0x31, 0x27, 0xe3, 0xf5, 0x62, 0x09, 0x0b, 0x1d, 0x4b, 0x8f, 0x72, 0x05, 0x61, 0x0d,
        0xbf, 0x9b, 0x16, 0x9a, 0x16, 0x07, 0x9e, 0x1c, 0xa4, 0x38, 0xd2, 0x00, 0x08},
    {0xac, 0xc7, 0x48, 0xb9, 0x6d, 0x88, 0x11, 0x7c, 0x8c, 0x1a, 0x51, 0x25, 0x22, 0xcb, 0xd1, 0x82, 0xa6, 0xb5, 0x1b,
        0x1f, 0x71, 0x2b, 0x53, 0x0b, 0xf6, 0x9e, 0x33, 0x40, 0x0e, 0x69, 0xd7, 0x0c},
    {0x47, 0x28, 0x86, 0x14, 0x71, 0xb8, 0x81, 0x7a, 0x4d, 0x7f, 0x4e, 0xc9, 0xc1, 0x0e, 0x85, 0xaf, 0xc8, 0xe8, 0xbb,
        0x24, 0xc4, 0x45, 0x62, 0xbc, 0x31, 0x30, 0xe4, 0x1a, 0xa7, 0xb9, 0xb5, 0x2e},
    {0x76, 0x4d, 0x85, 0x79, 0x56, 0xd1, 0xfb, 0x40, 0xc3, 0xf2, 0x31, 0x4b, 0xbe, 0x8f, 0x65, 0x04, 0xbd, 0x5d, 0xdc,
        0x44, 0x6f, 0x77, 0x79, 0xae, 0xa9, 0xbb, 0xae, 0xf3, 0xc0, 0x22, 0x79, 0x4f},
    {0x05, 0x10, 0x0b, 0x46, 0x03, 0xb0, 0x06, 0x36, 0x12, 0x68, 0xe3, 0x85, 0x0c, 0xd7, 0xe1, 0x4c, 0x72, 0x3e, 0xf2,
        0x20, 0x3a, 0xf0, 0xb0, 0xbc, 0xfa, 0xd2, 0xad, 0xb9, 0x83, 0xc0, 0xfe, 0x8e},
    {0x10, 0xbd, 0x87, 0xb8, 0x41, 0xf6, 0x01, 0xc8, 0x82, 0xbe, 0x9c, 0x74, 0xf5, 0x32, 0xff, 0x31, 0x96, 0x12, 0x85,
        0x40, 0xb4, 0xa6, 0x94, 0x48, 0x89, 0xb8, 0xa8, 0x4b, 0x0e, 0xa4, 0x78, 0x5c},
    {0xce, 0xfe, 0xd6, 0x41, 0xe3, 0xbe, 0xc5, 0x76, 0x75, 0x99, 0x8c, 0x8e, 0xa4, 0xf0, 0x07, 0x76, 0xf7, 0x3c, 0xa5,
        0xe1, 0x8b, 0xbf, 0xf9, 0x0f, 0xd5, 0x18, 0xb0, 0x49, 0x28, 0x10, 0x91, 0x04},
    {0x12, 0x26, 0x5c, 0x22, 0x6b, 0xde, 0x1f, 0x16, 0x3a, 0xab, 0x6b, 0xd8, 0x4e, 0x21, 0x6b, 0x9c, 0xc9, 0xc3, 0x95,
        0xdb, 0x77, 0x25, 0x9d, 0x78, 0xa8, 0x09, 0x37, 0x78, 0x9e, 0xc5, 0xc0, 0x01},
};


static void test_fp()
{
    std::cout << std::endl << "=== F_p arithmetic ===" << std::endl;
    unsigned char buf[32];

    fp_fe a, b, c, d;
    fp_frombytes(a, test_a_bytes);
    fp_frombytes(b, test_b_bytes);

    fp_tobytes(buf, a);
    check_bytes("tobytes(frombytes(a)) == a", test_a_bytes, buf, 32);

    fp_fe zero;
    fp_0(zero);
    fp_tobytes(buf, zero);
    check_bytes("tobytes(0)", zero_bytes, buf, 32);

    fp_fe one;
    fp_1(one);
    fp_tobytes(buf, one);
    check_bytes("tobytes(1)", one_bytes, buf, 32);
    check_nonzero("isone(1)", fp_isone(one));
    check_int("isnonzero(0)", 0, fp_isnonzero(zero));

    fp_add(c, a, zero);
    fp_tobytes(buf, c);
    check_bytes("a + 0 == a", test_a_bytes, buf, 32);

    fp_sub(c, a, b);
    fp_tobytes(buf, c);
    check_bytes("a - b (wraps below zero)", fp_a_minus_b_bytes, buf, 32);

    fp_add(c, c, b);
    check_nonzero("(a - b) + b == a", fp_eq(c, a));

    fp_mul(c, a, b);
    fp_tobytes(buf, c);
    check_bytes("a * b", fp_ab_bytes, buf, 32);

    fp_mul(d, b, a);
    fp_tobytes(buf, d);
    check_bytes("b * a == a * b", fp_ab_bytes, buf, 32);

    fp_sq(c, a);
    fp_tobytes(buf, c);
    check_bytes("a^2", fp_asq_bytes, buf, 32);

    fp_mul(d, a, a);
    fp_tobytes(buf, d);
    check_bytes("sq(a) == mul(a,a)", fp_asq_bytes, buf, 32);

    fp_mul(c, a, one);
    fp_tobytes(buf, c);
    check_bytes("a * 1 == a", test_a_bytes, buf, 32);

    fp_fe inv_a;
    fp_invert(inv_a, a);
    fp_tobytes(buf, inv_a);
    check_bytes("inv(a)", fp_ainv_bytes, buf, 32);

    fp_mul(c, inv_a, a);
    fp_tobytes(buf, c);
    check_bytes("inv(a) * a == 1", one_bytes, buf, 32);

    fp_invert(c, zero);
    check_int("inv(0) == 0 at the C level", 0, fp_isnonzero(c));

    fp_sub(c, a, a);
    fp_tobytes(buf, c);
    check_bytes("a - a == 0", zero_bytes, buf, 32);

    fp_neg(d, a);
    fp_add(c, a, d);
    fp_tobytes(buf, c);
    check_bytes("a + (-a) == 0", zero_bytes, buf, 32);

    fp_neg(c, zero);
    check_int("-0 == 0", 0, fp_isnonzero(c));

    fp_dbl(c, a);
    fp_add(d, a, a);
    check_nonzero("dbl(a) == a + a", fp_eq(c, d));

    /* p - 1 is the largest element; doubling it must wrap */
    fp_fe pm1;
    fp_frombytes(pm1, fp_p_minus_1_bytes);
    fp_tobytes(buf, pm1);
    check_bytes("tobytes(frombytes(p - 1))", fp_p_minus_1_bytes, buf, 32);
    fp_add(c, pm1, one);
    check_int("(p - 1) + 1 == 0", 0, fp_isnonzero(c));
    fp_mul(c, pm1, pm1);
    check_nonzero("(p - 1)^2 == 1", fp_isone(c));

    fp_frombytes(c, fp_p_bytes);
    check_int("frombytes(p) == 0", 0, fp_isnonzero(c));

    fp_frombytes(c, all_ones_bytes);
    fp_tobytes(buf, c);
    check_bytes("frombytes(2^256 - 1) reduced", fp_all_ones_reduced_bytes, buf, 32);
}

static void test_fp_api()
{
    std::cout << std::endl << "=== F_p C++ API ===" << std::endl;

    auto a = bn256::Fp::from_bytes(test_a_bytes);
    check_nonzero("from_bytes(a) accepted", a.has_value());
    check_nonzero("from_bytes(p - 1) accepted", bn256::Fp::from_bytes(fp_p_minus_1_bytes).has_value());
    check_int("from_bytes(p) rejected", 0, bn256::Fp::from_bytes(fp_p_bytes).has_value());
    check_int("from_bytes(2^256 - 1) rejected", 0, bn256::Fp::from_bytes(all_ones_bytes).has_value());

    if (!a)
        return;

    auto inv = a->invert();
    check_nonzero("invert(a) present", inv.has_value());
    if (inv)
        check_nonzero("a * invert(a) == 1", (*a * *inv).is_one());

    check_int("invert(0) rejected", 0, bn256::Fp::zero().invert().has_value());

    check_string("to_string(1)", std::string(63, '0') + "1", bn256::Fp::one().to_string());
    check_string("to_string(0x1234)", std::string(60, '0') + "1234", bn256::Fp::from_u64(0x1234).to_string());

    std::ostringstream os;
    os << bn256::Fp::from_u64(255);
    check_string("operator<<", std::string(62, '0') + "ff", os.str());
}

static void test_fp2()
{
    std::cout << std::endl << "=== F_p^2 arithmetic ===" << std::endl;
    unsigned char buf[32];

    fp2_fe z, c, d;
    fp_frombytes(z.x, test_a_bytes);
    fp_frombytes(z.y, test_b_bytes);

    fp2_sq(&c, &z);
    fp_tobytes(buf, c.x);
    check_bytes("z^2 (i-part)", fp2_zsq_x_bytes, buf, 32);
    fp_tobytes(buf, c.y);
    check_bytes("z^2 (real part)", fp2_zsq_y_bytes, buf, 32);

    fp2_mul(&d, &z, &z);
    check_nonzero("sq(z) == mul(z,z)", fp2_eq(&c, &d));

    fp2_mul_xi(&c, &z);
    fp_tobytes(buf, c.x);
    check_bytes("xi * z (i-part)", fp2_zxi_x_bytes, buf, 32);
    fp_tobytes(buf, c.y);
    check_bytes("xi * z (real part)", fp2_zxi_y_bytes, buf, 32);

    /* xi = i + 3 */
    fp2_fe xi;
    fp_1(xi.x);
    fp_1(xi.y);
    fp_add(xi.y, xi.y, xi.y);
    fp_add(xi.y, xi.y, xi.x);
    fp2_mul(&d, &z, &xi);
    check_nonzero("mul_xi(z) == z * (i + 3)", fp2_eq(&c, &d));

    fp2_invert(&c, &z);
    fp_tobytes(buf, c.x);
    check_bytes("inv(z) (i-part)", fp2_zinv_x_bytes, buf, 32);
    fp_tobytes(buf, c.y);
    check_bytes("inv(z) (real part)", fp2_zinv_y_bytes, buf, 32);

    fp2_mul(&d, &c, &z);
    check_nonzero("inv(z) * z == 1", fp2_isone(&d));

    /* i^2 = -1 */
    fp2_fe i;
    fp_1(i.x);
    fp_0(i.y);
    fp2_sq(&c, &i);
    fp2_1(&d);
    fp2_neg(&d, &d);
    check_nonzero("i^2 == -1", fp2_eq(&c, &d));

    fp2_conj(&c, &z);
    fp2_mul(&d, &c, &z);
    check_int("z * conj(z) is real", 0, fp_isnonzero(d.x));

    check_int("invert(0) rejected", 0, bn256::Fp2::zero().invert().has_value());

    const auto one = bn256::Fp::one();
    const auto two = bn256::Fp::from_u64(2);
    const auto zero64 = std::string(64, '0');
    check_string(
        "to_string(i + 2)",
        "(" + std::string(63, '0') + "1," + std::string(63, '0') + "2)",
        bn256::Fp2(one, two).to_string());
    check_string("to_string(0)", "(" + zero64 + "," + zero64 + ")", bn256::Fp2::zero().to_string());
}

static void test_fp6()
{
    std::cout << std::endl << "=== F_p^6 arithmetic ===" << std::endl;

    const auto g = bn256::Fp12::generator();
    const auto a = g.x();
    const auto b = g.y();

    check_nonzero("sq(a) == a * a", a.sq() == a * a);
    check_nonzero("a * b == b * a", a * b == b * a);

    const auto tau = bn256::Fp6(bn256::Fp2::zero(), bn256::Fp2::one(), bn256::Fp2::zero());
    check_nonzero("mul_tau(a) == a * t", a.mul_tau() == a * tau);

    const auto xi = bn256::Fp2(bn256::Fp::one(), bn256::Fp::from_u64(3));
    check_nonzero("t^3 == xi", tau * tau * tau == bn256::Fp6(bn256::Fp2::zero(), bn256::Fp2::zero(), xi));

    auto inv = a.invert();
    check_nonzero("invert(a) present", inv.has_value());
    if (inv)
        check_nonzero("a * invert(a) == 1", (a * *inv).is_one());
    check_int("invert(0) rejected", 0, bn256::Fp6::zero().invert().has_value());

    auto f = a;
    for (int k = 0; k < 6; k++)
        f = f.frobenius();
    check_nonzero("frobenius^6 == identity", f == a);
    check_nonzero("frobenius^2 == frobenius_p2", a.frobenius().frobenius() == a.frobenius_p2());
    check_nonzero("frobenius_p2^2 == frobenius_p4", a.frobenius_p2().frobenius_p2() == a.frobenius_p4());
    check_nonzero("frobenius(a * b) == frobenius(a) * frobenius(b)",
                  (a * b).frobenius() == a.frobenius() * b.frobenius());

    const auto s = xi.sq();
    check_nonzero("a * scalar == a * (scalar as F_p^6)",
                  a * s == a * bn256::Fp6(bn256::Fp2::zero(), bn256::Fp2::zero(), s));

    const auto zero64 = std::string(64, '0');
    const auto z2 = "(" + zero64 + "," + zero64 + ")";
    check_string("to_string(0)", "(" + z2 + "," + z2 + "," + z2 + ")", bn256::Fp6::zero().to_string());
}

static void test_constants()
{
    std::cout << std::endl << "=== Frobenius constants ===" << std::endl;

    const bn256::Fp2 c6(BN256_XI_TO_P_MINUS_1_OVER_6);
    const bn256::Fp2 c3(BN256_XI_TO_P_MINUS_1_OVER_3);
    const bn256::Fp2 c23(BN256_XI_TO_2P_MINUS_2_OVER_3);
    const bn256::Fp s6(BN256_XI_TO_P_SQUARED_MINUS_1_OVER_6);
    const bn256::Fp s3(BN256_XI_TO_P_SQUARED_MINUS_1_OVER_3);
    const bn256::Fp s23(BN256_XI_TO_2P_SQUARED_MINUS_2_OVER_3);

    check_nonzero("xi^((p-1)/3) == (xi^((p-1)/6))^2", c3 == c6.sq());
    check_nonzero("xi^((2p-2)/3) == (xi^((p-1)/3))^2", c23 == c3.sq());
    check_nonzero("xi^((p^2-1)/3) == (xi^((p^2-1)/6))^2", s3 == s6.sq());
    check_nonzero("xi^((2p^2-2)/3) == (xi^((p^2-1)/3))^2", s23 == s3.sq());

    /* xi^p = conj(xi), so (xi^((p-1)/6))^6 * xi == conj(xi) */
    const bn256::Fp2 xi(bn256::Fp::one(), bn256::Fp::from_u64(3));
    const auto c = c6.sq() * c6;
    check_nonzero("(xi^((p-1)/6))^6 * xi == conj(xi)", c.sq() * xi == xi.conj());

    /* xi^(p^2) = xi, so the p^2 constants are sixth roots of unity in F_p */
    const auto t = s6.sq() * s6;
    check_nonzero("(xi^((p^2-1)/6))^6 == 1", t.sq().is_one());
    check_int("xi^((p^2-1)/6) != 1", 0, s6.is_one());
}

static void test_fp12()
{
    std::cout << std::endl << "=== F_p^12 arithmetic ===" << std::endl;

    const auto g = bn256::Fp12::generator();
    check_fp12("generator", gt_g_bytes, g);

    check_nonzero("one is one", bn256::Fp12::one().is_one());
    check_nonzero("zero is zero", bn256::Fp12::zero().is_zero());
    check_nonzero("g * 1 == g", g * bn256::Fp12::one() == g);
    check_nonzero("g + 0 == g", g + bn256::Fp12::zero() == g);
    check_nonzero("g - g == 0", (g - g).is_zero());
    check_nonzero("g + (-g) == 0", (g + (-g)).is_zero());

    check_fp12("g^2", gt_gsq_bytes, g.sq());
    check_nonzero("sq(g) == g * g", g.sq() == g * g);
    check_nonzero("cyclotomic_sq(g) == sq(g)", g.cyclotomic_sq() == g.sq());

    const auto gf = g.frobenius();
    check_fp12("frobenius(g)", gt_gfrob_bytes, gf);
    check_fp12("frobenius_p2(g)", gt_gfrob2_bytes, g.frobenius_p2());
    check_fp12("frobenius_p4(g)", gt_gfrob4_bytes, g.frobenius_p4());
    check_nonzero("frobenius^2 == frobenius_p2", gf.frobenius() == g.frobenius_p2());
    check_nonzero("frobenius_p2^2 == frobenius_p4", g.frobenius_p2().frobenius_p2() == g.frobenius_p4());

    auto f = g;
    for (int k = 0; k < 6; k++)
        f = f.frobenius();
    check_nonzero("frobenius^6 == conj", f == g.conj());
    for (int k = 0; k < 6; k++)
        f = f.frobenius();
    check_nonzero("frobenius^12 == identity", f == g);

    auto inv = g.invert();
    check_nonzero("invert(g) present", inv.has_value());
    if (inv)
    {
        check_fp12("invert(g)", gt_ginv_bytes, *inv);
        check_nonzero("g * invert(g) == 1", (g * *inv).is_one());
        check_nonzero("invert(g) == conj(g) on the cyclotomic subgroup", *inv == g.conj());
    }

    check_int("invert(0) rejected", 0, bn256::Fp12::zero().invert().has_value());

    fp12_fe zero, out;
    fp12_0(&zero);
    fp12_invert(&out, &zero);
    check_nonzero("fp12_invert(0) == 0 at the C level", fp12_iszero(&out));

    /* in-place operation */
    fp12_fe h;
    fp12_copy(&h, &g.raw());
    fp12_mul(&h, &h, &h);
    check_nonzero("fp12_mul with aliased output", bn256::Fp12(h) == g.sq());

    const auto x = bn256::Fp12(g.x(), bn256::Fp6::zero());
    const auto s = g.y();
    check_nonzero("mul_fp6 matches full multiplication", g * s == g * bn256::Fp12(bn256::Fp6::zero(), s));
    check_nonzero("x*w squared is t * x^2", x.sq() == bn256::Fp12(bn256::Fp6::zero(), g.x().sq().mul_tau()));
}

static void test_fp12_exp()
{
    std::cout << std::endl << "=== F_p^12 exponentiation ===" << std::endl;

    const auto g = bn256::Fp12::generator();

    check_nonzero("g^0 == 1", g.exp(uint64_t(0)).is_one());
    check_nonzero("g^1 == g", g.exp(uint64_t(1)) == g);
    check_nonzero("g^2 == sq(g)", g.exp(uint64_t(2)) == g.sq());
    check_nonzero("empty exponent == 1", g.exp(nullptr, 0).is_one());

    const uint8_t padded[4] = {0x05, 0x00, 0x00, 0x00};
    check_nonzero("trailing zero bytes ignored", g.exp(padded, sizeof(padded)) == g.exp(uint64_t(5)));

    const auto v = g.pow_to_v();
    check_fp12("pow_to_v(g)", gt_gpowv_bytes, v);
    check_nonzero("pow_to_v(g) == g^1868033", v == g.exp(uint64_t(1868033)));

    const auto u = g.pow_to_u();
    check_fp12("pow_to_u(g)", gt_gpowu_bytes, u);
    check_nonzero("pow_to_u(g) == g^6518589491078791937", u == g.exp(uint64_t(6518589491078791937ULL)));

    auto checked = g.pow_to_u_checked();
    check_nonzero("pow_to_u_checked(g) present", checked.has_value());
    if (checked)
        check_nonzero("pow_to_u_checked(g) == pow_to_u(g)", *checked == u);
}

static void test_cyclotomic()
{
    std::cout << std::endl << "=== Cyclotomic subgroup ===" << std::endl;

    const auto g = bn256::Fp12::generator();
    check_nonzero("is_norm_one(g)", g.is_norm_one());
    check_nonzero("is_cyclotomic(g)", g.is_cyclotomic());
    check_nonzero("is_cyclotomic(1)", bn256::Fp12::one().is_cyclotomic());

    /* 2 has norm 4 */
    const auto two = bn256::Fp12(bn256::Fp6::zero(), bn256::Fp6::one().dbl());
    check_int("is_norm_one(2)", 0, two.is_norm_one());
    check_int("is_cyclotomic(2)", 0, two.is_cyclotomic());
    check_int("cyclotomic_sq_checked(2) rejected", 0, two.cyclotomic_sq_checked().has_value());
    check_int("pow_to_u_checked(2) rejected", 0, two.pow_to_u_checked().has_value());

    /* a norm-one element outside the cyclotomic subgroup: conj(a) / a */
    const auto a = bn256::Fp12(g.y(), g.x());
    const auto ainv = a.invert();
    check_nonzero("invert(a) present", ainv.has_value());
    if (ainv)
    {
        const auto m = a.conj() * *ainv;
        check_nonzero("conj(a)/a has norm one", m.is_norm_one());
        check_int("conj(a)/a is not cyclotomic", 0, m.is_cyclotomic());
        check_int("cyclotomic_sq(conj(a)/a) != sq(conj(a)/a)", 0, m.cyclotomic_sq() == m.sq());
        check_int("cyclotomic_sq_checked(conj(a)/a) rejected", 0, m.cyclotomic_sq_checked().has_value());

        const auto c = m.frobenius_p2() * m;
        check_nonzero("frobenius_p2(m) * m is cyclotomic", c.is_cyclotomic());
        check_nonzero("cyclotomic_sq(c) == sq(c)", c.cyclotomic_sq() == c.sq());
    }
}

static void test_fp12_encoding()
{
    std::cout << std::endl << "=== F_p^12 encoding ===" << std::endl;

    const auto g = bn256::Fp12::generator();
    const auto bytes = g.to_bytes();
    check_bytes("to_bytes(g)", &gt_g_bytes[0][0], bytes.data(), bn256::Fp12::BYTES);

    const auto back = bn256::Fp12::from_bytes(bytes.data());
    check_nonzero("from_bytes(to_bytes(g)) present", back.has_value());
    if (back)
        check_nonzero("from_bytes(to_bytes(g)) == g", *back == g);

    auto bad = bytes;
    std::memcpy(bad.data() + 5 * 32, fp_p_bytes, 32);
    check_int("from_bytes rejects a coordinate equal to p", 0, bn256::Fp12::from_bytes(bad.data()).has_value());

    const auto zero64 = std::string(64, '0');
    const auto one64 = std::string(63, '0') + "1";
    const auto z2 = "(" + zero64 + "," + zero64 + ")";
    const auto o2 = "(" + zero64 + "," + one64 + ")";
    const auto expected = "((" + z2 + "," + z2 + "," + z2 + "),(" + z2 + "," + z2 + "," + o2 + "))";
    check_string("to_string(1)", expected, bn256::Fp12::one().to_string());

    std::ostringstream os;
    os << bn256::Fp12::one();
    check_string("operator<<(1)", expected, os.str());
}

int main()
{
    std::cout << "bn256 Unit Tests" << std::endl;
    std::cout << "================" << std::endl;

    test_fp();
    test_fp_api();
    test_fp2();
    test_fp6();
    test_constants();
    test_fp12();
    test_fp12_exp();
    test_cyclotomic();
    test_fp12_encoding();

    std::cout << std::endl << "================" << std::endl;
    std::cout << "Total:  " << tests_run << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}

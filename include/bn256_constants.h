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

#ifndef BN256_CONSTANTS_H
#define BN256_CONSTANTS_H

#include "fp.h"
#include "fp12.h"
#include "fp2.h"

/*
 * Frobenius twisting constants, xi = i + 3, all in Montgomery form.
 *
 * xi^((p-1)/6), xi^((p-1)/3) and xi^((2p-2)/3) are proper F_p^2 elements.
 * xi^((p^2-1)/6), xi^((p^2-1)/3) and xi^((2p^2-2)/3) lie in F_p and are
 * stored as bare F_p scalars.
 */
static const fp2_fe BN256_XI_TO_P_MINUS_1_OVER_6 = {
    {0x25af52988477cdb7ULL, 0x3d81a455ddced86aULL, 0x227d012e872c2431ULL, 0x0179198d3ea65d05ULL},
    {0x7407634dd9cca958ULL, 0x36d5bd6c7afb8f26ULL, 0xf4b1c32cebd880faULL, 0x06aa7869306f455fULL}};

static const fp2_fe BN256_XI_TO_P_MINUS_1_OVER_3 = {
    {0x4f59e37c01832e57ULL, 0xae6be39ac2bbbfe4ULL, 0xe04ea1bb697512f8ULL, 0x3097caa8fc40e10eULL},
    {0xf8606916d3816f2cULL, 0x1e5c0d7926de927eULL, 0xbc45f3946d81185eULL, 0x80752a25aa738091ULL}};

static const fp2_fe BN256_XI_TO_2P_MINUS_2_OVER_3 = {
    {0x51678e7469b3c52aULL, 0x4fb98f8b13319fc9ULL, 0x29b2254db3f1df75ULL, 0x1c044935a3d22fb2ULL},
    {0x4d2ea218872f3d2cULL, 0x2fcb27fc4abe7b69ULL, 0xd31d972f0e88ced9ULL, 0x53adc04a00a73b15ULL}};

static const fp_fe BN256_XI_TO_P_SQUARED_MINUS_1_OVER_6 =
    {0xe21a761d259c78afULL, 0x06358fa3f5e84f7eULL, 0xb7c444d01ac33f0dULL, 0x35a9333f6e50d058ULL};

static const fp_fe BN256_XI_TO_P_SQUARED_MINUS_1_OVER_3 =
    {0x12d3cef5e1ada57dULL, 0xe2eca1463753babbULL, 0x0ca41e40ddccf750ULL, 0x551337060397e04cULL};

static const fp_fe BN256_XI_TO_2P_SQUARED_MINUS_2_OVER_3 =
    {0x3642364f386c1db8ULL, 0xe825f92d2acd661fULL, 0xf2aba7e846c19d14ULL, 0x5a0bcea3dc52b7a0ULL};

/*
 * Generator of the order-r subgroup of the cyclotomic subgroup of F_p^12,
 * i.e. the pairing of the G1 and G2 generators. Stored as (x*w + y) with
 * every leaf in Montgomery form.
 */
static const fp12_fe BN256_GT_GENERATOR = {
    {
        {{0x62d608d6bb67a4fbULL, 0x9a66ec93f0c2032fULL, 0x5391628e924e1a34ULL, 0x2162dbf7de801d0eULL},
         {0x3e0c1a72bf08eb4fULL, 0x4972ec05990a5eccULL, 0xf7b9a407ead8007eULL, 0x3ca04c613572ce49ULL}},
        {{0xace536a5607c910eULL, 0xda93774a941ddd40ULL, 0x5de0e9853b7593adULL, 0x0e05bb926f513153ULL},
         {0x3f4c99f8abaf1a22ULL, 0x66d5f6121f86dc33ULL, 0x8e0a82f68a50abbaULL, 0x819927d1eebd0695ULL}},
        {{0x07cdef49c5477faaULL, 0x40eb71ffedaa199dULL, 0xbc896661f17c9b8fULL, 0x3144462983c38c02ULL},
         {0xcd09ee8dd8418013ULL, 0xf8d050d05faa9b11ULL, 0x589e90a555507ee1ULL, 0x58e4ab25f9c49c15ULL}}},
    {
        {{0x7e76809b142d020bULL, 0xd9949d1b2822e995ULL, 0x3de93d974f84b076ULL, 0x144523477028928dULL},
         {0x079952799f9ef4b0ULL, 0x4102c47aa3df01c6ULL, 0xfa82a633c53da2e1ULL, 0x54c3f0392f9f7e0eULL}},
        {{0xd3432a335533272bULL, 0xa008fbbdc7d74f4aULL, 0x68e3c81eb7295ed9ULL, 0x17fe34c21fdecef2ULL},
         {0xfb0bc4c0ef6df55fULL, 0x8bdc585b70bc2120ULL, 0x17d498d2cb720defULL, 0x2a368248319b899cULL}},
        {{0xf8487d81cb354c6cULL, 0x7421be69f1522caaULL, 0x6940c778b9fb2d54ULL, 0x7da4b04e102bb621ULL},
         {0x97b91989993e7be4ULL, 0x8526545356eab684ULL, 0xb050073022eb1892ULL, 0x658b432ad09939c0ULL}}}};

#endif // BN256_CONSTANTS_H
